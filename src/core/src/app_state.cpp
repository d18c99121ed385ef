#include "sn/app_state.h"

namespace sn {

void SelectionState::clearNote() {
    selectedNoteId.reset();
    selectedNoteIndex.reset();
    selectedPageId.reset();
    selectedPageIndex = 0;
}

void SelectionState::clearAll() {
    selectedSubjectId.reset();
    selectedSubjectIndex.reset();
    clearNote();
}

bool SelectionState::operator==(const SelectionState& other) const {
    return selectedSubjectIndex == other.selectedSubjectIndex
        && selectedSubjectId == other.selectedSubjectId
        && selectedNoteIndex == other.selectedNoteIndex
        && selectedNoteId == other.selectedNoteId
        && selectedPageIndex == other.selectedPageIndex
        && selectedPageId == other.selectedPageId;
}

bool UIState::operator==(const UIState& other) const {
    return navigation == other.navigation
        && isPageNavigatorVisible == other.isPageNavigatorVisible
        && isPageSelectionActive == other.isPageSelectionActive
        && isSubjectSidebarVisible == other.isSubjectSidebarVisible
        && isCoordinateGridVisible == other.isCoordinateGridVisible
        && searchText == other.searchText
        && isDebugMode == other.isDebugMode
        && selection == other.selection;
}

bool SettingsState::operator==(const SettingsState& other) const {
    return disableFingerDrawing == other.disableFingerDrawing
        && autoScrollEnabled == other.autoScrollEnabled
        && defaultTemplate == other.defaultTemplate
        && defaultViewMode == other.defaultViewMode
        && defaultSortOption == other.defaultSortOption
        && defaultSortOrder == other.defaultSortOrder;
}

bool AppState::operator==(const AppState& other) const {
    return content == other.content
        && ui == other.ui
        && settings == other.settings;
}

} // namespace sn
