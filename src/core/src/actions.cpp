#include "sn/actions.h"

namespace sn {

namespace {

std::string titleOrUntitled(const std::string& title) {
    return title.empty() ? "Untitled" : title;
}

std::string optionalId(const std::optional<EntityId>& id) {
    return id ? *id : "none";
}

std::string boolText(bool value) {
    return value ? "true" : "false";
}

const char* viewModeName(ViewMode mode) {
    return mode == ViewMode::Grid ? "grid" : "list";
}

const char* sortOptionName(SortOption option) {
    switch (option) {
    case SortOption::DateModified: return "date modified";
    case SortOption::DateCreated:  return "date created";
    case SortOption::Title:        return "title";
    }
    return "date modified";
}

} // namespace

const char* actionCategoryName(ActionCategory category) {
    switch (category) {
    case ActionCategory::Subject:    return "Subject";
    case ActionCategory::Note:       return "Note";
    case ActionCategory::Page:       return "Page";
    case ActionCategory::Template:   return "Template";
    case ActionCategory::Navigation: return "Navigation";
    case ActionCategory::Settings:   return "Settings";
    }
    return "Unknown";
}

namespace actions {

std::string AddSubject::description() const {
    return "Add subject: " + subject.name;
}

std::string UpdateSubject::description() const {
    return "Update subject: " + subject.name;
}

std::string DeleteSubject::description() const {
    return "Delete subject: " + subjectId;
}

std::string SelectSubject::description() const {
    return "Select subject: " + optionalId(subjectId);
}

std::string LoadSubjects::description() const {
    return "Load " + std::to_string(subjects.size()) + " subjects";
}

std::string AddNote::description() const {
    return "Add note: " + titleOrUntitled(note.title) + " to subject: " + subjectId;
}

std::string UpdateNote::description() const {
    return "Update note: " + titleOrUntitled(note.title) + " in subject: " + subjectId;
}

std::string DeleteNote::description() const {
    return "Delete note: " + noteId + " from subject: " + subjectId;
}

std::string SelectNote::description() const {
    return "Select note: " + optionalId(noteId) + " in subject: " + optionalId(subjectId);
}

std::string AddPage::description() const {
    return "Add page to note: " + noteId + " in subject: " + subjectId;
}

std::string UpdatePage::description() const {
    return "Update page: " + page.id + " in note: " + noteId + " in subject: " + subjectId;
}

std::string DeletePage::description() const {
    return "Delete page: " + pageId + " from note: " + noteId + " in subject: " + subjectId;
}

std::string ReorderPages::description() const {
    return "Reorder pages from index " + std::to_string(fromIndex) + " to " + std::to_string(toIndex)
        + " in note: " + noteId + " in subject: " + subjectId;
}

std::string SelectPage::description() const {
    return "Select page at index: " + std::to_string(pageIndex) + " with ID: " + optionalId(pageId);
}

std::string SetNoteTemplate::description() const {
    return std::string("Set note template to: ") + templateTypeName(canvasTemplate.type)
        + " for note: " + noteId + " in subject: " + subjectId;
}

std::string SetPageTemplate::description() const {
    return std::string("Set page template to: ") + templateTypeName(canvasTemplate.type)
        + " for page: " + pageId + " in note: " + noteId + " in subject: " + subjectId;
}

std::string SetDefaultTemplate::description() const {
    return std::string("Set default template to: ") + templateTypeName(canvasTemplate.type);
}

std::string NavigateToSubjectsList::description() const {
    return "Navigate to subjects list";
}

std::string NavigateToNote::description() const {
    return "Navigate to note at index: " + std::to_string(noteIndex) + " in subject: " + subjectId;
}

std::string UpdatePageNavigatorVisibility::description() const {
    return "Update page navigator visibility to: " + boolText(isVisible);
}

std::string UpdateSubjectSidebarVisibility::description() const {
    return "Update subject sidebar visibility to: " + boolText(isVisible);
}

std::string UpdatePageSelectionActive::description() const {
    return "Update page selection active to: " + boolText(isActive);
}

std::string UpdateCoordinateGridVisibility::description() const {
    return "Update coordinate grid visibility to: " + boolText(isVisible);
}

std::string UpdateFingerDrawingSetting::description() const {
    return "Update finger drawing setting to disabled: " + boolText(isDisabled);
}

std::string UpdateAutoScrollSetting::description() const {
    return "Update auto-scroll setting to enabled: " + boolText(isEnabled);
}

std::string UpdateDebugModeSetting::description() const {
    return "Update debug mode setting to enabled: " + boolText(isEnabled);
}

std::string UpdateSearchText::description() const {
    return "Update search text to: " + text;
}

std::string UpdateDefaultViewMode::description() const {
    return std::string("Update default view mode to: ") + viewModeName(viewMode);
}

std::string UpdateDefaultSort::description() const {
    return std::string("Update default sort to: ") + sortOptionName(option)
        + (order == SortOrder::Ascending ? " ascending" : " descending");
}

} // namespace actions

ActionCategory categoryOf(const Action& action) {
    return std::visit([](const auto& a) {
        return std::decay_t<decltype(a)>::kCategory;
    }, action);
}

std::string describe(const Action& action) {
    return std::visit([](const auto& a) {
        return a.description();
    }, action);
}

} // namespace sn
