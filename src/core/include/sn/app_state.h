#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>

#include "note_model.h"

namespace sn {

struct SubjectsList {
    bool operator==(const SubjectsList&) const { return true; }
};

struct NoteDetail {
    int noteIndex = 0;
    SubjectId subjectId;

    bool operator==(const NoteDetail& other) const {
        return noteIndex == other.noteIndex && subjectId == other.subjectId;
    }
};

using NavigationTarget = std::variant<SubjectsList, NoteDetail>;

struct SelectionState {
    std::optional<int> selectedSubjectIndex;
    std::optional<SubjectId> selectedSubjectId;
    std::optional<int> selectedNoteIndex;
    std::optional<NoteId> selectedNoteId;
    int selectedPageIndex = 0;
    std::optional<PageId> selectedPageId;

    void clearNote();
    void clearAll();

    bool operator==(const SelectionState& other) const;
    bool operator!=(const SelectionState& other) const { return !(*this == other); }
};

struct ContentState {
    std::vector<Subject> subjects;

    bool operator==(const ContentState& other) const { return subjects == other.subjects; }
    bool operator!=(const ContentState& other) const { return !(*this == other); }
};

struct UIState {
    NavigationTarget navigation = SubjectsList{};
    bool isPageNavigatorVisible = false;
    bool isPageSelectionActive = false;
    bool isSubjectSidebarVisible = true;
    bool isCoordinateGridVisible = false;
    std::string searchText;
    bool isDebugMode = false;
    SelectionState selection;

    bool operator==(const UIState& other) const;
    bool operator!=(const UIState& other) const { return !(*this == other); }
};

enum class ViewMode {
    Grid,
    List
};

enum class SortOption {
    DateModified,
    DateCreated,
    Title
};

enum class SortOrder {
    Ascending,
    Descending
};

struct SettingsState {
    bool disableFingerDrawing = false;
    bool autoScrollEnabled = true;
    CanvasTemplate defaultTemplate = CanvasTemplate::none();
    ViewMode defaultViewMode = ViewMode::Grid;
    SortOption defaultSortOption = SortOption::DateModified;
    SortOrder defaultSortOrder = SortOrder::Descending;

    bool operator==(const SettingsState& other) const;
    bool operator!=(const SettingsState& other) const { return !(*this == other); }
};

// Single source of truth. Only the reducer pipeline produces new values;
// the store hands out shared immutable snapshots.
struct AppState {
    ContentState content;
    UIState ui;
    SettingsState settings;

    bool operator==(const AppState& other) const;
    bool operator!=(const AppState& other) const { return !(*this == other); }
};

} // namespace sn
