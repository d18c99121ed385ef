#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>

#include "note_model.h"
#include "app_state.h"

namespace sn {

enum class ActionCategory {
    Subject,
    Note,
    Page,
    Template,
    Navigation,
    Settings
};

[[nodiscard]] const char* actionCategoryName(ActionCategory category);

// Actions are plain data: no callbacks, no references into live state.
namespace actions {

// Subject actions
struct AddSubject {
    static constexpr ActionCategory kCategory = ActionCategory::Subject;
    Subject subject;
    std::string description() const;
};

struct UpdateSubject {
    static constexpr ActionCategory kCategory = ActionCategory::Subject;
    Subject subject;
    std::string description() const;
};

struct DeleteSubject {
    static constexpr ActionCategory kCategory = ActionCategory::Subject;
    SubjectId subjectId;
    std::string description() const;
};

struct SelectSubject {
    static constexpr ActionCategory kCategory = ActionCategory::Subject;
    std::optional<SubjectId> subjectId;
    std::string description() const;
};

// Replaces the whole subject list with what persistence loaded at startup.
struct LoadSubjects {
    static constexpr ActionCategory kCategory = ActionCategory::Subject;
    std::vector<Subject> subjects;
    std::string description() const;
};

// Note actions
struct AddNote {
    static constexpr ActionCategory kCategory = ActionCategory::Note;
    Note note;
    SubjectId subjectId;
    std::string description() const;
};

struct UpdateNote {
    static constexpr ActionCategory kCategory = ActionCategory::Note;
    Note note;
    SubjectId subjectId;
    std::string description() const;
};

struct DeleteNote {
    static constexpr ActionCategory kCategory = ActionCategory::Note;
    NoteId noteId;
    SubjectId subjectId;
    std::string description() const;
};

struct SelectNote {
    static constexpr ActionCategory kCategory = ActionCategory::Note;
    std::optional<NoteId> noteId;
    std::optional<SubjectId> subjectId;
    std::string description() const;
};

// Page actions
struct AddPage {
    static constexpr ActionCategory kCategory = ActionCategory::Page;
    Page page;
    NoteId noteId;
    SubjectId subjectId;
    std::string description() const;
};

struct UpdatePage {
    static constexpr ActionCategory kCategory = ActionCategory::Page;
    Page page;
    NoteId noteId;
    SubjectId subjectId;
    std::string description() const;
};

struct DeletePage {
    static constexpr ActionCategory kCategory = ActionCategory::Page;
    PageId pageId;
    NoteId noteId;
    SubjectId subjectId;
    std::string description() const;
};

struct ReorderPages {
    static constexpr ActionCategory kCategory = ActionCategory::Page;
    int fromIndex = 0;
    int toIndex = 0;
    NoteId noteId;
    SubjectId subjectId;
    std::string description() const;
};

struct SelectPage {
    static constexpr ActionCategory kCategory = ActionCategory::Page;
    int pageIndex = 0;
    std::optional<PageId> pageId;
    std::string description() const;
};

// Template actions
struct SetNoteTemplate {
    static constexpr ActionCategory kCategory = ActionCategory::Template;
    CanvasTemplate canvasTemplate;
    NoteId noteId;
    SubjectId subjectId;
    std::string description() const;
};

struct SetPageTemplate {
    static constexpr ActionCategory kCategory = ActionCategory::Template;
    CanvasTemplate canvasTemplate;
    PageId pageId;
    NoteId noteId;
    SubjectId subjectId;
    std::string description() const;
};

struct SetDefaultTemplate {
    static constexpr ActionCategory kCategory = ActionCategory::Template;
    CanvasTemplate canvasTemplate;
    std::string description() const;
};

// Navigation actions
struct NavigateToSubjectsList {
    static constexpr ActionCategory kCategory = ActionCategory::Navigation;
    std::string description() const;
};

struct NavigateToNote {
    static constexpr ActionCategory kCategory = ActionCategory::Navigation;
    int noteIndex = 0;
    SubjectId subjectId;
    std::string description() const;
};

struct UpdatePageNavigatorVisibility {
    static constexpr ActionCategory kCategory = ActionCategory::Navigation;
    bool isVisible = false;
    std::string description() const;
};

struct UpdateSubjectSidebarVisibility {
    static constexpr ActionCategory kCategory = ActionCategory::Navigation;
    bool isVisible = false;
    std::string description() const;
};

struct UpdatePageSelectionActive {
    static constexpr ActionCategory kCategory = ActionCategory::Navigation;
    bool isActive = false;
    std::string description() const;
};

struct UpdateCoordinateGridVisibility {
    static constexpr ActionCategory kCategory = ActionCategory::Navigation;
    bool isVisible = false;
    std::string description() const;
};

// Settings actions
struct UpdateFingerDrawingSetting {
    static constexpr ActionCategory kCategory = ActionCategory::Settings;
    bool isDisabled = false;
    std::string description() const;
};

struct UpdateAutoScrollSetting {
    static constexpr ActionCategory kCategory = ActionCategory::Settings;
    bool isEnabled = false;
    std::string description() const;
};

struct UpdateDebugModeSetting {
    static constexpr ActionCategory kCategory = ActionCategory::Settings;
    bool isEnabled = false;
    std::string description() const;
};

struct UpdateSearchText {
    static constexpr ActionCategory kCategory = ActionCategory::Settings;
    std::string text;
    std::string description() const;
};

struct UpdateDefaultViewMode {
    static constexpr ActionCategory kCategory = ActionCategory::Settings;
    ViewMode viewMode = ViewMode::Grid;
    std::string description() const;
};

struct UpdateDefaultSort {
    static constexpr ActionCategory kCategory = ActionCategory::Settings;
    SortOption option = SortOption::DateModified;
    SortOrder order = SortOrder::Descending;
    std::string description() const;
};

} // namespace actions

using Action = std::variant<
    actions::AddSubject,
    actions::UpdateSubject,
    actions::DeleteSubject,
    actions::SelectSubject,
    actions::LoadSubjects,
    actions::AddNote,
    actions::UpdateNote,
    actions::DeleteNote,
    actions::SelectNote,
    actions::AddPage,
    actions::UpdatePage,
    actions::DeletePage,
    actions::ReorderPages,
    actions::SelectPage,
    actions::SetNoteTemplate,
    actions::SetPageTemplate,
    actions::SetDefaultTemplate,
    actions::NavigateToSubjectsList,
    actions::NavigateToNote,
    actions::UpdatePageNavigatorVisibility,
    actions::UpdateSubjectSidebarVisibility,
    actions::UpdatePageSelectionActive,
    actions::UpdateCoordinateGridVisibility,
    actions::UpdateFingerDrawingSetting,
    actions::UpdateAutoScrollSetting,
    actions::UpdateDebugModeSetting,
    actions::UpdateSearchText,
    actions::UpdateDefaultViewMode,
    actions::UpdateDefaultSort>;

[[nodiscard]] ActionCategory categoryOf(const Action& action);
[[nodiscard]] std::string describe(const Action& action);

} // namespace sn
