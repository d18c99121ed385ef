#include "sn/reducers.h"

#include <algorithm>

namespace sn {

namespace {

template <typename T>
std::optional<size_t> indexById(const std::vector<T>& items, const EntityId& id) {
    auto it = std::find_if(items.begin(), items.end(),
        [&id](const T& item) { return item.id == id; });
    if (it == items.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - items.begin());
}

void renumberPages(std::vector<Page>& pages) {
    for (size_t i = 0; i < pages.size(); ++i) {
        pages[i].pageNumber = static_cast<int>(i) + 1;
    }
}

void selectFirstSubject(AppState& state) {
    if (state.content.subjects.empty()) {
        return;
    }
    state.ui.selection.selectedSubjectId = state.content.subjects[0].id;
    state.ui.selection.selectedSubjectIndex = 0;
}

// Indices in the selection are caches of the selected ids; refresh them
// after the sequences they index into have changed.
void resyncSelectionIndices(AppState& state) {
    auto& sel = state.ui.selection;
    if (!sel.selectedSubjectId) {
        return;
    }
    auto subjectIndex = indexById(state.content.subjects, *sel.selectedSubjectId);
    if (!subjectIndex) {
        sel.clearAll();
        return;
    }
    sel.selectedSubjectIndex = static_cast<int>(*subjectIndex);

    if (!sel.selectedNoteId) {
        return;
    }
    const auto& notes = state.content.subjects[*subjectIndex].notes;
    auto noteIndex = indexById(notes, *sel.selectedNoteId);
    if (!noteIndex) {
        sel.clearNote();
        return;
    }
    sel.selectedNoteIndex = static_cast<int>(*noteIndex);
}

struct ContentLocation {
    size_t subject;
    size_t note;
};

std::optional<ContentLocation> locateNote(const AppState& state, const SubjectId& subjectId, const NoteId& noteId) {
    auto subjectIndex = indexById(state.content.subjects, subjectId);
    if (!subjectIndex) {
        return std::nullopt;
    }
    auto noteIndex = indexById(state.content.subjects[*subjectIndex].notes, noteId);
    if (!noteIndex) {
        return std::nullopt;
    }
    return ContentLocation{*subjectIndex, *noteIndex};
}

class ContentReducer {
public:
    ContentReducer(const AppState& state, Timestamp now)
        : state_(state), now_(now) {}

    std::optional<AppState> operator()(const actions::AddSubject& action) const {
        AppState next = state_;
        Subject subject = action.subject;
        subject.touch(now_);
        next.content.subjects.push_back(std::move(subject));

        if (!next.ui.selection.selectedSubjectId) {
            next.ui.selection.selectedSubjectId = action.subject.id;
            next.ui.selection.selectedSubjectIndex = static_cast<int>(next.content.subjects.size()) - 1;
        }
        return next;
    }

    std::optional<AppState> operator()(const actions::UpdateSubject& action) const {
        auto index = indexById(state_.content.subjects, action.subject.id);
        if (!index) {
            return std::nullopt;
        }
        AppState next = state_;
        next.content.subjects[*index] = action.subject;
        next.content.subjects[*index].touch(now_);
        resyncSelectionIndices(next);

        if (auto* detail = std::get_if<NoteDetail>(&next.ui.navigation)) {
            const auto noteCount = static_cast<int>(next.content.subjects[*index].notes.size());
            if (detail->subjectId == action.subject.id && detail->noteIndex >= noteCount) {
                next.ui.navigation = SubjectsList{};
            }
        }
        return next;
    }

    std::optional<AppState> operator()(const actions::DeleteSubject& action) const {
        auto index = indexById(state_.content.subjects, action.subjectId);
        if (!index) {
            return std::nullopt;
        }
        AppState next = state_;
        // Notes and pages are owned by value, so erasing the subject drops
        // all of them. Selection pointing into them goes too.
        next.content.subjects.erase(next.content.subjects.begin() + static_cast<std::ptrdiff_t>(*index));

        auto& sel = next.ui.selection;
        if (sel.selectedSubjectId == action.subjectId) {
            sel.clearAll();
            selectFirstSubject(next);
        } else {
            resyncSelectionIndices(next);
        }

        if (auto* detail = std::get_if<NoteDetail>(&next.ui.navigation)) {
            if (detail->subjectId == action.subjectId) {
                next.ui.navigation = SubjectsList{};
            }
        }
        return next;
    }

    std::optional<AppState> operator()(const actions::SelectSubject& action) const {
        AppState next = state_;
        auto& sel = next.ui.selection;
        if (!action.subjectId) {
            sel.clearAll();
            return next;
        }
        auto index = indexById(state_.content.subjects, *action.subjectId);
        if (!index) {
            return std::nullopt;
        }
        sel.selectedSubjectId = *action.subjectId;
        sel.selectedSubjectIndex = static_cast<int>(*index);
        sel.clearNote();
        return next;
    }

    std::optional<AppState> operator()(const actions::LoadSubjects& action) const {
        AppState next = state_;
        next.content.subjects = action.subjects;
        next.ui.selection.clearAll();
        next.ui.navigation = SubjectsList{};
        selectFirstSubject(next);
        return next;
    }

    std::optional<AppState> operator()(const actions::AddNote& action) const {
        auto subjectIndex = indexById(state_.content.subjects, action.subjectId);
        if (!subjectIndex) {
            return std::nullopt;
        }
        AppState next = state_;
        auto& subject = next.content.subjects[*subjectIndex];
        subject.notes.push_back(action.note);
        subject.touch(now_);

        auto& sel = next.ui.selection;
        sel.selectedSubjectId = subject.id;
        sel.selectedSubjectIndex = static_cast<int>(*subjectIndex);
        sel.selectedNoteId = action.note.id;
        sel.selectedNoteIndex = static_cast<int>(subject.notes.size()) - 1;
        sel.selectedPageIndex = 0;
        if (!action.note.pages.empty()) {
            sel.selectedPageId = action.note.pages[0].id;
        } else {
            sel.selectedPageId.reset();
        }
        return next;
    }

    std::optional<AppState> operator()(const actions::UpdateNote& action) const {
        auto loc = locateNote(state_, action.subjectId, action.note.id);
        if (!loc) {
            return std::nullopt;
        }
        AppState next = state_;
        auto& subject = next.content.subjects[loc->subject];
        subject.notes[loc->note] = action.note;
        subject.notes[loc->note].lastModified = now_;
        subject.touch(now_);
        return next;
    }

    std::optional<AppState> operator()(const actions::DeleteNote& action) const {
        auto loc = locateNote(state_, action.subjectId, action.noteId);
        if (!loc) {
            return std::nullopt;
        }
        AppState next = state_;
        auto& subject = next.content.subjects[loc->subject];
        subject.notes.erase(subject.notes.begin() + static_cast<std::ptrdiff_t>(loc->note));
        subject.touch(now_);

        if (next.ui.selection.selectedNoteId == action.noteId) {
            next.ui.selection.clearNote();
        } else {
            resyncSelectionIndices(next);
        }

        // The detail view holds a position, so notes after the erased one shift down.
        if (auto* detail = std::get_if<NoteDetail>(&next.ui.navigation)) {
            const auto erased = static_cast<int>(loc->note);
            if (detail->subjectId == action.subjectId) {
                if (detail->noteIndex == erased) {
                    next.ui.navigation = SubjectsList{};
                } else if (detail->noteIndex > erased) {
                    --detail->noteIndex;
                }
            }
        }
        return next;
    }

    std::optional<AppState> operator()(const actions::SelectNote& action) const {
        AppState next = state_;
        auto& sel = next.ui.selection;
        if (!action.noteId || !action.subjectId) {
            // Keeps the subject selection.
            sel.clearNote();
            return next;
        }
        auto loc = locateNote(state_, *action.subjectId, *action.noteId);
        if (!loc) {
            return std::nullopt;
        }
        const auto& note = state_.content.subjects[loc->subject].notes[loc->note];
        sel.selectedSubjectId = *action.subjectId;
        sel.selectedSubjectIndex = static_cast<int>(loc->subject);
        sel.selectedNoteId = *action.noteId;
        sel.selectedNoteIndex = static_cast<int>(loc->note);
        sel.selectedPageIndex = 0;
        if (!note.pages.empty()) {
            sel.selectedPageId = note.pages[0].id;
        } else {
            sel.selectedPageId.reset();
        }
        return next;
    }

    std::optional<AppState> operator()(const actions::AddPage& action) const {
        auto loc = locateNote(state_, action.subjectId, action.noteId);
        if (!loc) {
            return std::nullopt;
        }
        AppState next = state_;
        auto& subject = next.content.subjects[loc->subject];
        auto& note = subject.notes[loc->note];
        note.pages.push_back(action.page);
        note.lastModified = now_;
        subject.touch(now_);

        if (next.ui.selection.selectedNoteId == action.noteId) {
            next.ui.selection.selectedPageIndex = static_cast<int>(note.pages.size()) - 1;
            next.ui.selection.selectedPageId = action.page.id;
        }
        return next;
    }

    std::optional<AppState> operator()(const actions::UpdatePage& action) const {
        auto loc = locateNote(state_, action.subjectId, action.noteId);
        if (!loc) {
            return std::nullopt;
        }
        auto pageIndex = indexById(state_.content.subjects[loc->subject].notes[loc->note].pages, action.page.id);
        if (!pageIndex) {
            return std::nullopt;
        }
        AppState next = state_;
        auto& subject = next.content.subjects[loc->subject];
        auto& note = subject.notes[loc->note];
        note.pages[*pageIndex] = action.page;
        note.lastModified = now_;
        subject.touch(now_);
        return next;
    }

    std::optional<AppState> operator()(const actions::DeletePage& action) const {
        auto loc = locateNote(state_, action.subjectId, action.noteId);
        if (!loc) {
            return std::nullopt;
        }
        auto pageIndex = indexById(state_.content.subjects[loc->subject].notes[loc->note].pages, action.pageId);
        if (!pageIndex) {
            return std::nullopt;
        }
        AppState next = state_;
        auto& subject = next.content.subjects[loc->subject];
        auto& note = subject.notes[loc->note];

        if (note.pages.size() <= 1) {
            // A note always keeps one page: clear it instead of removing it.
            Page cleared;
            cleared.id = action.pageId;
            cleared.pageTemplate = note.pages[*pageIndex].pageTemplate;
            cleared.pageNumber = 1;
            note.pages[0] = std::move(cleared);
        } else {
            note.pages.erase(note.pages.begin() + static_cast<std::ptrdiff_t>(*pageIndex));
            renumberPages(note.pages);

            auto& sel = next.ui.selection;
            if (sel.selectedNoteId == action.noteId && sel.selectedPageIndex >= static_cast<int>(*pageIndex)) {
                const int lastIndex = static_cast<int>(note.pages.size()) - 1;
                const int newIndex = std::max(0, std::min(sel.selectedPageIndex - 1, lastIndex));
                sel.selectedPageIndex = newIndex;
                sel.selectedPageId = note.pages[static_cast<size_t>(newIndex)].id;
            }
        }

        note.lastModified = now_;
        subject.touch(now_);
        return next;
    }

    std::optional<AppState> operator()(const actions::ReorderPages& action) const {
        auto loc = locateNote(state_, action.subjectId, action.noteId);
        if (!loc) {
            return std::nullopt;
        }
        const int count = static_cast<int>(state_.content.subjects[loc->subject].notes[loc->note].pages.size());
        if (action.fromIndex == action.toIndex
            || action.fromIndex < 0 || action.fromIndex >= count
            || action.toIndex < 0 || action.toIndex >= count) {
            return std::nullopt;
        }

        AppState next = state_;
        auto& subject = next.content.subjects[loc->subject];
        auto& pages = subject.notes[loc->note].pages;

        Page moved = pages[static_cast<size_t>(action.fromIndex)];
        pages.erase(pages.begin() + action.fromIndex);
        pages.insert(pages.begin() + action.toIndex, std::move(moved));
        renumberPages(pages);

        auto& sel = next.ui.selection;
        if (sel.selectedNoteId == action.noteId) {
            if (sel.selectedPageId) {
                if (auto index = indexById(pages, *sel.selectedPageId)) {
                    sel.selectedPageIndex = static_cast<int>(*index);
                }
            } else if (sel.selectedPageIndex == action.fromIndex) {
                sel.selectedPageIndex = action.toIndex;
            }
        }

        subject.notes[loc->note].lastModified = now_;
        subject.touch(now_);
        return next;
    }

    std::optional<AppState> operator()(const actions::SelectPage& action) const {
        const auto& sel = state_.ui.selection;
        if (!sel.selectedSubjectIndex || !sel.selectedNoteIndex) {
            return std::nullopt;
        }
        const int subjectIndex = *sel.selectedSubjectIndex;
        const int noteIndex = *sel.selectedNoteIndex;
        const auto& subjects = state_.content.subjects;
        if (subjectIndex < 0 || subjectIndex >= static_cast<int>(subjects.size())) {
            return std::nullopt;
        }
        const auto& notes = subjects[static_cast<size_t>(subjectIndex)].notes;
        if (noteIndex < 0 || noteIndex >= static_cast<int>(notes.size())) {
            return std::nullopt;
        }
        const auto& pages = notes[static_cast<size_t>(noteIndex)].pages;
        if (action.pageIndex < 0 || action.pageIndex >= static_cast<int>(pages.size())) {
            return std::nullopt;
        }

        AppState next = state_;
        next.ui.selection.selectedPageIndex = action.pageIndex;
        next.ui.selection.selectedPageId = action.pageId ? *action.pageId
                                                         : pages[static_cast<size_t>(action.pageIndex)].id;
        return next;
    }

    std::optional<AppState> operator()(const actions::SetNoteTemplate& action) const {
        auto loc = locateNote(state_, action.subjectId, action.noteId);
        if (!loc) {
            return std::nullopt;
        }
        AppState next = state_;
        auto& subject = next.content.subjects[loc->subject];
        subject.notes[loc->note].noteTemplate = action.canvasTemplate;
        subject.notes[loc->note].lastModified = now_;
        subject.touch(now_);
        return next;
    }

    std::optional<AppState> operator()(const actions::SetPageTemplate& action) const {
        auto loc = locateNote(state_, action.subjectId, action.noteId);
        if (!loc) {
            return std::nullopt;
        }
        auto pageIndex = indexById(state_.content.subjects[loc->subject].notes[loc->note].pages, action.pageId);
        if (!pageIndex) {
            return std::nullopt;
        }
        AppState next = state_;
        auto& subject = next.content.subjects[loc->subject];
        auto& note = subject.notes[loc->note];
        note.pages[*pageIndex].pageTemplate = action.canvasTemplate;
        note.lastModified = now_;
        subject.touch(now_);
        return next;
    }

    // Not a content action.
    template <typename A>
    std::optional<AppState> operator()(const A&) const {
        return std::nullopt;
    }

private:
    const AppState& state_;
    Timestamp now_;
};

class UIReducer {
public:
    explicit UIReducer(const UIState& state)
        : state_(state) {}

    std::optional<UIState> operator()(const actions::NavigateToSubjectsList&) const {
        UIState next = state_;
        next.navigation = SubjectsList{};
        return next;
    }

    std::optional<UIState> operator()(const actions::NavigateToNote& action) const {
        UIState next = state_;
        next.navigation = NoteDetail{action.noteIndex, action.subjectId};
        return next;
    }

    std::optional<UIState> operator()(const actions::UpdatePageNavigatorVisibility& action) const {
        UIState next = state_;
        next.isPageNavigatorVisible = action.isVisible;
        return next;
    }

    std::optional<UIState> operator()(const actions::UpdateSubjectSidebarVisibility& action) const {
        UIState next = state_;
        next.isSubjectSidebarVisible = action.isVisible;
        return next;
    }

    std::optional<UIState> operator()(const actions::UpdatePageSelectionActive& action) const {
        UIState next = state_;
        next.isPageSelectionActive = action.isActive;
        return next;
    }

    std::optional<UIState> operator()(const actions::UpdateCoordinateGridVisibility& action) const {
        UIState next = state_;
        next.isCoordinateGridVisible = action.isVisible;
        return next;
    }

    std::optional<UIState> operator()(const actions::UpdateDebugModeSetting& action) const {
        UIState next = state_;
        next.isDebugMode = action.isEnabled;
        return next;
    }

    std::optional<UIState> operator()(const actions::UpdateSearchText& action) const {
        UIState next = state_;
        next.searchText = action.text;
        return next;
    }

    template <typename A>
    std::optional<UIState> operator()(const A&) const {
        return std::nullopt;
    }

private:
    const UIState& state_;
};

class SettingsReducer {
public:
    explicit SettingsReducer(const SettingsState& state)
        : state_(state) {}

    std::optional<SettingsState> operator()(const actions::UpdateFingerDrawingSetting& action) const {
        SettingsState next = state_;
        next.disableFingerDrawing = action.isDisabled;
        return next;
    }

    std::optional<SettingsState> operator()(const actions::UpdateAutoScrollSetting& action) const {
        SettingsState next = state_;
        next.autoScrollEnabled = action.isEnabled;
        return next;
    }

    std::optional<SettingsState> operator()(const actions::UpdateDefaultViewMode& action) const {
        SettingsState next = state_;
        next.defaultViewMode = action.viewMode;
        return next;
    }

    std::optional<SettingsState> operator()(const actions::UpdateDefaultSort& action) const {
        SettingsState next = state_;
        next.defaultSortOption = action.option;
        next.defaultSortOrder = action.order;
        return next;
    }

    std::optional<SettingsState> operator()(const actions::SetDefaultTemplate& action) const {
        SettingsState next = state_;
        next.defaultTemplate = action.canvasTemplate;
        return next;
    }

    template <typename A>
    std::optional<SettingsState> operator()(const A&) const {
        return std::nullopt;
    }

private:
    const SettingsState& state_;
};

} // namespace

std::optional<AppState> reduceContent(const AppState& state, const Action& action, Timestamp now) {
    return std::visit(ContentReducer(state, now), action);
}

std::optional<UIState> reduceUI(const UIState& state, const Action& action) {
    return std::visit(UIReducer(state), action);
}

std::optional<SettingsState> reduceSettings(const SettingsState& state, const Action& action) {
    return std::visit(SettingsReducer(state), action);
}

std::optional<AppState> applyAction(const AppState& state, const Action& action, Timestamp now) {
    switch (categoryOf(action)) {
    case ActionCategory::Subject:
    case ActionCategory::Note:
    case ActionCategory::Page:
        return reduceContent(state, action, now);

    case ActionCategory::Template: {
        if (auto next = reduceContent(state, action, now)) {
            return next;
        }
        auto settings = reduceSettings(state.settings, action);
        if (!settings) {
            return std::nullopt;
        }
        AppState next = state;
        next.settings = std::move(*settings);
        return next;
    }

    case ActionCategory::Navigation: {
        auto ui = reduceUI(state.ui, action);
        if (!ui) {
            return std::nullopt;
        }
        AppState next = state;
        next.ui = std::move(*ui);
        return next;
    }

    case ActionCategory::Settings: {
        auto settings = reduceSettings(state.settings, action);
        auto ui = reduceUI(state.ui, action);
        if (!settings && !ui) {
            return std::nullopt;
        }
        AppState next = state;
        if (settings) {
            next.settings = std::move(*settings);
        }
        if (ui) {
            next.ui = std::move(*ui);
        }
        return next;
    }
    }
    return std::nullopt;
}

AppState reduce(const AppState& state, const Action& action, Timestamp now) {
    if (auto next = applyAction(state, action, now)) {
        return std::move(*next);
    }
    return state;
}

} // namespace sn
