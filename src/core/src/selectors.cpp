#include "sn/selectors.h"

#include <algorithm>
#include <cctype>

namespace sn {

const Subject* selectedSubject(const AppState& state) {
    const auto& id = state.ui.selection.selectedSubjectId;
    if (!id) {
        return nullptr;
    }
    for (const auto& subject : state.content.subjects) {
        if (subject.id == *id) {
            return &subject;
        }
    }
    return nullptr;
}

const Note* selectedNote(const AppState& state) {
    const Subject* subject = selectedSubject(state);
    const auto& id = state.ui.selection.selectedNoteId;
    if (!subject || !id) {
        return nullptr;
    }
    for (const auto& note : subject->notes) {
        if (note.id == *id) {
            return &note;
        }
    }
    return nullptr;
}

const Page* selectedPage(const AppState& state) {
    const Note* note = selectedNote(state);
    if (!note) {
        return nullptr;
    }
    const int index = state.ui.selection.selectedPageIndex;
    if (index < 0 || static_cast<size_t>(index) >= note->pages.size()) {
        return nullptr;
    }
    return &note->pages[static_cast<size_t>(index)];
}

const Subject* findSubjectByName(const AppState& state, const std::string& name) {
    auto it = std::find_if(state.content.subjects.begin(), state.content.subjects.end(),
        [&name](const Subject& s) { return s.name == name; });
    return it == state.content.subjects.end() ? nullptr : &*it;
}

const Note* findNoteByTitle(const Subject& subject, const std::string& title) {
    auto it = std::find_if(subject.notes.begin(), subject.notes.end(),
        [&title](const Note& n) { return n.title == title; });
    return it == subject.notes.end() ? nullptr : &*it;
}

std::vector<std::string> QueryParser::tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::string token;

    for (char raw : s) {
        auto c = static_cast<unsigned char>(raw);
        if (std::isalnum(c) || std::ispunct(c)) {
            token += static_cast<char>(std::tolower(c));
        } else if (!token.empty()) {
            tokens.push_back(token);
            token.clear();
        }
    }

    if (!token.empty()) {
        tokens.push_back(token);
    }

    return tokens;
}

std::vector<const Note*> notesMatching(const AppState& state, const std::string& query) {
    const auto queryTokens = QueryParser::tokenize(query);
    std::vector<const Note*> result;

    for (const auto& subject : state.content.subjects) {
        for (const auto& note : subject.notes) {
            if (queryTokens.empty()) {
                result.push_back(&note);
                continue;
            }
            const auto titleTokens = QueryParser::tokenize(note.title);
            // AND over query tokens, prefix match against title tokens
            bool all = std::all_of(queryTokens.begin(), queryTokens.end(), [&titleTokens](const std::string& q) {
                return std::any_of(titleTokens.begin(), titleTokens.end(),
                    [&q](const std::string& t) { return t.rfind(q, 0) == 0; });
            });
            if (all) {
                result.push_back(&note);
            }
        }
    }
    return result;
}

std::vector<const Note*> notesMatchingSearch(const AppState& state) {
    return notesMatching(state, state.ui.searchText);
}

namespace {

std::string lowered(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::vector<const Note*> sortedNotes(const Subject& subject, SortOption option, SortOrder order) {
    std::vector<const Note*> notes;
    notes.reserve(subject.notes.size());
    for (const auto& note : subject.notes) {
        notes.push_back(&note);
    }

    auto less = [option](const Note* a, const Note* b) {
        switch (option) {
        case SortOption::DateCreated:
            return a->dateCreated < b->dateCreated;
        case SortOption::Title:
            return lowered(a->title) < lowered(b->title);
        case SortOption::DateModified:
            break;
        }
        return a->lastModified < b->lastModified;
    };

    if (order == SortOrder::Ascending) {
        std::stable_sort(notes.begin(), notes.end(), less);
    } else {
        std::stable_sort(notes.begin(), notes.end(),
            [&less](const Note* a, const Note* b) { return less(b, a); });
    }
    return notes;
}

} // namespace sn
