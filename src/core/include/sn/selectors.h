#pragma once

#include <string>
#include <vector>

#include "app_state.h"

namespace sn {

// Derived read-only views over AppState. Returned pointers are valid for
// the lifetime of the state they were taken from.

[[nodiscard]] const Subject* selectedSubject(const AppState& state);
[[nodiscard]] const Note* selectedNote(const AppState& state);
[[nodiscard]] const Page* selectedPage(const AppState& state);

[[nodiscard]] const Subject* findSubjectByName(const AppState& state, const std::string& name);
[[nodiscard]] const Note* findNoteByTitle(const Subject& subject, const std::string& title);

class QueryParser {
public:
    // Lower-cased runs of alphanumeric and punctuation characters.
    static std::vector<std::string> tokenize(const std::string& s);
};

// Notes of all subjects, in order, whose titles match every token of
// `query` as a prefix of one of their own tokens. An empty query matches
// everything.
[[nodiscard]] std::vector<const Note*> notesMatching(const AppState& state, const std::string& query);

// notesMatching() with the current UIState search text.
[[nodiscard]] std::vector<const Note*> notesMatchingSearch(const AppState& state);

// Stable; ties keep subject order. Titles compare case-insensitively.
[[nodiscard]] std::vector<const Note*> sortedNotes(const Subject& subject, SortOption option, SortOrder order);

} // namespace sn
