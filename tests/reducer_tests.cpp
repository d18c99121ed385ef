#include <doctest/doctest.h>

#include "sn/reducers.h"
#include "test_support.h"

using namespace sn;
using sn::test::at;
using sn::test::sampleState;
using sn::test::subjectById;

namespace {

size_t pageCount(const AppState& state) {
    size_t total = 0;
    for (const auto& s : state.content.subjects) {
        for (const auto& n : s.notes) {
            total += n.pages.size();
        }
    }
    return total;
}

std::vector<PageId> pageIds(const Note& note) {
    std::vector<PageId> ids;
    for (const auto& p : note.pages) {
        ids.push_back(p.id);
    }
    return ids;
}

std::vector<int> pageNumbers(const Note& note) {
    std::vector<int> numbers;
    for (const auto& p : note.pages) {
        numbers.push_back(p.pageNumber);
    }
    return numbers;
}

const Note& firstNote(const AppState& state) {
    return state.content.subjects[0].notes[0];
}

} // namespace

TEST_CASE("Reducers: the same input always yields the same state")
{
    const AppState state = sampleState();
    const Action action = actions::AddPage{test::page("n1-p3", 3), "n1", "s1"};

    const AppState a = reduce(state, action, at(500));
    const AppState b = reduce(state, action, at(500));

    CHECK(a == b);
    CHECK(pageIds(firstNote(a)) == pageIds(firstNote(b)));
    CHECK(a.content.subjects[0].lastModified == b.content.subjects[0].lastModified);
}

TEST_CASE("Reducers: updating a note of a missing subject changes nothing")
{
    const AppState state = sampleState();
    Note edited = firstNote(state);
    edited.title = "Changed";

    CHECK_FALSE(applyAction(state, actions::UpdateNote{edited, "missing"}, at(500)));

    const AppState after = reduce(state, actions::UpdateNote{edited, "missing"}, at(500));
    CHECK(firstNote(after).title == "Algebra");
    CHECK(after.content.subjects[0].lastModified == at(100));
}

TEST_CASE("Reducers: deleting a subject removes its notes and pages")
{
    AppState state;
    Subject only = test::subject("s1", "Math");
    only.notes.push_back(test::note("n1", "Algebra"));
    only.notes.push_back(test::note("n2", "Geometry"));
    state.content.subjects.push_back(only);
    REQUIRE(pageCount(state) == 4);

    const AppState after = reduce(state, actions::DeleteSubject{"s1"}, at(500));
    CHECK(after.content.subjects.empty());
    CHECK(pageCount(after) == 0);
}

TEST_CASE("Reducers: adding a page touches the owning subject")
{
    const AppState state = sampleState();
    const Timestamp before = state.content.subjects[0].lastModified;

    const AppState after = reduce(state, actions::AddPage{test::page("n1-p3", 3), "n1", "s1"}, at(500));
    const Subject& subject = after.content.subjects[0];

    CHECK(subject.lastModified >= before);
    CHECK(subject.lastModified == at(500));
    CHECK(subject.notes[0].pages.size() == 3);
    CHECK(subject.notes[0].pages.back().id == "n1-p3");
}

TEST_CASE("Reducers: every content mutation touches the owning subject")
{
    const AppState state = sampleState();
    Note edited = firstNote(state);
    edited.title = "Linear Algebra";
    Page drawn = firstNote(state).pages[1];
    drawn.drawingData = {1, 2, 3};

    const std::vector<Action> mutations = {
        actions::AddNote{test::note("n3", "Calculus"), "s1"},
        actions::UpdateNote{edited, "s1"},
        actions::DeleteNote{"n2", "s1"},
        actions::AddPage{test::page("x", 3), "n1", "s1"},
        actions::UpdatePage{drawn, "n1", "s1"},
        actions::DeletePage{"n1-p2", "n1", "s1"},
        actions::ReorderPages{1, 0, "n1", "s1"},
        actions::SetNoteTemplate{CanvasTemplate::graph(), "n1", "s1"},
        actions::SetPageTemplate{CanvasTemplate::lined(), "n1-p1", "n1", "s1"},
    };

    for (const auto& action : mutations) {
        const std::string description = describe(action);
        CAPTURE(description);
        const AppState after = reduce(state, action, at(900));
        CHECK(subjectById(after, "s1").lastModified == at(900));
        CHECK(subjectById(after, "s2").lastModified == at(100));
    }
}

TEST_CASE("Reducers: reordering pages renumbers them")
{
    AppState state = sampleState();
    state.content.subjects[0].notes[0] = test::note("n1", "Algebra", 3);

    const AppState after = reduce(state, actions::ReorderPages{2, 0, "n1", "s1"}, at(500));
    const Note& note = firstNote(after);

    CHECK(pageIds(note) == std::vector<PageId>{"n1-p3", "n1-p1", "n1-p2"});
    CHECK(pageNumbers(note) == std::vector<int>{1, 2, 3});
}

TEST_CASE("Reducers: reordering keeps the selected page selected")
{
    AppState state = sampleState();
    state.content.subjects[0].notes[0] = test::note("n1", "Algebra", 3);
    state.ui.selection.selectedPageIndex = 2;
    state.ui.selection.selectedPageId = "n1-p3";

    const AppState after = reduce(state, actions::ReorderPages{2, 0, "n1", "s1"}, at(500));
    CHECK(after.ui.selection.selectedPageIndex == 0);
    CHECK(after.ui.selection.selectedPageId == PageId("n1-p3"));
}

TEST_CASE("Reducers: out of range reorder is a no-op")
{
    const AppState state = sampleState();
    CHECK_FALSE(applyAction(state, actions::ReorderPages{0, 5, "n1", "s1"}, at(500)));
    CHECK_FALSE(applyAction(state, actions::ReorderPages{-1, 0, "n1", "s1"}, at(500)));
    CHECK_FALSE(applyAction(state, actions::ReorderPages{1, 1, "n1", "s1"}, at(500)));
}

TEST_CASE("Reducers: adding subjects appends and selects the first one")
{
    AppState state;
    state = reduce(state, actions::AddSubject{test::subject("a", "First")}, at(200));
    state = reduce(state, actions::AddSubject{test::subject("b", "Second")}, at(300));

    REQUIRE(state.content.subjects.size() == 2);
    CHECK(state.content.subjects[0].id == "a");
    CHECK(state.content.subjects[1].id == "b");
    CHECK(state.content.subjects[1].lastModified == at(300));
    CHECK(state.ui.selection.selectedSubjectId == SubjectId("a"));
    CHECK(state.ui.selection.selectedSubjectIndex == 0);
}

TEST_CASE("Reducers: deleting the selected subject selects the first remaining one")
{
    AppState state = sampleState();
    state.ui.navigation = NoteDetail{0, "s1"};

    const AppState after = reduce(state, actions::DeleteSubject{"s1"}, at(500));
    CHECK(after.ui.selection.selectedSubjectId == SubjectId("s2"));
    CHECK(after.ui.selection.selectedSubjectIndex == 0);
    CHECK_FALSE(after.ui.selection.selectedNoteId);
    CHECK(std::holds_alternative<SubjectsList>(after.ui.navigation));
}

TEST_CASE("Reducers: deleting another subject keeps the selection and fixes its index")
{
    AppState state = sampleState();
    state.content.subjects.insert(state.content.subjects.begin(), test::subject("s0", "Art"));
    state.ui.selection.selectedSubjectIndex = 1;

    const AppState after = reduce(state, actions::DeleteSubject{"s0"}, at(500));
    CHECK(after.ui.selection.selectedSubjectId == SubjectId("s1"));
    CHECK(after.ui.selection.selectedSubjectIndex == 0);
    CHECK(after.ui.selection.selectedNoteId == NoteId("n1"));
}

TEST_CASE("Reducers: adding a note selects it and its first page")
{
    AppState state = sampleState();
    const Note added = test::note("n3", "Calculus");

    const AppState after = reduce(state, actions::AddNote{added, "s2"}, at(500));
    const auto& sel = after.ui.selection;

    CHECK(subjectById(after, "s2").notes.size() == 1);
    CHECK(sel.selectedSubjectId == SubjectId("s2"));
    CHECK(sel.selectedSubjectIndex == 1);
    CHECK(sel.selectedNoteId == NoteId("n3"));
    CHECK(sel.selectedNoteIndex == 0);
    CHECK(sel.selectedPageIndex == 0);
    CHECK(sel.selectedPageId == PageId("n3-p1"));
}

TEST_CASE("Reducers: deleting the selected note clears note selection")
{
    const AppState after = reduce(sampleState(), actions::DeleteNote{"n1", "s1"}, at(500));
    CHECK(after.content.subjects[0].notes.size() == 1);
    CHECK(after.ui.selection.selectedSubjectId == SubjectId("s1"));
    CHECK_FALSE(after.ui.selection.selectedNoteId);
    CHECK_FALSE(after.ui.selection.selectedPageId);
}

TEST_CASE("Reducers: deleting notes keeps the detail view on a valid note")
{
    const AppState viewing = reduce(sampleState(), actions::NavigateToNote{1, "s1"}, at(500));

    SUBCASE("deleting an earlier note shifts the viewed index down") {
        const AppState after = reduce(viewing, actions::DeleteNote{"n1", "s1"}, at(600));
        REQUIRE(std::holds_alternative<NoteDetail>(after.ui.navigation));
        const auto& detail = std::get<NoteDetail>(after.ui.navigation);
        CHECK(detail.noteIndex == 0);
        CHECK(after.content.subjects[0].notes[0].id == NoteId("n2"));
    }

    SUBCASE("deleting the viewed note returns to the subjects list") {
        const AppState after = reduce(viewing, actions::DeleteNote{"n2", "s1"}, at(600));
        CHECK(std::holds_alternative<SubjectsList>(after.ui.navigation));
    }

    SUBCASE("deleting both leaves no detail view behind") {
        const AppState first = reduce(viewing, actions::DeleteNote{"n1", "s1"}, at(600));
        const AppState second = reduce(first, actions::DeleteNote{"n2", "s1"}, at(700));
        CHECK(std::holds_alternative<SubjectsList>(second.ui.navigation));
    }

    SUBCASE("deleting a later note leaves the view alone") {
        const AppState onFirst = reduce(sampleState(), actions::NavigateToNote{0, "s1"}, at(500));
        const AppState after = reduce(onFirst, actions::DeleteNote{"n2", "s1"}, at(600));
        REQUIRE(std::holds_alternative<NoteDetail>(after.ui.navigation));
        CHECK(std::get<NoteDetail>(after.ui.navigation).noteIndex == 0);
    }
}

TEST_CASE("Reducers: updating a subject drops a detail view past its notes")
{
    const AppState viewing = reduce(sampleState(), actions::NavigateToNote{1, "s1"}, at(500));

    Subject trimmed = viewing.content.subjects[0];
    trimmed.notes.pop_back();
    const AppState after = reduce(viewing, actions::UpdateSubject{trimmed}, at(600));
    CHECK(std::holds_alternative<SubjectsList>(after.ui.navigation));

    Subject renamed = viewing.content.subjects[0];
    renamed.name = "Mathematics";
    const AppState kept = reduce(viewing, actions::UpdateSubject{renamed}, at(600));
    REQUIRE(std::holds_alternative<NoteDetail>(kept.ui.navigation));
    CHECK(std::get<NoteDetail>(kept.ui.navigation).noteIndex == 1);
}

TEST_CASE("Reducers: updating a note stamps its modification time")
{
    const AppState state = sampleState();
    Note edited = firstNote(state);
    edited.title = "Linear Algebra";

    const AppState after = reduce(state, actions::UpdateNote{edited, "s1"}, at(700));
    CHECK(firstNote(after).title == "Linear Algebra");
    CHECK(firstNote(after).lastModified == at(700));
}

TEST_CASE("Reducers: deleting a page renumbers and clamps the selection")
{
    AppState state = sampleState();
    state.content.subjects[0].notes[0] = test::note("n1", "Algebra", 3);
    state.ui.selection.selectedPageIndex = 2;
    state.ui.selection.selectedPageId = "n1-p3";

    const AppState after = reduce(state, actions::DeletePage{"n1-p3", "n1", "s1"}, at(500));
    CHECK(pageIds(firstNote(after)) == std::vector<PageId>{"n1-p1", "n1-p2"});
    CHECK(pageNumbers(firstNote(after)) == std::vector<int>{1, 2});
    CHECK(after.ui.selection.selectedPageIndex == 1);
    CHECK(after.ui.selection.selectedPageId == PageId("n1-p2"));
}

TEST_CASE("Reducers: deleting the only page clears it in place")
{
    AppState state = sampleState();
    Note single = test::note("n1", "Algebra", 1);
    single.pages[0].drawingData = {9, 9, 9};
    single.pages[0].pageTemplate = CanvasTemplate::dotted();
    state.content.subjects[0].notes[0] = single;

    const AppState after = reduce(state, actions::DeletePage{"n1-p1", "n1", "s1"}, at(500));
    const Note& note = firstNote(after);
    REQUIRE(note.pages.size() == 1);
    CHECK(note.pages[0].id == "n1-p1");
    CHECK(note.pages[0].drawingData.empty());
    CHECK(note.pages[0].pageNumber == 1);
    CHECK(note.pages[0].pageTemplate == CanvasTemplate::dotted());
}

TEST_CASE("Reducers: adding a page to the selected note selects it")
{
    const AppState after = reduce(sampleState(), actions::AddPage{test::page("new", 3), "n1", "s1"}, at(500));
    CHECK(after.ui.selection.selectedPageIndex == 2);
    CHECK(after.ui.selection.selectedPageId == PageId("new"));
}

TEST_CASE("Reducers: selecting pages is validated against the selection")
{
    const AppState state = sampleState();

    const AppState after = reduce(state, actions::SelectPage{1, std::nullopt}, at(500));
    CHECK(after.ui.selection.selectedPageIndex == 1);
    CHECK(after.ui.selection.selectedPageId == PageId("n1-p2"));

    CHECK_FALSE(applyAction(state, actions::SelectPage{2, std::nullopt}, at(500)));

    AppState noNote = state;
    noNote.ui.selection.clearNote();
    CHECK_FALSE(applyAction(noNote, actions::SelectPage{0, std::nullopt}, at(500)));
}

TEST_CASE("Reducers: selecting a note of a missing subject is a no-op")
{
    CHECK_FALSE(applyAction(sampleState(), actions::SelectNote{NoteId("n1"), SubjectId("nope")}, at(500)));
}

TEST_CASE("Reducers: selecting a subject clears the note selection")
{
    const AppState after = reduce(sampleState(), actions::SelectSubject{SubjectId("s2")}, at(500));
    CHECK(after.ui.selection.selectedSubjectId == SubjectId("s2"));
    CHECK(after.ui.selection.selectedSubjectIndex == 1);
    CHECK_FALSE(after.ui.selection.selectedNoteId);
}

TEST_CASE("Reducers: loading subjects replaces content and resets selection")
{
    AppState state = sampleState();
    state.ui.navigation = NoteDetail{1, "s1"};
    std::vector<Subject> loaded = {test::subject("x", "Loaded"), test::subject("y", "Other")};

    const AppState after = reduce(state, actions::LoadSubjects{loaded}, at(500));
    CHECK(after.content.subjects.size() == 2);
    CHECK(after.ui.selection.selectedSubjectId == SubjectId("x"));
    CHECK_FALSE(after.ui.selection.selectedNoteId);
    CHECK(std::holds_alternative<SubjectsList>(after.ui.navigation));
}

TEST_CASE("Reducers: templates apply to notes, pages and the default")
{
    const AppState state = sampleState();

    const AppState noteT = reduce(state, actions::SetNoteTemplate{CanvasTemplate::graph(), "n1", "s1"}, at(500));
    CHECK(firstNote(noteT).noteTemplate == CanvasTemplate::graph());

    const AppState pageT = reduce(state, actions::SetPageTemplate{CanvasTemplate::lined(), "n1-p2", "n1", "s1"}, at(500));
    CHECK(firstNote(pageT).pages[1].pageTemplate == CanvasTemplate::lined());
    CHECK_FALSE(firstNote(pageT).pages[0].pageTemplate);

    const AppState def = reduce(state, actions::SetDefaultTemplate{CanvasTemplate::dotted()}, at(500));
    CHECK(def.settings.defaultTemplate == CanvasTemplate::dotted());
    CHECK(def.content.subjects[0].lastModified == at(100));
}

TEST_CASE("Reducers: navigation actions only touch UI state")
{
    const AppState state = sampleState();

    const AppState detail = reduce(state, actions::NavigateToNote{1, "s1"}, at(500));
    REQUIRE(std::holds_alternative<NoteDetail>(detail.ui.navigation));
    CHECK(std::get<NoteDetail>(detail.ui.navigation).noteIndex == 1);

    const AppState back = reduce(detail, actions::NavigateToSubjectsList{}, at(500));
    CHECK(std::holds_alternative<SubjectsList>(back.ui.navigation));

    const AppState hidden = reduce(state, actions::UpdateSubjectSidebarVisibility{false}, at(500));
    CHECK_FALSE(hidden.ui.isSubjectSidebarVisible);
    const AppState grid = reduce(state, actions::UpdateCoordinateGridVisibility{true}, at(500));
    CHECK(grid.ui.isCoordinateGridVisible);
    CHECK(grid.settings == state.settings);
    CHECK(grid.content.subjects[0].lastModified == at(100));
}

TEST_CASE("Reducers: settings actions update settings and UI")
{
    AppState state = sampleState();
    state = reduce(state, actions::UpdateFingerDrawingSetting{true}, at(500));
    state = reduce(state, actions::UpdateAutoScrollSetting{false}, at(500));
    state = reduce(state, actions::UpdateDebugModeSetting{true}, at(500));
    state = reduce(state, actions::UpdateSearchText{"alg"}, at(500));
    state = reduce(state, actions::UpdateDefaultViewMode{ViewMode::List}, at(500));
    state = reduce(state, actions::UpdateDefaultSort{SortOption::Title, SortOrder::Ascending}, at(500));

    CHECK(state.settings.disableFingerDrawing);
    CHECK_FALSE(state.settings.autoScrollEnabled);
    CHECK(state.ui.isDebugMode);
    CHECK(state.ui.searchText == "alg");
    CHECK(state.settings.defaultViewMode == ViewMode::List);
    CHECK(state.settings.defaultSortOption == SortOption::Title);
    CHECK(state.settings.defaultSortOrder == SortOrder::Ascending);
}

TEST_CASE("Actions: descriptions and categories")
{
    CHECK(describe(actions::AddSubject{test::subject("s", "Math")}) == "Add subject: Math");
    CHECK(categoryOf(actions::ReorderPages{}) == ActionCategory::Page);
    CHECK(categoryOf(actions::SetDefaultTemplate{}) == ActionCategory::Template);
    CHECK(categoryOf(actions::UpdateSearchText{}) == ActionCategory::Settings);
    CHECK(std::string(actionCategoryName(ActionCategory::Navigation)) == "Navigation");
}
