#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "sn/events.h"
#include "sn/logging_middleware.h"
#include "sn/store.h"
#include "sn/subscription_manager.h"
#include "test_support.h"

using namespace sn;
using sn::test::at;

namespace {

class RecordingMiddleware : public Middleware {
public:
    RecordingMiddleware(std::string name, std::vector<std::string>& log)
        : name_(std::move(name)), log_(log) {}

    void beforeReduce(const Action& action, const AppState& current) override {
        log_.push_back(name_ + ".before " + describe(action) + " subjects=" + std::to_string(current.content.subjects.size()));
    }

    void afterReduce(const Action& action, const AppState& previous, const AppState& next) override {
        (void)action;
        log_.push_back(name_ + ".after " + std::to_string(previous.content.subjects.size()) + "->"
                       + std::to_string(next.content.subjects.size()));
    }

private:
    std::string name_;
    std::vector<std::string>& log_;
};

// Dispatches a follow-up action from its after-hook, once.
class ChainingMiddleware : public Middleware {
public:
    explicit ChainingMiddleware(Store& store) : store_(store) {}

    void afterReduce(const Action& action, const AppState&, const AppState&) override {
        if (!fired_ && std::holds_alternative<actions::AddSubject>(action)) {
            fired_ = true;
            store_.dispatch(actions::UpdateSearchText{"follow-up"});
        }
    }

private:
    Store& store_;
    bool fired_ = false;
};

} // namespace

TEST_CASE("Store: dispatch publishes the new state")
{
    EventBus bus;
    Store store(bus);
    store.setClock([] { return at(42); });

    std::vector<events::StateChanged> seen;
    SubscriptionManager subs(bus);
    subs.subscribe<events::StateChanged>([&seen](const events::StateChanged& e) { seen.push_back(e); });

    store.dispatch(actions::AddSubject{test::subject("s1", "Math")});

    REQUIRE(seen.size() == 1);
    CHECK(seen[0].previous->content.subjects.empty());
    CHECK(seen[0].current->content.subjects.size() == 1);
    CHECK(seen[0].current == store.snapshot());
    CHECK(seen[0].category == ActionCategory::Subject);
    CHECK(seen[0].actionDescription == "Add subject: Math");
    CHECK(store.state().content.subjects[0].lastModified == at(42));
}

TEST_CASE("Store: middleware hooks run in registration order around the reducer")
{
    EventBus bus;
    Store store(bus);
    std::vector<std::string> log;
    RecordingMiddleware first("first", log);
    RecordingMiddleware second("second", log);
    store.registerMiddleware(&first);
    store.registerMiddleware(&second);
    store.registerMiddleware(&first);

    store.dispatch(actions::AddSubject{test::subject("s1", "Math")});

    CHECK(log == std::vector<std::string>{
        "first.before Add subject: Math subjects=0",
        "second.before Add subject: Math subjects=0",
        "first.after 0->1",
        "second.after 0->1",
    });

    log.clear();
    store.removeMiddleware(&first);
    store.dispatch(actions::AddSubject{test::subject("s2", "Art")});
    CHECK(log.size() == 2);
}

TEST_CASE("Store: inapplicable actions keep the same state object")
{
    EventBus bus;
    Store store(bus);
    auto before = store.snapshot();

    std::shared_ptr<const AppState> previous;
    std::shared_ptr<const AppState> current;
    int ignored = 0;
    SubscriptionManager subs(bus);
    subs.subscribe<events::StateChanged>([&](const events::StateChanged& e) {
        previous = e.previous;
        current = e.current;
    });
    subs.subscribe<events::ActionIgnored>([&ignored](const events::ActionIgnored&) { ++ignored; });

    store.dispatch(actions::DeleteSubject{"missing"});
    CHECK(store.snapshot() == before);
    CHECK(previous == current);
    CHECK(ignored == 0);

    store.setDebugLogging(true);
    store.dispatch(actions::DeleteSubject{"missing"});
    CHECK(ignored == 1);
}

TEST_CASE("Store: select re-evaluates on every access")
{
    EventBus bus;
    Store store(bus);

    auto search = store.select([](const AppState& s) -> const std::string& { return s.ui.searchText; });
    auto settings = store.select(&AppState::settings);

    CHECK(search.get().empty());
    store.dispatch(actions::UpdateSearchText{"algebra"});
    CHECK(*search == "algebra");

    store.dispatch(actions::UpdateDefaultViewMode{ViewMode::List});
    CHECK(settings->defaultViewMode == ViewMode::List);
}

TEST_CASE("Store: dispatch from a middleware hook is deferred until the outer dispatch ends")
{
    EventBus bus;
    Store store(bus);
    ChainingMiddleware chaining(store);
    store.registerMiddleware(&chaining);

    std::vector<std::string> order;
    SubscriptionManager subs(bus);
    subs.subscribe<events::StateChanged>([&order](const events::StateChanged& e) { order.push_back(e.actionDescription); });

    store.dispatch(actions::AddSubject{test::subject("s1", "Math")});

    CHECK(order == std::vector<std::string>{"Add subject: Math", "Update search text to: follow-up"});
    CHECK(store.state().ui.searchText == "follow-up");
    CHECK(store.state().content.subjects.size() == 1);
}

TEST_CASE("Store: observers of StateChanged may dispatch")
{
    EventBus bus;
    Store store(bus);
    std::vector<std::string> order;

    SubscriptionManager subs(bus);
    subs.subscribe<events::StateChanged>([&](const events::StateChanged& e) {
        order.push_back(e.actionDescription);
        if (e.category == ActionCategory::Subject) {
            store.dispatch(actions::NavigateToSubjectsList{});
        }
    });

    store.dispatch(actions::AddSubject{test::subject("s1", "Math")});
    CHECK(order == std::vector<std::string>{"Add subject: Math", "Navigate to subjects list"});
}

TEST_CASE("Store: createNewNote adds a note to the selected subject")
{
    EventBus bus;
    AppState initial;
    initial.settings.defaultTemplate = CanvasTemplate::lined();
    Store store(bus, initial);

    CHECK_FALSE(createNewNote(store, "Nothing selected"));

    store.dispatch(actions::AddSubject{test::subject("s1", "Math")});
    REQUIRE(createNewNote(store, "Algebra"));

    const Subject& subject = store.state().content.subjects[0];
    REQUIRE(subject.notes.size() == 1);
    CHECK(subject.notes[0].title == "Algebra");
    CHECK(subject.notes[0].noteTemplate == CanvasTemplate::lined());
    REQUIRE(subject.notes[0].pages.size() == 1);
    CHECK(store.state().ui.selection.selectedNoteId == subject.notes[0].id);
}

TEST_CASE("LoggingMiddleware: keeps a bounded history of action descriptions")
{
    EventBus bus;
    Store store(bus);
    LoggingMiddleware logging;
    logging.setHistoryLimit(2);
    store.registerMiddleware(&logging);

    store.dispatch(actions::UpdateSearchText{"a"});
    store.dispatch(actions::UpdateSearchText{"b"});
    store.dispatch(actions::UpdateSearchText{"c"});

    CHECK(logging.history() == std::vector<std::string>{"Update search text to: b", "Update search text to: c"});
}
