#include "sn/store.h"

#include <algorithm>

#include <QString>

#include "sn/logging.h"
#include "sn/reducers.h"

namespace sn {

namespace {

// Resets a flag on scope exit, including when a hook throws.
class FlagGuard {
public:
    explicit FlagGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~FlagGuard() { flag_ = false; }

    FlagGuard(const FlagGuard&) = delete;
    FlagGuard& operator=(const FlagGuard&) = delete;

private:
    bool& flag_;
};

} // namespace

Store::Store(EventBus& bus, AppState initial)
    : bus_(bus)
    , current_(std::make_shared<const AppState>(std::move(initial)))
    , clock_([] { return std::chrono::system_clock::now(); }) {
}

void Store::setClock(Clock clock) {
    clock_ = clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); });
}

void Store::registerMiddleware(Middleware* middleware) {
    if (!middleware) {
        return;
    }
    if (std::find(middleware_.begin(), middleware_.end(), middleware) == middleware_.end()) {
        middleware_.push_back(middleware);
    }
}

void Store::removeMiddleware(Middleware* middleware) {
    middleware_.erase(std::remove(middleware_.begin(), middleware_.end(), middleware), middleware_.end());
}

void Store::dispatch(const Action& action) {
    if (reducing_) {
        qCCritical(lcStore) << "dispatch() re-entered from a middleware hook or reducer; deferring"
                            << QString::fromStdString(describe(action));
#ifdef SN_STRICT_DISPATCH
        Q_ASSERT_X(false, "Store::dispatch", "re-entrant dispatch");
#endif
        pending_.push_back(action);
        return;
    }

    // Actions dispatched while a queue is being drained (deferred ones, or
    // ones from StateChanged observers) run after it, in FIFO order.
    pending_.push_back(action);
    if (draining_) {
        return;
    }

    FlagGuard draining(draining_);
    while (!pending_.empty()) {
        Action next = std::move(pending_.front());
        pending_.pop_front();
        process(next);
    }
}

void Store::process(const Action& action) {
    std::shared_ptr<const AppState> previous = current_;
    const std::string description = describe(action);
    bool changed = false;

    if (debug_logging_) {
        qCInfo(lcStore) << "Action:" << QString::fromStdString(description);
    }

    {
        FlagGuard reducing(reducing_);
        // Copy so that a hook may register or remove middleware.
        const auto chain = middleware_;

        for (Middleware* m : chain) {
            m->beforeReduce(action, *previous);
        }

        auto next = applyAction(*previous, action, clock_());
        if (next) {
            current_ = std::make_shared<const AppState>(std::move(*next));
            changed = true;
        }

        for (Middleware* m : chain) {
            m->afterReduce(action, *previous, *current_);
        }
    }

    if (!changed && debug_logging_) {
        qCDebug(lcStore) << "no change for" << QString::fromStdString(description);
        bus_.publish(events::ActionIgnored{description});
    }

    bus_.publish(events::StateChanged{previous, current_, categoryOf(action), description});
}

bool createNewNote(Store& store, const std::string& title) {
    const AppState& state = store.state();
    const auto& subjectId = state.ui.selection.selectedSubjectId;
    if (!subjectId) {
        return false;
    }
    Note note = createNote(title, state.settings.defaultTemplate);
    store.dispatch(actions::AddNote{std::move(note), *subjectId});
    return true;
}

} // namespace sn
