#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "actions.h"
#include "app_state.h"
#include "event_bus.h"
#include "events.h"
#include "interfaces.h"

namespace sn {

class Store;

// Read-only projection into the store's current state. Evaluated on every
// access, so it always reflects the latest dispatch. The reference returned
// by get() is valid until the next dispatch.
template <typename T>
class StateView {
public:
    using Projection = std::function<const T&(const AppState&)>;

    StateView(const Store& store, Projection projection)
        : store_(&store), projection_(std::move(projection)) {}

    [[nodiscard]] const T& get() const;
    const T& operator*() const { return get(); }
    const T* operator->() const { return &get(); }

private:
    const Store* store_;
    Projection projection_;
};

// Owns the application state. State changes only through dispatch(), which
// runs middleware, the reducer pipeline and then publishes StateChanged.
class Store {
public:
    using Clock = std::function<Timestamp()>;

    explicit Store(EventBus& bus, AppState initial = {});

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    void dispatch(const Action& action);

    [[nodiscard]] const AppState& state() const { return *current_; }
    [[nodiscard]] std::shared_ptr<const AppState> snapshot() const { return current_; }

    // e.g. store.select([](const AppState& s) -> const UIState& { return s.ui; })
    template <typename F>
    [[nodiscard]] auto select(F projection) const
        -> StateView<std::decay_t<std::invoke_result_t<F, const AppState&>>> {
        using T = std::decay_t<std::invoke_result_t<F, const AppState&>>;
        static_assert(std::is_reference_v<std::invoke_result_t<F, const AppState&>>,
                      "select() projections must return a reference into the state");
        return StateView<T>(*this, std::move(projection));
    }

    template <typename T>
    [[nodiscard]] StateView<T> select(T AppState::*member) const {
        return StateView<T>(*this, [member](const AppState& s) -> const T& { return s.*member; });
    }

    // Non-owning; the middleware must outlive its registration.
    void registerMiddleware(Middleware* middleware);
    void removeMiddleware(Middleware* middleware);

    void setDebugLogging(bool enabled) { debug_logging_ = enabled; }
    [[nodiscard]] bool debugLogging() const { return debug_logging_; }

    void setClock(Clock clock);

    [[nodiscard]] EventBus& bus() const { return bus_; }

private:
    void process(const Action& action);

    EventBus& bus_;
    std::shared_ptr<const AppState> current_;
    std::vector<Middleware*> middleware_;
    Clock clock_;
    bool debug_logging_ = false;

    std::deque<Action> pending_;
    bool reducing_ = false;
    bool draining_ = false;
};

template <typename T>
const T& StateView<T>::get() const {
    return projection_(store_->state());
}

// Creates a note with the default template in the selected subject.
// Returns false when no subject is selected.
bool createNewNote(Store& store, const std::string& title);

} // namespace sn
