#pragma once

#include "actions.h"
#include "app_state.h"

namespace sn {

// Hook into Store::dispatch. Hooks run in registration order and must not
// call dispatch themselves.
class Middleware {
public:
    virtual ~Middleware() = default;

    // Called before the reducer with the state the action will be applied to.
    virtual void beforeReduce(const Action& action, const AppState& current) {
        (void)action;
        (void)current;
    }

    // Called after the new state has been committed. `previous` and `next`
    // are the same object when the action changed nothing.
    virtual void afterReduce(const Action& action, const AppState& previous, const AppState& next) = 0;
};

} // namespace sn
