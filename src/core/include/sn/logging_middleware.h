#pragma once

#include <string>
#include <vector>

#include "interfaces.h"

namespace sn {

// Logs every dispatched action through sn.core.store. Register it first so
// the log line precedes side effects of later middleware.
class LoggingMiddleware : public Middleware {
public:
    void beforeReduce(const Action& action, const AppState& current) override;
    void afterReduce(const Action& action, const AppState& previous, const AppState& next) override;

    // Descriptions of every action seen, oldest first.
    [[nodiscard]] const std::vector<std::string>& history() const { return history_; }
    void setHistoryLimit(size_t limit);

private:
    std::vector<std::string> history_;
    size_t history_limit_ = 100;
};

} // namespace sn
