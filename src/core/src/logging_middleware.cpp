#include "sn/logging_middleware.h"

#include <QString>

#include "sn/logging.h"

namespace sn {

void LoggingMiddleware::beforeReduce(const Action& action, const AppState& current) {
    (void)current;
    std::string description = describe(action);
    qCInfo(lcStore) << "dispatch" << actionCategoryName(categoryOf(action))
                    << QString::fromStdString(description);

    history_.push_back(std::move(description));
    if (history_.size() > history_limit_) {
        history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(history_.size() - history_limit_));
    }
}

void LoggingMiddleware::afterReduce(const Action& action, const AppState& previous, const AppState& next) {
    if (&previous == &next) {
        qCDebug(lcStore) << "unchanged after" << QString::fromStdString(describe(action));
    }
}

void LoggingMiddleware::setHistoryLimit(size_t limit) {
    history_limit_ = limit;
    if (history_.size() > history_limit_) {
        history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(history_.size() - history_limit_));
    }
}

} // namespace sn
