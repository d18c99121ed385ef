#pragma once

#include <functional>
#include <vector>

#include "event_bus.h"

namespace sn {

// Owns the subscriptions of one observer (typically a view) and cancels
// them together when that observer goes away.
class SubscriptionManager {
public:
    explicit SubscriptionManager(EventBus& bus);
    ~SubscriptionManager();

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    template <typename E>
    void subscribe(std::function<void(const E&)> callback) {
        handles_.push_back(bus_.subscribe<E>(std::move(callback)));
    }

    // Takes over a handle obtained elsewhere.
    void store(SubscriptionHandle handle);

    // Cancels every retained handle, then forgets them.
    void clearAll();

    [[nodiscard]] size_t size() const { return handles_.size(); }
    [[nodiscard]] bool empty() const { return handles_.empty(); }

private:
    EventBus& bus_;
    std::vector<SubscriptionHandle> handles_;
};

} // namespace sn
