#include "sn/subscription_manager.h"

namespace sn {

SubscriptionManager::SubscriptionManager(EventBus& bus)
    : bus_(bus) {
}

SubscriptionManager::~SubscriptionManager() {
    clearAll();
}

void SubscriptionManager::store(SubscriptionHandle handle) {
    handles_.push_back(std::move(handle));
}

void SubscriptionManager::clearAll() {
    // Swap out first: a cancelled callback may be running and call back in.
    std::vector<SubscriptionHandle> handles;
    handles.swap(handles_);
    for (auto& handle : handles) {
        handle.cancel();
    }
}

} // namespace sn
