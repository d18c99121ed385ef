#include "sn/event_bus.h"

#include <algorithm>

namespace sn {

namespace detail {

std::shared_ptr<SubscriptionSlot> SubscriptionRegistry::add(std::type_index type, const char* name,
                                                            std::function<void(const void*)> callback) {
    auto slot = std::make_shared<SubscriptionSlot>(next_id_++, type, std::move(callback));
    auto& channel = channels_[type];
    if (channel.name.empty()) {
        channel.name = name;
    }
    channel.slots.push_back(slot);
    return slot;
}

void SubscriptionRegistry::remove(const SubscriptionSlot& slot) {
    auto it = channels_.find(slot.type);
    if (it == channels_.end()) {
        return;
    }
    auto& slots = it->second.slots;
    slots.erase(std::remove_if(slots.begin(), slots.end(),
        [&slot](const std::shared_ptr<SubscriptionSlot>& s) { return s->id == slot.id; }),
        slots.end());
    if (slots.empty()) {
        channels_.erase(it);
    }
}

std::vector<std::shared_ptr<SubscriptionSlot>> SubscriptionRegistry::snapshot(std::type_index type) const {
    auto it = channels_.find(type);
    if (it == channels_.end()) {
        return {};
    }
    return it->second.slots;
}

std::set<std::string> SubscriptionRegistry::activeTypeNames() const {
    std::set<std::string> names;
    for (const auto& [type, channel] : channels_) {
        if (!channel.slots.empty()) {
            names.insert(channel.name);
        }
    }
    return names;
}

size_t SubscriptionRegistry::count(std::type_index type) const {
    auto it = channels_.find(type);
    return it == channels_.end() ? 0 : it->second.slots.size();
}

void SubscriptionRegistry::clear() {
    // Deactivate first so a publish already iterating a snapshot stops
    // delivering to them.
    for (auto& [type, channel] : channels_) {
        for (auto& slot : channel.slots) {
            slot->active = false;
        }
    }
    channels_.clear();
}

} // namespace detail

SubscriptionHandle::SubscriptionHandle(std::weak_ptr<detail::SubscriptionRegistry> registry,
                                       std::shared_ptr<detail::SubscriptionSlot> slot)
    : registry_(std::move(registry))
    , slot_(std::move(slot)) {
}

void SubscriptionHandle::cancel() {
    if (!slot_ || !slot_->active) {
        return;
    }
    slot_->active = false;
    if (auto registry = registry_.lock()) {
        registry->remove(*slot_);
    }
}

bool SubscriptionHandle::isActive() const {
    return slot_ && slot_->active;
}

std::uint64_t SubscriptionHandle::id() const {
    return slot_ ? slot_->id : 0;
}

EventBus::EventBus()
    : registry_(std::make_shared<detail::SubscriptionRegistry>()) {
}

EventBus::~EventBus() {
    registry_->clear();
}

void EventBus::unsubscribe(SubscriptionHandle& handle) {
    handle.cancel();
}

std::set<std::string> EventBus::listActiveEventTypes() const {
    return registry_->activeTypeNames();
}

void EventBus::clearAllSubscriptions() {
    qCDebug(lcBus) << "clearing all subscriptions";
    registry_->clear();
}

} // namespace sn
