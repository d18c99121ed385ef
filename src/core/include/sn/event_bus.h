#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "logging.h"

namespace sn {

// An event is any copyable value type that declares
//   static constexpr const char* kName;         // stable, unique
//   static constexpr const char* kDescription;  // human readable
template <typename T, typename = void>
struct is_event : std::false_type {};

template <typename T>
struct is_event<T, std::void_t<decltype(T::kName), decltype(T::kDescription)>> : std::true_type {};

namespace detail {

struct SubscriptionSlot {
    SubscriptionSlot(std::uint64_t id, std::type_index type, std::function<void(const void*)> callback)
        : id(id), type(type), callback(std::move(callback)) {}

    std::uint64_t id;
    std::type_index type;
    std::function<void(const void*)> callback;
    bool active = true;
};

// Type-indexed subscription table shared between a bus and its handles.
class SubscriptionRegistry {
public:
    std::shared_ptr<SubscriptionSlot> add(std::type_index type, const char* name,
                                          std::function<void(const void*)> callback);
    void remove(const SubscriptionSlot& slot);
    [[nodiscard]] std::vector<std::shared_ptr<SubscriptionSlot>> snapshot(std::type_index type) const;
    [[nodiscard]] std::set<std::string> activeTypeNames() const;
    [[nodiscard]] size_t count(std::type_index type) const;
    void clear();

private:
    struct Channel {
        std::string name;
        std::vector<std::shared_ptr<SubscriptionSlot>> slots;
    };

    std::unordered_map<std::type_index, Channel> channels_;
    std::uint64_t next_id_ = 1;
};

} // namespace detail

// Token for one registration. Copies refer to the same registration;
// dropping a handle does not cancel it.
class SubscriptionHandle {
public:
    SubscriptionHandle() = default;

    // Idempotent. Safe from inside a callback of an in-flight publish and
    // after the bus is gone.
    void cancel();

    [[nodiscard]] bool isActive() const;
    [[nodiscard]] std::uint64_t id() const;

private:
    friend class EventBus;
    SubscriptionHandle(std::weak_ptr<detail::SubscriptionRegistry> registry,
                       std::shared_ptr<detail::SubscriptionSlot> slot);

    std::weak_ptr<detail::SubscriptionRegistry> registry_;
    std::shared_ptr<detail::SubscriptionSlot> slot_;
};

// Synchronous, single-threaded publish/subscribe keyed by event type.
// Callbacks run inline, in registration order. Publishing from a callback
// runs depth-first before the outer publish continues.
class EventBus {
public:
    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template <typename E>
    void publish(const E& event) {
        static_assert(is_event<E>::value, "publish() requires an event type with kName and kDescription");

        // Iterate a snapshot: callbacks may subscribe or cancel. A slot
        // cancelled before it is reached is skipped; one added during this
        // pass is not invoked until the next publish.
        auto slots = registry_->snapshot(std::type_index(typeid(E)));
        qCDebug(lcBus) << "publish" << E::kName << "to" << slots.size() << "subscribers";
        for (const auto& slot : slots) {
            if (slot->active) {
                slot->callback(&event);
            }
        }
    }

    template <typename E>
    [[nodiscard]] SubscriptionHandle subscribe(std::function<void(const E&)> callback) {
        static_assert(is_event<E>::value, "subscribe() requires an event type with kName and kDescription");

        auto slot = registry_->add(std::type_index(typeid(E)), E::kName,
            [callback = std::move(callback)](const void* event) {
                callback(*static_cast<const E*>(event));
            });
        return SubscriptionHandle(registry_, std::move(slot));
    }

    void unsubscribe(SubscriptionHandle& handle);

    template <typename E>
    [[nodiscard]] size_t subscriberCount() const {
        return registry_->count(std::type_index(typeid(E)));
    }

    // Names of event types with at least one live subscription.
    [[nodiscard]] std::set<std::string> listActiveEventTypes() const;

    // Test teardown and debug tooling only.
    void clearAllSubscriptions();

private:
    std::shared_ptr<detail::SubscriptionRegistry> registry_;
};

} // namespace sn
