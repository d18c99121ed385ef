#pragma once

#include <cstdint>
#include <memory>
#include <typeindex>
#include <unordered_map>

namespace sn {

// Stable reference to an object owned by a HandleRegistry. Events carry
// these instead of pointers to foreign objects.
struct OpaqueHandle {
    std::uint64_t value = 0;

    [[nodiscard]] bool isValid() const { return value != 0; }
    bool operator==(const OpaqueHandle& other) const { return value == other.value; }
    bool operator!=(const OpaqueHandle& other) const { return value != other.value; }
};

// Side table mapping issued handles to the objects they stand for.
class HandleRegistry {
public:
    template <typename T>
    OpaqueHandle issue(std::shared_ptr<T> object) {
        return issueErased(std::static_pointer_cast<void>(std::move(object)), std::type_index(typeid(T)));
    }

    // Null when the handle is unknown, released, or registered as another type.
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> resolve(OpaqueHandle handle) const {
        auto it = entries_.find(handle.value);
        if (it == entries_.end() || it->second.type != std::type_index(typeid(T))) {
            return nullptr;
        }
        return std::static_pointer_cast<T>(it->second.object);
    }

    bool release(OpaqueHandle handle);
    [[nodiscard]] bool contains(OpaqueHandle handle) const;
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    struct Entry {
        std::shared_ptr<void> object;
        std::type_index type;
    };

    OpaqueHandle issueErased(std::shared_ptr<void> object, std::type_index type);

    std::unordered_map<std::uint64_t, Entry> entries_;
    std::uint64_t next_value_ = 1;
};

} // namespace sn
