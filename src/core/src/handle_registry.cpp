#include "sn/handle_registry.h"

namespace sn {

OpaqueHandle HandleRegistry::issueErased(std::shared_ptr<void> object, std::type_index type) {
    OpaqueHandle handle{next_value_++};
    entries_.emplace(handle.value, Entry{std::move(object), type});
    return handle;
}

bool HandleRegistry::release(OpaqueHandle handle) {
    return entries_.erase(handle.value) > 0;
}

bool HandleRegistry::contains(OpaqueHandle handle) const {
    return entries_.find(handle.value) != entries_.end();
}

} // namespace sn
