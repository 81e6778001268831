#include "cmdschema/registry/registry_handle.hpp"

namespace cmdschema::registry {

RegistryHandle::RegistryHandle(std::shared_ptr<const Registry> initial) {
    ensure_usable(initial);
    current_ = std::move(initial);
}

void RegistryHandle::ensure_usable(
    const std::shared_ptr<const Registry>& registry) {
    if (!registry) {
        throw errors::RegistryStateError("Registry snapshot is null");
    }
    if (!registry->is_finalized()) {
        throw errors::RegistryStateError(
            "Registry snapshot is " +
            registry_state_to_string(registry->state()) +
            ", only finalized registries can be served");
    }
}

std::shared_ptr<const Registry> RegistryHandle::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void RegistryHandle::reload(std::shared_ptr<const Registry> next) {
    ensure_usable(next);
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
    ++generation_;
}

std::uint64_t RegistryHandle::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

}  // namespace cmdschema::registry
