#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "cmdschema/registry/registry.hpp"

namespace cmdschema::registry {

// Holder for the live registry snapshot. Reloading swaps in a complete,
// already finalized registry; callers that obtained a snapshot earlier keep
// using it unchanged.
class RegistryHandle {
public:
    explicit RegistryHandle(std::shared_ptr<const Registry> initial);

    std::shared_ptr<const Registry> current() const;

    // Throws RegistryStateError if `next` is null or not finalized; the
    // current snapshot stays active in that case.
    void reload(std::shared_ptr<const Registry> next);

    std::uint64_t generation() const;

private:
    static void ensure_usable(const std::shared_ptr<const Registry>& registry);

    mutable std::mutex mutex_;
    std::shared_ptr<const Registry> current_;
    std::uint64_t generation_ = 0;
};

}  // namespace cmdschema::registry
