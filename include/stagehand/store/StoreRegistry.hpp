#pragma once

#include "stagehand/core/Scope.hpp"
#include "stagehand/store/ResidentStore.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace stagehand::store {

// Hands out one resident store per identity scope, creating it on first use.
class StoreRegistry {
public:
    std::shared_ptr<ResidentStore> acquire(const core::Scope &scope);

    [[nodiscard]] bool contains(const core::Scope &scope) const;
    [[nodiscard]] std::size_t size() const;

    // Forgets the store for a scope; holders of the handle keep their copy alive.
    void release(const core::Scope &scope);

private:
    mutable std::mutex mutex_;
    std::map<core::Scope, std::shared_ptr<ResidentStore>> stores_;
};

} // namespace stagehand::store
