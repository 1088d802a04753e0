#include "stagehand/store/StoreRegistry.hpp"

namespace stagehand::store {

std::shared_ptr<ResidentStore> StoreRegistry::acquire(const core::Scope &scope) {
    std::lock_guard lock(mutex_);

    auto it = stores_.find(scope);
    if (it == stores_.end()) {
        it = stores_.emplace(scope, std::make_shared<ResidentStore>(scope)).first;
    }

    return it->second;
}

bool StoreRegistry::contains(const core::Scope &scope) const {
    std::lock_guard lock(mutex_);
    return stores_.find(scope) != stores_.end();
}

std::size_t StoreRegistry::size() const {
    std::lock_guard lock(mutex_);
    return stores_.size();
}

void StoreRegistry::release(const core::Scope &scope) {
    std::lock_guard lock(mutex_);
    stores_.erase(scope);
}

} // namespace stagehand::store
