#include "stagehand/store/ResidentStore.hpp"

#include "stagehand/core/Error.hpp"

namespace stagehand::store {

ResidentStore::ResidentStore(core::Scope scope) : scope_(std::move(scope)) {}

staging::Entry ResidentStore::getEntry(const core::Context &ctx, staging::Service service,
                                       const std::string &name) const {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    auto serviceIt = state_.entries.find(service);
    if (serviceIt != state_.entries.end()) {
        auto it = serviceIt->second.find(name);
        if (it != serviceIt->second.end()) {
            return it->second;
        }
    }
    throw core::notStaged(std::string(staging::itemName(service)), name);
}

staging::TagEntry ResidentStore::getTag(const core::Context &ctx, staging::Service service,
                                        const std::string &name) const {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    auto serviceIt = state_.tags.find(service);
    if (serviceIt != state_.tags.end()) {
        auto it = serviceIt->second.find(name);
        if (it != serviceIt->second.end()) {
            return it->second;
        }
    }
    throw core::notStaged(std::string(staging::itemName(service)), name);
}

staging::EntryMap ResidentStore::listEntries(const core::Context &ctx, staging::Service service) const {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    auto it = state_.entries.find(service);
    return it == state_.entries.end() ? staging::EntryMap{} : it->second;
}

staging::TagEntryMap ResidentStore::listTags(const core::Context &ctx, staging::Service service) const {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    auto it = state_.tags.find(service);
    return it == state_.tags.end() ? staging::TagEntryMap{} : it->second;
}

void ResidentStore::stageEntry(const core::Context &ctx, staging::Service service, const std::string &name,
                               const staging::Entry &entry) {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    auto stored = entry;
    if (stored.operation == staging::Operation::Delete) {
        stored.value.reset();
    } else if (!stored.value) {
        throw core::StagingError(core::ErrorKind::InvalidArgument,
                                 "a " + std::string(staging::toString(stored.operation)) +
                                     " entry must carry a value");
    }
    state_.entries[service][name] = std::move(stored);
}

void ResidentStore::stageTag(const core::Context &ctx, staging::Service service, const std::string &name,
                             const staging::TagEntry &tagEntry) {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    if (tagEntry.empty()) {
        auto serviceIt = state_.tags.find(service);
        if (serviceIt != state_.tags.end()) {
            serviceIt->second.erase(name);
        }
        return;
    }
    state_.tags[service][name] = tagEntry;
}

void ResidentStore::unstageEntry(const core::Context &ctx, staging::Service service, const std::string &name) {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    auto serviceIt = state_.entries.find(service);
    if (serviceIt != state_.entries.end()) {
        serviceIt->second.erase(name);
    }
}

void ResidentStore::unstageTag(const core::Context &ctx, staging::Service service, const std::string &name) {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    auto serviceIt = state_.tags.find(service);
    if (serviceIt != state_.tags.end()) {
        serviceIt->second.erase(name);
    }
}

bool ResidentStore::unstageAll(const core::Context &ctx, staging::Service service) {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    const bool hadItems = !state_.empty(service);
    state_.removeService(service);
    return hadItems;
}

staging::State ResidentStore::drain(const core::Context &ctx, bool keep) {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    auto snapshot = state_.extract(std::nullopt);
    if (!keep) {
        state_ = staging::State{};
    }
    return snapshot;
}

void ResidentStore::writeState(const core::Context &ctx, const staging::State &state) {
    ctx.throwIfCancelled();
    std::lock_guard lock(mutex_);

    state_ = state;
}

} // namespace stagehand::store
