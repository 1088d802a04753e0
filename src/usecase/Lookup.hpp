#pragma once

#include "stagehand/core/Error.hpp"
#include "stagehand/store/Store.hpp"

#include <optional>
#include <string>

namespace stagehand::usecase::detail {

// Store lookups that treat NotStaged as absence.

inline std::optional<staging::Entry> findEntry(const store::Reader &store, const core::Context &ctx,
                                               staging::Service service, const std::string &name) {
    try {
        return store.getEntry(ctx, service, name);
    } catch (const core::StagingError &error) {
        if (error.kind() != core::ErrorKind::NotStaged) {
            throw;
        }
    }
    return std::nullopt;
}

inline std::optional<staging::TagEntry> findTag(const store::Reader &store, const core::Context &ctx,
                                                staging::Service service, const std::string &name) {
    try {
        return store.getTag(ctx, service, name);
    } catch (const core::StagingError &error) {
        if (error.kind() != core::ErrorKind::NotStaged) {
            throw;
        }
    }
    return std::nullopt;
}

} // namespace stagehand::usecase::detail
