#pragma once

#include "stagehand/core/Context.hpp"
#include "stagehand/staging/State.hpp"

#include <string>

namespace stagehand::store {

// Per-item read access. getEntry/getTag throw StagingError(NotStaged) for absent items;
// list results are ordered by name.
class Reader {
public:
    virtual ~Reader() = default;

    virtual staging::Entry getEntry(const core::Context &ctx, staging::Service service,
                                    const std::string &name) const = 0;
    virtual staging::TagEntry getTag(const core::Context &ctx, staging::Service service,
                                     const std::string &name) const = 0;
    virtual staging::EntryMap listEntries(const core::Context &ctx, staging::Service service) const = 0;
    virtual staging::TagEntryMap listTags(const core::Context &ctx, staging::Service service) const = 0;
};

// Per-item write access. Staging overwrites; unstaging an absent item is a no-op.
class Writer {
public:
    virtual ~Writer() = default;

    virtual void stageEntry(const core::Context &ctx, staging::Service service, const std::string &name,
                            const staging::Entry &entry) = 0;
    virtual void stageTag(const core::Context &ctx, staging::Service service, const std::string &name,
                          const staging::TagEntry &tagEntry) = 0;
    virtual void unstageEntry(const core::Context &ctx, staging::Service service, const std::string &name) = 0;
    virtual void unstageTag(const core::Context &ctx, staging::Service service, const std::string &name) = 0;

    // Clears one service and reports whether anything was staged there.
    virtual bool unstageAll(const core::Context &ctx, staging::Service service) = 0;
};

class ReadWriter : public Reader, public Writer {};

// Bulk transfer used by drain and persist.
class StateStore {
public:
    virtual ~StateStore() = default;

    // Returns the stored state; clears the source afterwards when keep is false.
    virtual staging::State drain(const core::Context &ctx, bool keep) = 0;

    // Replaces the stored state entirely.
    virtual void writeState(const core::Context &ctx, const staging::State &state) = 0;
};

} // namespace stagehand::store
