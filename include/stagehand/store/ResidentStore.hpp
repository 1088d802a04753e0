#pragma once

#include "stagehand/core/Scope.hpp"
#include "stagehand/store/Store.hpp"

#include <mutex>

namespace stagehand::store {

// In-memory staging store for one identity scope. Lives as long as the owning session
// and never touches the disk.
class ResidentStore final : public ReadWriter, public StateStore {
public:
    explicit ResidentStore(core::Scope scope);

    [[nodiscard]] const core::Scope &scope() const noexcept { return scope_; }

    staging::Entry getEntry(const core::Context &ctx, staging::Service service,
                            const std::string &name) const override;
    staging::TagEntry getTag(const core::Context &ctx, staging::Service service,
                             const std::string &name) const override;
    staging::EntryMap listEntries(const core::Context &ctx, staging::Service service) const override;
    staging::TagEntryMap listTags(const core::Context &ctx, staging::Service service) const override;

    void stageEntry(const core::Context &ctx, staging::Service service, const std::string &name,
                    const staging::Entry &entry) override;
    void stageTag(const core::Context &ctx, staging::Service service, const std::string &name,
                  const staging::TagEntry &tagEntry) override;
    void unstageEntry(const core::Context &ctx, staging::Service service, const std::string &name) override;
    void unstageTag(const core::Context &ctx, staging::Service service, const std::string &name) override;
    bool unstageAll(const core::Context &ctx, staging::Service service) override;

    staging::State drain(const core::Context &ctx, bool keep) override;
    void writeState(const core::Context &ctx, const staging::State &state) override;

private:
    core::Scope scope_;
    mutable std::mutex mutex_;
    staging::State state_;
};

} // namespace stagehand::store
