#pragma once

#include "stagehand/store/Store.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stagehand::usecase {

struct DiffInput {
    // Restrict the diff to one item.
    std::optional<std::string> name;
};

enum class DiffEntryType {
    Normal,
    Create,
    // The staged change went stale against the remote state and was unstaged.
    AutoUnstaged,
    Warning,
};

struct DiffEntry {
    std::string name;
    DiffEntryType type{DiffEntryType::Normal};
    std::optional<staging::Operation> operation;
    std::string remoteValue;
    std::string remoteIdentifier;
    std::string stagedValue;
    std::optional<std::string> description;
    std::string warning;
};

struct DiffTagEntry {
    std::string name;
    staging::TagMap add;
    staging::KeySet remove;
};

struct DiffOutput {
    std::string itemName;
    std::vector<DiffEntry> entries;
    std::vector<DiffTagEntry> tagEntries;
};

class DiffUseCase {
public:
    DiffUseCase(strategy::DiffStrategy &strategy, store::ReadWriter &store);

    DiffOutput execute(const core::Context &ctx, const DiffInput &input);

private:
    DiffEntry compare(const core::Context &ctx, const std::string &name, const staging::Entry &entry);
    DiffEntry autoUnstage(const core::Context &ctx, const std::string &name, const staging::Entry &entry,
                          const std::string &reason);

    strategy::DiffStrategy &strategy_;
    store::ReadWriter &store_;
};

[[nodiscard]] std::string_view toString(DiffEntryType type) noexcept;

} // namespace stagehand::usecase
