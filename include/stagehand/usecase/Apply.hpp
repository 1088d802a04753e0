#pragma once

#include "stagehand/core/Error.hpp"
#include "stagehand/store/Store.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stagehand::usecase {

struct ApplyInput {
    // Apply only this item.
    std::optional<std::string> name;
    // Apply conflicting items as well.
    bool ignoreConflicts{false};
};

struct ApplyFailure {
    core::ErrorKind kind{core::ErrorKind::RemoteOperationFailed};
    std::string message;
};

struct ApplyEntryResult {
    std::string name;
    strategy::ApplyStatus status{strategy::ApplyStatus::Failed};
    std::optional<ApplyFailure> error;
};

struct ApplyTagResult {
    std::string name;
    staging::TagMap add;
    staging::KeySet remove;
    std::optional<ApplyFailure> error;
};

struct ApplyOutput {
    std::string serviceName;
    std::string itemName;

    std::vector<ApplyEntryResult> entryResults;
    int entrySucceeded{0};
    int entryFailed{0};

    std::vector<ApplyTagResult> tagResults;
    int tagSucceeded{0};
    int tagFailed{0};

    // Items left staged because the remote side changed underneath them.
    std::vector<std::string> conflicts;

    // The pass stopped early; unprocessed items remain staged.
    bool cancelled{false};

    [[nodiscard]] bool failed() const noexcept { return entryFailed > 0 || tagFailed > 0; }
};

class ApplyUseCase {
public:
    ApplyUseCase(strategy::ApplyStrategy &strategy, store::ReadWriter &store);

    // Pushes staged changes one item at a time in name order. Remote failures are recorded
    // per item and never abort the pass.
    ApplyOutput execute(const core::Context &ctx, const ApplyInput &input);

    // Names whose staged entry no longer matches the remote state.
    std::vector<std::string> checkConflicts(const core::Context &ctx, const staging::EntryMap &entries);

private:
    strategy::ApplyStrategy &strategy_;
    store::ReadWriter &store_;
};

} // namespace stagehand::usecase
