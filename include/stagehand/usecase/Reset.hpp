#pragma once

#include "stagehand/store/Store.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <cstddef>
#include <string>

namespace stagehand::usecase {

struct ResetInput {
    // Item name, optionally with a version spec to restore that version.
    std::string spec;
    // Reset every staged item of the service instead of a single one.
    bool all{false};
};

enum class ResetResult {
    Unstaged,
    UnstagedAll,
    Restored,
    NotStaged,
    NothingStaged,
};

struct ResetOutput {
    ResetResult result{ResetResult::NothingStaged};
    std::string name;
    // Remote version that was restored, e.g. "#3".
    std::string versionLabel;
    std::size_t count{0};
    std::string serviceName;
    std::string itemName;
};

class ResetUseCase {
public:
    ResetUseCase(strategy::ResetStrategy &strategy, store::ReadWriter &store);

    ResetOutput execute(const core::Context &ctx, const ResetInput &input);

    // Removes the entry and tag change of one item; absent items are fine.
    void unstage(const core::Context &ctx, const std::string &name);

private:
    ResetOutput unstageAll(const core::Context &ctx);
    ResetOutput unstageOne(const core::Context &ctx, const std::string &name);
    ResetOutput restore(const core::Context &ctx, const std::string &spec, const std::string &name);

    strategy::ResetStrategy &strategy_;
    store::ReadWriter &store_;
};

[[nodiscard]] std::string_view toString(ResetResult result) noexcept;

} // namespace stagehand::usecase
