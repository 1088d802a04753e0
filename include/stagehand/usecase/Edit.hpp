#pragma once

#include "stagehand/store/Store.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <optional>
#include <string>

namespace stagehand::usecase {

struct EditInput {
    std::string name;
    std::string value;
    std::optional<std::string> description;
};

enum class EditResult {
    Staged,
    // Nothing was staged and the value already matches the remote one.
    Skipped,
    // A staged update was dropped because the new value matches the remote one.
    Unstaged,
};

struct EditOutput {
    std::string name;
    EditResult result{EditResult::Staged};
};

struct BaselineOutput {
    std::string value;
    bool fromStage{false};
};

class EditUseCase {
public:
    EditUseCase(strategy::EditStrategy &strategy, store::ReadWriter &store);

    EditOutput execute(const core::Context &ctx, const EditInput &input);

    // The value an editor should start from: the staged value, else the remote one.
    BaselineOutput baseline(const core::Context &ctx, const std::string &name);

private:
    strategy::EditStrategy &strategy_;
    store::ReadWriter &store_;
};

[[nodiscard]] std::string_view toString(EditResult result) noexcept;

} // namespace stagehand::usecase
