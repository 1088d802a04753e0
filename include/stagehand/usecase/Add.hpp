#pragma once

#include "stagehand/store/Store.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <optional>
#include <string>

namespace stagehand::usecase {

struct AddInput {
    std::string name;
    std::string value;
    std::optional<std::string> description;
};

struct AddOutput {
    std::string name;
};

struct DraftOutput {
    std::string value;
    bool staged{false};
};

// Stages the creation of an item that does not exist remotely yet.
class AddUseCase {
public:
    AddUseCase(strategy::EditStrategy &strategy, store::ReadWriter &store);

    AddOutput execute(const core::Context &ctx, const AddInput &input);

    // The staged create value for a name, if any.
    DraftOutput draft(const core::Context &ctx, const std::string &name) const;

private:
    strategy::EditStrategy &strategy_;
    store::ReadWriter &store_;
};

} // namespace stagehand::usecase
