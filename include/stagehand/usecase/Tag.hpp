#pragma once

#include "stagehand/store/Store.hpp"
#include "stagehand/staging/Transition.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <string>

namespace stagehand::usecase {

struct TagInput {
    std::string name;
    staging::TagMap tags;
};

struct UntagInput {
    std::string name;
    staging::KeySet keys;
};

struct CancelTagInput {
    std::string name;
    std::string key;
};

struct TagOutput {
    std::string name;
    // False when the change left nothing staged for the item's tags.
    bool staged{true};
};

class TagUseCase {
public:
    TagUseCase(strategy::EditStrategy &strategy, store::ReadWriter &store);

    TagOutput tag(const core::Context &ctx, const TagInput &input);
    TagOutput untag(const core::Context &ctx, const UntagInput &input);

    // Drop one key from the staged additions or removals. NotStaged when the key is not there.
    TagOutput cancelAddTag(const core::Context &ctx, const CancelTagInput &input);
    TagOutput cancelRemoveTag(const core::Context &ctx, const CancelTagInput &input);

private:
    TagOutput change(const core::Context &ctx, const std::string &input, const staging::TagAction &action);
    TagOutput cancel(const core::Context &ctx, const CancelTagInput &input, bool fromAdd);
    TagOutput commit(const core::Context &ctx, const std::string &name, staging::TagEntry tagEntry);

    strategy::EditStrategy &strategy_;
    store::ReadWriter &store_;
};

} // namespace stagehand::usecase
