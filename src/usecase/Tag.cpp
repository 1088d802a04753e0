#include "stagehand/usecase/Tag.hpp"

#include "stagehand/core/Error.hpp"
#include "stagehand/staging/Transition.hpp"
#include "usecase/Lookup.hpp"

namespace stagehand::usecase {

TagUseCase::TagUseCase(strategy::EditStrategy &strategy, store::ReadWriter &store)
    : strategy_(strategy), store_(store) {}

TagOutput TagUseCase::tag(const core::Context &ctx, const TagInput &input) {
    if (input.tags.empty()) {
        throw core::StagingError(core::ErrorKind::InvalidArgument, "no tags specified");
    }
    for (const auto &[key, value] : input.tags) {
        if (key.empty()) {
            throw core::StagingError(core::ErrorKind::InvalidArgument, "tag keys must not be empty");
        }
    }

    staging::TagAction action;
    action.type = staging::TagActionType::Tag;
    action.tags = input.tags;
    return change(ctx, input.name, action);
}

TagOutput TagUseCase::untag(const core::Context &ctx, const UntagInput &input) {
    if (input.keys.empty()) {
        throw core::StagingError(core::ErrorKind::InvalidArgument, "no tag keys specified");
    }

    staging::TagAction action;
    action.type = staging::TagActionType::Untag;
    action.keys = input.keys;
    return change(ctx, input.name, action);
}

TagOutput TagUseCase::change(const core::Context &ctx, const std::string &input, const staging::TagAction &action) {
    const auto service = strategy_.service();
    const auto name = strategy_.parseName(input);

    auto remote = strategy_.fetchCurrentValue(ctx, name);
    auto staged = detail::findEntry(store_, ctx, service, name);
    auto stagedTags = detail::findTag(store_, ctx, service, name);

    staging::EntryState state;
    state.staged = staging::stagedKindOf(staged);
    if (remote) {
        state.currentValue = remote->value;
    }

    auto effective = action;
    if (state.staged == staging::StagedKind::Create && action.type == staging::TagActionType::Untag) {
        // A staged create has no remote tags to remove.
        effective.remoteKeys = staging::KeySet{};
    }

    staging::StagedTags current;
    if (stagedTags) {
        current.toSet = stagedTags->add;
        current.toUnset = stagedTags->remove;
    }

    auto transition = staging::reduceTag(state, current, effective);
    staging::throwIfFailed(transition.error);

    staging::TagEntry tagEntry;
    tagEntry.add = std::move(transition.tags.toSet);
    tagEntry.remove = std::move(transition.tags.toUnset);
    tagEntry.baseModifiedAt = stagedTags && stagedTags->baseModifiedAt
                                  ? stagedTags->baseModifiedAt
                                  : (remote ? remote->lastModified : std::nullopt);
    return commit(ctx, name, std::move(tagEntry));
}

TagOutput TagUseCase::cancelAddTag(const core::Context &ctx, const CancelTagInput &input) {
    return cancel(ctx, input, true);
}

TagOutput TagUseCase::cancelRemoveTag(const core::Context &ctx, const CancelTagInput &input) {
    return cancel(ctx, input, false);
}

TagOutput TagUseCase::cancel(const core::Context &ctx, const CancelTagInput &input, bool fromAdd) {
    const auto service = strategy_.service();
    const auto name = strategy_.parseName(input.name);

    // Cancelling something that was never staged is a caller mistake, so NotStaged surfaces here.
    auto tagEntry = store_.getTag(ctx, service, name);
    const bool removed = fromAdd ? tagEntry.add.erase(input.key) > 0 : tagEntry.remove.erase(input.key) > 0;
    if (!removed) {
        throw core::StagingError(core::ErrorKind::NotStaged, std::string(fromAdd ? "tag " : "tag removal ") +
                                                                 input.key + " is not staged for " + name);
    }
    return commit(ctx, name, std::move(tagEntry));
}

TagOutput TagUseCase::commit(const core::Context &ctx, const std::string &name, staging::TagEntry tagEntry) {
    const auto service = strategy_.service();
    if (tagEntry.empty()) {
        store_.unstageTag(ctx, service, name);
        return {name, false};
    }
    tagEntry.stagedAt = staging::Clock::now();
    store_.stageTag(ctx, service, name, tagEntry);
    return {name, true};
}

} // namespace stagehand::usecase
