#include "stagehand/usecase/Edit.hpp"

#include "stagehand/core/Error.hpp"
#include "stagehand/staging/Transition.hpp"
#include "usecase/Lookup.hpp"

namespace stagehand::usecase {

namespace {

core::StagingError notFound(const strategy::EditStrategy &strategy, const std::string &name) {
    return core::StagingError(core::ErrorKind::ResourceNotFound, strategy.itemName() + " not found: " + name);
}

} // namespace

EditUseCase::EditUseCase(strategy::EditStrategy &strategy, store::ReadWriter &store)
    : strategy_(strategy), store_(store) {}

EditOutput EditUseCase::execute(const core::Context &ctx, const EditInput &input) {
    const auto service = strategy_.service();
    const auto name = strategy_.parseName(input.name);

    auto staged = detail::findEntry(store_, ctx, service, name);
    const auto stagedKind = staging::stagedKindOf(staged);
    if (stagedKind == staging::StagedKind::Delete) {
        staging::throwIfFailed(staging::TransitionError::CannotEditDelete);
    }

    staging::EntryState state;
    state.staged = stagedKind;
    std::optional<staging::Clock::time_point> remoteModifiedAt;
    if (stagedKind != staging::StagedKind::Create) {
        auto remote = strategy_.fetchCurrentValue(ctx, name);
        if (!remote) {
            throw notFound(strategy_, name);
        }
        state.currentValue = remote->value;
        remoteModifiedAt = remote->lastModified;
    }

    auto transition = staging::reduceEntry(state, {staging::EntryActionType::Edit, input.value});
    staging::throwIfFailed(transition.error);

    EditOutput output{name, EditResult::Staged};
    switch (transition.state.staged) {
    case staging::StagedKind::NotStaged:
        if (stagedKind == staging::StagedKind::NotStaged) {
            output.result = EditResult::Skipped;
        } else {
            store_.unstageEntry(ctx, service, name);
            output.result = EditResult::Unstaged;
        }
        return output;
    case staging::StagedKind::Create:
    case staging::StagedKind::Update:
        break;
    case staging::StagedKind::Delete:
        throw core::StagingError(core::ErrorKind::InvalidTransition, "edit cannot stage a deletion");
    }

    staging::Entry entry;
    entry.operation = transition.state.staged == staging::StagedKind::Create ? staging::Operation::Create
                                                                              : staging::Operation::Update;
    entry.value = transition.state.draftValue;
    entry.description = input.description ? input.description : (staged ? staged->description : std::nullopt);
    entry.stagedAt = staging::Clock::now();
    // Keep the first observed remote time so later remote edits are still detected.
    entry.baseModifiedAt = staged && staged->baseModifiedAt ? staged->baseModifiedAt : remoteModifiedAt;
    if (entry.operation == staging::Operation::Create) {
        entry.baseModifiedAt.reset();
    }
    store_.stageEntry(ctx, service, name, entry);
    return output;
}

BaselineOutput EditUseCase::baseline(const core::Context &ctx, const std::string &input) {
    const auto name = strategy_.parseName(input);

    auto staged = detail::findEntry(store_, ctx, strategy_.service(), name);
    if (staged) {
        if (staged->operation == staging::Operation::Delete) {
            staging::throwIfFailed(staging::TransitionError::CannotEditDelete);
        }
        return {staged->value.value_or(""), true};
    }

    auto remote = strategy_.fetchCurrentValue(ctx, name);
    if (!remote) {
        throw notFound(strategy_, name);
    }
    return {remote->value, false};
}

std::string_view toString(EditResult result) noexcept {
    switch (result) {
    case EditResult::Staged:
        return "staged";
    case EditResult::Skipped:
        return "skipped";
    case EditResult::Unstaged:
        return "unstaged";
    }
    return "unknown";
}

} // namespace stagehand::usecase
