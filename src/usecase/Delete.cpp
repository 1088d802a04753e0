#include "stagehand/usecase/Delete.hpp"

#include "stagehand/core/Error.hpp"
#include "stagehand/staging/Transition.hpp"
#include "usecase/Lookup.hpp"

namespace stagehand::usecase {

DeleteUseCase::DeleteUseCase(strategy::DeleteStrategy &strategy, store::ReadWriter &store,
                             int defaultRecoveryWindow)
    : strategy_(strategy), store_(store), defaultRecoveryWindow_(defaultRecoveryWindow) {}

DeleteOutput DeleteUseCase::execute(const core::Context &ctx, const DeleteInput &input) {
    const auto service = strategy_.service();
    const bool hasDeleteOptions = strategy_.hasDeleteOptions();
    const auto name = strategy_.parseName(input.name);

    const int recoveryWindow = input.recoveryWindow.value_or(defaultRecoveryWindow_);
    if (hasDeleteOptions && !input.force &&
        (recoveryWindow < kMinRecoveryWindowDays || recoveryWindow > kMaxRecoveryWindowDays)) {
        throw core::StagingError(core::ErrorKind::InvalidArgument, "recovery window must be between 7 and 30 days");
    }

    auto staged = detail::findEntry(store_, ctx, service, name);
    const auto lastModified = strategy_.fetchLastModified(ctx, name);
    const bool existsRemotely = lastModified.has_value();

    staging::EntryState state;
    state.staged = staging::stagedKindOf(staged);
    if (existsRemotely) {
        // Only existence matters for deletion.
        state.currentValue = std::string();
    }

    auto transition = staging::reduceEntry(state, {staging::EntryActionType::Delete, {}});
    staging::throwIfFailed(transition.error);

    if (transition.discardTags) {
        store_.unstageEntry(ctx, service, name);
        store_.unstageTag(ctx, service, name);
        return {name, true};
    }

    staging::Entry entry;
    entry.operation = staging::Operation::Delete;
    entry.stagedAt = staging::Clock::now();
    if (lastModified && *lastModified != staging::Clock::time_point{}) {
        entry.baseModifiedAt = lastModified;
    }
    if (hasDeleteOptions) {
        entry.deleteOptions = staging::DeleteOptions{input.force, input.force ? 0 : recoveryWindow};
    }
    store_.stageEntry(ctx, service, name, entry);

    DeleteOutput output{name};
    output.showDeleteOptions = hasDeleteOptions;
    if (hasDeleteOptions) {
        output.force = input.force;
        output.recoveryWindow = input.force ? 0 : recoveryWindow;
    }
    return output;
}

} // namespace stagehand::usecase
