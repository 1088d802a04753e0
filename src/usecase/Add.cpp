#include "stagehand/usecase/Add.hpp"

#include "stagehand/staging/Transition.hpp"
#include "usecase/Lookup.hpp"

namespace stagehand::usecase {

AddUseCase::AddUseCase(strategy::EditStrategy &strategy, store::ReadWriter &store)
    : strategy_(strategy), store_(store) {}

AddOutput AddUseCase::execute(const core::Context &ctx, const AddInput &input) {
    const auto service = strategy_.service();
    const auto name = strategy_.parseName(input.name);

    auto staged = detail::findEntry(store_, ctx, service, name);
    auto remote = strategy_.fetchCurrentValue(ctx, name);

    staging::EntryState state;
    state.staged = staging::stagedKindOf(staged);
    if (remote) {
        state.currentValue = remote->value;
    }

    auto transition = staging::reduceEntry(state, {staging::EntryActionType::Add, input.value});
    staging::throwIfFailed(transition.error);

    staging::Entry entry;
    entry.operation = staging::Operation::Create;
    entry.value = transition.state.draftValue;
    entry.description = input.description ? input.description : (staged ? staged->description : std::nullopt);
    entry.stagedAt = staging::Clock::now();
    store_.stageEntry(ctx, service, name, entry);

    return {name};
}

DraftOutput AddUseCase::draft(const core::Context &ctx, const std::string &input) const {
    const auto name = strategy_.parseName(input);
    auto staged = detail::findEntry(store_, ctx, strategy_.service(), name);
    if (staged && staged->operation == staging::Operation::Create) {
        return {staged->value.value_or(""), true};
    }
    return {};
}

} // namespace stagehand::usecase
