#include "stagehand/usecase/Reset.hpp"

#include "usecase/Lookup.hpp"

namespace stagehand::usecase {

ResetUseCase::ResetUseCase(strategy::ResetStrategy &strategy, store::ReadWriter &store)
    : strategy_(strategy), store_(store) {}

ResetOutput ResetUseCase::execute(const core::Context &ctx, const ResetInput &input) {
    if (input.all) {
        return unstageAll(ctx);
    }

    auto parsed = strategy_.parseSpec(input.spec);
    if (parsed.hasVersion) {
        return restore(ctx, input.spec, parsed.name);
    }
    return unstageOne(ctx, parsed.name);
}

void ResetUseCase::unstage(const core::Context &ctx, const std::string &name) {
    const auto service = strategy_.service();
    store_.unstageEntry(ctx, service, name);
    store_.unstageTag(ctx, service, name);
}

ResetOutput ResetUseCase::unstageAll(const core::Context &ctx) {
    const auto service = strategy_.service();

    ResetOutput output;
    output.serviceName = strategy_.serviceName();
    output.itemName = strategy_.itemName();

    const auto count = store_.listEntries(ctx, service).size() + store_.listTags(ctx, service).size();
    if (!store_.unstageAll(ctx, service)) {
        output.result = ResetResult::NothingStaged;
        return output;
    }

    output.result = ResetResult::UnstagedAll;
    output.count = count;
    return output;
}

ResetOutput ResetUseCase::unstageOne(const core::Context &ctx, const std::string &name) {
    const auto service = strategy_.service();

    ResetOutput output;
    output.name = name;
    output.serviceName = strategy_.serviceName();
    output.itemName = strategy_.itemName();

    const bool staged = detail::findEntry(store_, ctx, service, name).has_value() ||
                        detail::findTag(store_, ctx, service, name).has_value();
    if (!staged) {
        output.result = ResetResult::NotStaged;
        return output;
    }

    unstage(ctx, name);
    output.result = ResetResult::Unstaged;
    return output;
}

ResetOutput ResetUseCase::restore(const core::Context &ctx, const std::string &spec, const std::string &name) {
    auto version = strategy_.fetchVersion(ctx, spec);

    staging::Entry entry;
    entry.operation = staging::Operation::Update;
    entry.value = version.value;
    entry.stagedAt = staging::Clock::now();
    store_.stageEntry(ctx, strategy_.service(), name, entry);

    ResetOutput output;
    output.result = ResetResult::Restored;
    output.name = name;
    output.versionLabel = version.identifier;
    output.serviceName = strategy_.serviceName();
    output.itemName = strategy_.itemName();
    return output;
}

std::string_view toString(ResetResult result) noexcept {
    switch (result) {
    case ResetResult::Unstaged:
        return "unstaged";
    case ResetResult::UnstagedAll:
        return "unstagedAll";
    case ResetResult::Restored:
        return "restored";
    case ResetResult::NotStaged:
        return "notStaged";
    case ResetResult::NothingStaged:
        return "nothingStaged";
    }
    return "unknown";
}

} // namespace stagehand::usecase
