#include "stagehand/usecase/Diff.hpp"

#include "stagehand/core/Error.hpp"
#include "usecase/Lookup.hpp"

namespace stagehand::usecase {

DiffUseCase::DiffUseCase(strategy::DiffStrategy &strategy, store::ReadWriter &store)
    : strategy_(strategy), store_(store) {}

DiffOutput DiffUseCase::execute(const core::Context &ctx, const DiffInput &input) {
    const auto service = strategy_.service();

    DiffOutput output;
    output.itemName = strategy_.itemName();

    staging::EntryMap entries;
    staging::TagEntryMap tagEntries;
    if (input.name) {
        auto entry = detail::findEntry(store_, ctx, service, *input.name);
        auto tagEntry = detail::findTag(store_, ctx, service, *input.name);
        if (!entry && !tagEntry) {
            DiffEntry notStaged;
            notStaged.name = *input.name;
            notStaged.type = DiffEntryType::Warning;
            notStaged.warning = "not staged";
            output.entries.push_back(std::move(notStaged));
            return output;
        }
        if (entry) {
            entries.emplace(*input.name, *entry);
        }
        if (tagEntry) {
            tagEntries.emplace(*input.name, *tagEntry);
        }
    } else {
        entries = store_.listEntries(ctx, service);
        tagEntries = store_.listTags(ctx, service);
    }

    for (const auto &[name, entry] : entries) {
        output.entries.push_back(compare(ctx, name, entry));
    }
    for (const auto &[name, tagEntry] : tagEntries) {
        output.tagEntries.push_back({name, tagEntry.add, tagEntry.remove});
    }
    return output;
}

DiffEntry DiffUseCase::compare(const core::Context &ctx, const std::string &name, const staging::Entry &entry) {
    DiffEntry diff;
    diff.name = name;
    diff.operation = entry.operation;
    diff.description = entry.description;
    if (entry.operation != staging::Operation::Delete) {
        diff.stagedValue = entry.value.value_or("");
    }

    std::optional<strategy::RemoteValue> remote;
    try {
        remote = strategy_.fetchCurrent(ctx, name);
    } catch (const core::StagingError &error) {
        if (error.kind() == core::ErrorKind::Cancelled) {
            throw;
        }
        diff.type = DiffEntryType::Warning;
        diff.warning = error.what();
        return diff;
    }

    if (!remote) {
        switch (entry.operation) {
        case staging::Operation::Create:
            diff.type = DiffEntryType::Create;
            return diff;
        case staging::Operation::Update:
            return autoUnstage(ctx, name, entry, "item no longer exists remotely");
        case staging::Operation::Delete:
            return autoUnstage(ctx, name, entry, "already deleted remotely");
        }
        return diff;
    }

    diff.remoteValue = remote->value;
    diff.remoteIdentifier = remote->identifier;

    switch (entry.operation) {
    case staging::Operation::Create:
        return autoUnstage(ctx, name, entry, "item already exists remotely");
    case staging::Operation::Update:
        if (remote->value == diff.stagedValue) {
            return autoUnstage(ctx, name, entry, "identical to remote current");
        }
        break;
    case staging::Operation::Delete:
        break;
    }

    if (entry.baseModifiedAt && remote->lastModified && *remote->lastModified > *entry.baseModifiedAt) {
        diff.type = DiffEntryType::Warning;
        diff.warning = "modified remotely after the change was staged";
        return diff;
    }

    diff.type = DiffEntryType::Normal;
    return diff;
}

DiffEntry DiffUseCase::autoUnstage(const core::Context &ctx, const std::string &name, const staging::Entry &entry,
                                   const std::string &reason) {
    store_.unstageEntry(ctx, strategy_.service(), name);

    DiffEntry diff;
    diff.name = name;
    diff.type = DiffEntryType::AutoUnstaged;
    diff.operation = entry.operation;
    diff.warning = reason;
    return diff;
}

std::string_view toString(DiffEntryType type) noexcept {
    switch (type) {
    case DiffEntryType::Normal:
        return "normal";
    case DiffEntryType::Create:
        return "create";
    case DiffEntryType::AutoUnstaged:
        return "autoUnstaged";
    case DiffEntryType::Warning:
        return "warning";
    }
    return "unknown";
}

} // namespace stagehand::usecase
