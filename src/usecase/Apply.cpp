#include "stagehand/usecase/Apply.hpp"

#include "usecase/Lookup.hpp"

#include <exception>
#include <iostream>

namespace stagehand::usecase {

namespace {

ApplyFailure failureOf(const core::StagingError &error) {
    return {error.kind(), error.what()};
}

void logUnstageFailure(const std::string &name, const core::StagingError &error) {
    std::cerr << "[stagehand] " << name << " was applied but could not be unstaged: " << error.what() << '\n';
}

} // namespace

ApplyUseCase::ApplyUseCase(strategy::ApplyStrategy &strategy, store::ReadWriter &store)
    : strategy_(strategy), store_(store) {}

std::vector<std::string> ApplyUseCase::checkConflicts(const core::Context &ctx, const staging::EntryMap &entries) {
    std::vector<std::string> conflicts;

    for (const auto &[name, entry] : entries) {
        const bool isCreate = entry.operation == staging::Operation::Create;
        if (!isCreate && !entry.baseModifiedAt) {
            continue;
        }

        std::optional<staging::Clock::time_point> lastModified;
        try {
            lastModified = strategy_.fetchLastModified(ctx, name);
        } catch (const core::StagingError &error) {
            if (error.kind() == core::ErrorKind::Cancelled) {
                throw;
            }
            // Left to the apply pass, which records the remote failure for this item.
            continue;
        }

        if (!lastModified) {
            continue;
        }
        if (isCreate || *lastModified > *entry.baseModifiedAt) {
            conflicts.push_back(name);
        }
    }

    return conflicts;
}

ApplyOutput ApplyUseCase::execute(const core::Context &ctx, const ApplyInput &input) {
    const auto service = strategy_.service();

    ApplyOutput output;
    output.serviceName = strategy_.serviceName();
    output.itemName = strategy_.itemName();

    staging::EntryMap entries;
    staging::TagEntryMap tagEntries;
    if (input.name) {
        auto entry = detail::findEntry(store_, ctx, service, *input.name);
        auto tagEntry = detail::findTag(store_, ctx, service, *input.name);
        if (!entry && !tagEntry) {
            throw core::notStaged(output.itemName, *input.name);
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

    if (!input.ignoreConflicts && !entries.empty()) {
        output.conflicts = checkConflicts(ctx, entries);
        for (const auto &name : output.conflicts) {
            entries.erase(name);
            tagEntries.erase(name);
        }
    }

    for (const auto &[name, entry] : entries) {
        if (ctx.cancelled()) {
            output.cancelled = true;
            return output;
        }

        ApplyEntryResult result{name};
        try {
            result.status = strategy_.apply(ctx, name, entry);
        } catch (const core::StagingError &error) {
            if (error.kind() == core::ErrorKind::Cancelled) {
                output.cancelled = true;
                return output;
            }
            result.status = strategy::ApplyStatus::Failed;
            result.error = failureOf(error);
        } catch (const std::exception &error) {
            result.status = strategy::ApplyStatus::Failed;
            result.error = ApplyFailure{core::ErrorKind::RemoteOperationFailed, error.what()};
        }

        if (result.error) {
            ++output.entryFailed;
        } else {
            ++output.entrySucceeded;
            // The remote change already happened, so unstage even if the caller cancelled meanwhile.
            try {
                store_.unstageEntry(core::Context{}, service, name);
            } catch (const core::StagingError &error) {
                logUnstageFailure(name, error);
            }
        }
        output.entryResults.push_back(std::move(result));
    }

    for (const auto &[name, tagEntry] : tagEntries) {
        if (ctx.cancelled()) {
            output.cancelled = true;
            return output;
        }

        ApplyTagResult result{name, tagEntry.add, tagEntry.remove};
        try {
            strategy_.applyTags(ctx, name, tagEntry);
        } catch (const core::StagingError &error) {
            if (error.kind() == core::ErrorKind::Cancelled) {
                output.cancelled = true;
                return output;
            }
            result.error = failureOf(error);
        } catch (const std::exception &error) {
            result.error = ApplyFailure{core::ErrorKind::RemoteOperationFailed, error.what()};
        }

        if (result.error) {
            ++output.tagFailed;
        } else {
            ++output.tagSucceeded;
            try {
                store_.unstageTag(core::Context{}, service, name);
            } catch (const core::StagingError &error) {
                logUnstageFailure(name, error);
            }
        }
        output.tagResults.push_back(std::move(result));
    }

    return output;
}

} // namespace stagehand::usecase
