#include "stagehand/usecase/Status.hpp"

#include "stagehand/core/Error.hpp"
#include "usecase/Lookup.hpp"

namespace stagehand::usecase {

StatusUseCase::StatusUseCase(const store::Reader &store) : store_(store) {}

StatusOutput StatusUseCase::execute(const core::Context &ctx, const StatusInput &input) const {
    StatusOutput output;

    if (input.name) {
        if (!input.service) {
            throw core::StagingError(core::ErrorKind::InvalidArgument, "status of a single item needs a service");
        }
        const auto service = *input.service;
        auto entry = detail::findEntry(store_, ctx, service, *input.name);
        auto tagEntry = detail::findTag(store_, ctx, service, *input.name);
        if (!entry && !tagEntry) {
            throw core::notStaged(std::string(staging::itemName(service)), *input.name);
        }
        if (entry) {
            output.entries.push_back({service, *input.name, *entry});
        }
        if (tagEntry) {
            output.tagEntries.push_back({service, *input.name, *tagEntry});
        }
        return output;
    }

    for (auto service : staging::kAllServices) {
        if (input.service && *input.service != service) {
            continue;
        }
        for (const auto &[name, entry] : store_.listEntries(ctx, service)) {
            output.entries.push_back({service, name, entry});
        }
        for (const auto &[name, tagEntry] : store_.listTags(ctx, service)) {
            output.tagEntries.push_back({service, name, tagEntry});
        }
    }
    return output;
}

} // namespace stagehand::usecase
