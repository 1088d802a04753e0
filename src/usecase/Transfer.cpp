#include "stagehand/usecase/Transfer.hpp"

#include "stagehand/core/Error.hpp"

#include <iostream>
#include <map>
#include <string>

namespace stagehand::usecase {

namespace {

template <typename Map>
std::size_t countCollisions(const std::map<staging::Service, Map> &incoming,
                            const std::map<staging::Service, Map> &resident) {
    std::size_t collisions = 0;
    for (const auto &[service, items] : incoming) {
        auto residentItems = resident.find(service);
        if (residentItems == resident.end()) {
            continue;
        }
        for (const auto &[name, item] : items) {
            auto it = residentItems->second.find(name);
            if (it != residentItems->second.end() && !staging::sameIntent(item, it->second)) {
                ++collisions;
            }
        }
    }
    return collisions;
}

void removeTransferred(staging::State &state, const std::optional<staging::Service> &service) {
    if (service) {
        state.removeService(*service);
    } else {
        state = staging::State{};
    }
}

} // namespace

DrainUseCase::DrainUseCase(store::StateStore &file, store::StateStore &resident) : file_(file), resident_(resident) {}

DrainOutput DrainUseCase::execute(const core::Context &ctx, const DrainInput &input) {
    auto fileState = file_.drain(ctx, true);
    const auto incoming = fileState.extract(input.service);

    DrainOutput output;
    if (incoming.empty()) {
        return output;
    }

    const auto residentState = resident_.drain(ctx, true);
    const auto collisions = countCollisions(incoming.entries, residentState.entries) +
                            countCollisions(incoming.tags, residentState.tags);
    if (collisions > 0 && !input.force) {
        throw core::StagingError(core::ErrorKind::Conflict,
                                 "resident store already stages " + std::to_string(collisions) +
                                     " different change(s) for the same items; use force to resolve");
    }

    staging::State combined;
    if (input.merge) {
        combined = incoming;
        combined.overlay(residentState);
    } else {
        combined = residentState;
        combined.overlay(incoming);
    }
    resident_.writeState(ctx, combined);

    output.entryCount = incoming.entryCount();
    output.tagCount = incoming.tagCount();
    output.merged = collisions > 0;

    if (!input.keep) {
        removeTransferred(fileState, input.service);
        try {
            file_.writeState(core::Context{}, fileState);
        } catch (const core::StagingError &error) {
            std::cerr << "[stagehand:drain] staged changes were loaded but the file was not cleaned up: "
                      << error.what() << '\n';
            output.fileCleanupFailed = true;
        }
    }
    return output;
}

PersistUseCase::PersistUseCase(store::StateStore &resident, store::StateStore &file)
    : resident_(resident), file_(file) {}

PersistOutput PersistUseCase::execute(const core::Context &ctx, const PersistInput &input) {
    auto residentState = resident_.drain(ctx, true);
    const auto outgoing = residentState.extract(input.service);

    PersistOutput output;
    if (outgoing.empty()) {
        return output;
    }

    staging::State target;
    if (input.service || input.merge) {
        // An unreadable file is a hard stop so its other contents are never overwritten.
        target = file_.drain(ctx, true);
        if (input.service && !input.merge) {
            target.removeService(*input.service);
        }
        target.overlay(outgoing);
    } else {
        target = outgoing;
    }
    file_.writeState(ctx, target);

    output.entryCount = outgoing.entryCount();
    output.tagCount = outgoing.tagCount();

    if (!input.keep) {
        // The file already holds the hand-off, so the resident side is cleared even if the caller cancelled.
        removeTransferred(residentState, input.service);
        resident_.writeState(core::Context{}, residentState);
    }
    return output;
}

} // namespace stagehand::usecase
