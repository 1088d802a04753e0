#pragma once

#include "stagehand/store/Store.hpp"

#include <cstddef>
#include <optional>

namespace stagehand::usecase {

struct DrainInput {
    // Restrict the transfer to one service.
    std::optional<staging::Service> service;
    // Leave the drained items in the file.
    bool keep{false};
    // Proceed when the resident store holds different changes for the same items.
    bool force{false};
    // On a forced collision keep the resident item instead of the file's.
    bool merge{false};
};

struct DrainOutput {
    std::size_t entryCount{0};
    std::size_t tagCount{0};
    // At least one item was staged on both sides with different content.
    bool merged{false};
    // The resident store was written but the drained items could not be removed from the file.
    bool fileCleanupFailed{false};
};

// Moves staged changes from the file store into the resident store.
class DrainUseCase {
public:
    DrainUseCase(store::StateStore &file, store::StateStore &resident);

    DrainOutput execute(const core::Context &ctx, const DrainInput &input);

private:
    store::StateStore &file_;
    store::StateStore &resident_;
};

struct PersistInput {
    std::optional<staging::Service> service;
    // Leave the resident store intact (checkpoint) instead of clearing it (hand-off).
    bool keep{false};
    // Keep items already in the file that the resident store does not stage.
    bool merge{false};
};

struct PersistOutput {
    std::size_t entryCount{0};
    std::size_t tagCount{0};
};

// Moves staged changes from the resident store into the file store.
class PersistUseCase {
public:
    PersistUseCase(store::StateStore &resident, store::StateStore &file);

    PersistOutput execute(const core::Context &ctx, const PersistInput &input);

private:
    store::StateStore &resident_;
    store::StateStore &file_;
};

} // namespace stagehand::usecase
