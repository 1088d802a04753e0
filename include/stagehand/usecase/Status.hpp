#pragma once

#include "stagehand/store/Store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stagehand::usecase {

struct StatusInput {
    // All services when empty.
    std::optional<staging::Service> service;
    // A single item; requires a service.
    std::optional<std::string> name;
};

struct StatusEntry {
    staging::Service service{staging::Service::Parameter};
    std::string name;
    staging::Entry entry;
};

struct StatusTagEntry {
    staging::Service service{staging::Service::Parameter};
    std::string name;
    staging::TagEntry tagEntry;
};

struct StatusOutput {
    std::vector<StatusEntry> entries;
    std::vector<StatusTagEntry> tagEntries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty() && tagEntries.empty(); }
};

class StatusUseCase {
public:
    explicit StatusUseCase(const store::Reader &store);

    // Lists staged items in service then name order. A named item with nothing staged is NotStaged.
    StatusOutput execute(const core::Context &ctx, const StatusInput &input) const;

private:
    const store::Reader &store_;
};

} // namespace stagehand::usecase
