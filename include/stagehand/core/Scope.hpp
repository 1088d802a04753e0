#pragma once

#include <compare>
#include <string>

namespace stagehand::core {

// Remote-account identity a store is bound to.
struct Scope {
    std::string accountId;
    std::string region;

    auto operator<=>(const Scope &) const = default;
};

} // namespace stagehand::core
