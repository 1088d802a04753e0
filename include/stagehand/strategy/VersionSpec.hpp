#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace stagehand::strategy {

// <name>[#<version>]<shift>*  where a shift is "~" or "~N", cumulative.
struct ParameterSpec {
    std::string name;
    std::optional<std::int64_t> version;
    int shift = 0;

    [[nodiscard]] bool hasVersion() const noexcept { return version.has_value() || shift > 0; }
};

// <name>[#<versionId> | :<label>]<shift>*
struct SecretSpec {
    std::string name;
    std::optional<std::string> versionId;
    std::optional<std::string> label;
    int shift = 0;

    [[nodiscard]] bool hasVersion() const noexcept {
        return versionId.has_value() || label.has_value() || shift > 0;
    }
};

// Both throw StagingError(InvalidArgument) on malformed input.
ParameterSpec parseParameterSpec(const std::string &input);
SecretSpec parseSecretSpec(const std::string &input);

} // namespace stagehand::strategy
