#include "stagehand/strategy/VersionSpec.hpp"

#include "stagehand/core/Error.hpp"

#include <cctype>
#include <limits>

namespace stagehand::strategy {

namespace {

core::StagingError invalidSpec(const std::string &input, const std::string &reason) {
    return core::StagingError(core::ErrorKind::InvalidArgument, "invalid version spec '" + input + "': " + reason);
}

std::string trim(const std::string &input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
}

bool isLabelChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

// Consumes "~", "~N" and repetitions from position, returning the accumulated shift.
int parseShift(const std::string &input, std::size_t position) {
    long total = 0;
    while (position < input.size()) {
        if (input[position] != '~') {
            throw invalidSpec(input, "unexpected character '" + std::string(1, input[position]) + "'");
        }
        ++position;

        const auto digitsBegin = position;
        while (position < input.size() && isDigit(input[position])) {
            ++position;
        }
        if (digitsBegin == position) {
            ++total;
        } else {
            const auto digits = input.substr(digitsBegin, position - digitsBegin);
            if (digits.size() > 6) {
                throw invalidSpec(input, "shift is too large");
            }
            total += std::stol(digits);
        }
        if (total > std::numeric_limits<int>::max() / 2) {
            throw invalidSpec(input, "shift is too large");
        }
    }
    return static_cast<int>(total);
}

std::size_t scan(const std::string &input, std::size_t position, bool (*accept)(char)) {
    while (position < input.size() && accept(input[position])) {
        ++position;
    }
    return position;
}

} // namespace

ParameterSpec parseParameterSpec(const std::string &raw) {
    const auto input = trim(raw);
    if (input.empty()) {
        throw core::StagingError(core::ErrorKind::InvalidArgument, "empty parameter name");
    }

    const auto nameEnd = input.find_first_of("#~");
    ParameterSpec spec;
    spec.name = input.substr(0, nameEnd);
    if (spec.name.empty()) {
        throw invalidSpec(input, "empty name");
    }
    if (nameEnd == std::string::npos) {
        return spec;
    }

    auto position = nameEnd;
    if (input[position] == '#') {
        const auto end = scan(input, position + 1, isDigit);
        if (end == position + 1) {
            throw invalidSpec(input, "# must be followed by a version number");
        }
        const auto digits = input.substr(position + 1, end - position - 1);
        if (digits.size() > 18) {
            throw invalidSpec(input, "version number is too large");
        }
        spec.version = std::stoll(digits);
        if (*spec.version < 1) {
            throw invalidSpec(input, "version numbers start at 1");
        }
        position = end;
    }

    spec.shift = parseShift(input, position);
    return spec;
}

SecretSpec parseSecretSpec(const std::string &raw) {
    const auto input = trim(raw);
    if (input.empty()) {
        throw core::StagingError(core::ErrorKind::InvalidArgument, "empty secret name");
    }

    const auto nameEnd = input.find_first_of("#:~");
    SecretSpec spec;
    spec.name = input.substr(0, nameEnd);
    if (spec.name.empty()) {
        throw invalidSpec(input, "empty name");
    }
    if (nameEnd == std::string::npos) {
        return spec;
    }

    auto position = nameEnd;
    if (input[position] == '#') {
        const auto end = scan(input, position + 1, isIdChar);
        if (end == position + 1) {
            throw invalidSpec(input, "# must be followed by a version ID");
        }
        spec.versionId = input.substr(position + 1, end - position - 1);
        position = end;
    } else if (input[position] == ':') {
        const auto end = scan(input, position + 1, isLabelChar);
        if (end == position + 1) {
            throw invalidSpec(input, ": must be followed by a label");
        }
        spec.label = input.substr(position + 1, end - position - 1);
        position = end;
    }

    if (position < input.size() && (input[position] == '#' || input[position] == ':')) {
        throw invalidSpec(input, "multiple absolute version specifiers");
    }
    spec.shift = parseShift(input, position);
    return spec;
}

} // namespace stagehand::strategy
