#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace stagehand::core {

enum class ErrorKind {
    NotStaged,
    InvalidService,
    DecryptionFailed,
    Conflict,
    RemoteOperationFailed,
    ResourceNotFound,
    InvalidTransition,
    InvalidArgument,
    StorageFailed,
    Cancelled,
    Internal,
};

class StagingError : public std::runtime_error {
public:
    StagingError(ErrorKind kind, const std::string &message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

[[nodiscard]] StagingError notStaged(const std::string &itemName, const std::string &name);

std::string_view toString(ErrorKind kind) noexcept;

} // namespace stagehand::core
