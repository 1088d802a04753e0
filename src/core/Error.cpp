#include "stagehand/core/Error.hpp"

namespace stagehand::core {

StagingError::StagingError(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), kind_(kind) {}

StagingError notStaged(const std::string &itemName, const std::string &name) {
    return StagingError(ErrorKind::NotStaged, itemName + " " + name + " is not staged");
}

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::NotStaged:
        return "notStaged";
    case ErrorKind::InvalidService:
        return "invalidService";
    case ErrorKind::DecryptionFailed:
        return "decryptionFailed";
    case ErrorKind::Conflict:
        return "conflict";
    case ErrorKind::RemoteOperationFailed:
        return "remoteOperationFailed";
    case ErrorKind::ResourceNotFound:
        return "resourceNotFound";
    case ErrorKind::InvalidTransition:
        return "invalidTransition";
    case ErrorKind::InvalidArgument:
        return "invalidArgument";
    case ErrorKind::StorageFailed:
        return "storageFailed";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Internal:
        return "internal";
    }

    return "unknown";
}

} // namespace stagehand::core
