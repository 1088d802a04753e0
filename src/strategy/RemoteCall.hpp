#pragma once

#include "stagehand/core/Error.hpp"

#include <exception>
#include <memory>
#include <string>

namespace stagehand::strategy::detail {

// Runs a remote call, rethrowing staging errors as-is and wrapping anything else as
// RemoteOperationFailed.
template <typename Call>
auto callRemote(const std::string &what, Call &&call) -> decltype(call()) {
    try {
        return call();
    } catch (const core::StagingError &) {
        throw;
    } catch (const std::exception &error) {
        throw core::StagingError(core::ErrorKind::RemoteOperationFailed, what + ": " + error.what());
    }
}

template <typename Client>
Client &requireClient(const std::shared_ptr<Client> &client, const std::string &serviceName) {
    if (!client) {
        throw core::StagingError(core::ErrorKind::InvalidArgument, "no " + serviceName + " client configured");
    }
    return *client;
}

} // namespace stagehand::strategy::detail
