#pragma once

#include <stop_token>
#include <utility>

namespace stagehand::core {

// Cancellation handle passed into every store and remote operation.
class Context {
public:
    Context() = default;
    explicit Context(std::stop_token token) : token_(std::move(token)) {}

    [[nodiscard]] bool cancelled() const noexcept { return token_.stop_requested(); }

    // Throws StagingError(Cancelled) once a stop has been requested.
    void throwIfCancelled() const;

private:
    std::stop_token token_;
};

} // namespace stagehand::core
