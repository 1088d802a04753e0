#include "stagehand/core/Context.hpp"

#include "stagehand/core/Error.hpp"

namespace stagehand::core {

void Context::throwIfCancelled() const {
    if (cancelled()) {
        throw StagingError(ErrorKind::Cancelled, "operation cancelled");
    }
}

} // namespace stagehand::core
