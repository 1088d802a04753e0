#include "stagehand/strategy/Strategy.hpp"

namespace stagehand::strategy {

std::string_view toString(ApplyStatus status) noexcept {
    switch (status) {
    case ApplyStatus::Created:
        return "created";
    case ApplyStatus::Updated:
        return "updated";
    case ApplyStatus::Deleted:
        return "deleted";
    case ApplyStatus::Failed:
        return "failed";
    }
    return "unknown";
}

} // namespace stagehand::strategy
