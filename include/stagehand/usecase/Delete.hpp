#pragma once

#include "stagehand/store/Store.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <optional>
#include <string>

namespace stagehand::usecase {

inline constexpr int kMinRecoveryWindowDays = 7;
inline constexpr int kMaxRecoveryWindowDays = 30;

struct DeleteInput {
    std::string name;
    // Secrets only: delete without a recovery window.
    bool force{false};
    // Secrets only: days before permanent deletion; the configured default when empty.
    std::optional<int> recoveryWindow;
};

struct DeleteOutput {
    std::string name;
    // A staged create was dropped instead of staging a deletion.
    bool unstaged{false};
    bool showDeleteOptions{false};
    bool force{false};
    int recoveryWindow{0};
};

class DeleteUseCase {
public:
    DeleteUseCase(strategy::DeleteStrategy &strategy, store::ReadWriter &store,
                  int defaultRecoveryWindow = kMaxRecoveryWindowDays);

    DeleteOutput execute(const core::Context &ctx, const DeleteInput &input);

private:
    strategy::DeleteStrategy &strategy_;
    store::ReadWriter &store_;
    int defaultRecoveryWindow_;
};

} // namespace stagehand::usecase
