#pragma once

#include "stagehand/core/Scope.hpp"
#include "stagehand/core/Settings.hpp"
#include "stagehand/store/Store.hpp"

#include <filesystem>
#include <string>

namespace stagehand::store
{

/**
 * @brief Durable staging store holding one serialized State per identity scope.
 *
 * Without a passphrase the file is plain JSON. With one, every write produces an
 * encrypted envelope and reads require the same passphrase. A missing file reads
 * as an empty State.
 */
class FileStore final : public StateStore
{
public:
    explicit FileStore(
        std::filesystem::path path,
        std::string passphrase = {},
        core::KdfProfile kdfProfile = core::KdfProfile::Moderate);

    //! <stateDirectory>/<account>/<region>/stage.json
    [[nodiscard]] static std::filesystem::path pathFor(const core::Settings& settings, const core::Scope& scope);

    [[nodiscard]] static FileStore forScope(
        const core::Settings& settings,
        const core::Scope& scope,
        std::string passphrase = {});

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool hasPassphrase() const noexcept { return !passphrase_.empty(); }

    [[nodiscard]] bool exists() const;

    //! False for a missing file. Throws StagingError(StorageFailed) if the file cannot be read.
    [[nodiscard]] bool isEncrypted() const;

    //! Reads the file without modifying it.
    [[nodiscard]] staging::State read(const core::Context& ctx) const;

    staging::State drain(const core::Context& ctx, bool keep) override;

    //! Atomically replaces the file. An empty state removes the file instead.
    void writeState(const core::Context& ctx, const staging::State& state) override;

    //! Deletes the file; a missing file is not an error.
    void remove(const core::Context& ctx);

private:
    std::filesystem::path path_;
    std::string passphrase_;
    core::KdfProfile kdfProfile_;
};

} // namespace stagehand::store
