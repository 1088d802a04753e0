#pragma once

#include <filesystem>
#include <string>

namespace stagehand::core
{

enum class KdfProfile
{
    Interactive,
    Moderate,
    Sensitive,
};

struct Settings
{
    std::filesystem::path stateDirectory;
    KdfProfile kdfProfile = KdfProfile::Moderate;
    int defaultRecoveryWindowDays = 30;
};

[[nodiscard]] Settings LoadSettings(const std::filesystem::path& path);
void SaveSettings(const Settings& settings, const std::filesystem::path& path);

//! Directory holding config.json and, unless overridden, the staging files.
//! Honours STAGEHAND_HOME, then HOME, then the working directory.
[[nodiscard]] std::filesystem::path DefaultHome();
[[nodiscard]] std::filesystem::path DefaultSettingsPath();

[[nodiscard]] KdfProfile ParseKdfProfile(const std::string& value);
[[nodiscard]] std::string ToString(KdfProfile profile);

} // namespace stagehand::core
