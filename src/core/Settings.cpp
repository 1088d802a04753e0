#include "stagehand/core/Settings.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

namespace stagehand::core
{
namespace
{
constexpr char kHomeDir[] = ".stagehand";
constexpr char kSettingsFile[] = "config.json";
constexpr int kMinRecoveryWindow = 7;
constexpr int kMaxRecoveryWindow = 30;

nlohmann::json Serialize(const Settings& settings)
{
    nlohmann::json json;
    json["stateDirectory"] = settings.stateDirectory.string();
    json["kdfProfile"] = ToString(settings.kdfProfile);
    json["defaultRecoveryWindowDays"] = settings.defaultRecoveryWindowDays;
    return json;
}

Settings Deserialize(const nlohmann::json& json, Settings settings)
{
    if (const auto it = json.find("stateDirectory"); it != json.end() && it->is_string())
    {
        const auto value = it->get<std::string>();
        if (!value.empty())
        {
            settings.stateDirectory = std::filesystem::path{value};
        }
    }
    if (const auto it = json.find("kdfProfile"); it != json.end() && it->is_string())
    {
        settings.kdfProfile = ParseKdfProfile(it->get<std::string>());
    }
    if (const auto it = json.find("defaultRecoveryWindowDays"); it != json.end() && it->is_number_integer())
    {
        settings.defaultRecoveryWindowDays =
            std::clamp(it->get<int>(), kMinRecoveryWindow, kMaxRecoveryWindow);
    }
    return settings;
}

Settings Defaults()
{
    Settings settings;
    settings.stateDirectory = DefaultHome();
    return settings;
}

} // namespace

Settings LoadSettings(const std::filesystem::path& path)
{
    Settings settings = Defaults();
    std::error_code error;
    if (!std::filesystem::exists(path, error))
    {
        return settings;
    }

    std::ifstream input{path};
    if (!input.is_open())
    {
        return settings;
    }

    try
    {
        const nlohmann::json document = nlohmann::json::parse(input, nullptr, true, true);
        if (document.is_object())
        {
            settings = Deserialize(document, settings);
        }
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[stagehand] Ignoring unreadable settings file " << path << ": " << ex.what() << '\n';
        return Defaults();
    }

    return settings;
}

void SaveSettings(const Settings& settings, const std::filesystem::path& path)
{
    std::error_code error;
    const auto directory = path.parent_path();
    if (!directory.empty() && !std::filesystem::exists(directory, error))
    {
        std::filesystem::create_directories(directory, error);
    }

    std::ofstream output{path};
    if (!output.is_open())
    {
        std::cerr << "[stagehand] Unable to write settings file: " << path << '\n';
        return;
    }

    output << Serialize(settings).dump(2);
}

std::filesystem::path DefaultHome()
{
    if (const char* homeOverride = std::getenv("STAGEHAND_HOME"); homeOverride != nullptr && *homeOverride != '\0')
    {
        return std::filesystem::path{homeOverride};
    }

    std::filesystem::path base = std::filesystem::path{std::getenv("HOME") ? std::getenv("HOME") : ""};
#ifdef _WIN32
    if (base.empty())
    {
        if (const char* userProfile = std::getenv("USERPROFILE"))
        {
            base = userProfile;
        }
    }
#endif
    if (base.empty())
    {
        base = std::filesystem::current_path();
    }
    return base / kHomeDir;
}

std::filesystem::path DefaultSettingsPath()
{
    return DefaultHome() / kSettingsFile;
}

KdfProfile ParseKdfProfile(const std::string& value)
{
    if (value == "interactive")
    {
        return KdfProfile::Interactive;
    }
    if (value == "sensitive")
    {
        return KdfProfile::Sensitive;
    }
    return KdfProfile::Moderate;
}

std::string ToString(KdfProfile profile)
{
    switch (profile)
    {
    case KdfProfile::Interactive:
        return "interactive";
    case KdfProfile::Moderate:
        return "moderate";
    case KdfProfile::Sensitive:
        return "sensitive";
    }
    return "moderate";
}

} // namespace stagehand::core
