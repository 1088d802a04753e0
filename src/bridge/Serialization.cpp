#include "bridge/Serialization.hpp"

#include <string>

namespace stagehand::usecase {

namespace {

nlohmann::json failureJson(const std::optional<ApplyFailure> &failure) {
    if (!failure) {
        return nullptr;
    }
    return {{"kind", std::string(core::toString(failure->kind))}, {"message", failure->message}};
}

template <typename T>
nlohmann::json optionalJson(const std::optional<T> &value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

} // namespace

void to_json(nlohmann::json &json, const StatusOutput &output) {
    json = nlohmann::json{{"entries", nlohmann::json::array()}, {"tagEntries", nlohmann::json::array()}};
    for (const auto &item : output.entries) {
        nlohmann::json entry = item.entry;
        entry["service"] = std::string(staging::toString(item.service));
        entry["name"] = item.name;
        json["entries"].push_back(std::move(entry));
    }
    for (const auto &item : output.tagEntries) {
        nlohmann::json entry = item.tagEntry;
        entry["service"] = std::string(staging::toString(item.service));
        entry["name"] = item.name;
        json["tagEntries"].push_back(std::move(entry));
    }
}

void to_json(nlohmann::json &json, const AddOutput &output) {
    json = {{"name", output.name}};
}

void to_json(nlohmann::json &json, const DraftOutput &output) {
    json = {{"value", output.value}, {"staged", output.staged}};
}

void to_json(nlohmann::json &json, const EditOutput &output) {
    json = {{"name", output.name}, {"result", std::string(toString(output.result))}};
}

void to_json(nlohmann::json &json, const BaselineOutput &output) {
    json = {{"value", output.value}, {"fromStage", output.fromStage}};
}

void to_json(nlohmann::json &json, const DeleteOutput &output) {
    json = {{"name", output.name},
            {"unstaged", output.unstaged},
            {"showDeleteOptions", output.showDeleteOptions},
            {"force", output.force},
            {"recoveryWindow", output.recoveryWindow}};
}

void to_json(nlohmann::json &json, const TagOutput &output) {
    json = {{"name", output.name}, {"staged", output.staged}};
}

void to_json(nlohmann::json &json, const ResetOutput &output) {
    json = {{"result", std::string(toString(output.result))},
            {"name", output.name},
            {"versionLabel", output.versionLabel},
            {"count", output.count},
            {"serviceName", output.serviceName},
            {"itemName", output.itemName}};
}

void to_json(nlohmann::json &json, const DiffOutput &output) {
    json = nlohmann::json{{"itemName", output.itemName},
                          {"entries", nlohmann::json::array()},
                          {"tagEntries", nlohmann::json::array()}};
    for (const auto &entry : output.entries) {
        json["entries"].push_back({
            {"name", entry.name},
            {"type", std::string(toString(entry.type))},
            {"operation", entry.operation ? nlohmann::json(std::string(staging::toString(*entry.operation))) : nullptr},
            {"remoteValue", entry.remoteValue},
            {"remoteIdentifier", entry.remoteIdentifier},
            {"stagedValue", entry.stagedValue},
            {"description", optionalJson(entry.description)},
            {"warning", entry.warning},
        });
    }
    for (const auto &entry : output.tagEntries) {
        json["tagEntries"].push_back({{"name", entry.name}, {"add", entry.add}, {"remove", entry.remove}});
    }
}

void to_json(nlohmann::json &json, const ApplyOutput &output) {
    json = nlohmann::json{{"serviceName", output.serviceName},
                          {"itemName", output.itemName},
                          {"entryResults", nlohmann::json::array()},
                          {"entrySucceeded", output.entrySucceeded},
                          {"entryFailed", output.entryFailed},
                          {"tagResults", nlohmann::json::array()},
                          {"tagSucceeded", output.tagSucceeded},
                          {"tagFailed", output.tagFailed},
                          {"conflicts", output.conflicts},
                          {"cancelled", output.cancelled}};
    for (const auto &result : output.entryResults) {
        json["entryResults"].push_back({{"name", result.name},
                                        {"status", std::string(strategy::toString(result.status))},
                                        {"error", failureJson(result.error)}});
    }
    for (const auto &result : output.tagResults) {
        json["tagResults"].push_back({{"name", result.name},
                                      {"add", result.add},
                                      {"remove", result.remove},
                                      {"error", failureJson(result.error)}});
    }
}

void to_json(nlohmann::json &json, const DrainOutput &output) {
    json = {{"entryCount", output.entryCount},
            {"tagCount", output.tagCount},
            {"merged", output.merged},
            {"fileCleanupFailed", output.fileCleanupFailed}};
}

void to_json(nlohmann::json &json, const PersistOutput &output) {
    json = {{"entryCount", output.entryCount}, {"tagCount", output.tagCount}};
}

} // namespace stagehand::usecase
