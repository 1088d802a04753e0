#pragma once

#include "stagehand/core/Context.hpp"
#include "stagehand/staging/State.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stagehand::strategy {

// Remote resource APIs the strategies adapt. Implementations report absence through
// empty optionals and any other failure by throwing.

struct ParameterRecord {
    std::string name;
    std::string value;
    std::string type = "String";
    std::int64_t version = 0;
    std::optional<staging::Clock::time_point> lastModified;
    std::optional<std::string> description;
};

struct PutParameterRequest {
    std::string name;
    std::string value;
    std::string type = "String";
    std::optional<std::string> description;
    bool overwrite = false;
};

class ParameterClient {
public:
    virtual ~ParameterClient() = default;

    virtual std::optional<ParameterRecord> getParameter(const core::Context &ctx, const std::string &name) = 0;

    // Every stored version, oldest first. Empty when the parameter does not exist.
    virtual std::vector<ParameterRecord> getParameterHistory(const core::Context &ctx, const std::string &name) = 0;

    // Returns the new version number.
    virtual std::int64_t putParameter(const core::Context &ctx, const PutParameterRequest &request) = 0;

    // Returns false when the parameter did not exist.
    virtual bool deleteParameter(const core::Context &ctx, const std::string &name) = 0;

    virtual void addTags(const core::Context &ctx, const std::string &name, const staging::TagMap &tags) = 0;
    virtual void removeTags(const core::Context &ctx, const std::string &name, const staging::KeySet &keys) = 0;
    virtual std::vector<std::string> listParameters(const core::Context &ctx) = 0;
};

struct SecretRecord {
    std::string name;
    std::string arn;
    std::string value;
    std::string versionId;
    std::vector<std::string> stages;
    std::optional<staging::Clock::time_point> lastModified;
    std::optional<std::string> description;
};

struct SecretSelector {
    std::optional<std::string> versionId;
    std::optional<std::string> label;
};

struct CreateSecretRequest {
    std::string name;
    std::string value;
    std::optional<std::string> description;
};

class SecretClient {
public:
    virtual ~SecretClient() = default;

    // Without a selector the AWSCURRENT version is returned.
    virtual std::optional<SecretRecord> getSecret(const core::Context &ctx, const std::string &name,
                                                  const SecretSelector &selector = {}) = 0;

    // Every version, newest first. Values are not populated.
    virtual std::vector<SecretRecord> listSecretVersions(const core::Context &ctx, const std::string &name) = 0;

    // Returns the ARN of the new secret.
    virtual std::string createSecret(const core::Context &ctx, const CreateSecretRequest &request) = 0;

    // Returns the new version id.
    virtual std::string putSecretValue(const core::Context &ctx, const std::string &name,
                                       const std::string &value) = 0;
    virtual void updateDescription(const core::Context &ctx, const std::string &name,
                                   const std::string &description) = 0;

    // Returns false when the secret did not exist.
    virtual bool deleteSecret(const core::Context &ctx, const std::string &name,
                              const staging::DeleteOptions &options) = 0;

    virtual void tagResource(const core::Context &ctx, const std::string &name, const staging::TagMap &tags) = 0;
    virtual void untagResource(const core::Context &ctx, const std::string &name,
                               const staging::KeySet &keys) = 0;
    virtual std::vector<std::string> listSecrets(const core::Context &ctx) = 0;
};

} // namespace stagehand::strategy
