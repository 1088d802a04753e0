#pragma once

#include "stagehand/strategy/RemoteClient.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <memory>

namespace stagehand::strategy {

// Secrets Manager flavour of every staging capability.
class SecretStrategy final : public FullStrategy {
public:
    explicit SecretStrategy(std::shared_ptr<SecretClient> client = nullptr);

    [[nodiscard]] staging::Service service() const noexcept override { return staging::Service::Secret; }
    [[nodiscard]] std::string serviceName() const override { return "Secrets Manager"; }
    [[nodiscard]] std::string itemName() const override { return "secret"; }
    [[nodiscard]] bool hasDeleteOptions() const noexcept override { return true; }

    std::string parseName(const std::string &input) const override;
    ParsedSpec parseSpec(const std::string &input) const override;

    std::optional<RemoteValue> fetchCurrentValue(const core::Context &ctx, const std::string &name) override;
    std::optional<RemoteValue> fetchCurrent(const core::Context &ctx, const std::string &name) override;
    std::optional<staging::Clock::time_point> fetchLastModified(const core::Context &ctx,
                                                                 const std::string &name) override;

    ApplyStatus apply(const core::Context &ctx, const std::string &name, const staging::Entry &entry) override;
    void applyTags(const core::Context &ctx, const std::string &name, const staging::TagEntry &tagEntry) override;

    RemoteValue fetchVersion(const core::Context &ctx, const std::string &spec) override;

private:
    std::optional<SecretRecord> fetch(const core::Context &ctx, const std::string &name,
                                      const SecretSelector &selector = {});

    std::shared_ptr<SecretClient> client_;
};

// Version ids are shown by their first eight characters.
[[nodiscard]] std::string truncateVersionId(const std::string &versionId);

} // namespace stagehand::strategy
