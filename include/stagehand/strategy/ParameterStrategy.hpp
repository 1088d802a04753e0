#pragma once

#include "stagehand/strategy/RemoteClient.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <memory>

namespace stagehand::strategy {

// SSM Parameter Store flavour of every staging capability. A strategy without a client
// can still parse names.
class ParameterStrategy final : public FullStrategy {
public:
    explicit ParameterStrategy(std::shared_ptr<ParameterClient> client = nullptr);

    [[nodiscard]] staging::Service service() const noexcept override { return staging::Service::Parameter; }
    [[nodiscard]] std::string serviceName() const override { return "SSM Parameter Store"; }
    [[nodiscard]] std::string itemName() const override { return "parameter"; }
    [[nodiscard]] bool hasDeleteOptions() const noexcept override { return false; }

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
    std::optional<ParameterRecord> current(const core::Context &ctx, const std::string &name);

    std::shared_ptr<ParameterClient> client_;
};

} // namespace stagehand::strategy
