#include "stagehand/strategy/SecretStrategy.hpp"

#include "stagehand/core/Error.hpp"
#include "stagehand/strategy/VersionSpec.hpp"
#include "strategy/RemoteCall.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace stagehand::strategy {

namespace {

constexpr std::size_t kShownVersionIdLength = 8;
constexpr const char *kCurrentStage = "AWSCURRENT";

RemoteValue toRemoteValue(const SecretRecord &record) {
    return {record.value, "#" + truncateVersionId(record.versionId), record.lastModified};
}

bool hasStage(const SecretRecord &record, const std::string &stage) {
    return std::find(record.stages.begin(), record.stages.end(), stage) != record.stages.end();
}

core::StagingError versionNotFound(const std::string &name, const std::string &detail) {
    return core::StagingError(core::ErrorKind::ResourceNotFound, detail + " of secret " + name + " not found");
}

} // namespace

std::string truncateVersionId(const std::string &versionId) {
    return versionId.substr(0, std::min(versionId.size(), kShownVersionIdLength));
}

SecretStrategy::SecretStrategy(std::shared_ptr<SecretClient> client) : client_(std::move(client)) {}

std::string SecretStrategy::parseName(const std::string &input) const {
    auto spec = parseSecretSpec(input);
    if (spec.hasVersion()) {
        throw core::StagingError(core::ErrorKind::InvalidArgument,
                                 "expected a secret name without version specifier: " + input);
    }
    return spec.name;
}

ParsedSpec SecretStrategy::parseSpec(const std::string &input) const {
    auto spec = parseSecretSpec(input);
    return {spec.name, spec.hasVersion()};
}

std::optional<SecretRecord> SecretStrategy::fetch(const core::Context &ctx, const std::string &name,
                                                  const SecretSelector &selector) {
    ctx.throwIfCancelled();
    auto &client = detail::requireClient(client_, serviceName());
    return detail::callRemote("failed to get secret " + name,
                              [&] { return client.getSecret(ctx, name, selector); });
}

std::optional<RemoteValue> SecretStrategy::fetchCurrentValue(const core::Context &ctx, const std::string &name) {
    auto record = fetch(ctx, name);
    if (!record) {
        return std::nullopt;
    }
    return toRemoteValue(*record);
}

std::optional<RemoteValue> SecretStrategy::fetchCurrent(const core::Context &ctx, const std::string &name) {
    return fetchCurrentValue(ctx, name);
}

std::optional<staging::Clock::time_point> SecretStrategy::fetchLastModified(const core::Context &ctx,
                                                                           const std::string &name) {
    auto record = fetch(ctx, name);
    if (!record) {
        return std::nullopt;
    }
    return record->lastModified.value_or(staging::Clock::time_point{});
}

ApplyStatus SecretStrategy::apply(const core::Context &ctx, const std::string &name, const staging::Entry &entry) {
    ctx.throwIfCancelled();
    auto &client = detail::requireClient(client_, serviceName());

    switch (entry.operation) {
    case staging::Operation::Create: {
        CreateSecretRequest request{name, entry.value.value_or(""), entry.description};
        detail::callRemote("failed to create secret " + name, [&] { return client.createSecret(ctx, request); });
        return ApplyStatus::Created;
    }
    case staging::Operation::Update:
        detail::callRemote("failed to update secret " + name,
                           [&] { return client.putSecretValue(ctx, name, entry.value.value_or("")); });
        if (entry.description) {
            detail::callRemote("failed to update description of secret " + name,
                               [&] { client.updateDescription(ctx, name, *entry.description); });
        }
        return ApplyStatus::Updated;
    case staging::Operation::Delete: {
        auto options = entry.deleteOptions.value_or(staging::DeleteOptions{});
        detail::callRemote("failed to delete secret " + name,
                           [&] { return client.deleteSecret(ctx, name, options); });
        return ApplyStatus::Deleted;
    }
    }

    throw core::StagingError(core::ErrorKind::InvalidArgument, "unknown operation for secret " + name);
}

void SecretStrategy::applyTags(const core::Context &ctx, const std::string &name,
                               const staging::TagEntry &tagEntry) {
    ctx.throwIfCancelled();
    auto &client = detail::requireClient(client_, serviceName());

    if (!tagEntry.add.empty()) {
        detail::callRemote("failed to tag secret " + name, [&] { client.tagResource(ctx, name, tagEntry.add); });
    }
    if (!tagEntry.remove.empty()) {
        detail::callRemote("failed to untag secret " + name,
                           [&] { client.untagResource(ctx, name, tagEntry.remove); });
    }
}

RemoteValue SecretStrategy::fetchVersion(const core::Context &ctx, const std::string &input) {
    auto spec = parseSecretSpec(input);
    SecretSelector selector{spec.versionId, spec.label};

    if (spec.shift == 0) {
        auto record = fetch(ctx, spec.name, selector);
        if (!record) {
            throw versionNotFound(spec.name, spec.hasVersion() ? "requested version" : "current version");
        }
        return toRemoteValue(*record);
    }

    ctx.throwIfCancelled();
    auto &client = detail::requireClient(client_, serviceName());
    auto versions = detail::callRemote("failed to list versions of secret " + spec.name,
                                       [&] { return client.listSecretVersions(ctx, spec.name); });
    if (versions.empty()) {
        throw core::StagingError(core::ErrorKind::ResourceNotFound, "secret not found: " + spec.name);
    }

    auto base = versions.begin();
    if (spec.versionId) {
        base = std::find_if(versions.begin(), versions.end(),
                            [&](const SecretRecord &record) { return record.versionId == *spec.versionId; });
    } else {
        const std::string stage = spec.label.value_or(kCurrentStage);
        base = std::find_if(versions.begin(), versions.end(),
                            [&](const SecretRecord &record) { return hasStage(record, stage); });
    }
    if (base == versions.end()) {
        throw versionNotFound(spec.name, "requested version");
    }

    const auto index = static_cast<std::size_t>(std::distance(versions.begin(), base)) +
                       static_cast<std::size_t>(spec.shift);
    if (index >= versions.size()) {
        throw core::StagingError(core::ErrorKind::ResourceNotFound,
                                 "version shift out of range for secret " + spec.name);
    }

    auto record = fetch(ctx, spec.name, SecretSelector{versions[index].versionId, std::nullopt});
    if (!record) {
        throw versionNotFound(spec.name, "requested version");
    }
    return toRemoteValue(*record);
}

} // namespace stagehand::strategy
