#include "stagehand/strategy/ParameterStrategy.hpp"

#include "stagehand/core/Error.hpp"
#include "stagehand/strategy/VersionSpec.hpp"
#include "strategy/RemoteCall.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace stagehand::strategy {

namespace {

RemoteValue toRemoteValue(const ParameterRecord &record) {
    return {record.value, "#" + std::to_string(record.version), record.lastModified};
}

} // namespace

ParameterStrategy::ParameterStrategy(std::shared_ptr<ParameterClient> client) : client_(std::move(client)) {}

std::string ParameterStrategy::parseName(const std::string &input) const {
    auto spec = parseParameterSpec(input);
    if (spec.hasVersion()) {
        throw core::StagingError(core::ErrorKind::InvalidArgument,
                                 "expected a parameter name without version specifier: " + input);
    }
    return spec.name;
}

ParsedSpec ParameterStrategy::parseSpec(const std::string &input) const {
    auto spec = parseParameterSpec(input);
    return {spec.name, spec.hasVersion()};
}

std::optional<ParameterRecord> ParameterStrategy::current(const core::Context &ctx, const std::string &name) {
    ctx.throwIfCancelled();
    auto &client = detail::requireClient(client_, serviceName());
    return detail::callRemote("failed to get parameter " + name,
                              [&] { return client.getParameter(ctx, name); });
}

std::optional<RemoteValue> ParameterStrategy::fetchCurrentValue(const core::Context &ctx, const std::string &name) {
    auto record = current(ctx, name);
    if (!record) {
        return std::nullopt;
    }
    return toRemoteValue(*record);
}

std::optional<RemoteValue> ParameterStrategy::fetchCurrent(const core::Context &ctx, const std::string &name) {
    return fetchCurrentValue(ctx, name);
}

std::optional<staging::Clock::time_point> ParameterStrategy::fetchLastModified(const core::Context &ctx,
                                                                              const std::string &name) {
    auto record = current(ctx, name);
    if (!record) {
        return std::nullopt;
    }
    return record->lastModified.value_or(staging::Clock::time_point{});
}

ApplyStatus ParameterStrategy::apply(const core::Context &ctx, const std::string &name,
                                     const staging::Entry &entry) {
    ctx.throwIfCancelled();
    auto &client = detail::requireClient(client_, serviceName());

    switch (entry.operation) {
    case staging::Operation::Create: {
        PutParameterRequest request{name, entry.value.value_or(""), "String", entry.description, false};
        detail::callRemote("failed to create parameter " + name, [&] { return client.putParameter(ctx, request); });
        return ApplyStatus::Created;
    }
    case staging::Operation::Update: {
        auto existing = current(ctx, name);
        if (!existing) {
            throw core::StagingError(core::ErrorKind::ResourceNotFound, "parameter not found: " + name);
        }
        PutParameterRequest request{name, entry.value.value_or(""), existing->type, entry.description, true};
        detail::callRemote("failed to update parameter " + name, [&] { return client.putParameter(ctx, request); });
        return ApplyStatus::Updated;
    }
    case staging::Operation::Delete:
        // A parameter that is already gone counts as deleted.
        detail::callRemote("failed to delete parameter " + name, [&] { return client.deleteParameter(ctx, name); });
        return ApplyStatus::Deleted;
    }

    throw core::StagingError(core::ErrorKind::InvalidArgument, "unknown operation for parameter " + name);
}

void ParameterStrategy::applyTags(const core::Context &ctx, const std::string &name,
                                  const staging::TagEntry &tagEntry) {
    ctx.throwIfCancelled();
    auto &client = detail::requireClient(client_, serviceName());

    if (!tagEntry.add.empty()) {
        detail::callRemote("failed to add tags to parameter " + name,
                           [&] { client.addTags(ctx, name, tagEntry.add); });
    }
    if (!tagEntry.remove.empty()) {
        detail::callRemote("failed to remove tags from parameter " + name,
                           [&] { client.removeTags(ctx, name, tagEntry.remove); });
    }
}

RemoteValue ParameterStrategy::fetchVersion(const core::Context &ctx, const std::string &input) {
    ctx.throwIfCancelled();
    auto spec = parseParameterSpec(input);
    auto &client = detail::requireClient(client_, serviceName());

    auto history = detail::callRemote("failed to get history of parameter " + spec.name,
                                      [&] { return client.getParameterHistory(ctx, spec.name); });
    if (history.empty()) {
        throw core::StagingError(core::ErrorKind::ResourceNotFound, "parameter not found: " + spec.name);
    }

    std::ptrdiff_t index = static_cast<std::ptrdiff_t>(history.size()) - 1;
    if (spec.version) {
        auto it = std::find_if(history.begin(), history.end(),
                               [&](const ParameterRecord &record) { return record.version == *spec.version; });
        if (it == history.end()) {
            throw core::StagingError(core::ErrorKind::ResourceNotFound,
                                     "version " + std::to_string(*spec.version) + " of parameter " + spec.name +
                                         " not found");
        }
        index = std::distance(history.begin(), it);
    }

    index -= spec.shift;
    if (index < 0) {
        throw core::StagingError(core::ErrorKind::ResourceNotFound,
                                 "version shift out of range for parameter " + spec.name);
    }
    return toRemoteValue(history[static_cast<std::size_t>(index)]);
}

} // namespace stagehand::strategy
