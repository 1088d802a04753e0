#pragma once

#include "stagehand/core/Context.hpp"
#include "stagehand/staging/State.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace stagehand::strategy {

// Identity shared by every capability of one resource kind.
class ServiceStrategy {
public:
    virtual ~ServiceStrategy() = default;

    [[nodiscard]] virtual staging::Service service() const noexcept = 0;
    // Human readable service name, e.g. "SSM Parameter Store".
    [[nodiscard]] virtual std::string serviceName() const = 0;
    // Item noun used in messages, e.g. "parameter".
    [[nodiscard]] virtual std::string itemName() const = 0;
    [[nodiscard]] virtual bool hasDeleteOptions() const noexcept = 0;
};

struct ParsedSpec {
    std::string name;
    bool hasVersion = false;
};

// Name validation without remote access.
class Parser : public virtual ServiceStrategy {
public:
    // Returns the bare name; throws StagingError(InvalidArgument) when a version specifier is present.
    virtual std::string parseName(const std::string &input) const = 0;
    virtual ParsedSpec parseSpec(const std::string &input) const = 0;
};

struct RemoteValue {
    std::string value;
    // Display form of the remote version, "#3" for a parameter or "#<id>" for a secret.
    std::string identifier;
    std::optional<staging::Clock::time_point> lastModified;
};

// Every fetch below returns an empty optional when the item does not exist remotely and throws
// StagingError(RemoteOperationFailed) on any other remote failure.

class EditStrategy : public virtual Parser {
public:
    virtual std::optional<RemoteValue> fetchCurrentValue(const core::Context &ctx, const std::string &name) = 0;
};

// fetchLastModified is empty when the item does not exist remotely. An existing item whose
// modification time is unknown reports the epoch.

class DeleteStrategy : public virtual Parser {
public:
    virtual std::optional<staging::Clock::time_point> fetchLastModified(const core::Context &ctx,
                                                                         const std::string &name) = 0;
};

enum class ApplyStatus {
    Created,
    Updated,
    Deleted,
    Failed,
};

class ApplyStrategy : public virtual ServiceStrategy {
public:
    // Pushes one staged entry and reports what happened remotely. Deleting an item that
    // is already gone counts as deleted.
    virtual ApplyStatus apply(const core::Context &ctx, const std::string &name, const staging::Entry &entry) = 0;
    virtual void applyTags(const core::Context &ctx, const std::string &name, const staging::TagEntry &tagEntry) = 0;
    virtual std::optional<staging::Clock::time_point> fetchLastModified(const core::Context &ctx,
                                                                         const std::string &name) = 0;
};

class DiffStrategy : public virtual ServiceStrategy {
public:
    virtual std::optional<RemoteValue> fetchCurrent(const core::Context &ctx, const std::string &name) = 0;
};

class ResetStrategy : public virtual Parser {
public:
    // Resolves a version spec; throws StagingError(ResourceNotFound) when the version does not exist.
    virtual RemoteValue fetchVersion(const core::Context &ctx, const std::string &spec) = 0;
};

class FullStrategy : public EditStrategy,
                     public DeleteStrategy,
                     public ApplyStrategy,
                     public DiffStrategy,
                     public ResetStrategy {};

[[nodiscard]] std::string_view toString(ApplyStatus status) noexcept;

} // namespace stagehand::strategy
