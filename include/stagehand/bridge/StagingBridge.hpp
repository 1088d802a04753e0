#pragma once

#include "stagehand/core/Context.hpp"
#include "stagehand/core/Error.hpp"
#include "stagehand/core/Scope.hpp"
#include "stagehand/core/Settings.hpp"
#include "stagehand/store/FileStore.hpp"
#include "stagehand/store/StoreRegistry.hpp"
#include "stagehand/strategy/Strategy.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stagehand::bridge {

// Requests carry the service as its string tag, "param" or "secret". An empty service means all
// services where the operation allows it.

struct StatusRequest {
    std::string service;
    std::string name;
};

struct AddRequest {
    std::string service;
    std::string name;
    std::string value;
    std::string description;
};

using EditRequest = AddRequest;

struct NameRequest {
    std::string service;
    std::string name;
};

struct DeleteRequest {
    std::string service;
    std::string name;
    bool force{false};
    // Zero selects the configured default.
    int recoveryWindow{0};
};

struct TagRequest {
    std::string service;
    std::string name;
    std::map<std::string, std::string> tags;
};

struct UntagRequest {
    std::string service;
    std::string name;
    std::vector<std::string> keys;
};

struct CancelTagRequest {
    std::string service;
    std::string name;
    std::string key;
};

struct ResetRequest {
    std::string service;
    std::string spec;
    bool all{false};
};

struct DiffRequest {
    std::string service;
    std::string name;
};

struct ApplyRequest {
    std::string service;
    std::string name;
    bool ignoreConflicts{false};
};

struct DrainRequest {
    std::string service;
    std::string passphrase;
    bool keep{false};
    bool force{false};
    bool merge{false};
};

struct PersistRequest {
    std::string service;
    std::string passphrase;
    bool keep{false};
    bool merge{false};
};

struct FileStatusRequest {
    std::string passphrase;
};

struct BridgeError {
    core::ErrorKind kind{core::ErrorKind::Internal};
    std::string message;
};

struct BridgeResponse {
    nlohmann::json data;
    std::optional<BridgeError> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
    [[nodiscard]] nlohmann::json toJson() const;
};

// Front-end entry point. Every call returns a response; errors come back classified and are never thrown.
class StagingBridge {
public:
    StagingBridge(core::Settings settings, core::Scope scope, store::StoreRegistry &registry,
                  std::shared_ptr<strategy::FullStrategy> parameterStrategy,
                  std::shared_ptr<strategy::FullStrategy> secretStrategy);

    BridgeResponse status(const core::Context &ctx, const StatusRequest &request);
    BridgeResponse add(const core::Context &ctx, const AddRequest &request);
    BridgeResponse draft(const core::Context &ctx, const NameRequest &request);
    BridgeResponse edit(const core::Context &ctx, const EditRequest &request);
    BridgeResponse baseline(const core::Context &ctx, const NameRequest &request);
    BridgeResponse remove(const core::Context &ctx, const DeleteRequest &request);
    BridgeResponse tag(const core::Context &ctx, const TagRequest &request);
    BridgeResponse untag(const core::Context &ctx, const UntagRequest &request);
    BridgeResponse cancelAddTag(const core::Context &ctx, const CancelTagRequest &request);
    BridgeResponse cancelRemoveTag(const core::Context &ctx, const CancelTagRequest &request);
    BridgeResponse unstage(const core::Context &ctx, const NameRequest &request);
    BridgeResponse reset(const core::Context &ctx, const ResetRequest &request);
    BridgeResponse diff(const core::Context &ctx, const DiffRequest &request);
    BridgeResponse apply(const core::Context &ctx, const ApplyRequest &request);
    BridgeResponse drain(const core::Context &ctx, const DrainRequest &request);
    BridgeResponse persist(const core::Context &ctx, const PersistRequest &request);
    BridgeResponse fileStatus(const core::Context &ctx, const FileStatusRequest &request);

    [[nodiscard]] const std::shared_ptr<store::ResidentStore> &residentStore() const noexcept { return resident_; }

private:
    strategy::FullStrategy &strategyFor(const std::string &service) const;
    [[nodiscard]] store::FileStore fileStore(const std::string &passphrase) const;

    core::Settings settings_;
    core::Scope scope_;
    std::shared_ptr<store::ResidentStore> resident_;
    std::shared_ptr<strategy::FullStrategy> parameterStrategy_;
    std::shared_ptr<strategy::FullStrategy> secretStrategy_;
};

// Resolves a service tag; throws StagingError(InvalidService) for anything unknown.
staging::Service serviceFromTag(const std::string &tag);
std::optional<staging::Service> optionalServiceFromTag(const std::string &tag);

} // namespace stagehand::bridge
