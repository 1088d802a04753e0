#include "stagehand/bridge/StagingBridge.hpp"

#include "bridge/Serialization.hpp"

#include <exception>
#include <utility>

namespace stagehand::bridge {

namespace {

template <typename Call>
BridgeResponse respond(Call &&call) {
    BridgeResponse response;
    try {
        response.data = call();
    } catch (const core::StagingError &error) {
        response.error = BridgeError{error.kind(), error.what()};
    } catch (const std::exception &error) {
        response.error = BridgeError{core::ErrorKind::Internal, error.what()};
    }
    return response;
}

std::optional<std::string> nonEmpty(const std::string &value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

nlohmann::json BridgeResponse::toJson() const {
    if (error) {
        return {{"ok", false},
                {"error", {{"kind", std::string(core::toString(error->kind))}, {"message", error->message}}}};
    }
    return {{"ok", true}, {"data", data}};
}

staging::Service serviceFromTag(const std::string &tag) {
    auto service = staging::parseService(tag);
    if (!service) {
        throw core::StagingError(core::ErrorKind::InvalidService, "unknown service: '" + tag + "'");
    }
    return *service;
}

std::optional<staging::Service> optionalServiceFromTag(const std::string &tag) {
    if (tag.empty()) {
        return std::nullopt;
    }
    return serviceFromTag(tag);
}

StagingBridge::StagingBridge(core::Settings settings, core::Scope scope, store::StoreRegistry &registry,
                             std::shared_ptr<strategy::FullStrategy> parameterStrategy,
                             std::shared_ptr<strategy::FullStrategy> secretStrategy)
    : settings_(std::move(settings)),
      scope_(std::move(scope)),
      resident_(registry.acquire(scope_)),
      parameterStrategy_(std::move(parameterStrategy)),
      secretStrategy_(std::move(secretStrategy)) {}

strategy::FullStrategy &StagingBridge::strategyFor(const std::string &service) const {
    const auto &strategy =
        serviceFromTag(service) == staging::Service::Parameter ? parameterStrategy_ : secretStrategy_;
    if (!strategy) {
        throw core::StagingError(core::ErrorKind::InvalidService,
                                 "no strategy configured for service '" + service + "'");
    }
    return *strategy;
}

store::FileStore StagingBridge::fileStore(const std::string &passphrase) const {
    return store::FileStore::forScope(settings_, scope_, passphrase);
}

BridgeResponse StagingBridge::status(const core::Context &ctx, const StatusRequest &request) {
    return respond([&] {
        usecase::StatusInput input{optionalServiceFromTag(request.service), nonEmpty(request.name)};
        return nlohmann::json(usecase::StatusUseCase(*resident_).execute(ctx, input));
    });
}

BridgeResponse StagingBridge::add(const core::Context &ctx, const AddRequest &request) {
    return respond([&] {
        usecase::AddUseCase useCase(strategyFor(request.service), *resident_);
        return nlohmann::json(useCase.execute(ctx, {request.name, request.value, nonEmpty(request.description)}));
    });
}

BridgeResponse StagingBridge::draft(const core::Context &ctx, const NameRequest &request) {
    return respond([&] {
        usecase::AddUseCase useCase(strategyFor(request.service), *resident_);
        return nlohmann::json(useCase.draft(ctx, request.name));
    });
}

BridgeResponse StagingBridge::edit(const core::Context &ctx, const EditRequest &request) {
    return respond([&] {
        usecase::EditUseCase useCase(strategyFor(request.service), *resident_);
        return nlohmann::json(useCase.execute(ctx, {request.name, request.value, nonEmpty(request.description)}));
    });
}

BridgeResponse StagingBridge::baseline(const core::Context &ctx, const NameRequest &request) {
    return respond([&] {
        usecase::EditUseCase useCase(strategyFor(request.service), *resident_);
        return nlohmann::json(useCase.baseline(ctx, request.name));
    });
}

BridgeResponse StagingBridge::remove(const core::Context &ctx, const DeleteRequest &request) {
    return respond([&] {
        usecase::DeleteUseCase useCase(strategyFor(request.service), *resident_, settings_.defaultRecoveryWindowDays);
        usecase::DeleteInput input{request.name, request.force, std::nullopt};
        if (request.recoveryWindow > 0) {
            input.recoveryWindow = request.recoveryWindow;
        }
        return nlohmann::json(useCase.execute(ctx, input));
    });
}

BridgeResponse StagingBridge::tag(const core::Context &ctx, const TagRequest &request) {
    return respond([&] {
        usecase::TagUseCase useCase(strategyFor(request.service), *resident_);
        staging::TagMap tags(request.tags.begin(), request.tags.end());
        return nlohmann::json(useCase.tag(ctx, {request.name, std::move(tags)}));
    });
}

BridgeResponse StagingBridge::untag(const core::Context &ctx, const UntagRequest &request) {
    return respond([&] {
        usecase::TagUseCase useCase(strategyFor(request.service), *resident_);
        staging::KeySet keys(request.keys.begin(), request.keys.end());
        return nlohmann::json(useCase.untag(ctx, {request.name, std::move(keys)}));
    });
}

BridgeResponse StagingBridge::cancelAddTag(const core::Context &ctx, const CancelTagRequest &request) {
    return respond([&] {
        usecase::TagUseCase useCase(strategyFor(request.service), *resident_);
        return nlohmann::json(useCase.cancelAddTag(ctx, {request.name, request.key}));
    });
}

BridgeResponse StagingBridge::cancelRemoveTag(const core::Context &ctx, const CancelTagRequest &request) {
    return respond([&] {
        usecase::TagUseCase useCase(strategyFor(request.service), *resident_);
        return nlohmann::json(useCase.cancelRemoveTag(ctx, {request.name, request.key}));
    });
}

BridgeResponse StagingBridge::unstage(const core::Context &ctx, const NameRequest &request) {
    return respond([&] {
        auto &strategy = strategyFor(request.service);
        const auto name = strategy.parseName(request.name);
        usecase::ResetUseCase(strategy, *resident_).unstage(ctx, name);
        return nlohmann::json{{"name", name}};
    });
}

BridgeResponse StagingBridge::reset(const core::Context &ctx, const ResetRequest &request) {
    return respond([&] {
        usecase::ResetUseCase useCase(strategyFor(request.service), *resident_);
        return nlohmann::json(useCase.execute(ctx, {request.spec, request.all}));
    });
}

BridgeResponse StagingBridge::diff(const core::Context &ctx, const DiffRequest &request) {
    return respond([&] {
        usecase::DiffUseCase useCase(strategyFor(request.service), *resident_);
        return nlohmann::json(useCase.execute(ctx, {nonEmpty(request.name)}));
    });
}

BridgeResponse StagingBridge::apply(const core::Context &ctx, const ApplyRequest &request) {
    return respond([&] {
        usecase::ApplyUseCase useCase(strategyFor(request.service), *resident_);
        return nlohmann::json(useCase.execute(ctx, {nonEmpty(request.name), request.ignoreConflicts}));
    });
}

BridgeResponse StagingBridge::drain(const core::Context &ctx, const DrainRequest &request) {
    return respond([&] {
        auto file = fileStore(request.passphrase);
        usecase::DrainInput input{optionalServiceFromTag(request.service), request.keep, request.force, request.merge};
        return nlohmann::json(usecase::DrainUseCase(file, *resident_).execute(ctx, input));
    });
}

BridgeResponse StagingBridge::persist(const core::Context &ctx, const PersistRequest &request) {
    return respond([&] {
        auto file = fileStore(request.passphrase);
        usecase::PersistInput input{optionalServiceFromTag(request.service), request.keep, request.merge};
        return nlohmann::json(usecase::PersistUseCase(*resident_, file).execute(ctx, input));
    });
}

BridgeResponse StagingBridge::fileStatus(const core::Context &ctx, const FileStatusRequest &request) {
    return respond([&] {
        ctx.throwIfCancelled();
        auto file = fileStore(request.passphrase);
        return nlohmann::json{
            {"path", file.path().string()}, {"exists", file.exists()}, {"encrypted", file.isEncrypted()}};
    });
}

} // namespace stagehand::bridge
