#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "stagehand/core/Error.hpp"
#include "stagehand/store/ResidentStore.hpp"
#include "stagehand/strategy/ParameterStrategy.hpp"
#include "stagehand/strategy/SecretStrategy.hpp"
#include "stagehand/usecase/Apply.hpp"
#include "stagehand/usecase/Diff.hpp"
#include "stagehand/usecase/Reset.hpp"
#include "support/FakeRemote.hpp"

#include <chrono>
#include <memory>
#include <stop_token>

using namespace stagehand;
using namespace stagehand::staging;
using namespace stagehand::usecase;

namespace
{
const Clock::time_point kStagedBase{std::chrono::seconds{1'600'000'000}};

struct Fixture
{
    core::Context ctx;
    std::shared_ptr<testing::FakeParameterClient> client = std::make_shared<testing::FakeParameterClient>();
    strategy::ParameterStrategy strategy{client};
    store::ResidentStore store{core::Scope{"123456789012", "us-east-1"}};

    void stage(const std::string& name, Operation operation, std::optional<std::string> value = std::nullopt,
               std::optional<Clock::time_point> base = std::nullopt)
    {
        Entry entry;
        entry.operation = operation;
        entry.value = std::move(value);
        entry.stagedAt = Clock::now();
        entry.baseModifiedAt = base;
        store.stageEntry(ctx, Service::Parameter, name, entry);
    }
};

// Requests cancellation once the first write has gone through.
class StoppingParameterClient : public testing::FakeParameterClient
{
public:
    explicit StoppingParameterClient(std::stop_source source) : source_(std::move(source)) {}

    std::int64_t putParameter(const core::Context& ctx, const strategy::PutParameterRequest& request) override
    {
        const auto version = FakeParameterClient::putParameter(ctx, request);
        source_.request_stop();
        return version;
    }

private:
    std::stop_source source_;
};

const DiffEntry& find_diff(const DiffOutput& output, const std::string& name)
{
    for (const auto& entry : output.entries)
    {
        if (entry.name == name)
        {
            return entry;
        }
    }
    FAIL("no diff entry for " << name);
    return output.entries.front();
}
}

TEST_CASE("Reset unstages one item, all items or restores a version")
{
    Fixture fx;
    fx.client->seed("/app/key", "v1");
    fx.client->seed("/app/key", "v2");
    ResetUseCase reset{fx.strategy, fx.store};

    CHECK(reset.execute(fx.ctx, {"/app/key"}).result == ResetResult::NotStaged);

    const auto restored = reset.execute(fx.ctx, {"/app/key#1"});
    CHECK(restored.result == ResetResult::Restored);
    CHECK(restored.versionLabel == "#1");
    CHECK(fx.store.getEntry(fx.ctx, Service::Parameter, "/app/key").value == "v1");

    CHECK(reset.execute(fx.ctx, {"/app/key"}).result == ResetResult::Unstaged);
    CHECK(fx.store.listEntries(fx.ctx, Service::Parameter).empty());

    fx.stage("/a", Operation::Delete);
    fx.stage("/b", Operation::Delete);
    const auto all = reset.execute(fx.ctx, {"", true});
    CHECK(all.result == ResetResult::UnstagedAll);
    CHECK(all.count == 2);
    CHECK(reset.execute(fx.ctx, {"", true}).result == ResetResult::NothingStaged);
    CHECK(toString(ResetResult::UnstagedAll) == "unstagedAll");
}

TEST_CASE("Diff classifies staged entries against the remote state")
{
    Fixture fx;
    fx.client->seed("/update", "old", kStagedBase);
    fx.client->seed("/same", "value", kStagedBase);
    fx.client->seed("/exists", "value", kStagedBase);
    fx.client->seed("/drifted", "old", kStagedBase + std::chrono::hours{1});

    fx.stage("/update", Operation::Update, "new", kStagedBase);
    fx.stage("/same", Operation::Update, "value", kStagedBase);
    fx.stage("/exists", Operation::Create, "value");
    fx.stage("/fresh", Operation::Create, "value");
    fx.stage("/vanished", Operation::Update, "value", kStagedBase);
    fx.stage("/gone", Operation::Delete);
    fx.stage("/drifted", Operation::Update, "new", kStagedBase);

    DiffUseCase diff{fx.strategy, fx.store};
    const auto output = diff.execute(fx.ctx, {});
    CHECK(output.itemName == "parameter");

    const auto& update = find_diff(output, "/update");
    CHECK(update.type == DiffEntryType::Normal);
    CHECK(update.remoteValue == "old");
    CHECK(update.stagedValue == "new");
    CHECK(update.remoteIdentifier == "#1");

    CHECK(find_diff(output, "/same").type == DiffEntryType::AutoUnstaged);
    CHECK(find_diff(output, "/exists").type == DiffEntryType::AutoUnstaged);
    CHECK(find_diff(output, "/fresh").type == DiffEntryType::Create);
    CHECK(find_diff(output, "/vanished").type == DiffEntryType::AutoUnstaged);
    CHECK(find_diff(output, "/gone").warning == "already deleted remotely");
    CHECK(find_diff(output, "/drifted").type == DiffEntryType::Warning);

    const auto remaining = fx.store.listEntries(fx.ctx, Service::Parameter);
    CHECK(remaining.size() == 3);
    CHECK(remaining.count("/update") == 1);
    CHECK(remaining.count("/fresh") == 1);
    CHECK(remaining.count("/drifted") == 1);
}

TEST_CASE("Diff reports unstaged names and remote failures as warnings")
{
    Fixture fx;
    fx.stage("/app/key", Operation::Update, "v", kStagedBase);
    DiffUseCase diff{fx.strategy, fx.store};

    const auto missing = diff.execute(fx.ctx, {std::string{"/other"}});
    REQUIRE(missing.entries.size() == 1);
    CHECK(missing.entries[0].warning == "not staged");

    fx.client->failReads = true;
    const auto failed = diff.execute(fx.ctx, {});
    REQUIRE(failed.entries.size() == 1);
    CHECK(failed.entries[0].type == DiffEntryType::Warning);
    CHECK(fx.store.listEntries(fx.ctx, Service::Parameter).size() == 1);
}

TEST_CASE("Apply unstages successes and keeps failures staged")
{
    Fixture fx;
    fx.client->seed("/update", "old", kStagedBase);
    fx.client->seed("/broken", "old", kStagedBase);
    fx.client->failing.insert("/broken");

    fx.stage("/create", Operation::Create, "v");
    fx.stage("/update", Operation::Update, "new", kStagedBase);
    fx.stage("/broken", Operation::Update, "new", kStagedBase);

    TagEntry tags;
    tags.add = {{"env", "prod"}};
    fx.store.stageTag(fx.ctx, Service::Parameter, "/update", tags);

    ApplyUseCase apply{fx.strategy, fx.store};
    const auto output = apply.execute(fx.ctx, {});
    CHECK(output.entrySucceeded == 2);
    CHECK(output.entryFailed == 1);
    CHECK(output.tagSucceeded == 1);
    CHECK(output.failed());
    CHECK_FALSE(output.cancelled);

    REQUIRE(output.entryResults.size() == 3);
    CHECK(output.entryResults[0].name == "/broken");
    REQUIRE(output.entryResults[0].error.has_value());
    CHECK(output.entryResults[0].error->kind == core::ErrorKind::RemoteOperationFailed);

    const auto remaining = fx.store.listEntries(fx.ctx, Service::Parameter);
    CHECK(remaining.size() == 1);
    CHECK(remaining.count("/broken") == 1);
    CHECK(fx.store.listTags(fx.ctx, Service::Parameter).empty());
    CHECK(fx.client->tags.at("/update").at("env") == "prod");
}

TEST_CASE("Apply leaves conflicting items staged unless told to ignore them")
{
    Fixture fx;
    fx.client->seed("/drifted", "old", kStagedBase + std::chrono::hours{1});
    fx.client->seed("/taken", "theirs", kStagedBase);
    fx.client->seed("/fine", "old", kStagedBase);

    fx.stage("/drifted", Operation::Update, "mine", kStagedBase);
    fx.stage("/taken", Operation::Create, "mine");
    fx.stage("/fine", Operation::Update, "new", kStagedBase);

    ApplyUseCase apply{fx.strategy, fx.store};
    const auto output = apply.execute(fx.ctx, {});
    CHECK(output.conflicts == std::vector<std::string>{"/drifted", "/taken"});
    CHECK(output.entrySucceeded == 1);
    CHECK(fx.store.listEntries(fx.ctx, Service::Parameter).size() == 2);

    fx.store.unstageEntry(fx.ctx, Service::Parameter, "/taken");
    const auto forced = apply.execute(fx.ctx, {std::nullopt, true});
    CHECK(forced.conflicts.empty());
    CHECK(forced.entrySucceeded == 1);
    CHECK(fx.client->parameters.at("/drifted").back().value == "mine");
}

TEST_CASE("Apply of a single unstaged name reports NotStaged")
{
    Fixture fx;
    ApplyUseCase apply{fx.strategy, fx.store};
    CHECK_THROWS_AS((void)apply.execute(fx.ctx, {std::string{"/nothing"}}), core::StagingError);
}

TEST_CASE("Cancelling mid-pass keeps the unprocessed items staged")
{
    Fixture fx;
    fx.stage("/a", Operation::Create, "v");
    fx.stage("/b", Operation::Create, "v");

    std::stop_source source;
    const core::Context ctx{source.get_token()};
    auto client = std::make_shared<StoppingParameterClient>(source);
    strategy::ParameterStrategy strategy{client};

    ApplyUseCase apply{strategy, fx.store};
    const auto output = apply.execute(ctx, {std::nullopt, true});
    CHECK(output.cancelled);
    CHECK(output.entrySucceeded == 1);
    CHECK(client->putCalls == 1);

    const auto remaining = fx.store.listEntries(fx.ctx, Service::Parameter);
    REQUIRE(remaining.size() == 1);
    CHECK(remaining.count("/b") == 1);
}

TEST_CASE("An already cancelled apply touches nothing")
{
    Fixture fx;
    fx.stage("/a", Operation::Create, "v");

    std::stop_source source;
    source.request_stop();
    ApplyUseCase apply{fx.strategy, fx.store};
    try
    {
        (void)apply.execute(core::Context{source.get_token()}, {});
        FAIL("expected cancellation");
    }
    catch (const core::StagingError& error)
    {
        CHECK(error.kind() == core::ErrorKind::Cancelled);
    }
    CHECK(fx.client->putCalls == 0);
    CHECK(fx.store.listEntries(fx.ctx, Service::Parameter).size() == 1);
}

TEST_CASE("Secret deletes are applied with their recovery window")
{
    core::Context ctx;
    auto client = std::make_shared<testing::FakeSecretClient>();
    client->seed("db", "pw");
    strategy::SecretStrategy strategy{client};
    store::ResidentStore store{core::Scope{}};

    Entry removal;
    removal.operation = Operation::Delete;
    removal.deleteOptions = DeleteOptions{false, 21};
    store.stageEntry(ctx, Service::Secret, "db", removal);

    ApplyUseCase apply{strategy, store};
    const auto output = apply.execute(ctx, {});
    CHECK(output.serviceName == "Secrets Manager");
    REQUIRE(output.entryResults.size() == 1);
    CHECK(output.entryResults[0].status == strategy::ApplyStatus::Deleted);
    CHECK(client->lastDeleteOptions->recoveryWindow == 21);
    CHECK(client->secrets.empty());
}
