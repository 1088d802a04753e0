#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "stagehand/core/Error.hpp"
#include "stagehand/store/ResidentStore.hpp"
#include "stagehand/strategy/ParameterStrategy.hpp"
#include "stagehand/strategy/SecretStrategy.hpp"
#include "stagehand/usecase/Add.hpp"
#include "stagehand/usecase/Delete.hpp"
#include "stagehand/usecase/Edit.hpp"
#include "stagehand/usecase/Status.hpp"
#include "stagehand/usecase/Tag.hpp"
#include "support/FakeRemote.hpp"

#include <memory>

using namespace stagehand;
using namespace stagehand::staging;
using namespace stagehand::usecase;

namespace
{
struct ParameterFixture
{
    core::Context ctx;
    std::shared_ptr<testing::FakeParameterClient> client = std::make_shared<testing::FakeParameterClient>();
    strategy::ParameterStrategy strategy{client};
    store::ResidentStore store{core::Scope{"123456789012", "us-east-1"}};
};

struct SecretFixture
{
    core::Context ctx;
    std::shared_ptr<testing::FakeSecretClient> client = std::make_shared<testing::FakeSecretClient>();
    strategy::SecretStrategy strategy{client};
    store::ResidentStore store{core::Scope{"123456789012", "us-east-1"}};
};

core::ErrorKind kind_of(auto&& call)
{
    try
    {
        call();
    }
    catch (const core::StagingError& error)
    {
        return error.kind();
    }
    FAIL("expected StagingError");
    return core::ErrorKind::Internal;
}
}

TEST_CASE("Status lists items in service then name order")
{
    ParameterFixture fx;
    fx.client->seed("/b", "1");
    fx.client->seed("/a", "1");
    EditUseCase edit{fx.strategy, fx.store};
    edit.execute(fx.ctx, {"/b", "2"});
    edit.execute(fx.ctx, {"/a", "2"});

    Entry secret;
    secret.operation = Operation::Delete;
    fx.store.stageEntry(fx.ctx, Service::Secret, "db", secret);

    StatusUseCase status{fx.store};
    const auto all = status.execute(fx.ctx, {});
    REQUIRE(all.entries.size() == 3);
    CHECK(all.entries[0].name == "/a");
    CHECK(all.entries[1].name == "/b");
    CHECK(all.entries[2].service == Service::Secret);

    CHECK(status.execute(fx.ctx, {Service::Secret, std::nullopt}).entries.size() == 1);
    CHECK(status.execute(fx.ctx, {Service::Parameter, std::string{"/a"}}).entries.size() == 1);
    CHECK(kind_of([&] { (void)status.execute(fx.ctx, {Service::Parameter, std::string{"/zzz"}}); })
          == core::ErrorKind::NotStaged);
    CHECK(kind_of([&] { (void)status.execute(fx.ctx, {std::nullopt, std::string{"/a"}}); })
          == core::ErrorKind::InvalidArgument);
}

TEST_CASE("Add stages a create and refuses existing items")
{
    ParameterFixture fx;
    fx.client->seed("/existing", "v");
    AddUseCase add{fx.strategy, fx.store};

    add.execute(fx.ctx, {"/new", "value", std::string{"first"}});
    const auto entry = fx.store.getEntry(fx.ctx, Service::Parameter, "/new");
    CHECK(entry.operation == Operation::Create);
    CHECK(entry.value == "value");
    CHECK_FALSE(entry.baseModifiedAt.has_value());

    add.execute(fx.ctx, {"/new", "changed", std::nullopt});
    CHECK(fx.store.getEntry(fx.ctx, Service::Parameter, "/new").description == "first");
    CHECK(add.draft(fx.ctx, "/new").value == "changed");
    CHECK_FALSE(add.draft(fx.ctx, "/other").staged);

    CHECK(kind_of([&] { (void)add.execute(fx.ctx, {"/existing", "x", std::nullopt}); })
          == core::ErrorKind::InvalidTransition);
}

TEST_CASE("Edit records the remote base time and auto-unstages reverts")
{
    ParameterFixture fx;
    const auto modified = Clock::time_point{std::chrono::seconds{1'650'000'000}};
    fx.client->seed("/app/key", "old", modified);
    EditUseCase edit{fx.strategy, fx.store};

    CHECK(edit.execute(fx.ctx, {"/app/key", "new"}).result == EditResult::Staged);
    const auto entry = fx.store.getEntry(fx.ctx, Service::Parameter, "/app/key");
    CHECK(entry.operation == Operation::Update);
    CHECK(entry.baseModifiedAt == modified);

    CHECK(edit.baseline(fx.ctx, "/app/key").fromStage);
    CHECK(edit.execute(fx.ctx, {"/app/key", "old"}).result == EditResult::Unstaged);
    CHECK(fx.store.listEntries(fx.ctx, Service::Parameter).empty());
    CHECK(edit.execute(fx.ctx, {"/app/key", "old"}).result == EditResult::Skipped);
    CHECK(edit.baseline(fx.ctx, "/app/key").value == "old");

    CHECK(kind_of([&] { (void)edit.execute(fx.ctx, {"/missing", "x"}); }) == core::ErrorKind::ResourceNotFound);
}

TEST_CASE("Editing a staged create keeps it a create")
{
    ParameterFixture fx;
    AddUseCase add{fx.strategy, fx.store};
    EditUseCase edit{fx.strategy, fx.store};
    add.execute(fx.ctx, {"/new", "v1", std::nullopt});

    CHECK(edit.execute(fx.ctx, {"/new", "v2"}).result == EditResult::Staged);
    const auto entry = fx.store.getEntry(fx.ctx, Service::Parameter, "/new");
    CHECK(entry.operation == Operation::Create);
    CHECK(entry.value == "v2");
}

TEST_CASE("Deleting a staged create unstages it with its tags")
{
    ParameterFixture fx;
    AddUseCase add{fx.strategy, fx.store};
    TagUseCase tags{fx.strategy, fx.store};
    DeleteUseCase remove{fx.strategy, fx.store};

    add.execute(fx.ctx, {"/new", "v", std::nullopt});
    tags.tag(fx.ctx, {"/new", {{"env", "dev"}}});

    const auto output = remove.execute(fx.ctx, {"/new"});
    CHECK(output.unstaged);
    CHECK(fx.store.listEntries(fx.ctx, Service::Parameter).empty());
    CHECK(fx.store.listTags(fx.ctx, Service::Parameter).empty());
}

TEST_CASE("Deletion blocks edits and validates the recovery window")
{
    SecretFixture fx;
    fx.client->seed("db", "pw");
    DeleteUseCase remove{fx.strategy, fx.store, 10};
    EditUseCase edit{fx.strategy, fx.store};

    CHECK(kind_of([&] { (void)remove.execute(fx.ctx, {"db", false, 3}); }) == core::ErrorKind::InvalidArgument);
    CHECK(kind_of([&] { (void)remove.execute(fx.ctx, {"missing"}); }) == core::ErrorKind::ResourceNotFound);

    const auto output = remove.execute(fx.ctx, {"db"});
    CHECK(output.showDeleteOptions);
    CHECK(output.recoveryWindow == 10);
    const auto entry = fx.store.getEntry(fx.ctx, Service::Secret, "db");
    CHECK(entry.operation == Operation::Delete);
    REQUIRE(entry.deleteOptions.has_value());
    CHECK(entry.deleteOptions->recoveryWindow == 10);

    CHECK(kind_of([&] { (void)edit.execute(fx.ctx, {"db", "new"}); }) == core::ErrorKind::InvalidTransition);

    const auto forced = remove.execute(fx.ctx, {"db", true, 1});
    CHECK(forced.force);
    CHECK(forced.recoveryWindow == 0);
}

TEST_CASE("Tag changes that cancel out leave nothing staged")
{
    ParameterFixture fx;
    fx.client->seed("/app/key", "v");
    TagUseCase tags{fx.strategy, fx.store};

    CHECK(tags.tag(fx.ctx, {"/app/key", {{"env", "prod"}}}).staged);
    CHECK(tags.untag(fx.ctx, {"/app/key", {"owner"}}).staged);

    auto staged = fx.store.getTag(fx.ctx, Service::Parameter, "/app/key");
    CHECK(staged.add.count("env") == 1);
    CHECK(staged.remove.count("owner") == 1);

    CHECK(tags.cancelAddTag(fx.ctx, {"/app/key", "env"}).staged);
    CHECK_FALSE(tags.cancelRemoveTag(fx.ctx, {"/app/key", "owner"}).staged);
    CHECK(fx.store.listTags(fx.ctx, Service::Parameter).empty());

    CHECK(kind_of([&] { (void)tags.cancelAddTag(fx.ctx, {"/app/key", "env"}); }) == core::ErrorKind::NotStaged);
}

TEST_CASE("Tagging requires an existing or staged item")
{
    ParameterFixture fx;
    TagUseCase tags{fx.strategy, fx.store};
    CHECK(kind_of([&] { (void)tags.tag(fx.ctx, {"/missing", {{"k", "v"}}}); }) == core::ErrorKind::ResourceNotFound);
    CHECK(kind_of([&] { (void)tags.tag(fx.ctx, {"/missing", {}}); }) == core::ErrorKind::InvalidArgument);

    AddUseCase add{fx.strategy, fx.store};
    add.execute(fx.ctx, {"/missing", "v", std::nullopt});
    tags.tag(fx.ctx, {"/missing", {{"k", "v"}}});
    CHECK_FALSE(tags.untag(fx.ctx, {"/missing", {"k"}}).staged);
}
