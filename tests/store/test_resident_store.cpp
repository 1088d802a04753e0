#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "stagehand/core/Error.hpp"
#include "stagehand/store/ResidentStore.hpp"
#include "stagehand/store/StoreRegistry.hpp"

#include <stop_token>
#include <string>

using namespace stagehand;
using namespace stagehand::staging;

namespace
{
Entry update(std::string value)
{
    Entry entry;
    entry.operation = Operation::Update;
    entry.value = std::move(value);
    entry.stagedAt = Clock::now();
    return entry;
}

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

TEST_CASE("Staging the same name twice keeps the latest entry")
{
    const core::Context ctx;
    store::ResidentStore store{core::Scope{"123456789012", "eu-west-1"}};

    store.stageEntry(ctx, Service::Parameter, "/app/key", update("one"));
    store.stageEntry(ctx, Service::Parameter, "/app/key", update("two"));

    const auto entries = store.listEntries(ctx, Service::Parameter);
    REQUIRE(entries.size() == 1);
    CHECK(entries.at("/app/key").value == "two");
    CHECK(store.listEntries(ctx, Service::Secret).empty());
}

TEST_CASE("Missing items report NotStaged and unstage is idempotent")
{
    const core::Context ctx;
    store::ResidentStore store{core::Scope{}};

    CHECK(kind_of([&] { (void)store.getEntry(ctx, Service::Secret, "missing"); }) == core::ErrorKind::NotStaged);
    CHECK(kind_of([&] { (void)store.getTag(ctx, Service::Secret, "missing"); }) == core::ErrorKind::NotStaged);

    store.stageEntry(ctx, Service::Secret, "db", update("pw"));
    store.unstageEntry(ctx, Service::Secret, "db");
    CHECK_NOTHROW(store.unstageEntry(ctx, Service::Secret, "db"));
    CHECK_NOTHROW(store.unstageTag(ctx, Service::Secret, "db"));
}

TEST_CASE("Delete entries drop their value and creates require one")
{
    const core::Context ctx;
    store::ResidentStore store{core::Scope{}};

    Entry removal;
    removal.operation = Operation::Delete;
    removal.value = "leftover";
    store.stageEntry(ctx, Service::Parameter, "/gone", removal);
    CHECK_FALSE(store.getEntry(ctx, Service::Parameter, "/gone").value.has_value());

    Entry create;
    create.operation = Operation::Create;
    CHECK(kind_of([&] { store.stageEntry(ctx, Service::Parameter, "/new", create); })
          == core::ErrorKind::InvalidArgument);
}

TEST_CASE("An empty tag change unstages the tag entry")
{
    const core::Context ctx;
    store::ResidentStore store{core::Scope{}};

    TagEntry tags;
    tags.add = {{"env", "prod"}};
    store.stageTag(ctx, Service::Parameter, "/app/key", tags);
    CHECK(store.listTags(ctx, Service::Parameter).size() == 1);

    store.stageTag(ctx, Service::Parameter, "/app/key", TagEntry{});
    CHECK(store.listTags(ctx, Service::Parameter).empty());
}

TEST_CASE("unstageAll clears one service only")
{
    const core::Context ctx;
    store::ResidentStore store{core::Scope{}};
    store.stageEntry(ctx, Service::Parameter, "/a", update("1"));
    store.stageEntry(ctx, Service::Secret, "s", update("2"));

    CHECK(store.unstageAll(ctx, Service::Parameter));
    CHECK_FALSE(store.unstageAll(ctx, Service::Parameter));
    CHECK(store.listEntries(ctx, Service::Secret).size() == 1);
}

TEST_CASE("Drain with keep leaves the state in place")
{
    const core::Context ctx;
    store::ResidentStore store{core::Scope{}};
    store.stageEntry(ctx, Service::Parameter, "/a", update("1"));

    CHECK(store.drain(ctx, true).entryCount() == 1);
    CHECK(store.drain(ctx, false).entryCount() == 1);
    CHECK(store.drain(ctx, false).empty());

    State replacement;
    replacement.entries[Service::Secret]["s"] = update("x");
    store.writeState(ctx, replacement);
    CHECK(store.listEntries(ctx, Service::Secret).size() == 1);
    CHECK(store.listEntries(ctx, Service::Parameter).empty());
}

TEST_CASE("A cancelled context stops store operations")
{
    std::stop_source source;
    source.request_stop();
    const core::Context ctx{source.get_token()};
    store::ResidentStore store{core::Scope{}};
    CHECK(kind_of([&] { (void)store.listEntries(ctx, Service::Parameter); }) == core::ErrorKind::Cancelled);
}

TEST_CASE("Registry hands out one store per scope")
{
    const core::Context ctx;
    store::StoreRegistry registry;
    const core::Scope prod{"111111111111", "us-east-1"};
    const core::Scope dev{"222222222222", "us-east-1"};

    auto first = registry.acquire(prod);
    auto again = registry.acquire(prod);
    auto other = registry.acquire(dev);
    CHECK(first == again);
    CHECK(first != other);
    CHECK(registry.size() == 2);

    first->stageEntry(ctx, Service::Parameter, "/a", update("1"));
    CHECK(other->listEntries(ctx, Service::Parameter).empty());

    registry.release(prod);
    CHECK_FALSE(registry.contains(prod));
    CHECK(first->listEntries(ctx, Service::Parameter).size() == 1);
    CHECK(registry.acquire(prod) != first);
}
