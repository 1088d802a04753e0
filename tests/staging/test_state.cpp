#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "stagehand/staging/State.hpp"

#include <chrono>
#include <string>

using namespace stagehand::staging;

namespace
{
Clock::time_point at_millis(std::int64_t millis)
{
    return Clock::time_point{std::chrono::milliseconds{millis}};
}

Entry update(std::string value)
{
    Entry entry;
    entry.operation = Operation::Update;
    entry.value = std::move(value);
    entry.stagedAt = at_millis(1'700'000'000'000);
    return entry;
}
}

TEST_CASE("State serializes entries, tags and timestamps")
{
    State state;
    auto entry = update("v2");
    entry.description = "rotated";
    entry.baseModifiedAt = at_millis(1'600'000'000'000);
    state.entries[Service::Parameter]["/app/config"] = entry;

    Entry removal;
    removal.operation = Operation::Delete;
    removal.stagedAt = at_millis(1'700'000'000'500);
    removal.deleteOptions = DeleteOptions{false, 7};
    state.entries[Service::Secret]["db-password"] = removal;

    TagEntry tags;
    tags.add = {{"env", "prod"}};
    tags.remove = {"owner"};
    tags.stagedAt = at_millis(1'700'000'000'000);
    state.tags[Service::Parameter]["/app/config"] = tags;

    const nlohmann::json json = state;
    CHECK(json["version"] == kStateVersion);
    CHECK(json["entries"]["param"]["/app/config"]["value"] == "v2");
    CHECK(json["entries"]["param"]["/app/config"]["staged_at"] == 1'700'000'000'000);
    CHECK_FALSE(json["entries"]["secret"]["db-password"].contains("value"));
    CHECK(json["entries"]["secret"]["db-password"]["delete_options"]["recovery_window"] == 7);

    const auto restored = json.get<State>();
    CHECK(restored.entryCount() == 2);
    CHECK(restored.tagCount() == 1);
    const auto& restoredEntry = restored.entries.at(Service::Parameter).at("/app/config");
    CHECK(sameIntent(restoredEntry, entry));
    CHECK(restoredEntry.baseModifiedAt == entry.baseModifiedAt);
    CHECK(restored.tags.at(Service::Parameter).at("/app/config").add.at("env") == "prod");
}

TEST_CASE("State rejects unknown services and value-less updates")
{
    auto unknown = nlohmann::json::parse(R"({"version":2,"entries":{"queue":{}}})");
    CHECK_THROWS((void)unknown.get<State>());

    auto missingValue = nlohmann::json::parse(
        R"({"version":2,"entries":{"param":{"/a":{"operation":"update","staged_at":0}}}})");
    CHECK_THROWS((void)missingValue.get<State>());
}

TEST_CASE("Empty tag entries are dropped when loading")
{
    auto json = nlohmann::json::parse(
        R"({"version":2,"tags":{"param":{"/a":{"add":{},"remove":[],"staged_at":0}}}})");
    const auto state = json.get<State>();
    CHECK(state.empty());
}

TEST_CASE("Extract, overlay and removeService act per service")
{
    State state;
    state.entries[Service::Parameter]["/a"] = update("1");
    state.entries[Service::Secret]["s"] = update("2");

    const auto params = state.extract(Service::Parameter);
    CHECK(params.entryCount() == 1);
    CHECK(params.empty(Service::Secret));

    State incoming;
    incoming.entries[Service::Parameter]["/a"] = update("changed");
    incoming.entries[Service::Parameter]["/b"] = update("new");
    state.overlay(incoming);
    CHECK(state.entries[Service::Parameter]["/a"].value == "changed");
    CHECK(state.entryCount() == 3);

    state.removeService(Service::Parameter);
    CHECK(state.empty(Service::Parameter));
    CHECK_FALSE(state.empty());
}

TEST_CASE("sameIntent ignores timestamps")
{
    auto first = update("v");
    auto second = update("v");
    second.stagedAt = at_millis(42);
    CHECK(sameIntent(first, second));
    second.value = "w";
    CHECK_FALSE(sameIntent(first, second));
}

TEST_CASE("Service and operation tags parse back")
{
    for (auto service : kAllServices)
    {
        CHECK(parseService(toString(service)) == service);
    }
    CHECK_FALSE(parseService("ssm").has_value());
    CHECK(parseOperation("delete") == Operation::Delete);
    CHECK(itemName(Service::Secret) == "secret");
}
