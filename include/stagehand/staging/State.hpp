#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace stagehand::staging
{

enum class Service
{
    Parameter,
    Secret,
};

inline constexpr std::array<Service, 2> kAllServices{Service::Parameter, Service::Secret};

enum class Operation
{
    Create,
    Update,
    Delete,
};

using Clock = std::chrono::system_clock;
using TagMap = std::map<std::string, std::string>;
using KeySet = std::set<std::string>;

inline constexpr int kStateVersion = 2;

//! Secrets Manager style delete parameters. A recovery window of 0 means the remote default.
struct DeleteOptions
{
    bool force{false};
    int recoveryWindow{0};

    bool operator==(const DeleteOptions&) const = default;
};

/**
 * @brief One pending value change for an item.
 *
 * value is present iff operation != Delete. baseModifiedAt records the remote
 * modification time observed when the change was staged and is absent for creates.
 */
struct Entry
{
    Operation operation{Operation::Update};
    std::optional<std::string> value;
    std::optional<std::string> description;
    Clock::time_point stagedAt{};
    std::optional<Clock::time_point> baseModifiedAt;
    std::optional<DeleteOptions> deleteOptions;
};

//! One pending tag change for an item. Never stored while both add and remove are empty.
struct TagEntry
{
    TagMap add;
    KeySet remove;
    Clock::time_point stagedAt{};
    std::optional<Clock::time_point> baseModifiedAt;

    [[nodiscard]] bool empty() const noexcept { return add.empty() && remove.empty(); }
};

using EntryMap = std::map<std::string, Entry>;
using TagEntryMap = std::map<std::string, TagEntry>;

struct State
{
    int version{kStateVersion};
    std::map<Service, EntryMap> entries;
    std::map<Service, TagEntryMap> tags;

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] bool empty(Service service) const noexcept;
    [[nodiscard]] std::size_t entryCount() const noexcept;
    [[nodiscard]] std::size_t tagCount() const noexcept;

    //! Copy restricted to one service, or the whole state when service is empty.
    [[nodiscard]] State extract(std::optional<Service> service) const;
    void removeService(Service service);
    //! Copies every item of other into this state, replacing items with the same name.
    void overlay(const State& other);
};

//! True when two entries describe the same change, ignoring timestamps.
[[nodiscard]] bool sameIntent(const Entry& lhs, const Entry& rhs);
[[nodiscard]] bool sameIntent(const TagEntry& lhs, const TagEntry& rhs);

[[nodiscard]] std::string_view toString(Service service) noexcept;
[[nodiscard]] std::optional<Service> parseService(std::string_view tag) noexcept;
//! Noun used in messages, "parameter" or "secret".
[[nodiscard]] std::string_view itemName(Service service) noexcept;
[[nodiscard]] std::string_view toString(Operation operation) noexcept;
[[nodiscard]] std::optional<Operation> parseOperation(std::string_view tag) noexcept;

void to_json(nlohmann::json& json, const DeleteOptions& options);
void from_json(const nlohmann::json& json, DeleteOptions& options);

void to_json(nlohmann::json& json, const Entry& entry);
void from_json(const nlohmann::json& json, Entry& entry);

void to_json(nlohmann::json& json, const TagEntry& entry);
void from_json(const nlohmann::json& json, TagEntry& entry);

void to_json(nlohmann::json& json, const State& state);
void from_json(const nlohmann::json& json, State& state);

} // namespace stagehand::staging
