#include "stagehand/staging/State.hpp"

#include <cstdint>
#include <stdexcept>

namespace stagehand::staging
{
namespace
{
std::int64_t to_epoch_millis(Clock::time_point time)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

Clock::time_point from_epoch_millis(std::int64_t millis)
{
    return Clock::time_point{std::chrono::milliseconds{millis}};
}

std::optional<Clock::time_point> optional_time(const nlohmann::json& json, const char* key)
{
    const auto it = json.find(key);
    if (it == json.end() || it->is_null())
    {
        return std::nullopt;
    }
    return from_epoch_millis(it->get<std::int64_t>());
}

std::optional<std::string> optional_string(const nlohmann::json& json, const char* key)
{
    const auto it = json.find(key);
    if (it == json.end() || it->is_null())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

template <typename Map>
nlohmann::json encode_services(const std::map<Service, Map>& services)
{
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [service, items] : services)
    {
        if (!items.empty())
        {
            json[std::string{toString(service)}] = items;
        }
    }
    return json;
}

template <typename Map>
std::map<Service, Map> decode_services(const nlohmann::json& json, const char* key)
{
    std::map<Service, Map> services;
    const auto it = json.find(key);
    if (it == json.end() || it->is_null())
    {
        return services;
    }

    for (auto service = it->begin(); service != it->end(); ++service)
    {
        const auto parsed = parseService(service.key());
        if (!parsed)
        {
            throw std::runtime_error{"Staging state references unknown service: " + service.key()};
        }
        auto items = service.value().template get<Map>();
        if (!items.empty())
        {
            services[*parsed] = std::move(items);
        }
    }
    return services;
}

} // namespace

bool State::empty() const noexcept
{
    return entryCount() == 0 && tagCount() == 0;
}

bool State::empty(Service service) const noexcept
{
    const auto entry = entries.find(service);
    const auto tag = tags.find(service);
    return (entry == entries.end() || entry->second.empty()) && (tag == tags.end() || tag->second.empty());
}

std::size_t State::entryCount() const noexcept
{
    std::size_t count = 0;
    for (const auto& [service, items] : entries)
    {
        count += items.size();
    }
    return count;
}

std::size_t State::tagCount() const noexcept
{
    std::size_t count = 0;
    for (const auto& [service, items] : tags)
    {
        count += items.size();
    }
    return count;
}

State State::extract(std::optional<Service> service) const
{
    if (!service)
    {
        return *this;
    }

    State result;
    result.version = version;
    if (const auto it = entries.find(*service); it != entries.end() && !it->second.empty())
    {
        result.entries[*service] = it->second;
    }
    if (const auto it = tags.find(*service); it != tags.end() && !it->second.empty())
    {
        result.tags[*service] = it->second;
    }
    return result;
}

void State::removeService(Service service)
{
    entries.erase(service);
    tags.erase(service);
}

void State::overlay(const State& other)
{
    for (const auto& [service, items] : other.entries)
    {
        for (const auto& [name, entry] : items)
        {
            entries[service][name] = entry;
        }
    }
    for (const auto& [service, items] : other.tags)
    {
        for (const auto& [name, tagEntry] : items)
        {
            tags[service][name] = tagEntry;
        }
    }
}

bool sameIntent(const Entry& lhs, const Entry& rhs)
{
    return lhs.operation == rhs.operation && lhs.value == rhs.value && lhs.description == rhs.description &&
        lhs.deleteOptions == rhs.deleteOptions;
}

bool sameIntent(const TagEntry& lhs, const TagEntry& rhs)
{
    return lhs.add == rhs.add && lhs.remove == rhs.remove;
}

std::string_view toString(Service service) noexcept
{
    switch (service)
    {
    case Service::Parameter:
        return "param";
    case Service::Secret:
        return "secret";
    }
    return "unknown";
}

std::optional<Service> parseService(std::string_view tag) noexcept
{
    if (tag == "param")
    {
        return Service::Parameter;
    }
    if (tag == "secret")
    {
        return Service::Secret;
    }
    return std::nullopt;
}

std::string_view itemName(Service service) noexcept
{
    return service == Service::Parameter ? "parameter" : "secret";
}

std::string_view toString(Operation operation) noexcept
{
    switch (operation)
    {
    case Operation::Create:
        return "create";
    case Operation::Update:
        return "update";
    case Operation::Delete:
        return "delete";
    }
    return "unknown";
}

std::optional<Operation> parseOperation(std::string_view tag) noexcept
{
    if (tag == "create")
    {
        return Operation::Create;
    }
    if (tag == "update")
    {
        return Operation::Update;
    }
    if (tag == "delete")
    {
        return Operation::Delete;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& json, const DeleteOptions& options)
{
    json = nlohmann::json{{"force", options.force}, {"recovery_window", options.recoveryWindow}};
}

void from_json(const nlohmann::json& json, DeleteOptions& options)
{
    options.force = json.value("force", false);
    options.recoveryWindow = json.value("recovery_window", 0);
}

void to_json(nlohmann::json& json, const Entry& entry)
{
    json = nlohmann::json{
        {"operation", std::string{toString(entry.operation)}},
        {"staged_at", to_epoch_millis(entry.stagedAt)}
    };
    if (entry.operation != Operation::Delete && entry.value)
    {
        json["value"] = *entry.value;
    }
    if (entry.description)
    {
        json["description"] = *entry.description;
    }
    if (entry.baseModifiedAt)
    {
        json["base_modified_at"] = to_epoch_millis(*entry.baseModifiedAt);
    }
    if (entry.deleteOptions)
    {
        json["delete_options"] = *entry.deleteOptions;
    }
}

void from_json(const nlohmann::json& json, Entry& entry)
{
    const auto operation = parseOperation(json.at("operation").get<std::string>());
    if (!operation)
    {
        throw std::runtime_error{"Staged entry has an unknown operation"};
    }
    entry.operation = *operation;
    entry.value = optional_string(json, "value");
    if (entry.operation == Operation::Delete)
    {
        entry.value.reset();
    }
    else if (!entry.value)
    {
        throw std::runtime_error{"Staged entry is missing its value"};
    }
    entry.description = optional_string(json, "description");
    entry.stagedAt = from_epoch_millis(json.at("staged_at").get<std::int64_t>());
    entry.baseModifiedAt = optional_time(json, "base_modified_at");
    if (const auto it = json.find("delete_options"); it != json.end() && !it->is_null())
    {
        entry.deleteOptions = it->get<DeleteOptions>();
    }
    else
    {
        entry.deleteOptions.reset();
    }
}

void to_json(nlohmann::json& json, const TagEntry& entry)
{
    json = nlohmann::json{{"staged_at", to_epoch_millis(entry.stagedAt)}};
    if (!entry.add.empty())
    {
        json["add"] = entry.add;
    }
    if (!entry.remove.empty())
    {
        json["remove"] = entry.remove;
    }
    if (entry.baseModifiedAt)
    {
        json["base_modified_at"] = to_epoch_millis(*entry.baseModifiedAt);
    }
}

void from_json(const nlohmann::json& json, TagEntry& entry)
{
    entry.add = json.value("add", TagMap{});
    entry.remove = json.value("remove", KeySet{});
    entry.stagedAt = from_epoch_millis(json.at("staged_at").get<std::int64_t>());
    entry.baseModifiedAt = optional_time(json, "base_modified_at");
}

void to_json(nlohmann::json& json, const State& state)
{
    json = nlohmann::json{
        {"version", state.version},
        {"entries", encode_services(state.entries)},
        {"tags", encode_services(state.tags)}
    };
}

void from_json(const nlohmann::json& json, State& state)
{
    state.version = json.value("version", kStateVersion);
    state.entries = decode_services<EntryMap>(json, "entries");
    state.tags = decode_services<TagEntryMap>(json, "tags");

    // Tag entries with nothing to add or remove are never kept.
    for (auto& [service, items] : state.tags)
    {
        std::erase_if(items, [](const auto& item) { return item.second.empty(); });
    }
    std::erase_if(state.tags, [](const auto& item) { return item.second.empty(); });
}

} // namespace stagehand::staging
