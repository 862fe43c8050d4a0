#include "engine/ClockSettings.hpp"

#include "engine/Errors.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <array>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <yyjson.h>

namespace gt::engine
{

namespace
{

constexpr std::array<std::string_view, 7> kKnownKeys = {
    {"speedFactor", "ratios", "units", "epochOffset", "origin", "statePath",
     "tickIntervalMs"}};

std::string key_string(yyjson_val *key)
{
    return std::string(yyjson_get_str(key), yyjson_get_len(key));
}

void require_type(yyjson_val *root, char const *key, bool ok,
                  std::string_view expected)
{
    if (yyjson_obj_get(root, key) != nullptr && !ok)
    {
        throw ConfigError(std::format("\"{}\" must be {}", key, expected));
    }
}

std::optional<std::int64_t> read_int(yyjson_val *object, char const *key)
{
    auto value = gt::json::get_int(object, key);
    require_type(object, key, value.has_value(), "an integer");
    return value;
}

void read_ratios(yyjson_val *object, UnitRatios &ratios)
{
    struct RatioField
    {
        char const *key;
        std::int64_t UnitRatios::*field;
    };
    static constexpr RatioField kFields[] = {
        {"secsPerMin", &UnitRatios::secs_per_min},
        {"minsPerHour", &UnitRatios::mins_per_hour},
        {"hoursPerDay", &UnitRatios::hours_per_day},
        {"daysPerWeek", &UnitRatios::days_per_week},
        {"weeksPerMonth", &UnitRatios::weeks_per_month},
        {"monthsPerYear", &UnitRatios::months_per_year},
    };
    for (auto const &field : kFields)
    {
        if (auto value = read_int(object, field.key))
        {
            ratios.*field.field = *value;
        }
    }
    size_t idx, limit;
    yyjson_val *key = nullptr;
    yyjson_val *value = nullptr;
    yyjson_obj_foreach(object, idx, limit, key, value)
    {
        auto name = key_string(key);
        bool known = false;
        for (auto const &field : kFields)
        {
            known = known || name == field.key;
        }
        if (!known)
        {
            GT_LOG_WARN("ignoring unknown ratio \"{}\"", name);
        }
    }
}

void read_units(yyjson_val *object, UnitTable::Overrides &units)
{
    size_t idx, limit;
    yyjson_val *key = nullptr;
    yyjson_val *value = nullptr;
    yyjson_obj_foreach(object, idx, limit, key, value)
    {
        auto name = key_string(key);
        if (!yyjson_is_int(value))
        {
            throw ConfigError(
                std::format("size of unit \"{}\" must be an integer", name));
        }
        units[name] = yyjson_get_sint(value);
    }
}

} // namespace

UnitTable ClockSettings::build_unit_table() const
{
    return UnitTable::from_ratios(ratios, units, speed_factor);
}

ClockSettings parse_clock_settings(std::string_view payload)
{
    auto doc = gt::json::Document::parse_lenient(payload);
    if (!doc.is_valid())
    {
        throw ConfigError("configuration is not valid JSON");
    }
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        throw ConfigError("configuration must be a JSON object");
    }

    ClockSettings settings;
    if (auto speed = gt::json::get_number(root, "speedFactor"))
    {
        settings.speed_factor = *speed;
    }
    else
    {
        require_type(root, "speedFactor", false, "a number");
    }

    if (auto *ratios = yyjson_obj_get(root, "ratios"))
    {
        require_type(root, "ratios", yyjson_is_obj(ratios), "an object");
        read_ratios(ratios, settings.ratios);
    }
    if (auto *units = yyjson_obj_get(root, "units"))
    {
        require_type(root, "units", yyjson_is_obj(units), "an object");
        read_units(units, settings.units);
    }
    if (auto offset = read_int(root, "epochOffset"))
    {
        settings.epoch_offset = *offset;
    }
    settings.origin = read_int(root, "origin");
    if (auto path = gt::json::get_string(root, "statePath"))
    {
        settings.state_path = *path;
    }
    else
    {
        require_type(root, "statePath", false, "a string");
    }
    if (auto interval = read_int(root, "tickIntervalMs"))
    {
        if (*interval <= 0)
        {
            throw ConfigError("\"tickIntervalMs\" must be positive");
        }
        settings.tick_interval = std::chrono::milliseconds(*interval);
    }

    size_t idx, limit;
    yyjson_val *key = nullptr;
    yyjson_val *value = nullptr;
    yyjson_obj_foreach(root, idx, limit, key, value)
    {
        auto name = key_string(key);
        bool known = false;
        for (auto candidate : kKnownKeys)
        {
            known = known || candidate == name;
        }
        if (!known)
        {
            GT_LOG_WARN("ignoring unknown configuration key \"{}\"", name);
        }
    }

    // Validate now so a bad calendar fails at load time, not at first use.
    settings.build_unit_table();
    return settings;
}

ClockSettings load_clock_settings(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        throw ConfigError(
            std::format("cannot read configuration {}", path.string()));
    }
    std::string payload((std::istreambuf_iterator<char>(input)),
                        std::istreambuf_iterator<char>());
    auto settings = parse_clock_settings(payload);
    GT_LOG_INFO("loaded configuration {}", path.string());
    return settings;
}

} // namespace gt::engine
