#include "engine/UnitTable.hpp"

#include "engine/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <functional>
#include <limits>

namespace gt::engine
{

namespace
{

struct UnitAlias
{
    std::string_view name;
    Unit unit;
};

// Listing order decides the order of aliases in all_units().
constexpr std::array<UnitAlias, 9> kUnitAliases = {{
    {"sec", Unit::Second},
    {"min", Unit::Minute},
    {"hr", Unit::Hour},
    {"hour", Unit::Hour},
    {"day", Unit::Day},
    {"week", Unit::Week},
    {"month", Unit::Month},
    {"year", Unit::Year},
    {"yr", Unit::Year},
}};

std::optional<Unit> find_exact(std::string_view name) noexcept
{
    for (auto const &alias : kUnitAliases)
    {
        if (alias.name == name)
        {
            return alias.unit;
        }
    }
    return std::nullopt;
}

std::int64_t checked_multiply(std::int64_t size, std::int64_t ratio,
                              std::string_view what)
{
    if (ratio <= 0)
    {
        throw ConfigError(
            std::format("{} must be a positive integer, got {}", what, ratio));
    }
    if (size > std::numeric_limits<std::int64_t>::max() / ratio)
    {
        throw ConfigError(std::format("{} = {} overflows the unit table",
                                      what, ratio));
    }
    return size * ratio;
}

} // namespace

std::optional<Unit> find_unit(std::string_view name) noexcept
{
    if (auto unit = find_exact(name))
    {
        return unit;
    }
    if (name.size() > 1 && name.back() == 's')
    {
        return find_exact(name.substr(0, name.size() - 1));
    }
    return std::nullopt;
}

Unit parse_unit(std::string_view name)
{
    if (auto unit = find_unit(name))
    {
        return *unit;
    }
    throw UnknownUnitError(std::string(name));
}

std::string_view unit_name(Unit unit) noexcept
{
    switch (unit)
    {
    case Unit::Second:
        return "sec";
    case Unit::Minute:
        return "min";
    case Unit::Hour:
        return "hour";
    case Unit::Day:
        return "day";
    case Unit::Week:
        return "week";
    case Unit::Month:
        return "month";
    case Unit::Year:
        return "year";
    }
    return "sec";
}

UnitTable::UnitTable() : UnitTable(sizes_from_ratios(UnitRatios{}), 1.0)
{
}

UnitTable::UnitTable(Sizes sizes, double speed_factor)
    : sizes_(sizes), speed_factor_(speed_factor)
{
}

UnitTable UnitTable::configure(Overrides const &overrides,
                               double speed_factor)
{
    return from_ratios(UnitRatios{}, overrides, speed_factor);
}

UnitTable UnitTable::from_ratios(UnitRatios const &ratios, double speed_factor)
{
    return from_ratios(ratios, Overrides{}, speed_factor);
}

UnitTable UnitTable::from_ratios(UnitRatios const &ratios,
                                 Overrides const &overrides,
                                 double speed_factor)
{
    auto sizes = sizes_from_ratios(ratios);
    apply_overrides(sizes, overrides);
    validate(sizes, speed_factor);
    return UnitTable(sizes, speed_factor);
}

std::int64_t UnitTable::size_of(std::string_view name) const
{
    return size_of(parse_unit(name));
}

std::vector<std::pair<std::string, std::int64_t>> UnitTable::all_units() const
{
    std::vector<std::pair<std::string, std::int64_t>> result;
    result.reserve(kUnitAliases.size());
    for (auto const &alias : kUnitAliases)
    {
        result.emplace_back(std::string(alias.name), size_of(alias.unit));
    }
    std::stable_sort(result.begin(), result.end(),
                     [](auto const &lhs, auto const &rhs)
                     { return lhs.second > rhs.second; });
    return result;
}

std::vector<std::int64_t> UnitTable::distinct_sizes_descending() const
{
    std::vector<std::int64_t> result(sizes_.begin(), sizes_.end());
    std::sort(result.begin(), result.end(), std::greater<>());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

UnitTable::Sizes UnitTable::sizes_from_ratios(UnitRatios const &ratios)
{
    Sizes sizes{};
    sizes[0] = 1;
    sizes[1] = checked_multiply(sizes[0], ratios.secs_per_min, "secsPerMin");
    sizes[2] = checked_multiply(sizes[1], ratios.mins_per_hour, "minsPerHour");
    sizes[3] = checked_multiply(sizes[2], ratios.hours_per_day, "hoursPerDay");
    sizes[4] = checked_multiply(sizes[3], ratios.days_per_week, "daysPerWeek");
    sizes[5] =
        checked_multiply(sizes[4], ratios.weeks_per_month, "weeksPerMonth");
    sizes[6] =
        checked_multiply(sizes[5], ratios.months_per_year, "monthsPerYear");
    return sizes;
}

void UnitTable::apply_overrides(Sizes &sizes, Overrides const &overrides)
{
    std::array<std::optional<std::int64_t>, kUnitCount> seen{};
    for (auto const &[name, size] : overrides)
    {
        auto unit = find_unit(name);
        if (!unit)
        {
            throw ConfigError(
                std::format("cannot override unknown unit \"{}\"", name));
        }
        if (size <= 0)
        {
            throw ConfigError(std::format(
                "unit \"{}\" must have a positive size, got {}", name, size));
        }
        auto index = static_cast<std::size_t>(*unit);
        if (seen[index] && *seen[index] != size)
        {
            throw ConfigError(std::format(
                "conflicting sizes for unit \"{}\": {} and {}",
                unit_name(*unit), *seen[index], size));
        }
        seen[index] = size;
        sizes[index] = size;
    }
}

void UnitTable::validate(Sizes const &sizes, double speed_factor)
{
    if (!std::isfinite(speed_factor) || speed_factor <= 0.0)
    {
        throw ConfigError(std::format(
            "speed factor must be positive and finite, got {}", speed_factor));
    }
    if (sizes[0] != 1)
    {
        throw ConfigError(
            std::format("the second must be 1 base second, got {}", sizes[0]));
    }
    for (std::size_t i = 1; i < sizes.size(); ++i)
    {
        auto const smaller = unit_name(static_cast<Unit>(i - 1));
        auto const larger = unit_name(static_cast<Unit>(i));
        if (sizes[i] <= sizes[i - 1])
        {
            throw ConfigError(std::format(
                "unit \"{}\" ({}) must be larger than \"{}\" ({})", larger,
                sizes[i], smaller, sizes[i - 1]));
        }
        if (sizes[i] % sizes[i - 1] != 0)
        {
            throw ConfigError(std::format(
                "unit \"{}\" ({}) is not a whole number of \"{}\" ({})",
                larger, sizes[i], smaller, sizes[i - 1]));
        }
    }
}

} // namespace gt::engine
