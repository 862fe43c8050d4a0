#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gt::engine
{

enum class Unit : std::uint8_t
{
    Second,
    Minute,
    Hour,
    Day,
    Week,
    Month,
    Year,
};

inline constexpr std::size_t kUnitCount = 7;

// Resolves a unit name or alias ("hr", "yr"). A trailing plural "s" is
// stripped when the name itself is unknown.
std::optional<Unit> find_unit(std::string_view name) noexcept;
// Same as find_unit() but throws UnknownUnitError.
Unit parse_unit(std::string_view name);
std::string_view unit_name(Unit unit) noexcept;

// Step ratios between consecutive units, used by configuration files that
// describe the calendar as "N minutes per hour" rather than absolute sizes.
struct UnitRatios
{
    std::int64_t secs_per_min = 60;
    std::int64_t mins_per_hour = 60;
    std::int64_t hours_per_day = 24;
    std::int64_t days_per_week = 7;
    std::int64_t weeks_per_month = 4;
    std::int64_t months_per_year = 12;
};

// Immutable table of unit sizes (in base game seconds) and the speed factor.
// Every size is a strict integer multiple of the next smaller one and the
// second is always 1.
class UnitTable
{
  public:
    using Overrides = std::map<std::string, std::int64_t>;

    // Default calendar, speed factor 1.
    UnitTable();

    static UnitTable configure(Overrides const &overrides,
                               double speed_factor);
    static UnitTable from_ratios(UnitRatios const &ratios,
                                 double speed_factor);
    // Ratios first, absolute overrides applied on top.
    static UnitTable from_ratios(UnitRatios const &ratios,
                                 Overrides const &overrides,
                                 double speed_factor);

    std::int64_t size_of(Unit unit) const noexcept
    {
        return sizes_[static_cast<std::size_t>(unit)];
    }
    std::int64_t size_of(std::string_view name) const;
    double speed_factor() const noexcept { return speed_factor_; }

    // (name, size) for every accepted name, aliases included, largest first.
    std::vector<std::pair<std::string, std::int64_t>> all_units() const;
    // Sizes with aliases collapsed, largest first; always ends with 1.
    std::vector<std::int64_t> distinct_sizes_descending() const;

  private:
    using Sizes = std::array<std::int64_t, kUnitCount>;

    UnitTable(Sizes sizes, double speed_factor);

    static Sizes sizes_from_ratios(UnitRatios const &ratios);
    static void apply_overrides(Sizes &sizes, Overrides const &overrides);
    static void validate(Sizes const &sizes, double speed_factor);

    Sizes sizes_{};
    double speed_factor_ = 1.0;
};

} // namespace gt::engine
