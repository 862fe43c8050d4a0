#pragma once

#include "engine/UnitTable.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace gt::engine
{

// Absolute or relative game time, in base game seconds.
using GameSeconds = std::int64_t;

// Unit name -> value pairs as callers and configuration files spell them
// ("hour", "mins", "yr"). Resolved to Unit once, at the boundary.
using UnitComponents = std::vector<std::pair<std::string, std::int64_t>>;

// A game time naming only some units, e.g. {hour: 2, min: 30}. Units not
// named keep their current value when the target is resolved.
class PartialTimeSpec
{
  public:
    using Field = std::pair<Unit, std::int64_t>;

    PartialTimeSpec() = default;
    PartialTimeSpec(std::initializer_list<Field> fields);

    // Throws UnknownUnitError or InvalidTargetError; nothing is kept on
    // failure.
    static PartialTimeSpec parse(UnitComponents const &components);

    // Naming a unit twice keeps the last value.
    void set(Unit unit, std::int64_t value);

    std::vector<Field> const &fields() const noexcept { return fields_; }
    bool empty() const noexcept { return fields_.empty(); }

    UnitComponents to_components() const;

    bool operator==(PartialTimeSpec const &other) const = default;

  private:
    std::vector<Field> fields_;
};

// Real-world duration split into calendar-like components. Converted with
// the fixed real ladder (365-day year, 30.4-day month), never the game one.
struct RealDuration
{
    double secs = 0;
    double mins = 0;
    double hrs = 0;
    double days = 0;
    double weeks = 0;
    double months = 0;
    double yrs = 0;

    double total_seconds() const noexcept;
};

// Real-world divisors used to format a real duration: year, month, week,
// day, hour, minute.
inline constexpr std::int64_t kRealYear = 31536000;
inline constexpr std::int64_t kRealMonth = 2628000;
inline constexpr std::int64_t kRealWeek = 604800;
inline constexpr std::int64_t kRealDay = 86400;
inline constexpr std::int64_t kRealHour = 3600;
inline constexpr std::int64_t kRealMinute = 60;

std::vector<std::int64_t> const &real_divisor_ladder();

class TimeConverter
{
  public:
    explicit TimeConverter(UnitTable const &units) : units_(units) {}

    // Floor-divides total_seconds by each divisor in turn, carrying the
    // remainder forward. The result has divisors.size() + 1 entries, the last
    // one being the leftover seconds.
    static std::vector<std::int64_t>
    breakdown(std::int64_t total_seconds,
              std::vector<std::int64_t> const &divisors);

    double real_to_game(double real_seconds) const noexcept;
    double real_to_game(RealDuration const &duration) const noexcept;
    // Game time as one value per distinct unit, largest first, then seconds.
    std::vector<std::int64_t> real_to_game_breakdown(double real_seconds) const;

    // Real seconds needed for the given amount of game time to pass.
    double game_to_real(UnitComponents const &components) const;
    // Same, formatted on the real ladder: years, months, weeks, days, hours,
    // minutes, seconds.
    std::vector<std::int64_t>
    game_to_real_breakdown(UnitComponents const &components) const;

    // Absolute game time at which `target` next occurs strictly after
    // `current`. A target already reached rolls over by one step of the unit
    // immediately above the largest unit it names. Throws InvalidTargetError
    // when even the rolled-over target is not in the future (an outermost
    // unit value already passed) or when the result overflows GameSeconds.
    GameSeconds resolve_next_game_time(GameSeconds current,
                                       PartialTimeSpec const &target) const;
    // Real seconds until resolve_next_game_time().
    double resolve_next_occurrence(GameSeconds current,
                                   PartialTimeSpec const &target) const;

    UnitTable const &units() const noexcept { return units_; }

  private:
    UnitTable const &units_;
};

// "2 day 3 hour 0 min 12 sec"; zero leading fields are skipped.
std::string format_breakdown(std::vector<std::int64_t> const &fields,
                             std::vector<std::string> const &names);

} // namespace gt::engine
