#include "engine/TimeConverter.hpp"

#include "engine/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace gt::engine
{

namespace
{

std::int64_t floor_div(std::int64_t value, std::int64_t divisor) noexcept
{
    auto quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0)))
    {
        --quotient;
    }
    return quotient;
}

std::int64_t truncate_seconds(double seconds) noexcept
{
    return static_cast<std::int64_t>(std::trunc(seconds));
}

// Distinct unit sizes, largest first, without the trailing 1.
std::vector<std::int64_t> game_divisors(UnitTable const &units)
{
    auto sizes = units.distinct_sizes_descending();
    sizes.pop_back();
    return sizes;
}

// Sizes are positive; fields may be negative only for a negative current
// time. Throws InvalidTargetError when the sum leaves the int64 range.
GameSeconds project(std::vector<std::int64_t> const &fields,
                    std::vector<std::int64_t> const &sizes)
{
    constexpr auto kMax = std::numeric_limits<GameSeconds>::max();
    constexpr auto kMin = std::numeric_limits<GameSeconds>::min();
    GameSeconds projected = 0;
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        auto const field = fields[i];
        auto const size = sizes[i];
        if (field > kMax / size || field < kMin / size)
        {
            throw InvalidTargetError(std::format(
                "target value {} times unit size {} is out of range", field,
                size));
        }
        auto const term = field * size;
        if ((term > 0 && projected > kMax - term) ||
            (term < 0 && projected < kMin - term))
        {
            throw InvalidTargetError(
                "target lies outside the representable game time range");
        }
        projected += term;
    }
    return projected;
}

} // namespace

PartialTimeSpec::PartialTimeSpec(std::initializer_list<Field> fields)
{
    for (auto const &[unit, value] : fields)
    {
        set(unit, value);
    }
}

PartialTimeSpec PartialTimeSpec::parse(UnitComponents const &components)
{
    PartialTimeSpec target;
    for (auto const &[name, value] : components)
    {
        target.set(parse_unit(name), value);
    }
    return target;
}

void PartialTimeSpec::set(Unit unit, std::int64_t value)
{
    if (value < 0)
    {
        throw InvalidTargetError(std::format(
            "target {} must not be negative, got {}", unit_name(unit), value));
    }
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [unit](Field const &field)
                           { return field.first == unit; });
    if (it != fields_.end())
    {
        it->second = value;
        return;
    }
    fields_.emplace_back(unit, value);
}

UnitComponents PartialTimeSpec::to_components() const
{
    UnitComponents components;
    components.reserve(fields_.size());
    for (auto const &[unit, value] : fields_)
    {
        components.emplace_back(std::string(unit_name(unit)), value);
    }
    return components;
}

double RealDuration::total_seconds() const noexcept
{
    return secs + mins * kRealMinute + hrs * kRealHour + days * kRealDay +
           weeks * kRealWeek + months * kRealMonth + yrs * kRealYear;
}

std::vector<std::int64_t> const &real_divisor_ladder()
{
    static std::vector<std::int64_t> const kLadder = {
        kRealYear, kRealMonth, kRealWeek, kRealDay, kRealHour, kRealMinute};
    return kLadder;
}

std::vector<std::int64_t>
TimeConverter::breakdown(std::int64_t total_seconds,
                         std::vector<std::int64_t> const &divisors)
{
    std::vector<std::int64_t> result;
    result.reserve(divisors.size() + 1);
    auto remaining = total_seconds;
    for (auto divisor : divisors)
    {
        if (divisor <= 0)
        {
            throw std::invalid_argument(
                std::format("breakdown divisor must be positive, got {}",
                            divisor));
        }
        auto quotient = floor_div(remaining, divisor);
        result.push_back(quotient);
        remaining -= quotient * divisor;
    }
    result.push_back(remaining);
    return result;
}

double TimeConverter::real_to_game(double real_seconds) const noexcept
{
    return real_seconds * units_.speed_factor();
}

double TimeConverter::real_to_game(RealDuration const &duration) const noexcept
{
    return real_to_game(duration.total_seconds());
}

std::vector<std::int64_t>
TimeConverter::real_to_game_breakdown(double real_seconds) const
{
    return breakdown(truncate_seconds(real_to_game(real_seconds)),
                     game_divisors(units_));
}

double TimeConverter::game_to_real(UnitComponents const &components) const
{
    double game_seconds = 0;
    for (auto const &[name, value] : components)
    {
        game_seconds +=
            static_cast<double>(value) * static_cast<double>(units_.size_of(name));
    }
    return game_seconds / units_.speed_factor();
}

std::vector<std::int64_t>
TimeConverter::game_to_real_breakdown(UnitComponents const &components) const
{
    return breakdown(truncate_seconds(game_to_real(components)),
                     real_divisor_ladder());
}

GameSeconds
TimeConverter::resolve_next_game_time(GameSeconds current,
                                      PartialTimeSpec const &target) const
{
    auto sizes = units_.distinct_sizes_descending();
    auto fields = breakdown(current, game_divisors(units_));

    // Index of the largest unit the target names; 0 when nothing is named
    // so that an empty target rolls the outermost unit.
    std::size_t higher = 0;
    bool any = false;
    for (auto const &[unit, value] : target.fields())
    {
        auto it = std::find(sizes.begin(), sizes.end(), units_.size_of(unit));
        auto index = static_cast<std::size_t>(it - sizes.begin());
        fields[index] = value;
        if (!any || index < higher)
        {
            higher = index;
            any = true;
        }
    }

    auto projected = project(fields, sizes);
    if (projected <= current)
    {
        fields[higher > 0 ? higher - 1 : 0] += 1;
        projected = project(fields, sizes);
    }
    // Only a target naming the outermost unit with a value already behind
    // the clock can stay in the past.
    if (projected <= current)
    {
        throw InvalidTargetError(std::format(
            "target has no occurrence after game time {}", current));
    }
    return projected;
}

double
TimeConverter::resolve_next_occurrence(GameSeconds current,
                                       PartialTimeSpec const &target) const
{
    auto projected = resolve_next_game_time(current, target);
    return static_cast<double>(projected - current) / units_.speed_factor();
}

std::string format_breakdown(std::vector<std::int64_t> const &fields,
                             std::vector<std::string> const &names)
{
    std::string result;
    auto count = std::min(fields.size(), names.size());
    bool leading = true;
    for (std::size_t i = 0; i < count; ++i)
    {
        // Always print the final field so a zero duration reads "0 sec".
        if (leading && fields[i] == 0 && i + 1 < count)
        {
            continue;
        }
        leading = false;
        if (!result.empty())
        {
            result.push_back(' ');
        }
        result += std::format("{} {}", fields[i], names[i]);
    }
    return result;
}

} // namespace gt::engine
