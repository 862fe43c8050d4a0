#include "app/DaemonSupport.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <vector>

namespace gt::app
{

namespace
{

std::vector<std::string> breakdown_names()
{
    // Unit sizes are strictly increasing, so every unit has its own field.
    std::vector<std::string> names;
    for (auto i = engine::kUnitCount; i-- > 0;)
    {
        names.emplace_back(engine::unit_name(static_cast<engine::Unit>(i)));
    }
    return names;
}

} // namespace

std::optional<engine::UnitComponents> parse_target(std::string_view text)
{
    engine::UnitComponents components;
    while (!text.empty())
    {
        auto comma = text.find(',');
        auto item = text.substr(0, comma);
        text = comma == std::string_view::npos ? std::string_view()
                                               : text.substr(comma + 1);
        auto eq = item.find('=');
        if (eq == std::string_view::npos || eq == 0)
        {
            return std::nullopt;
        }
        auto value = std::string(item.substr(eq + 1));
        std::size_t used = 0;
        try
        {
            components.emplace_back(std::string(item.substr(0, eq)),
                                    std::stoll(value, &used));
        }
        catch (std::exception const &)
        {
            return std::nullopt;
        }
        if (used != value.size())
        {
            return std::nullopt;
        }
    }
    if (components.empty())
    {
        return std::nullopt;
    }
    return components;
}

std::chrono::system_clock::time_point
resolve_origin(engine::ClockSettings const &settings,
               engine::PersistenceManager &persistence)
{
    using std::chrono::system_clock;
    if (settings.origin)
    {
        return system_clock::time_point(std::chrono::seconds(*settings.origin));
    }
    if (auto stored = persistence.get_setting(kOriginSettingKey))
    {
        try
        {
            return system_clock::time_point(
                std::chrono::seconds(std::stoll(*stored)));
        }
        catch (std::exception const &ex)
        {
            GT_LOG_WARN("ignoring unreadable clock origin {}: {}", *stored,
                        ex.what());
        }
    }
    auto now = std::chrono::time_point_cast<std::chrono::seconds>(
        system_clock::now());
    if (!persistence.set_setting(kOriginSettingKey,
                                 std::to_string(now.time_since_epoch().count())))
    {
        GT_LOG_WARN("could not persist the clock origin; the game clock will "
                    "restart from its epoch next time");
    }
    return now;
}

std::optional<engine::EntryHandle>
schedule_unless_present(engine::ScheduleManager &manager,
                        std::string const &handler, std::string const &args,
                        engine::UnitComponents const &target, bool repeat)
{
    auto const parsed = engine::PartialTimeSpec::parse(target);
    for (auto const &state : manager.entries())
    {
        if (state.handler == handler && state.args == args &&
            state.target == parsed && state.repeat == repeat)
        {
            GT_LOG_INFO("entry {} already covers this request; not scheduling "
                        "it again",
                        state.entry_id);
            return std::nullopt;
        }
    }
    return manager.schedule(handler, args, parsed, repeat);
}

std::string describe_game_time(engine::UnitTable const &units,
                               engine::GameSeconds game_seconds)
{
    auto divisors = units.distinct_sizes_descending();
    divisors.pop_back();
    return engine::format_breakdown(
        engine::TimeConverter::breakdown(game_seconds, divisors),
        breakdown_names());
}

} // namespace gt::app
