#pragma once

#include "engine/ClockSettings.hpp"
#include "engine/PersistenceManager.hpp"
#include "engine/ScheduleManager.hpp"
#include "engine/TimeConverter.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace gt::app
{

// Settings key holding the wall-clock origin of the game clock, in unix
// seconds.
inline constexpr char kOriginSettingKey[] = "clockOrigin";

// "hour=2,min=30" -> {{"hour", 2}, {"min", 30}}. Unit names are checked later
// by the scheduler. Returns nullopt on malformed text.
std::optional<engine::UnitComponents> parse_target(std::string_view text);

// The configured origin wins; otherwise the one stored by an earlier run.
// A first run stores the current time so later runs continue the same clock.
std::chrono::system_clock::time_point
resolve_origin(engine::ClockSettings const &settings,
               engine::PersistenceManager &persistence);

// Schedules a command-line entry unless a live entry (usually one restored
// by on_resume) already has the same handler, args, target and repeat flag.
// Returns nullopt when it was already present.
std::optional<engine::EntryHandle>
schedule_unless_present(engine::ScheduleManager &manager,
                        std::string const &handler, std::string const &args,
                        engine::UnitComponents const &target, bool repeat);

std::string describe_game_time(engine::UnitTable const &units,
                               engine::GameSeconds game_seconds);

} // namespace gt::app
