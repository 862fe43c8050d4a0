#pragma once

#include "engine/TimeConverter.hpp"
#include "engine/UnitTable.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace gt::engine
{

// Startup configuration of the daemon. Every field has a usable default, so
// an absent configuration file means "default calendar, real speed".
struct ClockSettings
{
    double speed_factor = 1.0;
    UnitRatios ratios{};
    // Absolute unit sizes applied on top of `ratios`.
    UnitTable::Overrides units;
    // Game time at the real-time origin.
    GameSeconds epoch_offset = 0;
    // Unix time at which the game clock started. Unset means "first start",
    // in which case the daemon picks now and persists it.
    std::optional<std::int64_t> origin;
    std::filesystem::path state_path;
    std::chrono::milliseconds tick_interval{250};

    // Throws ConfigError.
    UnitTable build_unit_table() const;
};

// Both throw ConfigError on malformed input. Unknown keys are logged and
// ignored.
ClockSettings parse_clock_settings(std::string_view payload);
ClockSettings load_clock_settings(std::filesystem::path const &path);

} // namespace gt::engine
