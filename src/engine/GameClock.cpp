#include "engine/GameClock.hpp"

#include <cmath>

namespace gt::engine
{

SystemGameClock::SystemGameClock(Clock::time_point origin,
                                 GameSeconds epoch_offset, double speed_factor)
    : origin_(origin), epoch_offset_(epoch_offset), speed_factor_(speed_factor)
{
}

GameSeconds SystemGameClock::current_game_seconds() const
{
    return game_seconds_at(Clock::now());
}

GameSeconds
SystemGameClock::game_seconds_at(Clock::time_point now) const noexcept
{
    auto const real_elapsed =
        std::chrono::duration<double>(now - origin_).count();
    return epoch_offset_ +
           static_cast<GameSeconds>(std::floor(real_elapsed * speed_factor_));
}

} // namespace gt::engine
