#pragma once

#include "engine/TimeConverter.hpp"

#include <chrono>

namespace gt::engine
{

// Source of the absolute game time. Non-decreasing while the process runs;
// an external reset may move it backwards.
class GameClock
{
  public:
    virtual ~GameClock() = default;

    virtual GameSeconds current_game_seconds() const = 0;
    virtual double speed_factor() const = 0;
};

// Game clock derived from the system clock: the game time is the real time
// elapsed since `origin`, scaled by the speed factor, plus `epoch_offset`.
// Because the origin is a wall-clock instant the game keeps advancing while
// the process is down.
class SystemGameClock final : public GameClock
{
  public:
    using Clock = std::chrono::system_clock;

    SystemGameClock(Clock::time_point origin, GameSeconds epoch_offset,
                    double speed_factor);

    GameSeconds current_game_seconds() const override;
    double speed_factor() const noexcept override { return speed_factor_; }

    GameSeconds game_seconds_at(Clock::time_point now) const noexcept;

    Clock::time_point origin() const noexcept { return origin_; }
    GameSeconds epoch_offset() const noexcept { return epoch_offset_; }

  private:
    Clock::time_point origin_;
    GameSeconds epoch_offset_ = 0;
    double speed_factor_ = 1.0;
};

} // namespace gt::engine
