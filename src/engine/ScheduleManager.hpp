#pragma once

#include "engine/GameClock.hpp"
#include "engine/HandlerRegistry.hpp"
#include "engine/ScheduleStore.hpp"
#include "engine/TimeConverter.hpp"
#include "engine/TimerService.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gt::engine
{

struct EntryHandle
{
    EntryId id = 0;
    // Real seconds until the first fire, as computed by schedule().
    double delay_seconds = 0;
    // Absolute game time the entry is armed for.
    GameSeconds fire_at = 0;
};

// Fires registered handlers when the game clock reaches a partial target,
// once or every time the target comes round again.
//
// Entry lifecycle: PendingArm -> Armed -> Fired -> (Armed | done), or
// cancelled at any point. The persistent store mirrors the live entries so
// that a restarted host can call on_resume() and get every entry re-armed
// with a delay derived from the live clock.
class ScheduleManager
{
  public:
    enum class EntryStatus
    {
        PendingArm,
        Armed,
        Fired,
    };

    // The store is optional; without one entries do not survive a restart.
    ScheduleManager(TimeConverter const &converter, GameClock const &clock,
                    TimerHost &timers, HandlerRegistry const &handlers,
                    ScheduleStore *store = nullptr);
    ~ScheduleManager();

    ScheduleManager(ScheduleManager const &) = delete;
    ScheduleManager &operator=(ScheduleManager const &) = delete;

    // Throws UnknownHandlerError; UnknownUnitError and InvalidTargetError come
    // from parsing or resolving `target`. Nothing is scheduled when it
    // throws.
    EntryHandle schedule(std::string const &handler, std::string args,
                         PartialTimeSpec target, bool repeat = false);
    EntryHandle schedule(std::string const &handler, std::string args,
                         UnitComponents const &target, bool repeat = false);

    // Idempotent. Returns false when the entry was already gone.
    bool cancel(EntryId id);

    // The host is about to stop or reload: every entry is disarmed, flagged
    // for recompute and checkpointed.
    void on_suspend_notice();
    // Restores persisted entries and re-arms every entry that is not armed,
    // each against the live clock. An entry whose target has no occurrence
    // left is finished and dropped from the store. Returns the number of
    // entries armed.
    std::size_t on_resume();

    std::optional<ScheduleState> state_of(EntryId id) const;
    std::optional<EntryStatus> status_of(EntryId id) const;
    // Delay computed by the most recent arm of the entry.
    std::optional<double> delay_of(EntryId id) const;
    std::size_t size() const;
    // Snapshot of every live entry, in id order.
    std::vector<ScheduleState> entries() const;

  private:
    struct Entry
    {
        ScheduleState state;
        EntryStatus status = EntryStatus::PendingArm;
        TimerHost::TimerHandle timer = 0;
        // Bumped on every arm and disarm; a fire carrying an older value is
        // stale.
        std::uint64_t generation = 0;
        double delay_seconds = 0;
        GameSeconds fire_at = 0;
    };

    // Resolves the next occurrence strictly after max(live clock,
    // `not_before`) and arms the timer. Throws InvalidTargetError, with
    // `entry` untouched and nothing armed, when no such occurrence exists.
    // Caller holds mutex_.
    void arm_locked(Entry &entry, std::optional<GameSeconds> not_before = {});
    void disarm_locked(Entry &entry);
    void handle_fire(EntryId id, std::uint64_t generation);
    // Store writes happen with mutex_ held so checkpoints follow the order
    // of the in-memory changes.
    void persist(ScheduleState const &state);
    void forget(EntryId id);

    TimeConverter const &converter_;
    GameClock const &clock_;
    TimerHost &timers_;
    HandlerRegistry const &handlers_;
    ScheduleStore *store_ = nullptr;

    mutable std::mutex mutex_;
    std::map<EntryId, Entry> entries_;
    EntryId next_id_ = 1;
};

} // namespace gt::engine
