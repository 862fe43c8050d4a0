#include "engine/ScheduleManager.hpp"

#include "engine/Errors.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <utility>
#include <vector>

namespace gt::engine
{

namespace
{

std::string describe(PartialTimeSpec const &target)
{
    std::string result;
    for (auto const &[unit, value] : target.fields())
    {
        if (!result.empty())
        {
            result.push_back(',');
        }
        result += std::format("{}={}", unit_name(unit), value);
    }
    return result.empty() ? std::string("*") : result;
}

} // namespace

ScheduleManager::ScheduleManager(TimeConverter const &converter,
                                 GameClock const &clock, TimerHost &timers,
                                 HandlerRegistry const &handlers,
                                 ScheduleStore *store)
    : converter_(converter), clock_(clock), timers_(timers),
      handlers_(handlers), store_(store)
{
    if (std::abs(clock_.speed_factor() - converter_.units().speed_factor()) >
        1e-9)
    {
        GT_LOG_WARN("game clock speed factor {} differs from unit table {}",
                    clock_.speed_factor(), converter_.units().speed_factor());
    }
    // New ids continue after whatever is checkpointed.
    if (store_ != nullptr)
    {
        for (auto const &state : store_->load_all())
        {
            next_id_ = std::max(next_id_, state.entry_id + 1);
        }
    }
}

ScheduleManager::~ScheduleManager()
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[id, entry] : entries_)
    {
        disarm_locked(entry);
    }
}

EntryHandle ScheduleManager::schedule(std::string const &handler,
                                      std::string args, PartialTimeSpec target,
                                      bool repeat)
{
    if (!handlers_.contains(handler))
    {
        throw UnknownHandlerError(handler);
    }

    EntryHandle handle;
    ScheduleState snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry entry;
        entry.state.entry_id = next_id_;
        entry.state.handler = handler;
        entry.state.args = std::move(args);
        entry.state.target = std::move(target);
        entry.state.repeat = repeat;
        // Resolving throws before a timer is armed, so a rejected target
        // leaves neither an entry nor a checkpoint behind.
        arm_locked(entry);
        ++next_id_;
        auto [it, inserted] = entries_.emplace(entry.state.entry_id,
                                               std::move(entry));
        handle.id = it->first;
        handle.delay_seconds = it->second.delay_seconds;
        handle.fire_at = it->second.fire_at;
        snapshot = it->second.state;
        persist(snapshot);
    }

    GT_LOG_INFO("scheduled entry {} ({} at {}{}) in {:.1f}s", handle.id,
                handler, describe(snapshot.target),
                repeat ? ", repeating" : "", handle.delay_seconds);
    return handle;
}

EntryHandle ScheduleManager::schedule(std::string const &handler,
                                      std::string args,
                                      UnitComponents const &target, bool repeat)
{
    return schedule(handler, std::move(args), PartialTimeSpec::parse(target),
                    repeat);
}

bool ScheduleManager::cancel(EntryId id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
        {
            return false;
        }
        disarm_locked(it->second);
        entries_.erase(it);
        forget(id);
    }
    GT_LOG_INFO("cancelled entry {}", id);
    return true;
}

void ScheduleManager::on_suspend_notice()
{
    std::size_t suspended = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[id, entry] : entries_)
        {
            disarm_locked(entry);
            entry.status = EntryStatus::PendingArm;
            entry.state.needs_recompute = true;
            persist(entry.state);
            ++suspended;
        }
    }
    GT_LOG_INFO("suspended {} scheduled entries", suspended);
}

std::size_t ScheduleManager::on_resume()
{
    std::vector<ScheduleState> restored;
    if (store_ != nullptr)
    {
        restored = store_->load_all();
    }

    std::size_t armed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &state : restored)
        {
            next_id_ = std::max(next_id_, state.entry_id + 1);
            if (entries_.count(state.entry_id) > 0)
            {
                continue;
            }
            if (!handlers_.contains(state.handler))
            {
                GT_LOG_WARN("entry {} refers to unregistered handler {}; left "
                            "suspended",
                            state.entry_id, state.handler);
                continue;
            }
            Entry entry;
            entry.state = std::move(state);
            entries_.emplace(entry.state.entry_id, std::move(entry));
        }

        for (auto it = entries_.begin(); it != entries_.end();)
        {
            auto &entry = it->second;
            if (entry.status == EntryStatus::Armed)
            {
                ++it;
                continue;
            }
            try
            {
                arm_locked(entry);
            }
            catch (InvalidTargetError const &ex)
            {
                GT_LOG_INFO("entry {} finished while suspended: {}", it->first,
                            ex.what());
                auto const id = it->first;
                it = entries_.erase(it);
                forget(id);
                continue;
            }
            entry.state.needs_recompute = false;
            persist(entry.state);
            ++armed;
            GT_LOG_DEBUG("resumed entry {}: fires in {:.1f}s", it->first,
                         entry.delay_seconds);
            ++it;
        }
    }
    GT_LOG_INFO("resumed {} scheduled entries", armed);
    return armed;
}

std::optional<ScheduleState> ScheduleManager::state_of(EntryId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end())
    {
        return std::nullopt;
    }
    return it->second.state;
}

std::optional<ScheduleManager::EntryStatus>
ScheduleManager::status_of(EntryId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end())
    {
        return std::nullopt;
    }
    return it->second.status;
}

std::optional<double> ScheduleManager::delay_of(EntryId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end())
    {
        return std::nullopt;
    }
    return it->second.delay_seconds;
}

std::size_t ScheduleManager::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<ScheduleState> ScheduleManager::entries() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScheduleState> states;
    states.reserve(entries_.size());
    for (auto const &[id, entry] : entries_)
    {
        states.push_back(entry.state);
    }
    return states;
}

void ScheduleManager::arm_locked(Entry &entry,
                                 std::optional<GameSeconds> not_before)
{
    auto const now = clock_.current_game_seconds();
    auto const from = not_before ? std::max(now, *not_before) : now;
    auto const next =
        converter_.resolve_next_game_time(from, entry.state.target);

    entry.fire_at = next;
    entry.delay_seconds = static_cast<double>(next - now) /
                          converter_.units().speed_factor();
    entry.generation += 1;
    entry.status = EntryStatus::Armed;

    auto const id = entry.state.entry_id;
    auto const generation = entry.generation;
    entry.timer = timers_.arm_once(entry.delay_seconds, [this, id, generation]
                                   { handle_fire(id, generation); });
}

void ScheduleManager::disarm_locked(Entry &entry)
{
    if (entry.timer != 0)
    {
        timers_.disarm(entry.timer);
        entry.timer = 0;
    }
    entry.generation += 1;
}

void ScheduleManager::handle_fire(EntryId id, std::uint64_t generation)
{
    HandlerRegistry::Handler handler;
    std::string handler_name;
    std::string args;
    bool repeat = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        // Cancelled, suspended or re-armed while this fire was in flight.
        if (it == entries_.end() || it->second.generation != generation)
        {
            return;
        }
        auto &entry = it->second;
        entry.status = EntryStatus::Fired;
        entry.timer = 0;
        handler_name = entry.state.handler;
        args = entry.state.args;
        repeat = entry.state.repeat;
        handler = handlers_.find(handler_name);
        if (!repeat)
        {
            entries_.erase(it);
            forget(id);
        }
    }

    std::exception_ptr failure;
    if (handler)
    {
        GT_LOG_DEBUG("firing entry {} ({})", id, handler_name);
        try
        {
            handler(args);
        }
        catch (...)
        {
            // Held until the re-arm below has run.
            failure = std::current_exception();
        }
    }
    else
    {
        GT_LOG_ERROR("entry {} fired but handler {} is no longer registered",
                     id, handler_name);
    }

    if (repeat)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        // The handler may have cancelled its own entry.
        if (it != entries_.end() && it->second.generation == generation)
        {
            // Re-read the live clock, but never resolve from a point before
            // the target that just fired so an early wake-up cannot fire the
            // same occurrence twice.
            try
            {
                arm_locked(it->second, it->second.fire_at);
                GT_LOG_DEBUG("re-armed entry {}: fires in {:.1f}s", id,
                             it->second.delay_seconds);
            }
            catch (InvalidTargetError const &ex)
            {
                GT_LOG_INFO("entry {} has no further occurrence: {}", id,
                            ex.what());
                entries_.erase(it);
                forget(id);
            }
        }
    }
    else
    {
        GT_LOG_DEBUG("entry {} done", id);
    }

    if (failure)
    {
        try
        {
            std::rethrow_exception(failure);
        }
        catch (std::exception const &ex)
        {
            std::throw_with_nested(CallbackError(
                id, std::format("handler {} failed: {}", handler_name,
                                ex.what())));
        }
        catch (...)
        {
            std::throw_with_nested(CallbackError(
                id, std::format("handler {} failed with a non-standard "
                                "exception",
                                handler_name)));
        }
    }
}

void ScheduleManager::persist(ScheduleState const &state)
{
    if (store_ != nullptr && !store_->save(state))
    {
        GT_LOG_WARN("failed to checkpoint entry {}", state.entry_id);
    }
}

void ScheduleManager::forget(EntryId id)
{
    if (store_ != nullptr && !store_->remove(id))
    {
        GT_LOG_WARN("failed to remove checkpoint of entry {}", id);
    }
}

} // namespace gt::engine
