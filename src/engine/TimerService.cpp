#include "engine/TimerService.hpp"

#include "engine/Errors.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <utility>

namespace gt::engine
{

auto TimerService::arm_once(double delay_seconds, Callback on_fire)
    -> TimerHandle
{
    auto delay = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(std::max(0.0, delay_seconds)));
    return arm_at(Clock::now() + delay, std::move(on_fire));
}

auto TimerService::arm_at(Clock::time_point deadline, Callback on_fire)
    -> TimerHandle
{
    std::lock_guard<std::mutex> lock(mutex_);
    TimerHandle id = next_id_++;
    tasks_.push({id, deadline, std::move(on_fire)});
    armed_.insert(id);
    return id;
}

void TimerService::disarm(TimerHandle handle)
{
    // The queued task stays behind and is dropped when it comes due.
    std::lock_guard<std::mutex> lock(mutex_);
    armed_.erase(handle);
}

void TimerService::set_fault_handler(FaultHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    fault_handler_ = std::move(handler);
}

std::size_t TimerService::tick(Clock::time_point now)
{
    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!tasks_.empty() && tasks_.top().next_run <= now)
        {
            Task task = tasks_.top();
            tasks_.pop();
            if (armed_.erase(task.id) == 0)
            {
                continue;
            }
            due.push_back(std::move(task));
        }
    }

    std::size_t executed = 0;
    for (auto &task : due)
    {
        if (!task.callback)
        {
            continue;
        }
        try
        {
            task.callback();
        }
        catch (std::exception const &)
        {
            report_fault(std::current_exception());
        }
        catch (...)
        {
            report_fault(std::current_exception());
        }
        ++executed;
    }
    return executed;
}

std::chrono::milliseconds
TimerService::time_until_next_task(Clock::time_point now) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.empty())
    {
        return std::chrono::hours(24); // Infinite sleep essentially
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
        return std::chrono::milliseconds(0);
    return std::chrono::ceil<std::chrono::milliseconds>(next - now);
}

std::size_t TimerService::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_.size();
}

void TimerService::report_fault(std::exception_ptr error) const
{
    FaultHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = fault_handler_;
    }
    if (handler)
    {
        handler(error);
        return;
    }
    try
    {
        std::rethrow_exception(error);
    }
    catch (CallbackError const &ex)
    {
        GT_LOG_ERROR("scheduled entry {} failed: {}", ex.entry_id(),
                     ex.what());
    }
    catch (std::exception const &ex)
    {
        GT_LOG_ERROR("timer callback failed: {}", ex.what());
    }
    catch (...)
    {
        GT_LOG_ERROR("timer callback failed with a non-standard exception");
    }
}

} // namespace gt::engine
