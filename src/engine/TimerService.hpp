#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <unordered_set>
#include <vector>

namespace gt::engine
{

// Host that fires one-shot callbacks after a real-time delay.
class TimerHost
{
  public:
    using TimerHandle = std::uint64_t;
    using Callback = std::function<void()>;

    virtual ~TimerHost() = default;

    virtual TimerHandle arm_once(double delay_seconds, Callback on_fire) = 0;
    // Unknown or already fired handles are ignored.
    virtual void disarm(TimerHandle handle) = 0;
};

// Timer host driven by the owner's loop: tick() runs whatever is due.
// Callbacks run on the ticking thread, outside the internal lock, so they
// may arm or disarm timers themselves.
class TimerService final : public TimerHost
{
  public:
    using Clock = std::chrono::steady_clock;
    // Receives exceptions escaping a callback. Without one they are logged.
    using FaultHandler = std::function<void(std::exception_ptr)>;

    TimerHandle arm_once(double delay_seconds, Callback on_fire) override;
    TimerHandle arm_at(Clock::time_point deadline, Callback on_fire);
    void disarm(TimerHandle handle) override;

    void set_fault_handler(FaultHandler handler);

    // Run due timers. Returns how many were executed.
    std::size_t tick(Clock::time_point now);

    // Helper for the main loop: "How long can I sleep before work is due?"
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

    std::size_t pending() const;

  private:
    struct Task
    {
        TimerHandle id;
        Clock::time_point next_run;
        Callback callback;

        // Min-heap priority queue needs > operator for smallest-first
        bool operator>(Task const &other) const
        {
            return next_run > other.next_run ||
                   (next_run == other.next_run && id > other.id);
        }
    };

    void report_fault(std::exception_ptr error) const;

    mutable std::mutex mutex_;
    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TimerHandle> armed_;
    TimerHandle next_id_ = 1;
    FaultHandler fault_handler_;
};

} // namespace gt::engine
