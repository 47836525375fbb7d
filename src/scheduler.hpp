// =============================================================================
// PrinterHub - Cooperative Scheduler
// =============================================================================
// Single-threaded timer/task loop. Every coordinator step runs here as a short
// non-blocking task; network completions from other threads come back through
// post(). Two clocks:
//   RealTime - steady_clock, run() blocks and sleeps until the next timer
//   Manual   - virtual time, advance() jumps from timer to timer (tests, sim)
// =============================================================================
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

namespace printerhub {

class Scheduler {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Duration = std::chrono::milliseconds;
    using TimePoint = std::chrono::steady_clock::time_point;

    enum class Mode { RealTime, Manual };

    explicit Scheduler(Mode mode = Mode::RealTime);
    ~Scheduler() = default;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    Mode mode() const { return mode_; }
    TimePoint now() const;

    // Run task once after delay. Returns an id usable with cancel().
    TimerId schedule(Duration delay, Task task);
    TimerId scheduleAt(TimePoint due, Task task);
    // false if the timer already fired or was never scheduled
    bool cancel(TimerId id);

    // Thread-safe: queue task to run on the loop at the next step
    void post(Task task);

    // Run posted tasks and every timer already due. Returns tasks executed.
    size_t runPending();

    // Manual mode: move virtual time forward, firing timers in due order
    void advance(Duration d);

    // RealTime mode: loop until stop()
    void run();
    void stop();

    size_t timerCount() const;

private:
    struct TimerKey {
        TimePoint due;
        TimerId id;
        bool operator<(const TimerKey& o) const {
            return due < o.due || (due == o.due && id < o.id);
        }
    };

    bool runOne();
    void invoke(Task& task);

    const Mode mode_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, TimePoint> timer_index_;
    std::deque<Task> posted_;
    TimerId next_id_ = 1;
    TimePoint manual_now_;
    bool stop_requested_ = false;
};

} // namespace printerhub
