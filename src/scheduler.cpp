#include "scheduler.hpp"
#include "printerhub_log.hpp"
#include <exception>

namespace printerhub {

Scheduler::Scheduler(Mode mode)
    : mode_(mode), manual_now_(std::chrono::steady_clock::now()) {}

Scheduler::TimePoint Scheduler::now() const {
    if (mode_ == Mode::RealTime) return std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    return manual_now_;
}

Scheduler::TimerId Scheduler::schedule(Duration delay, Task task) {
    if (delay.count() < 0) delay = Duration(0);
    return scheduleAt(now() + delay, std::move(task));
}

Scheduler::TimerId Scheduler::scheduleAt(TimePoint due, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        timers_.emplace(TimerKey{due, id}, std::move(task));
        timer_index_[id] = due;
    }
    cv_.notify_one();
    return id;
}

bool Scheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_index_.find(id);
    if (it == timer_index_.end()) return false;
    timers_.erase(TimerKey{it->second, id});
    timer_index_.erase(it);
    return true;
}

void Scheduler::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        posted_.push_back(std::move(task));
    }
    cv_.notify_one();
}

size_t Scheduler::timerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void Scheduler::invoke(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        PHLOG_ERROR("sched", "Task threw: %s", e.what());
    }
}

// Posted tasks first (they are completions of work already started),
// then the earliest due timer.
bool Scheduler::runOne() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!posted_.empty()) {
            task = std::move(posted_.front());
            posted_.pop_front();
        } else if (!timers_.empty()) {
            auto it = timers_.begin();
            TimePoint current = (mode_ == Mode::RealTime)
                ? std::chrono::steady_clock::now() : manual_now_;
            if (it->first.due > current) return false;
            task = std::move(it->second);
            timer_index_.erase(it->first.id);
            timers_.erase(it);
        } else {
            return false;
        }
    }
    invoke(task);
    return true;
}

size_t Scheduler::runPending() {
    size_t count = 0;
    while (runOne()) ++count;
    return count;
}

void Scheduler::advance(Duration d) {
    if (mode_ != Mode::Manual) {
        PHLOG_WARN("sched", "advance() ignored on a real-time scheduler");
        return;
    }
    TimePoint target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = manual_now_ + d;
    }
    for (;;) {
        runPending();
        std::lock_guard<std::mutex> lock(mutex_);
        if (timers_.empty()) break;
        TimePoint next_due = timers_.begin()->first.due;
        if (next_due > target) break;
        if (next_due > manual_now_) manual_now_ = next_due;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual_now_ = target;
    }
    runPending();
}

void Scheduler::run() {
    if (mode_ != Mode::RealTime) {
        PHLOG_WARN("sched", "run() requires a real-time scheduler");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    PHLOG_DEBUG("sched", "Loop started");
    for (;;) {
        runPending();
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_requested_) break;
        if (!posted_.empty()) continue;
        if (timers_.empty()) {
            cv_.wait(lock, [this] { return stop_requested_ || !posted_.empty() || !timers_.empty(); });
        } else {
            TimePoint next_due = timers_.begin()->first.due;
            cv_.wait_until(lock, next_due, [this, next_due] {
                return stop_requested_ || !posted_.empty() ||
                       (!timers_.empty() && timers_.begin()->first.due < next_due);
            });
        }
        if (stop_requested_) break;
    }
    PHLOG_DEBUG("sched", "Loop stopped");
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

} // namespace printerhub
