#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace castbar::events {

// Cooperative timers, all run from the thread that calls process().
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void(Clock::time_point)>;

    // First due at `start` when `run_now`, else at start + interval.
    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task,
                  bool run_now = true, Clock::time_point start = Clock::now());
    void unschedule(const std::string& name);

    // Runs every due task, in name order. Returns the number run.
    int process(Clock::time_point now = Clock::now());

    // Earliest time any task is due; `now` when nothing is scheduled
    Clock::time_point next_due(Clock::time_point now = Clock::now()) const;

    size_t size() const { return tasks_.size(); }

private:
    struct ScheduledTask {
        Task task;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
    };

    std::map<std::string, ScheduledTask> tasks_;
};

}  // namespace castbar::events
