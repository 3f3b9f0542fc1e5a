#include "events/Scheduler.hpp"
#include "util/Logger.hpp"
#include <utility>

namespace castbar::events {

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task,
                         bool run_now, Clock::time_point start) {
    util::Logger::debug("Scheduler: Scheduling " + name + " every " +
        std::to_string(interval.count()) + "ms");

    tasks_[name] = {std::move(task), interval, run_now ? start : start + interval};
}

void Scheduler::unschedule(const std::string& name) {
    util::Logger::debug("Scheduler: Unscheduling " + name);

    tasks_.erase(name);
}

int Scheduler::process(Clock::time_point now) {
    int ran = 0;
    for (auto& [name, task] : tasks_) {
        if (now >= task.next_run) {
            task.task(now);
            // Keep the cadence; skip missed slots rather than bursting
            task.next_run += task.interval;
            if (task.next_run <= now) {
                task.next_run = now + task.interval;
            }
            ++ran;
        }
    }
    return ran;
}

Scheduler::Clock::time_point Scheduler::next_due(Clock::time_point now) const {
    if (tasks_.empty()) {
        return now;
    }
    auto due = tasks_.begin()->second.next_run;
    for (const auto& [name, task] : tasks_) {
        if (task.next_run < due) {
            due = task.next_run;
        }
    }
    return due;
}

}  // namespace castbar::events
