#pragma once

#include "app/Context.hpp"
#include "collectors/DiscoveryClient.hpp"
#include "core/Cycler.hpp"
#include "core/OutputDriver.hpp"
#include "events/Scheduler.hpp"
#include <atomic>
#include <chrono>

namespace castbar::app {

/**
 * Wires discovery -> registry -> cycler -> formatter -> marquee -> sink.
 *
 * The cycler ("cycle", every period) and the output driver ("frame", every
 * frame interval) share one Scheduler on the calling thread. Discovery runs
 * on its own thread and only touches the registry.
 */
class Application {
public:
    using Clock = std::chrono::steady_clock;

    // Both timers first fire at `start`
    Application(Context& ctx, collectors::DiscoveryClient* discovery,
                Clock::time_point start = Clock::now());

    // Main loop; returns when `shutdown` becomes true. Sink errors propagate.
    void run(const std::atomic<bool>& shutdown);

    // Runs whatever timers are due at `now`
    int step(Clock::time_point now);

    // Clears the bar on exit
    void write_blank_line();

    core::Cycler& cycler() { return cycler_; }
    core::OutputDriver& driver() { return driver_; }

    // Cycler filter rejecting devices whose formatted line matches `regex`
    static core::Cycler::Filter make_blacklist_filter(const backend::Config& config);

private:
    void attach_discovery();

    Context& ctx_;
    collectors::DiscoveryClient* discovery_;
    core::Cycler cycler_;
    core::OutputDriver driver_;
    events::Scheduler scheduler_;
};

}  // namespace castbar::app
