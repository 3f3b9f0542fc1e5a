#include "app/Application.hpp"
#include "ui/StatusFormatter.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <regex>
#include <thread>
#include <pthread.h>
#include <signal.h>

namespace castbar::app {

namespace {

std::chrono::milliseconds period_interval(double seconds) {
    seconds = std::min(seconds, backend::Config::kMaxSeconds);
    return std::chrono::milliseconds(std::max<long>(1, std::lround(seconds * 1000.0)));
}

// SIGINT/SIGTERM must land on the main thread, which may be blocked on the sink
void block_stop_signals() {
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    int err = pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    if (err != 0) {
        util::Logger::warn("Application: Cannot block stop signals on discovery thread: " +
            std::string(std::strerror(err)));
    }
}

core::OutputOptions output_options(const backend::Config& config) {
    core::OutputOptions options;
    options.width = config.width;
    options.speed = config.marquee_speed;
    options.pause = config.marquee_pause;
    options.dedupe = config.dedupe;
    return options;
}

}  // namespace

Application::Application(Context& ctx, collectors::DiscoveryClient* discovery,
                         Clock::time_point start)
    : ctx_(ctx),
      discovery_(discovery),
      cycler_(ctx.registry, ctx.selection, make_blacklist_filter(ctx.config)),
      driver_(ctx.registry, ctx.selection,
              ui::StatusFormatter(ctx.config.format, ctx.config.unicode),
              ctx.sink, output_options(ctx.config)) {
    attach_discovery();

    auto period = period_interval(ctx_.config.period);
    auto frame = core::OutputDriver::frame_interval(ctx_.config.marquee_speed);

    // "cycle" sorts before "frame", so a tick that fires both selects first
    scheduler_.schedule("cycle", period, [this](Clock::time_point now) { cycler_.tick(now); },
                        true, start);
    scheduler_.schedule("frame", frame, [this](Clock::time_point now) { driver_.tick(now); },
                        true, start);

    util::Logger::info("Application: period " + std::to_string(period.count()) +
        "ms, frame interval " + std::to_string(frame.count()) + "ms, width " +
        std::to_string(ctx_.config.width));
}

void Application::attach_discovery() {
    if (!discovery_) {
        util::Logger::warn("Application: No discovery feed configured, nothing will ever play");
        return;
    }

    auto& registry = ctx_.registry;
    discovery_->set_listener(
        [&registry](const std::string& id, const model::DeviceSnapshot& snap) {
            model::DeviceSnapshot copy = snap;
            copy.id = id;
            registry.update(copy);
        },
        [&registry](const std::string& id) {
            registry.remove(id);
        });
}

int Application::step(Clock::time_point now) {
    return scheduler_.process(now);
}

void Application::run(const std::atomic<bool>& shutdown) {
    std::jthread discovery_thread;
    if (discovery_) {
        discovery_thread = std::jthread([this](std::stop_token st) {
            block_stop_signals();
            discovery_->run(st);
        });
    }

    util::Logger::info("Application: Running");

    while (!shutdown.load()) {
        auto now = Clock::now();
        step(now);

        // Sleep until the next timer, waking at least every 100ms for shutdown
        auto wake = std::min(scheduler_.next_due(now), Clock::now() + std::chrono::milliseconds(100));
        std::this_thread::sleep_until(wake);
    }

    util::Logger::info("Application: Shutdown requested");
    // jthread destructor requests stop and joins
}

void Application::write_blank_line() {
    ctx_.sink.write_line("");
}

core::Cycler::Filter Application::make_blacklist_filter(const backend::Config& config) {
    if (config.blacklist_regex.empty()) {
        return nullptr;
    }

    // validate() has already compiled this pattern once
    std::regex pattern(config.blacklist_regex);
    ui::StatusFormatter formatter(config.format, config.unicode);
    return [pattern, formatter](const model::DeviceSnapshot& snap) {
        return !std::regex_search(formatter.format(snap), pattern);
    };
}

}  // namespace castbar::app
