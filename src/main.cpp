#include "app/Application.hpp"
#include "app/Context.hpp"
#include "backend/Config.hpp"
#include "collectors/FeedCollector.hpp"
#include "output/Sink.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <signal.h>

// Set from the signal handler, polled by the main loop
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void install_signal_handlers() {
    // No SA_RESTART: a FIFO open or write blocked on the status bar must
    // return EINTR so shutdown is noticed
    struct sigaction stop {};
    stop.sa_handler = signal_handler;
    sigemptyset(&stop.sa_mask);
    stop.sa_flags = 0;

    // A status bar that goes away must surface as EPIPE, not kill us silently
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);

    if (::sigaction(SIGINT, &stop, nullptr) != 0 ||
        ::sigaction(SIGTERM, &stop, nullptr) != 0 ||
        ::sigaction(SIGPIPE, &ignore, nullptr) != 0) {
        throw std::system_error(errno, std::generic_category(), "sigaction");
    }
}

int main(int argc, char** argv) {
    castbar::backend::Config config;
    try {
        config = castbar::backend::ConfigLoader::load_config(argc, argv);
        if (config.show_help) {
            std::cout << castbar::backend::ConfigLoader::usage();
            return 0;
        }
        config.validate();
    } catch (const std::invalid_argument& e) {
        // Rejected before any frame is written
        std::cerr << "castbar: " << e.what() << "\n\n" << castbar::backend::ConfigLoader::usage();
        return 2;
    }

    castbar::util::Logger::Level level = castbar::util::Logger::Level::Info;
    if (!castbar::util::Logger::parse_level(config.effective_log_level(), level)) {
        level = castbar::util::Logger::Level::Info;
    }
    castbar::util::Logger::init(config.log_file, level);
    castbar::util::Logger::info("castbar starting...");

    try {
        install_signal_handlers();

        castbar::output::FileSink sink(config.output_path, [] { return g_shutdown.load(); });
        castbar::app::Context ctx(config, sink);

        std::unique_ptr<castbar::collectors::FeedCollector> feed;
        if (!config.feed_path.empty()) {
            feed = std::make_unique<castbar::collectors::FeedCollector>(config.feed_path);
        }

        castbar::app::Application app(ctx, feed.get());
        app.run(g_shutdown);

        // Leave the bar empty rather than showing a stale frame
        app.write_blank_line();

        castbar::util::Logger::info("castbar shutdown");
        return 0;
    } catch (const std::system_error& e) {
        if (g_shutdown.load() && e.code() == std::errc::interrupted) {
            // Signalled while blocked on the output; nothing more can be written
            castbar::util::Logger::info("castbar shutdown while waiting on output: " + std::string(e.what()));
            return 0;
        }
        castbar::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        castbar::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
