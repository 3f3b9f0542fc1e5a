#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace castbar::backend {

struct Config {
    // Upper bound for period, pause and 1/speed, in seconds
    static constexpr double kMaxSeconds = 24.0 * 60 * 60;

    // Display settings
    std::string format;                 // Empty: default layout
    bool unicode = false;
    int width = 85;                     // Codepoints per line
    std::string blacklist_regex = "^$"; // Empty disables the filter

    // Cycling
    double period = 10.0;               // Seconds per device

    // Marquee
    double marquee_speed = 5.0;         // Characters per second
    double marquee_pause = 2.0;         // Seconds held at offset 0

    // I/O
    std::string feed_path;              // Discovery feed; empty: none
    std::string output_path = "-";      // "-" is stdout
    bool dedupe = false;                // Skip frames equal to the previous one

    // Logging
    std::string log_level = "INFO";
    std::string log_file = "/tmp/castbar.log";
    int verbose = 0;
    int quiet = 0;

    bool show_help = false;

    // Throws std::invalid_argument naming the first bad setting
    void validate() const;

    // log_level shifted by quiet - verbose, clamped to DEBUG..WARNING
    std::string effective_log_level() const;
};

class ConfigLoader {
public:
    // Defaults, then the config file, then argv
    static Config load_config(int argc, const char* const* argv);
    static Config load_from_file(const std::filesystem::path& path, Config base = {});
    static void apply_args(Config& cfg, const std::vector<std::string>& args);
    static std::string usage();

private:
    static std::filesystem::path get_config_file();
};

}  // namespace castbar::backend
