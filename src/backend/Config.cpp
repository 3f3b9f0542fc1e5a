#include "backend/Config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include "util/Logger.hpp"

namespace castbar::backend {

namespace {

const std::vector<std::string> kLogLevels = {"DEBUG", "INFO", "WARNING"};

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

double parse_double(const std::string& option, const std::string& value) {
    size_t used = 0;
    double result = 0;
    try {
        result = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + ": expected a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(option + ": expected a number, got '" + value + "'");
    }
    return result;
}

int parse_int(const std::string& option, const std::string& value) {
    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + ": expected an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(option + ": expected an integer, got '" + value + "'");
    }
    return result;
}

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

}  // namespace

void Config::validate() const {
    if (width <= 0) {
        throw std::invalid_argument("width must be a positive integer (got " + std::to_string(width) + ")");
    }
    if (!std::isfinite(period) || !(period > 0) || period > kMaxSeconds) {
        throw std::invalid_argument("period must be in (0, " + std::to_string(kMaxSeconds) +
            "] seconds (got " + std::to_string(period) + ")");
    }
    if (!std::isfinite(marquee_speed) || !(marquee_speed >= 0) ||
        (marquee_speed > 0 && 1.0 / marquee_speed > kMaxSeconds)) {
        throw std::invalid_argument("marquee_speed must be 0 or at least one step per " +
            std::to_string(kMaxSeconds) + " seconds (got " + std::to_string(marquee_speed) + ")");
    }
    if (!std::isfinite(marquee_pause) || !(marquee_pause >= 0) || marquee_pause > kMaxSeconds) {
        throw std::invalid_argument("marquee_pause must be in [0, " + std::to_string(kMaxSeconds) +
            "] seconds (got " + std::to_string(marquee_pause) + ")");
    }
    if (std::find(kLogLevels.begin(), kLogLevels.end(), log_level) == kLogLevels.end()) {
        throw std::invalid_argument("log_level must be one of DEBUG, INFO, WARNING (got " + log_level + ")");
    }
    if (!blacklist_regex.empty()) {
        try {
            std::regex check(blacklist_regex);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("blacklist regex '" + blacklist_regex + "' is invalid: " + e.what());
        }
    }
}

std::string Config::effective_log_level() const {
    auto it = std::find(kLogLevels.begin(), kLogLevels.end(), log_level);
    int base = it == kLogLevels.end() ? 1 : static_cast<int>(it - kLogLevels.begin());
    int level = std::clamp(base + quiet - verbose, 0, static_cast<int>(kLogLevels.size()) - 1);
    return kLogLevels[static_cast<size_t>(level)];
}

Config ConfigLoader::load_config(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    // --config has to be known before the file is read
    std::filesystem::path config_file = get_config_file();
    bool explicit_file = false;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_file = args[i + 1];
            explicit_file = true;
        } else if (args[i].starts_with("--config=")) {
            config_file = args[i].substr(9);
            explicit_file = true;
        }
    }

    Config cfg;
    if (std::filesystem::exists(config_file)) {
        cfg = load_from_file(config_file, cfg);
    } else if (explicit_file) {
        throw std::invalid_argument("config file not found: " + config_file.string());
    }

    apply_args(cfg, args);
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path, Config base) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = std::move(base);

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot read " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring line " + std::to_string(line_no) + ": " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        try {
            if (current_section == "display") {
                if (key == "format") cfg.format = value;
                else if (key == "unicode") cfg.unicode = parse_bool(value);
                else if (key == "width") cfg.width = parse_int(key, value);
                else if (key == "blacklist_regex") cfg.blacklist_regex = value;
            }
            else if (current_section == "cycle") {
                if (key == "period") cfg.period = parse_double(key, value);
            }
            else if (current_section == "marquee") {
                if (key == "speed") cfg.marquee_speed = parse_double(key, value);
                else if (key == "pause") cfg.marquee_pause = parse_double(key, value);
            }
            else if (current_section == "io") {
                if (key == "feed") cfg.feed_path = value;
                else if (key == "output") cfg.output_path = value;
                else if (key == "dedupe") cfg.dedupe = parse_bool(value);
            }
            else if (current_section == "log") {
                if (key == "level") cfg.log_level = upper(value);
                else if (key == "file") cfg.log_file = value;
            }
        } catch (const std::invalid_argument& e) {
            util::Logger::warn("Config: " + path.string() + ":" + std::to_string(line_no) +
                ": " + e.what() + ", keeping previous value");
        }
    }

    return cfg;
}

void ConfigLoader::apply_args(Config& cfg, const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::string inline_value;
        bool has_inline = false;

        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }

        auto value = [&]() -> std::string {
            if (has_inline) return inline_value;
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + ": missing value");
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") cfg.show_help = true;
        else if (arg == "--period") cfg.period = parse_double(arg, value());
        else if (arg == "-f" || arg == "--format") cfg.format = value();
        else if (arg == "-u" || arg == "--unicode") cfg.unicode = true;
        else if (arg == "--width") cfg.width = parse_int(arg, value());
        else if (arg == "--marquee_speed" || arg == "--marquee-speed") cfg.marquee_speed = parse_double(arg, value());
        else if (arg == "--marquee_pause" || arg == "--marquee-pause") cfg.marquee_pause = parse_double(arg, value());
        else if (arg == "--blacklist-regex" || arg == "--blacklist_regex") cfg.blacklist_regex = value();
        else if (arg == "--feed") cfg.feed_path = value();
        else if (arg == "-o" || arg == "--output") cfg.output_path = value();
        else if (arg == "--dedupe") cfg.dedupe = true;
        else if (arg == "--config") value();  // Consumed by load_config
        else if (arg == "--log_level" || arg == "--log-level") cfg.log_level = upper(value());
        else if (arg == "--log_file" || arg == "--log-file") cfg.log_file = value();
        else if (arg == "-v" || arg == "--verbose") cfg.verbose++;
        else if (arg == "-q" || arg == "--quiet") cfg.quiet++;
        else throw std::invalid_argument("unknown option: " + args[i]);
    }
}

std::string ConfigLoader::usage() {
    return
        "usage: castbar [options]\n"
        "\n"
        "Show local cast device status in a format suitable for status bars.\n"
        "\n"
        "  --period SECONDS            time to show a device before cycling (default 10)\n"
        "  -f, --format FORMAT         status template, e.g. '{status} {artist} - {title}'\n"
        "  -u, --unicode               use unicode glyphs for {status}\n"
        "  --width N                   output at most N unicode codepoints per line (default 85)\n"
        "  --marquee_speed CPS         characters to scroll per second (default 5)\n"
        "  --marquee_pause SECONDS     pause at the start of each scroll (default 2)\n"
        "  --blacklist-regex REGEX     skip devices whose status matches (default ^$)\n"
        "  --feed PATH                 device event feed (FIFO or file)\n"
        "  -o, --output PATH           frame sink, '-' for stdout (default -)\n"
        "  --dedupe                    only write frames that changed\n"
        "  --config PATH               config file (default ~/.config/castbar/config.toml)\n"
        "  --log_level LEVEL           DEBUG, INFO or WARNING (default INFO)\n"
        "  --log_file PATH             log destination (default /tmp/castbar.log)\n"
        "  -v, --verbose               log more\n"
        "  -q, --quiet                 log less\n"
        "  -h, --help                  show this help\n";
}

std::filesystem::path ConfigLoader::get_config_file() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "castbar" / "config.toml";
    }
    return ".config/castbar/config.toml";
}

}  // namespace castbar::backend
