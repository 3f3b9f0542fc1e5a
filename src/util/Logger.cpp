#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace castbar::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open between writes
static std::string log_path = "/tmp/castbar.log";
static Logger::Level log_threshold = Logger::Level::Info;

void Logger::init(const std::string& path, Level threshold) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    log_threshold = threshold;
    log_file.open(log_path, std::ios::app);
}

void Logger::set_threshold(Level threshold) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_threshold = threshold;
}

Logger::Level Logger::threshold() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_threshold;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < log_threshold) return;
    if (!log_file.is_open()) {
        // Not initialized yet (tests, early startup)
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

bool Logger::parse_level(const std::string& name, Level& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") out = Level::Debug;
    else if (upper == "INFO") out = Level::Info;
    else if (upper == "WARNING" || upper == "WARN") out = Level::Warn;
    else if (upper == "ERROR") out = Level::Error;
    else return false;
    return true;
}

}  // namespace castbar::util
