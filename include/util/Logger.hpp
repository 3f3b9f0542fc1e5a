#pragma once

#include <string>

namespace castbar::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init(const std::string& path, Level threshold = Level::Info);
    static void set_threshold(Level threshold);
    static Level threshold();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // Accepts DEBUG, INFO, WARNING/WARN, ERROR (any case).
    static bool parse_level(const std::string& name, Level& out);
};

}  // namespace castbar::util
