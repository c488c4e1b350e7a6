/**
 * Log.hpp - Leveled diagnostic output on stderr
 */

#pragma once

#include <string>

namespace ut {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    // Accepts "debug", "info", "warning"/"warn", "error"; anything else keeps the current level
    static bool setLevel(const std::string& name);
    static bool parseLevel(const std::string& name, LogLevel& level);
    static std::string levelName(LogLevel level);

    static void write(LogLevel level, const std::string& component, const std::string& message);

    static void debug(const std::string& component, const std::string& message) {
        write(LogLevel::DEBUG, component, message);
    }
    static void info(const std::string& component, const std::string& message) {
        write(LogLevel::INFO, component, message);
    }
    static void warning(const std::string& component, const std::string& message) {
        write(LogLevel::WARNING, component, message);
    }
    static void error(const std::string& component, const std::string& message) {
        write(LogLevel::ERROR, component, message);
    }
};

} // namespace ut
