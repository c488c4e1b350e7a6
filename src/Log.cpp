/**
 * Log.cpp - Leveled diagnostic output on stderr
 */

#include "ut/Log.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <unistd.h>

namespace ut {

namespace {

const std::string RESET = "\033[0m";
const std::string YELLOW = "\033[33m";
const std::string RED = "\033[31m";
const std::string CYAN = "\033[36m";

std::atomic<int> g_level{static_cast<int>(LogLevel::WARNING)};
std::mutex g_write_mutex;

} // anonymous namespace

void Logger::setLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(g_level.load());
}

bool Logger::enabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load();
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::WARNING;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

bool Logger::setLevel(const std::string& name) {
    LogLevel parsed;
    if (!parseLevel(name, parsed)) return false;
    setLevel(parsed);
    return true;
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "debug";
        case LogLevel::INFO:    return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR:   return "error";
    }
    return "warning";
}

void Logger::write(LogLevel level, const std::string& component, const std::string& message) {
    if (!enabled(level)) return;

    std::string color;
    std::string tag;
    switch (level) {
        case LogLevel::DEBUG:   color = "";     tag = "DEBUG"; break;
        case LogLevel::INFO:    color = CYAN;   tag = "INFO"; break;
        case LogLevel::WARNING: color = YELLOW; tag = "WARN"; break;
        case LogLevel::ERROR:   color = RED;    tag = "ERROR"; break;
    }

    // No escape codes when stderr is redirected to a file
    static const bool colored = isatty(STDERR_FILENO) != 0;

    std::lock_guard<std::mutex> lock(g_write_mutex);
    if (colored && !color.empty()) {
        std::cerr << color << "[" << tag << "] " << component << ": " << message << RESET << "\n";
    } else {
        std::cerr << "[" << tag << "] " << component << ": " << message << "\n";
    }
}

} // namespace ut
