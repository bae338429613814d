#include "logging.hpp"
#include "errors.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <unistd.h>

namespace tollgate {
namespace logging {

// Same palette as the statistics report
static const char* C_GREY   = "\033[90m";
static const char* C_CYAN   = "\033[36m";
static const char* C_YELLOW = "\033[33m";
static const char* C_RED    = "\033[31m";
static const char* C_RESET  = "\033[0m";

static std::atomic<Level> g_level{Level::Info};
static std::mutex g_write_mutex;

void set_level(Level lvl) {
    g_level.store(lvl);
}

Level level() {
    return g_level.load();
}

Level parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "off" || lower == "none") return Level::Off;

    throw ConfigError("unknown log level '" + name + "'");
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
    }
    return "?";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Level::Debug: return C_GREY;
        case Level::Info:  return C_CYAN;
        case Level::Warn:  return C_YELLOW;
        case Level::Error: return C_RED;
        default:           return C_RESET;
    }
}

void write(Level lvl, const std::string& message) {
    static const bool colored = ::isatty(STDERR_FILENO) != 0;

    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << std::put_time(&tm_buf, "%H:%M:%S") << '.'
              << std::setw(3) << std::setfill('0') << millis << std::setfill(' ') << ' ';
    if (colored) std::cerr << level_color(lvl);
    std::cerr << '[' << std::left << std::setw(5) << level_name(lvl) << ']' << std::right;
    if (colored) std::cerr << C_RESET;
    std::cerr << " tollgate: " << message << '\n';
}

} // namespace logging
} // namespace tollgate
