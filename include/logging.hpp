#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace tollgate {
namespace logging {

enum class Level {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

void set_level(Level level);
Level level();

// Accepts "debug", "info", "warn"/"warning", "error", "off" (any case).
// Throws ConfigError on anything else.
Level parse_level(const std::string& name);
const char* level_name(Level level);

inline bool enabled(Level lvl) {
    return lvl >= level() && lvl != Level::Off;
}

void write(Level lvl, const std::string& message);

template <typename... Args>
void log(Level lvl, Args&&... args) {
    if (!enabled(lvl)) return;
    std::ostringstream out;
    (out << ... << std::forward<Args>(args));
    write(lvl, out.str());
}

template <typename... Args>
void debug(Args&&... args) { log(Level::Debug, std::forward<Args>(args)...); }

template <typename... Args>
void info(Args&&... args) { log(Level::Info, std::forward<Args>(args)...); }

template <typename... Args>
void warn(Args&&... args) { log(Level::Warn, std::forward<Args>(args)...); }

template <typename... Args>
void error(Args&&... args) { log(Level::Error, std::forward<Args>(args)...); }

} // namespace logging
} // namespace tollgate
