#pragma once
#include <fmt/core.h>
#include <string>
#include <string_view>
#include <utility>

namespace winprob::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide threshold; messages below it are dropped
void set_level(Level level);
Level level();

bool enabled(Level level);

// Writes "[level] message" to stderr
void write(Level level, std::string_view message);

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Debug)) {
        write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Warn)) {
        write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Error)) {
        write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
    }
}

} // namespace winprob::log
