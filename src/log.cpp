#include "winprob/log.hpp"
#include <atomic>
#include <cstdio>
#include <mutex>

namespace winprob::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_write_mutex;  // Keep lines from concurrent workers whole

const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
    }
    return "?";
}

} // namespace

void set_level(Level level) {
    g_level.store(level);
}

Level level() {
    return g_level.load();
}

bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(g_level.load());
}

void write(Level level, std::string_view message) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    fmt::print(stderr, "[{}] {}\n", level_name(level), message);
}

} // namespace winprob::log
