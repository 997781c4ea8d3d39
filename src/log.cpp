// =============================================================================
// log.cpp - Leveled stderr logger
// =============================================================================

#include "lever/log.hpp"
#include "lever/errors.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace lever {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::INFO)};

} // anonymous namespace

const char* to_string(Level level) noexcept {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARN: return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::OFF: return "OFF";
    }
    return "LOG";
}

Level parse_level(std::string_view name) {
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off") return Level::OFF;
    throw ConfigError("unknown log level: " + std::string(name));
}

void set_level(Level level) noexcept {
    g_level.store(static_cast<int>(level));
}

Level level() noexcept {
    return static_cast<Level>(g_level.load());
}

bool enabled(Level level) noexcept {
    return level != Level::OFF && static_cast<int>(level) >= g_level.load();
}

void write(Level level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }

    using clock = std::chrono::system_clock;
    const auto now = clock::to_time_t(clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%F %T");
    std::cerr << "[" << ss.str() << "][" << to_string(level) << "] " << message << std::endl;
}

} // namespace log
} // namespace lever
