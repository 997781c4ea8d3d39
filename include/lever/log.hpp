#ifndef LEVER_LOG_HPP
#define LEVER_LOG_HPP

#include <string>
#include <string_view>

namespace lever {
namespace log {

// =============================================================================
// Leveled stderr logger
// =============================================================================

enum class Level : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

const char* to_string(Level level) noexcept;

// "debug", "info", "warn", "error" or "off"; throws ConfigError otherwise
Level parse_level(std::string_view name);

void set_level(Level level) noexcept;
Level level() noexcept;

bool enabled(Level level) noexcept;

// "[YYYY-MM-DD HH:MM:SS][LEVEL] message" on stderr
void write(Level level, const std::string& message);

inline void debug(const std::string& msg) { write(Level::DEBUG, msg); }
inline void info(const std::string& msg) { write(Level::INFO, msg); }
inline void warn(const std::string& msg) { write(Level::WARN, msg); }
inline void error(const std::string& msg) { write(Level::ERROR, msg); }

} // namespace log
} // namespace lever

#endif // LEVER_LOG_HPP
