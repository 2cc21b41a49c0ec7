#ifndef ZAP_LOG_HPP
#define ZAP_LOG_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace zap {
namespace log {

enum class Level : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

// Process-wide threshold (default INFO)
void set_level(Level level);
Level level();

bool enabled(Level level);

// "trace", "debug", "info", "warn", "error", "off"
// Throws std::invalid_argument for anything else.
Level parse_level(std::string_view name);
const char* level_name(Level level);

// Writes "[zap] <level> <msg>" to std::clog, serialized across threads
void write(Level level, std::string_view msg);

inline void trace(std::string_view msg) { write(Level::TRACE, msg); }
inline void debug(std::string_view msg) { write(Level::DEBUG, msg); }
inline void info(std::string_view msg) { write(Level::INFO, msg); }
inline void warn(std::string_view msg) { write(Level::WARN, msg); }
inline void error(std::string_view msg) { write(Level::ERROR, msg); }

} // namespace log
} // namespace zap

#endif // ZAP_LOG_HPP
