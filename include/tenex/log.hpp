#ifndef TENEX_LOG_HPP
#define TENEX_LOG_HPP

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace tenex {
namespace log {

// =============================================================================
// Leveled Logger (std::cerr by default)
// =============================================================================

enum class Level : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

void set_level(Level level);
Level level();
bool enabled(Level level);

// Redirect output; the stream must outlive all logging
void set_stream(std::ostream& out);
void reset_stream();

// "trace" .. "off", case-sensitive
std::optional<Level> parse_level(std::string_view name);
const char* level_name(Level level);

void write(Level level, std::string_view component, std::string_view message);

inline void trace(std::string_view component, std::string_view message) {
    write(Level::TRACE, component, message);
}
inline void debug(std::string_view component, std::string_view message) {
    write(Level::DEBUG, component, message);
}
inline void info(std::string_view component, std::string_view message) {
    write(Level::INFO, component, message);
}
inline void warn(std::string_view component, std::string_view message) {
    write(Level::WARN, component, message);
}
inline void error(std::string_view component, std::string_view message) {
    write(Level::ERROR, component, message);
}

} // namespace log
} // namespace tenex

#endif // TENEX_LOG_HPP
