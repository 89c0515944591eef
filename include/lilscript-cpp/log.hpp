/// @file log.hpp
/// @brief Leveled diagnostics with a replaceable sink.
///
/// The library reports non-fatal conditions (lenient fallbacks, ambiguous
/// markup) through this facility instead of failing. Applications choose
/// the threshold and may redirect messages to their own sink.

#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace lilscript_cpp {

/// Severity of a diagnostic message, in increasing order.
enum class LogLevel : std::uint8_t {
    debug,
    info,
    warn,
    error,
    off,  ///< Threshold only: suppresses every message.
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::debug: return "debug";
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
        case LogLevel::off:   return "off";
    }
    return "unknown";
}

/// Receives every message at or above the current threshold.
using LogSink = std::function<void(LogLevel, std::string_view)>;

/// Set the minimum level that reaches the sink (default: warn).
void set_log_level(LogLevel level);

/// Get the current threshold.
auto log_level() -> LogLevel;

/// Replace the sink. An empty sink restores the default stderr writer.
/// Sink calls are serialized, so a sink needs no locking of its own. A
/// sink may itself call log() or set_log_sink() on the same thread.
void set_log_sink(LogSink sink);

/// Emit a message if `level` is at or above the threshold.
void log(LogLevel level, std::string_view message);

inline void log_debug(std::string_view message) { log(LogLevel::debug, message); }
inline void log_info(std::string_view message) { log(LogLevel::info, message); }
inline void log_warn(std::string_view message) { log(LogLevel::warn, message); }
inline void log_error(std::string_view message) { log(LogLevel::error, message); }

}  // namespace lilscript_cpp
