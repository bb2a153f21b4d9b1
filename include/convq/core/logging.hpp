// ============================================================================
// convq/core/logging.hpp - Leveled Diagnostic Logging
// ============================================================================
//
// One process-wide logger writing single lines to stderr:
//
//   [2025-06-01 12:00:00.123] [WARN ] [loop] hub: connection c-7 lagging (dropped=12)
//
// The level comes from CONVQ_LOG_LEVEL (error|warn|info|debug|trace) unless
// SetLevel() is called, which EngineContext does from the "log.level"
// setting. Messages below the level are never formatted.
//
// USAGE:
// ------
//   CONVQ_LOG_INFO("registry", "task " << id << " created");
//   CONVQ_LOG_DEBUG("hub", "join " << conn << " -> " << group);
//
// ============================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace convq {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4,
};

class Logger {
   public:
    static void SetLevel(LogLevel level);
    [[nodiscard]] static LogLevel Level();
    [[nodiscard]] static bool Enabled(LogLevel level) { return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Level()); }

    static void Log(LogLevel level, std::string_view component, std::string_view message);

    // Case-insensitive; accepts "warning" for Warn
    static std::optional<LogLevel> ParseLevel(std::string_view text);
    static std::string_view LevelName(LogLevel level);

    // Name shown in the thread column for the calling thread
    static void SetThreadName(std::string name);
};

}  // namespace convq

#define CONVQ_LOG(level, component, expr)                              \
    do {                                                               \
        if (::convq::Logger::Enabled(level)) {                         \
            std::ostringstream convq_log_stream_;                      \
            convq_log_stream_ << expr;                                 \
            ::convq::Logger::Log(level, component, convq_log_stream_.str()); \
        }                                                              \
    } while (0)

#define CONVQ_LOG_ERROR(component, expr) CONVQ_LOG(::convq::LogLevel::Error, component, expr)
#define CONVQ_LOG_WARN(component, expr) CONVQ_LOG(::convq::LogLevel::Warn, component, expr)
#define CONVQ_LOG_INFO(component, expr) CONVQ_LOG(::convq::LogLevel::Info, component, expr)
#define CONVQ_LOG_DEBUG(component, expr) CONVQ_LOG(::convq::LogLevel::Debug, component, expr)
#define CONVQ_LOG_TRACE(component, expr) CONVQ_LOG(::convq::LogLevel::Trace, component, expr)
