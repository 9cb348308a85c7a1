#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logging for engine diagnostics.
///
/// Diagnostic output only. Gameplay history lives in the per-session
/// EventLog (cge/game/event_log.hpp), never here.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cge/foundation/game_result.hpp"
#include "cge/foundation/types.hpp"

namespace cge::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories, each with its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Process-level framework messages
    Session     = 1, ///< Session lifecycle and phase transitions
    Action      = 2, ///< Action validation and application
    Rules       = 3, ///< Rule engine computations
    Progression = 4, ///< Experience and breakthroughs
    Config      = 5  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Session", "Action", "Rules", "Progression", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.sessionId = SessionId(3);
///   ctx.extra["action"] = "cultivate";
///   logger.logWithContext(LogLevel::Info, LogCategory::Session,
///                         "Action rejected", ctx);
/// @endcode
struct LogContext {
    std::optional<SessionId> sessionId;
    std::optional<std::string> characterName;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger on top of kcenon's GlobalLoggerRegistry.
///
/// Each category resolves to a named logger ("cge.<Category>") and falls
/// back to the registry's default logger. PIMPL keeps kcenon headers out
/// of the public API.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Session     | Info          |
/// | Action      | Debug         |
/// | Rules       | Debug         |
/// | Progression | Info          |
/// | Config      | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    GameResult<void> flush();

    /// Process-wide instance used by the CGE_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cge::foundation

/// @name CGE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define CGE_MIN_LOG_LEVEL before including this header to strip calls
/// below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef CGE_MIN_LOG_LEVEL
    #define CGE_MIN_LOG_LEVEL 0
#endif

#define CGE_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= CGE_MIN_LOG_LEVEL &&                      \
            ::cge::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::cge::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define CGE_LOG_DEBUG(cat, msg) \
    CGE_LOG(::cge::foundation::LogLevel::Debug, (cat), (msg))

#define CGE_LOG_INFO(cat, msg) \
    CGE_LOG(::cge::foundation::LogLevel::Info, (cat), (msg))

#define CGE_LOG_WARN(cat, msg) \
    CGE_LOG(::cge::foundation::LogLevel::Warning, (cat), (msg))

#define CGE_LOG_ERROR(cat, msg) \
    CGE_LOG(::cge::foundation::LogLevel::Error, (cat), (msg))

/// @}
