#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon logger interface for
///        category-filtered, structured game logging.
///
/// The engine never prints. Everything worth telling the player or a
/// developer goes through this logger; the presentation layer decides
/// which logger implementation is registered.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "dcr/foundation/game_result.hpp"

namespace dcr::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Game log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Game lifecycle, reset
    Character = 1, ///< Progression, equipment, skills
    Encounter = 2, ///< Enemy and NPC spawning
    Combat    = 3, ///< Exchanges, flee, bribe
    Quest     = 4, ///< Quest completion and rewards
    World     = 5, ///< Movement, tombstones
    Config    = 6  ///< Rules and catalog loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Character", "Encounter", "Combat", "Quest", "World", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
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

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.location = "~/projects";
///   ctx.character = "goblin";
///   ctx.extra["damage"] = "12";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "enemy hits", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> location;
    std::optional<std::string> character;
    std::unordered_map<std::string, std::string> extra;
};

/// Game logger wrapping kcenon's logging interface.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Character | Info          |
/// | Encounter | Debug         |
/// | Combat    | Debug         |
/// | Quest     | Info          |
/// | World     | Info          |
/// | Config    | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registered default logger.
    GameResult<void> flush();

    /// Process-wide instance used by the DCR_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dcr::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace — macros are global)
// ---------------------------------------------------------------------------

/// @name DCR_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// DCR_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef DCR_MIN_LOG_LEVEL
    #define DCR_MIN_LOG_LEVEL 0
#endif

#define DCR_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= DCR_MIN_LOG_LEVEL &&                      \
            ::dcr::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::dcr::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define DCR_LOG_DEBUG(cat, msg) \
    DCR_LOG(::dcr::foundation::LogLevel::Debug, (cat), (msg))

#define DCR_LOG_INFO(cat, msg) \
    DCR_LOG(::dcr::foundation::LogLevel::Info, (cat), (msg))

#define DCR_LOG_WARN(cat, msg) \
    DCR_LOG(::dcr::foundation::LogLevel::Warning, (cat), (msg))

#define DCR_LOG_ERROR(cat, msg) \
    DCR_LOG(::dcr::foundation::LogLevel::Error, (cat), (msg))

/// @}
