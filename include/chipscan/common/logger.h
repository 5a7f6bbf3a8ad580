// =============================================================================
// chipscan - Logger Module
// =============================================================================
// Asynchronous diagnostics through Quill.
//
// Log output always goes to stderr (and optionally a file) so that the result
// table written to stdout stays machine-readable.
//
// Usage:
//   chipscan::log::init({.logFile = "scan.log",
//                        .level = chipscan::log::levelFromVerbosity(1, false)});
//   CHIPSCAN_LOG_INFO("Loaded {} variants", count);
//
// The CHIPSCAN_LOG_* macros are no-ops until init() has been called, so the
// engine can be driven from tests and embedding code without a backend.
// =============================================================================

#ifndef CHIPSCAN_COMMON_LOGGER_H
#define CHIPSCAN_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace chipscan::log {

// =============================================================================
// Log Levels
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Level selected by the command-line verbosity flags.
/// @param verbosity Number of -v flags (0 = warnings, 1 = progress, 2+ = debug).
/// @param quiet -q given; overrides verbosity and keeps only errors.
[[nodiscard]] constexpr Level levelFromVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kDebug;
    }
    return verbosity == 1 ? Level::kInfo : Level::kWarning;
}

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

// =============================================================================
// Configuration
// =============================================================================

/// @brief Logger setup.
struct Config {
    /// @brief Additional log file (truncated on open). Empty disables it.
    std::string logFile;

    /// @brief Minimum level written.
    Level level = Level::kWarning;

    /// @brief Write to stderr. The file sink alone is used when false and a file is set.
    bool enableStderr = true;

    std::string loggerName = "chipscan";
};

// =============================================================================
// Lifecycle
// =============================================================================

/// @brief Start the backend and create the global logger.
/// @note Call once from main() before any worker thread starts; later calls are ignored.
void init(const Config& config);

/// @brief Global logger, or nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush and stop the backend thread.
void shutdown();

}  // namespace chipscan::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define CHIPSCAN_LOG_IMPL(QUILL_MACRO, fmt, ...)                                  \
    do {                                                                          \
        if (quill::Logger* chipscanLogger = ::chipscan::log::logger()) {          \
            QUILL_MACRO(chipscanLogger, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                         \
    } while (false)

#define CHIPSCAN_LOG_TRACE(fmt, ...) CHIPSCAN_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define CHIPSCAN_LOG_DEBUG(fmt, ...) CHIPSCAN_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define CHIPSCAN_LOG_INFO(fmt, ...) CHIPSCAN_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define CHIPSCAN_LOG_WARNING(fmt, ...) \
    CHIPSCAN_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define CHIPSCAN_LOG_ERROR(fmt, ...) CHIPSCAN_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define CHIPSCAN_LOG_CRITICAL(fmt, ...) \
    CHIPSCAN_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // CHIPSCAN_COMMON_LOGGER_H
