// =============================================================================
// parz - Logging
// =============================================================================
// One process-wide Quill logger shared by the command handlers, the
// collector and every worker thread. Records go to the console and, when
// configured, to a log file truncated at startup.
//
//   parz::log::init({.logFile = "run.log", .level = parz::log::Level::kDebug});
//   PARZ_LOG_DEBUG("Worker {} done", index);
//   parz::log::shutdown();
// =============================================================================

#ifndef PARZ_COMMON_LOGGER_H
#define PARZ_COMMON_LOGGER_H

#include <string>

#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace parz::log {

/// @brief Minimum severity that reaches the sinks.
enum class Level { kTrace, kDebug, kInfo, kWarning, kError };

struct Config {
    /// @brief Additional file sink. Empty disables it.
    std::string logFile;
    Level level = Level::kInfo;
};

/// @brief Start the backend and create the logger.
/// @note Call before spawning workers. A second call keeps the first logger.
void init(const Config& config);

/// @brief The shared logger, nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Drain pending records and stop the backend thread.
void shutdown();

}  // namespace parz::log

#define PARZ_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(parz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PARZ_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(parz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PARZ_LOG_INFO(fmt, ...) \
    LOG_INFO(parz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PARZ_LOG_WARNING(fmt, ...) \
    LOG_WARNING(parz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PARZ_LOG_ERROR(fmt, ...) \
    LOG_ERROR(parz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // PARZ_COMMON_LOGGER_H
