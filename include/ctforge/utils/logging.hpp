/**
 * @file logging.hpp
 * @brief spdlog setup for the provisioning CLI
 *
 * All components log through the global spdlog functions. This header only
 * configures the default logger once at startup: a colored stderr sink
 * whose lines carry an upper-case severity tag (INFO, WARNING, ERROR) and
 * an optional plain file sink.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace ctforge {
namespace utils {

/**
 * @struct LoggingOptions
 * @brief Logger configuration
 */
struct LoggingOptions {
    bool verbose{false};                 ///< Enable debug level
    std::filesystem::path log_file;      ///< Additional file sink (empty = none)
};

/// Pattern used by every sink; `%*` is the severity tag flag
inline constexpr const char* kLogPattern = "[%H:%M:%S] [%^%*%$] %v";

/**
 * @brief Install the default logger
 * @param options Verbosity and optional log file
 */
void InitLogging(const LoggingOptions& options);

/**
 * @brief Upper-case severity tag for a spdlog level value
 * @param level spdlog::level::level_enum cast to int
 */
std::string SeverityTag(int level);

} // namespace utils
} // namespace ctforge
