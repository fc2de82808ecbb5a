/**
 * @file json_reporter.hpp
 * @brief Machine-readable record of a provisioning run
 *
 * **Report layout**:
 * ```json
 * {
 *   "metadata": {"tool": "ctforge", "generated_at": "2025-01-01T00:00:00Z"},
 *   "result": {
 *     "success": true,
 *     "stage": "Complete",
 *     "container_id": 105,
 *     "storage": "local",
 *     "template": "debian-10-standard_10.7-1_amd64.tar.gz",
 *     "ip_address": "192.168.1.50",
 *     "endpoints": ["https://192.168.1.50:8443", "https://UnifiNetworkController:8443"],
 *     "started_at": "...", "finished_at": "...", "duration_seconds": 42
 *   },
 *   "error": null
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace ctforge {

namespace core {
    struct ProvisionResult;
}

namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Output formatting
 */
struct JsonReporterConfig {
    bool pretty_print{true};    ///< Pretty print JSON
    int indent_size{2};         ///< Indentation spaces
};

/**
 * @class JsonReporter
 * @brief Serializes a ProvisionResult
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Write the report to a file, creating parent directories
     * @throws std::runtime_error if the file cannot be written
     */
    void GenerateReport(const core::ProvisionResult& result, const std::filesystem::path& path) const;

    std::string GenerateJsonString(const core::ProvisionResult& result) const;

    /// ISO-8601 UTC, e.g. "2025-01-01T12:00:00Z"
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace ctforge
