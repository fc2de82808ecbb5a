/**
 * @file json_reporter.cpp
 * @brief Machine-readable record of a provisioning run
 *
 * @date 2025
 */

#include "ctforge/reporters/json_reporter.hpp"
#include "ctforge/core/provisioning_session.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace ctforge {
namespace reporters {

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

std::string JsonReporter::GenerateJsonString(const core::ProvisionResult& result) const {
    json j;

    j["metadata"] = {
        {"tool", "ctforge"},
        {"generated_at", FormatTimestamp(std::chrono::system_clock::now())}
    };

    auto duration = std::chrono::duration_cast<std::chrono::seconds>(
        result.finished_at - result.started_at);

    j["result"] = {
        {"success", result.success},
        {"stage", core::StageToString(result.stage_reached)},
        {"container_id", result.container_id ? json(*result.container_id) : json(nullptr)},
        {"storage", result.storage_tag},
        {"template", result.template_name},
        {"ip_address", result.ip_address},
        {"endpoints", result.endpoints},
        {"description", result.description},
        {"started_at", FormatTimestamp(result.started_at)},
        {"finished_at", FormatTimestamp(result.finished_at)},
        {"duration_seconds", duration.count()}
    };

    if (result.success) {
        j["error"] = nullptr;
    }
    else {
        j["error"] = {
            {"kind", core::ErrorKindToString(result.error_kind)},
            {"exit_code", result.exit_code},
            {"message", result.error_message},
            {"context", result.error_context},
            {"rollback_warnings", result.rollback_warnings}
        };
    }

    return config_.pretty_print ? j.dump(config_.indent_size) : j.dump();
}

void JsonReporter::GenerateReport(const core::ProvisionResult& result,
                                  const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open report file: " + path.string());
    }

    file << GenerateJsonString(result) << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write report file: " + path.string());
    }
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&t), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace reporters
} // namespace ctforge
