/**
 * @file config.cpp
 * @brief JSON configuration loading and validation
 *
 * @date 2025
 */

#include "ctforge/core/config.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>
#include <set>
#include <system_error>

using json = nlohmann::json;

namespace ctforge {
namespace core {

namespace {

const std::set<std::string> kKnownKeys = {
    "os_family", "os_version", "template_storage", "setup_script", "bridge",
    "prepare_host", "kernel_modules", "modules_file", "log_file",
    "report_path", "verbose"
};

template <typename T>
void ReadKey(const json& j, const char* key, T& target) {
    if (!j.contains(key)) {
        return;
    }
    try {
        target = j.at(key).get<T>();
    }
    catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void ReadPath(const json& j, const char* key, std::filesystem::path& target) {
    std::string value = target.string();
    ReadKey(j, key, value);
    target = value;
}

} // anonymous namespace

ProvisionConfig ParseConfig(const std::string& json_text, const ProvisionConfig& base) {
    json j;
    try {
        j = json::parse(json_text);
    }
    catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    for (const auto& item : j.items()) {
        if (kKnownKeys.count(item.key()) == 0) {
            spdlog::warn("Ignoring unknown configuration key '{}'", item.key());
        }
    }

    ProvisionConfig config = base;
    ReadKey(j, "os_family", config.os_family);
    ReadKey(j, "os_version", config.os_version);
    ReadKey(j, "template_storage", config.template_storage);
    ReadPath(j, "setup_script", config.setup_script);
    ReadKey(j, "bridge", config.bridge);
    ReadKey(j, "prepare_host", config.prepare_host);
    ReadKey(j, "kernel_modules", config.kernel_modules);
    ReadPath(j, "modules_file", config.modules_file);
    ReadPath(j, "log_file", config.log_file);
    ReadPath(j, "report_path", config.report_path);
    ReadKey(j, "verbose", config.verbose);

    return config;
}

ProvisionConfig LoadConfig(const std::filesystem::path& path, const ProvisionConfig& base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot read configuration file: " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    spdlog::debug("Loaded configuration from {}", path.string());
    return ParseConfig(content, base);
}

void ValidateConfig(const ProvisionConfig& config) {
    if (config.os_family.empty()) {
        throw ConfigError("os_family must not be empty");
    }
    if (config.os_version.empty()) {
        throw ConfigError("os_version must not be empty");
    }
    if (config.template_storage.empty()) {
        throw ConfigError("template_storage must not be empty");
    }
    if (config.bridge.empty()) {
        throw ConfigError("bridge must not be empty");
    }
    if (config.setup_script.empty()) {
        throw ConfigError("setup_script must not be empty");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config.setup_script, ec)) {
        throw ConfigError("Setup script not found: " + config.setup_script.string());
    }

    for (const auto& module : config.kernel_modules) {
        if (module.empty() || module.find_first_of(" \t\n/") != std::string::npos) {
            throw ConfigError("Invalid kernel module name: '" + module + "'");
        }
    }
}

} // namespace core
} // namespace ctforge
