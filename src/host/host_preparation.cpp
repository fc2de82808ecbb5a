/**
 * @file host_preparation.cpp
 * @brief Kernel module loading and boot-time persistence
 *
 * @date 2025
 */

#include "ctforge/host/host_preparation.hpp"
#include "ctforge/core/errors.hpp"
#include "ctforge/utils/command_utils.hpp"
#include "ctforge/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace ctforge {
namespace host {

using utils::StringUtils;

namespace {

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return {};
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

} // anonymous namespace

HostPreparation::HostPreparation(Config config)
    : config_(std::move(config)) {
}

void HostPreparation::Prepare() {
    for (const auto& module : config_.modules) {
        if (IsLoaded(module)) {
            spdlog::debug("Kernel module '{}' already loaded", module);
        } else {
            Load(module);
        }
        Persist(module);
    }
}

bool HostPreparation::IsLoaded(const std::string& module) const {
    auto loaded = ParseLoadedModules(ReadFile(config_.proc_modules));
    for (const auto& name : loaded) {
        if (name == module) {
            return true;
        }
    }
    return false;
}

void HostPreparation::Load(const std::string& module) {
    spdlog::info("Loading kernel module '{}'", module);

    auto result = utils::ExecuteCommand({"modprobe", module});
    if (!result.success) {
        throw core::ProvisionError(core::ErrorKind::HOST_CAPABILITY_UNAVAILABLE,
                                   "Failed to load '" + module + "' module.",
                                   result.exit_code, "modprobe " + module);
    }
}

void HostPreparation::Persist(const std::string& module) {
    auto content = ReadFile(config_.modules_file);
    if (IsListed(content, module)) {
        return;
    }

    std::ofstream file(config_.modules_file, std::ios::app);
    if (!content.empty() && content.back() != '\n') {
        file << '\n';
    }
    if (!file.is_open() || !(file << module << '\n')) {
        throw core::ProvisionError(core::ErrorKind::HOST_CAPABILITY_UNAVAILABLE,
                                   "Failed to add '" + module + "' module to load at boot.",
                                   1, "append " + config_.modules_file.string());
    }

    spdlog::info("Added '{}' to {}", module, config_.modules_file.string());
}

std::vector<std::string> HostPreparation::ParseLoadedModules(const std::string& proc_modules) {
    std::vector<std::string> names;
    for (const auto& line : StringUtils::SplitLines(proc_modules)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (!fields.empty()) {
            names.push_back(fields[0]);
        }
    }
    return names;
}

bool HostPreparation::IsListed(const std::string& modules_file_content, const std::string& module) {
    std::istringstream stream(modules_file_content);
    std::string line;
    while (std::getline(stream, line)) {
        if (line == module) {
            return true;
        }
    }
    return false;
}

} // namespace host
} // namespace ctforge
