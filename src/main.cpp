/**
 * @file main.cpp
 * @brief ctforge - Command-line interface
 *
 * Provisions one LXC container on a Proxmox VE host: picks a storage pool,
 * fetches the newest matching OS template, creates and starts the
 * container and runs a setup script inside it. Any failure after the
 * first host change is rolled back before exiting.
 *
 * Exit status: 0 on success, 2 for configuration errors, otherwise the
 * exit code of the first failing host command (1 when none applies).
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "ctforge/core/config.hpp"
#include "ctforge/core/provision_engine.hpp"
#include "ctforge/host/pve_host.hpp"
#include "ctforge/ui/whiptail_prompt.hpp"
#include "ctforge/utils/logging.hpp"

#include <iostream>

namespace {

constexpr int kConfigErrorExitCode = 2;

/*******************************************************************************
 * Command-line overrides
 ******************************************************************************/

struct CommandLineOptions {
    std::string config_path;
    std::string setup_script;
    std::string os_family;
    std::string os_version;
    std::string template_storage;
    std::string bridge;
    std::string report_path;
    std::string log_file;
    bool verbose{false};
    bool skip_host_preparation{false};
};

ctforge::core::ProvisionConfig BuildConfig(const CommandLineOptions& options) {
    ctforge::core::ProvisionConfig config;
    if (!options.config_path.empty()) {
        config = ctforge::core::LoadConfig(options.config_path);
    }

    if (!options.setup_script.empty()) config.setup_script = options.setup_script;
    if (!options.os_family.empty()) config.os_family = options.os_family;
    if (!options.os_version.empty()) config.os_version = options.os_version;
    if (!options.template_storage.empty()) config.template_storage = options.template_storage;
    if (!options.bridge.empty()) config.bridge = options.bridge;
    if (!options.report_path.empty()) config.report_path = options.report_path;
    if (!options.log_file.empty()) config.log_file = options.log_file;
    if (options.verbose) config.verbose = true;
    if (options.skip_host_preparation) config.prepare_host = false;

    ctforge::core::ValidateConfig(config);
    return config;
}

} // namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"ctforge - LXC container provisioning for Proxmox VE"};

    CommandLineOptions options;

    app.add_option("-c,--config", options.config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-s,--setup-script", options.setup_script,
                   "Script pushed to /setup.sh and run inside the container");
    app.add_option("--os-family", options.os_family, "Template OS family (default: debian)");
    app.add_option("--os-version", options.os_version, "Template OS version (default: 10)");
    app.add_option("--template-storage", options.template_storage,
                   "Storage holding LXC templates (default: local)");
    app.add_option("--bridge", options.bridge, "Network bridge (default: vmbr0)");
    app.add_option("--report", options.report_path, "Write a JSON report to this path");
    app.add_option("--log-file", options.log_file, "Also log to this file");
    app.add_flag("-v,--verbose", options.verbose, "Enable verbose logging");
    app.add_flag("--skip-host-preparation", options.skip_host_preparation,
                 "Do not check the aufs/overlay kernel modules");

    CLI11_PARSE(app, argc, argv);

    // Console logging must work before the configuration is known
    ctforge::utils::InitLogging({options.verbose, {}});

    ctforge::core::ProvisionConfig config;
    try {
        config = BuildConfig(options);
    }
    catch (const ctforge::core::ConfigError& e) {
        spdlog::error("{}", e.what());
        return kConfigErrorExitCode;
    }

    try {
        ctforge::utils::InitLogging({config.verbose, config.log_file});
    }
    catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Failed to open log file {}: {}", config.log_file.string(), e.what());
        return kConfigErrorExitCode;
    }

    ctforge::host::PveHost host;
    ctforge::core::ProvisionEngine engine(host, config, ctforge::ui::WhiptailStoragePrompt);

    auto result = engine.Run();

    if (!result.success) {
        spdlog::error("{}@{} {}", result.exit_code, result.error_context, result.error_message);
        return ctforge::core::ProcessExitCode(result);
    }

    for (const auto& endpoint : result.endpoints) {
        std::cout << endpoint << "\n";
    }
    return 0;
}
