/**
 * @file config.hpp
 * @brief Run configuration loaded from JSON and the command line
 *
 * Disk size, memory, swap and hostname are fixed provisioning constants
 * (see provisioning_session.hpp) and are deliberately absent here.
 *
 * **Example**:
 * @code{.json}
 * {
 *   "os_family": "debian",
 *   "os_version": "10",
 *   "setup_script": "/root/setup.sh",
 *   "kernel_modules": ["aufs", "overlay"],
 *   "log_file": "/var/log/ctforge.log"
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctforge {
namespace core {

/**
 * @class ConfigError
 * @brief Invalid or unreadable configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct ProvisionConfig
 * @brief User-adjustable settings for one provisioning run
 */
struct ProvisionConfig {
    // Template Selection
    std::string os_family{"debian"};          ///< OS family, also the container ostype
    std::string os_version{"10"};             ///< Major version to match
    std::string template_storage{"local"};    ///< Storage holding vztmpl images

    // Guest Setup
    std::filesystem::path setup_script{"setup.sh"};   ///< Second-stage executable

    // Network
    std::string bridge{"vmbr0"};              ///< Bridge for the single DHCP interface

    // Host Preparation
    bool prepare_host{true};                                    ///< Check kernel modules
    std::vector<std::string> kernel_modules{"aufs", "overlay"}; ///< Modules to ensure
    std::filesystem::path modules_file{"/etc/modules"};         ///< Boot-time module list

    // Output
    std::filesystem::path log_file;           ///< Extra log file (empty = stderr only)
    std::filesystem::path report_path;        ///< JSON report (empty = none)
    bool verbose{false};
};

/**
 * @brief Apply a JSON document on top of existing settings
 *
 * Keys absent from the document keep their current value. Unknown keys are
 * reported with a warning.
 *
 * @param json_text JSON object text
 * @param base Settings to start from
 * @throws ConfigError on syntax errors or wrong value types
 */
ProvisionConfig ParseConfig(const std::string& json_text,
                            const ProvisionConfig& base = ProvisionConfig{});

/**
 * @brief Read and parse a configuration file
 * @throws ConfigError if the file cannot be read or parsed
 */
ProvisionConfig LoadConfig(const std::filesystem::path& path,
                           const ProvisionConfig& base = ProvisionConfig{});

/**
 * @brief Check settings before any host interaction
 * @throws ConfigError naming the first invalid setting
 */
void ValidateConfig(const ProvisionConfig& config);

} // namespace core
} // namespace ctforge
