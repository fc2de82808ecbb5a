/**
 * @file host_preparation.hpp
 * @brief Kernel module checks performed before any container state exists
 *
 * Containers built from these templates rely on overlay-style filesystems
 * inside the guest. The host must have the modules loaded now and listed
 * in the modules file so they come back after a reboot.
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ctforge {
namespace host {

/**
 * @class HostPreparation
 * @brief Ensures required kernel modules are loaded and persisted
 */
class HostPreparation {
public:
    /**
     * @struct Config
     * @brief Module list and the files consulted
     */
    struct Config {
        std::vector<std::string> modules{"aufs", "overlay"};   ///< Modules to ensure
        std::filesystem::path proc_modules{"/proc/modules"};    ///< Loaded module table
        std::filesystem::path modules_file{"/etc/modules"};     ///< Boot-time module list
    };

    explicit HostPreparation(Config config);

    /**
     * @brief Load and persist every configured module
     * @throws core::ProvisionError (HOST_CAPABILITY_UNAVAILABLE) on failure
     */
    void Prepare();

    /**
     * @brief Names of loaded modules from /proc/modules content
     */
    static std::vector<std::string> ParseLoadedModules(const std::string& proc_modules);

    /**
     * @brief Whether a modules file lists the module on a line of its own
     */
    static bool IsListed(const std::string& modules_file_content, const std::string& module);

private:
    bool IsLoaded(const std::string& module) const;
    void Load(const std::string& module);
    void Persist(const std::string& module);

    Config config_;
};

} // namespace host
} // namespace ctforge
