/**
 * @file host_capability.hpp
 * @brief Narrow interface to the virtualization host
 *
 * The provisioning pipeline never runs host tools directly. It talks to a
 * HostCapability, which PveHost binds to the Proxmox command-line tools and
 * tests bind to in-memory fakes. Every operation is synchronous; a failed
 * operation throws HostCommandError carrying the tool's exit code.
 *
 * @date 2025
 */

#pragma once

#include "ctforge/core/types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace ctforge {
namespace host {

/**
 * @class HostCommandError
 * @brief A host operation failed
 */
class HostCommandError : public std::runtime_error {
public:
    HostCommandError(const std::string& command, int exit_code, const std::string& output)
        : std::runtime_error(BuildMessage(command, exit_code, output))
        , command_(command)
        , exit_code_(exit_code)
        , output_(output) {}

    const std::string& GetCommand() const { return command_; }
    int GetExitCode() const { return exit_code_; }
    const std::string& GetOutput() const { return output_; }

private:
    static std::string BuildMessage(const std::string& command, int exit_code,
                                    const std::string& output) {
        std::string message = "'" + command + "' failed with exit code " +
                              std::to_string(exit_code);
        if (!output.empty()) {
            message += ": " + output;
        }
        while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
            message.pop_back();
        }
        return message;
    }

    std::string command_;
    int exit_code_;
    std::string output_;
};

/**
 * @class HostCapability
 * @brief Operations the provisioning pipeline needs from the host
 */
class HostCapability {
public:
    virtual ~HostCapability() = default;

    // Storage
    virtual std::vector<core::StoragePool> ListStoragePools() = 0;
    virtual void AllocateDisk(const core::DiskSpec& disk) = 0;
    virtual void FreeDisk(const std::string& volume_id) = 0;

    /**
     * @brief Volumes on a storage owned by a guest identifier
     * @throws HostCommandError if the storage cannot list volumes by owner
     */
    virtual std::vector<std::string> ListStorageVolumes(const std::string& storage_tag,
                                                        int container_id) = 0;

    /// Filesystem path backing a volume, used to format raw images
    virtual std::string DiskPath(const std::string& volume_id) = 0;
    virtual void MakeFilesystem(const std::string& disk_path) = 0;

    // Identifiers and host facts
    virtual int NextContainerId() = 0;
    virtual std::string HostArchitecture() = 0;
    virtual std::string HostLocaltimeTarget() = 0;

    // Templates
    virtual void RefreshTemplateIndex() = 0;
    virtual std::vector<std::string> ListAvailableTemplates(const std::string& os_family) = 0;
    virtual bool IsTemplateCached(const std::string& storage_tag, const std::string& name) = 0;
    virtual void DownloadTemplate(const std::string& storage_tag, const std::string& name) = 0;

    // Container lifecycle
    virtual void CreateContainer(const core::ContainerSpec& spec) = 0;

    /// Mount the container root filesystem, returns the mount path
    virtual std::string Mount(int container_id) = 0;
    virtual void LinkLocaltime(const std::string& mount_path, const std::string& target) = 0;
    virtual void Unmount(int container_id) = 0;
    virtual void Start(int container_id) = 0;
    virtual void Stop(int container_id) = 0;
    virtual void Destroy(int container_id) = 0;
    virtual core::ContainerStatus Status(int container_id) = 0;

    // Guest interaction
    virtual void PushFile(int container_id, const std::string& local_path,
                          const std::string& remote_path, int mode) = 0;
    virtual void Exec(int container_id, const std::vector<std::string>& command) = 0;
    virtual std::string QueryInterfaceAddress(int container_id, const std::string& iface) = 0;
    virtual void SetDescription(int container_id, const std::string& text) = 0;
};

} // namespace host
} // namespace ctforge
