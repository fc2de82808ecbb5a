/**
 * @file pve_host.hpp
 * @brief HostCapability bound to the Proxmox VE command-line tools
 *
 * Maps each host operation to `pvesm`, `pvesh`, `pveam` or `pct`, runs it
 * through CommandUtils and parses the tabular output. The parsers are
 * public static members so they can be exercised against captured output
 * without a Proxmox host.
 *
 * **Tool Mapping**:
 * | Operation              | Command                                          |
 * |------------------------|--------------------------------------------------|
 * | ListStoragePools       | pvesm status -content rootdir                    |
 * | NextContainerId        | pvesh get /cluster/nextid --output-format json   |
 * | RefreshTemplateIndex   | pveam update                                     |
 * | ListAvailableTemplates | pveam available -section system                  |
 * | IsTemplateCached       | pveam list <storage>                             |
 * | DownloadTemplate       | pveam download <storage> <template>              |
 * | AllocateDisk           | pvesm alloc <storage> <id> <name> <size> --format|
 * | ListStorageVolumes     | pvesm list <storage> --vmid <id>                 |
 * | FreeDisk               | pvesm free <volume>                              |
 * | DiskPath               | pvesm path <volume>                              |
 * | MakeFilesystem         | mkfs.ext4 <path>                                 |
 * | CreateContainer        | pct create ...                                   |
 * | Mount / Unmount        | pct mount / pct unmount                          |
 * | Start / Stop / Destroy | pct start / pct stop / pct destroy               |
 * | Status                 | pct status <id>                                  |
 * | PushFile               | pct push <id> <local> <remote> -perms <mode>     |
 * | Exec                   | pct exec <id> -- <command>                       |
 * | SetDescription         | pct set <id> -description <text>                 |
 *
 * @date 2025
 */

#pragma once

#include "ctforge/host/host_capability.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ctforge {
namespace host {

/**
 * @class PveHost
 * @brief Proxmox VE host binding
 */
class PveHost : public HostCapability {
public:
    /**
     * @param localtime_path Host timezone link to mirror into containers
     */
    explicit PveHost(std::filesystem::path localtime_path = "/etc/localtime");
    ~PveHost() override;

    std::vector<core::StoragePool> ListStoragePools() override;
    void AllocateDisk(const core::DiskSpec& disk) override;
    void FreeDisk(const std::string& volume_id) override;
    std::vector<std::string> ListStorageVolumes(const std::string& storage_tag,
                                                int container_id) override;
    std::string DiskPath(const std::string& volume_id) override;
    void MakeFilesystem(const std::string& disk_path) override;

    int NextContainerId() override;
    std::string HostArchitecture() override;
    std::string HostLocaltimeTarget() override;

    void RefreshTemplateIndex() override;
    std::vector<std::string> ListAvailableTemplates(const std::string& os_family) override;
    bool IsTemplateCached(const std::string& storage_tag, const std::string& name) override;
    void DownloadTemplate(const std::string& storage_tag, const std::string& name) override;

    void CreateContainer(const core::ContainerSpec& spec) override;
    std::string Mount(int container_id) override;
    void LinkLocaltime(const std::string& mount_path, const std::string& target) override;
    void Unmount(int container_id) override;
    void Start(int container_id) override;
    void Stop(int container_id) override;
    void Destroy(int container_id) override;
    core::ContainerStatus Status(int container_id) override;

    void PushFile(int container_id, const std::string& local_path,
                  const std::string& remote_path, int mode) override;
    void Exec(int container_id, const std::vector<std::string>& command) override;
    std::string QueryInterfaceAddress(int container_id, const std::string& iface) override;
    void SetDescription(int container_id, const std::string& text) override;

    // ------------------------------------------------------------------
    // Output parsers
    // ------------------------------------------------------------------

    /**
     * @brief Parse `pvesm status` output
     *
     * Columns: Name Type Status Total Used Available %. Sizes are KiB.
     * The header row and malformed rows are skipped.
     *
     * @param output Raw command output
     * @param rootdir_query True when the query was filtered by rootdir content
     */
    static std::vector<core::StoragePool> ParseStorageStatus(const std::string& output,
                                                             bool rootdir_query = true);

    /**
     * @brief Parse `pveam available` output, keeping names that contain os_family
     */
    static std::vector<std::string> ParseAvailableTemplates(const std::string& output,
                                                            const std::string& os_family);

    /**
     * @brief Parse `pveam list <storage>` output into bare template names
     */
    static std::vector<std::string> ParseCachedTemplates(const std::string& output);

    /**
     * @brief Parse `pvesm list` output into volume identifiers
     */
    static std::vector<std::string> ParseVolumeList(const std::string& output);

    /**
     * @brief Parse the JSON answer of `pvesh get /cluster/nextid`
     * @return Identifier, or nullopt when the answer is not a number
     */
    static std::optional<int> ParseNextId(const std::string& output);

    /**
     * @brief Extract the mount path from `pct mount` output
     *
     * The tool prints `mounted CT 100 in '/var/lib/lxc/100/rootfs'`.
     */
    static std::optional<std::string> ParseMountPath(const std::string& output);

    /**
     * @brief Parse `pct status` output ("status: running")
     */
    static core::ContainerStatus ParseContainerStatus(const std::string& output);

    /// True when `pct config` output carries "lock: mounted"
    static bool ParseMountLock(const std::string& output);

    /**
     * @brief First IPv4 address in `ip address show` output
     */
    static std::optional<std::string> ParseInterfaceAddress(const std::string& output);

    /**
     * @brief Render a byte count as a size argument ("20G", "512M", "4K")
     */
    static std::string FormatSizeArgument(std::uint64_t bytes);

private:
    std::string Run(const std::vector<std::string>& args);

    std::filesystem::path localtime_path_;
};

} // namespace host
} // namespace ctforge
