/**
 * @file types.hpp
 * @brief Data model shared by the provisioning pipeline and host bindings
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ctforge {
namespace core {

/**
 * @enum StorageKind
 * @brief Storage backend families that change disk naming and filesystem policy
 */
enum class StorageKind {
    DIR,       ///< Directory on a local filesystem
    NFS,       ///< Network filesystem mount
    ZFSPOOL,   ///< ZFS pool, volumes are managed datasets
    OTHER      ///< Any other backend (lvm, lvmthin, cifs, btrfs, ...)
};

/**
 * @struct StoragePool
 * @brief Storage location as reported by the host
 */
struct StoragePool {
    std::string tag;                  ///< Storage identifier, unique per query
    StorageKind kind{StorageKind::OTHER};
    std::string type_name;            ///< Raw backend type string ("dir", "lvmthin", ...)
    std::uint64_t free_bytes{0};      ///< Advisory free space
    bool supports_rootdir{false};     ///< Accepts container root filesystems
};

/**
 * @enum DiskFormat
 * @brief On-disk format of the container root volume
 */
enum class DiskFormat {
    RAW,      ///< Raw image, formatted with ext4 before use
    SUBVOL    ///< Backend-managed subvolume, never formatted by us
};

/**
 * @struct DiskSpec
 * @brief Root volume of the container being provisioned
 */
struct DiskSpec {
    std::string storage_tag;
    int container_id{0};
    std::uint64_t size_bytes{0};
    DiskFormat format{DiskFormat::RAW};
    std::string name;         ///< Volume name passed to the allocator
    std::string volume_id;    ///< Full volume reference "<storage>:<path>"
};

/**
 * @struct TemplateReference
 * @brief OS template selected for the container
 */
struct TemplateReference {
    std::string os_family;    ///< e.g. "debian"
    std::string os_version;   ///< e.g. "10"
    std::string full_name;    ///< e.g. "debian-10-standard_10.7-1_amd64.tar.gz"
};

/**
 * @struct ContainerStatus
 * @brief Host view of one container identifier
 */
struct ContainerStatus {
    bool defined{false};   ///< A container with this identifier exists
    bool running{false};   ///< Runtime status is "running"
    bool mounted{false};   ///< Root filesystem is mounted on the host
};

/**
 * @struct ContainerSpec
 * @brief Everything the host needs to create the container
 */
struct ContainerSpec {
    int id{0};
    std::string template_storage;         ///< Storage holding the template
    std::string template_name;            ///< Template file name
    std::string arch;                     ///< Host-detected architecture
    std::vector<std::string> features;    ///< e.g. {"nesting=1"}
    std::string hostname;
    std::string interface_name;           ///< Single DHCP interface, e.g. "eth0"
    std::string bridge;                   ///< Bridge the interface attaches to
    std::string ostype;
    DiskSpec disk;                        ///< Root filesystem volume
    int memory_mb{0};
    int swap_mb{0};
    bool onboot{true};
};

/**
 * @enum Stage
 * @brief Furthest point reached in the forward provisioning sequence
 *
 * Values are ordered; a session only ever moves to a larger value.
 */
enum class Stage {
    INIT,
    STORAGE_ALLOCATED,
    FILESYSTEM_READY,
    CONTAINER_CREATED,
    MOUNTED,
    TIMEZONE_SYNCED,
    STARTED,
    SETUP_PUSHED,
    SETUP_EXECUTED,
    COMPLETE
};

std::string StorageKindToString(StorageKind kind);
StorageKind StorageKindFromString(const std::string& type_name);
std::string DiskFormatToString(DiskFormat format);
std::string StageToString(Stage stage);

} // namespace core
} // namespace ctforge
