/**
 * @file disk_layout.cpp
 * @brief Root volume naming and format policy per storage kind
 *
 * @date 2025
 */

#include "ctforge/core/disk_layout.hpp"

#include <string>

namespace ctforge {
namespace core {

DiskSpec BuildDiskSpec(const StoragePool& storage, int container_id, std::uint64_t size_bytes) {
    const std::string id = std::to_string(container_id);

    std::string prefix = "vm";
    std::string extension;
    std::string reference;

    DiskSpec disk;
    disk.storage_tag = storage.tag;
    disk.container_id = container_id;
    disk.size_bytes = size_bytes;
    disk.format = DiskFormat::RAW;

    switch (storage.kind) {
        case StorageKind::DIR:
        case StorageKind::NFS:
            // File-backed images live in a per-guest directory
            extension = ".raw";
            reference = id + "/";
            break;
        case StorageKind::ZFSPOOL:
            prefix = "subvol";
            disk.format = DiskFormat::SUBVOL;
            break;
        case StorageKind::OTHER:
            break;
    }

    disk.name = prefix + "-" + id + "-disk-0" + extension;
    disk.volume_id = storage.tag + ":" + reference + disk.name;
    return disk;
}

bool RequiresFilesystem(const DiskSpec& disk) {
    return disk.format == DiskFormat::RAW;
}

} // namespace core
} // namespace ctforge
