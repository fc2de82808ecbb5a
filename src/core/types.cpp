/**
 * @file types.cpp
 * @brief String conversions for the provisioning data model
 *
 * @date 2025
 */

#include "ctforge/core/types.hpp"

namespace ctforge {
namespace core {

std::string StorageKindToString(StorageKind kind) {
    switch (kind) {
        case StorageKind::DIR:     return "dir";
        case StorageKind::NFS:     return "nfs";
        case StorageKind::ZFSPOOL: return "zfspool";
        case StorageKind::OTHER:   return "other";
    }
    return "other";
}

StorageKind StorageKindFromString(const std::string& type_name) {
    if (type_name == "dir") return StorageKind::DIR;
    if (type_name == "nfs") return StorageKind::NFS;
    if (type_name == "zfspool") return StorageKind::ZFSPOOL;
    return StorageKind::OTHER;
}

std::string DiskFormatToString(DiskFormat format) {
    return format == DiskFormat::SUBVOL ? "subvol" : "raw";
}

std::string StageToString(Stage stage) {
    switch (stage) {
        case Stage::INIT:              return "Init";
        case Stage::STORAGE_ALLOCATED: return "StorageAllocated";
        case Stage::FILESYSTEM_READY:  return "FilesystemReady";
        case Stage::CONTAINER_CREATED: return "ContainerCreated";
        case Stage::MOUNTED:           return "Mounted";
        case Stage::TIMEZONE_SYNCED:   return "TimezoneSynced";
        case Stage::STARTED:           return "Started";
        case Stage::SETUP_PUSHED:      return "SetupPushed";
        case Stage::SETUP_EXECUTED:    return "SetupExecuted";
        case Stage::COMPLETE:          return "Complete";
    }
    return "Unknown";
}

} // namespace core
} // namespace ctforge
