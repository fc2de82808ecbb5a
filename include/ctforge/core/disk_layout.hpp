/**
 * @file disk_layout.hpp
 * @brief Root volume naming and format policy per storage kind
 *
 * | Kind     | Format | Name                  | Volume id                        | mkfs |
 * |----------|--------|-----------------------|----------------------------------|------|
 * | dir, nfs | raw    | vm-<id>-disk-0.raw    | <tag>:<id>/vm-<id>-disk-0.raw    | yes  |
 * | zfspool  | subvol | subvol-<id>-disk-0    | <tag>:subvol-<id>-disk-0         | no   |
 * | other    | raw    | vm-<id>-disk-0        | <tag>:vm-<id>-disk-0             | yes  |
 *
 * @date 2025
 */

#pragma once

#include "ctforge/core/types.hpp"

#include <cstdint>

namespace ctforge {
namespace core {

/**
 * @brief Build the root volume description for a container
 * @param storage Selected storage pool
 * @param container_id Fresh container identifier
 * @param size_bytes Volume size
 */
DiskSpec BuildDiskSpec(const StoragePool& storage, int container_id, std::uint64_t size_bytes);

/**
 * @brief Whether the volume must be formatted before container creation
 */
bool RequiresFilesystem(const DiskSpec& disk);

} // namespace core
} // namespace ctforge
