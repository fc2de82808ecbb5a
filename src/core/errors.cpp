/**
 * @file errors.cpp
 * @brief Provisioning failure taxonomy
 *
 * @date 2025
 */

#include "ctforge/core/errors.hpp"

namespace ctforge {
namespace core {

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                        return "None";
        case ErrorKind::NO_ELIGIBLE_STORAGE:         return "NoEligibleStorage";
        case ErrorKind::SELECTION_CANCELLED:         return "SelectionCancelled";
        case ErrorKind::TEMPLATE_NOT_FOUND:          return "TemplateNotFound";
        case ErrorKind::TEMPLATE_DOWNLOAD_FAILED:    return "TemplateDownloadFailed";
        case ErrorKind::ALLOCATION_FAILED:           return "AllocationFailed";
        case ErrorKind::FILESYSTEM_CREATION_FAILED:  return "FilesystemCreationFailed";
        case ErrorKind::CONTAINER_CREATION_FAILED:   return "ContainerCreationFailed";
        case ErrorKind::MOUNT_FAILED:                return "MountFailed";
        case ErrorKind::START_FAILED:                return "StartFailed";
        case ErrorKind::SETUP_PUSH_FAILED:           return "SetupPushFailed";
        case ErrorKind::SETUP_EXECUTION_FAILED:      return "SetupExecutionFailed";
        case ErrorKind::HOST_CAPABILITY_UNAVAILABLE: return "HostCapabilityUnavailable";
    }
    return "Unknown";
}

} // namespace core
} // namespace ctforge
