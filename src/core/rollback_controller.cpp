/**
 * @file rollback_controller.cpp
 * @brief Best-effort teardown of a failed provisioning session
 *
 * @date 2025
 */

#include "ctforge/core/rollback_controller.hpp"
#include "ctforge/core/provisioning_session.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace ctforge {
namespace core {

RollbackController::RollbackController(host::HostCapability& host)
    : host_(host) {
}

void RollbackController::Rollback(const ProvisioningSession& session) noexcept {
    const auto& container_id = session.GetContainerId();
    if (!container_id) {
        spdlog::debug("No container id was assigned, nothing to roll back");
        return;
    }

    const int id = *container_id;
    const std::string storage_tag = session.GetStorage().tag;

    spdlog::info("Rolling back container {} (reached {})", id, StageToString(session.GetStage()));

    bool unmounted = false;
    if (session.IsMounted()) {
        unmounted = Attempt("unmount container " + std::to_string(id), [&] { host_.Unmount(id); });
    }

    ContainerStatus status;
    Attempt("query status of container " + std::to_string(id),
            [&] { status = host_.Status(id); });

    // The host may hold a mount the session never saw complete
    if (status.mounted && !unmounted) {
        Attempt("unmount container " + std::to_string(id), [&] { host_.Unmount(id); });
    }

    if (status.defined) {
        if (status.running) {
            Attempt("stop container " + std::to_string(id), [&] { host_.Stop(id); });
        }
        bool destroyed = Attempt("destroy container " + std::to_string(id),
                                 [&] { host_.Destroy(id); });

        // Volumes of a container that still exists are its root filesystem
        if (destroyed) {
            FreeOwnedVolumes(storage_tag, id, true);
        }
    }
    else {
        FreeOwnedVolumes(storage_tag, id, false);
    }

    if (warnings_.empty()) {
        spdlog::info("Rollback of container {} complete", id);
    }
    else {
        spdlog::warn("Rollback of container {} finished with {} warning(s)", id, warnings_.size());
    }
}

void RollbackController::FreeOwnedVolumes(const std::string& storage_tag, int container_id,
                                          bool after_destroy) {
    std::vector<std::string> volumes;
    bool listed = Attempt("list volumes of " + std::to_string(container_id) + " on '" + storage_tag + "'",
                          [&] { volumes = host_.ListStorageVolumes(storage_tag, container_id); });
    if (!listed) {
        Warn("Storage '" + storage_tag + "' cannot list volumes by owner, volumes of " +
             std::to_string(container_id) + " were left in place");
        return;
    }

    if (volumes.empty()) {
        return;
    }

    if (after_destroy) {
        Warn("Destroying container " + std::to_string(container_id) + " left " +
             std::to_string(volumes.size()) + " volume(s) behind");
    }

    for (const auto& volume : volumes) {
        Attempt("free volume " + volume, [&] { host_.FreeDisk(volume); });
    }
}

bool RollbackController::Attempt(const std::string& action, const std::function<void()>& fn) {
    try {
        spdlog::debug("rollback: {}", action);
        fn();
        return true;
    }
    catch (const std::exception& e) {
        Warn("Failed to " + action + ": " + e.what());
        return false;
    }
}

void RollbackController::Warn(const std::string& message) {
    spdlog::warn("{}", message);
    warnings_.push_back(message);
}

} // namespace core
} // namespace ctforge
