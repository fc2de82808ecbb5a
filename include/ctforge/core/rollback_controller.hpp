/**
 * @file rollback_controller.hpp
 * @brief Best-effort teardown of a failed provisioning session
 *
 * @date 2025
 */

#pragma once

#include "ctforge/host/host_capability.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ctforge {
namespace core {

class ProvisioningSession;

/**
 * @class RollbackController
 * @brief Removes every host artifact a failed session left behind
 *
 * Decisions come from what the host reports, not from the session stage:
 *
 * 1. Unmount the root filesystem if the session still has it mounted.
 * 2. Query the container status. A failed query counts as "not defined".
 *    A mount the host still reports is released as well.
 * 3. Defined container: stop it when running, then destroy it. Only after
 *    a successful destroy are leftover volumes freed.
 * 4. No container: free every volume still owned by the identifier on
 *    the selected storage.
 *
 * Every action is attempted even when an earlier one failed. Failures are
 * logged and collected as warnings; Rollback() never throws.
 */
class RollbackController {
public:
    explicit RollbackController(host::HostCapability& host);

    void Rollback(const ProvisioningSession& session) noexcept;

    const std::vector<std::string>& GetWarnings() const { return warnings_; }

private:
    /// Run one rollback action, recording a warning if it throws
    bool Attempt(const std::string& action, const std::function<void()>& fn);

    void FreeOwnedVolumes(const std::string& storage_tag, int container_id, bool after_destroy);

    void Warn(const std::string& message);

    host::HostCapability& host_;
    std::vector<std::string> warnings_;
};

} // namespace core
} // namespace ctforge
