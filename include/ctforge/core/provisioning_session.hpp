/**
 * @file provisioning_session.hpp
 * @brief Forward provisioning sequence for one container
 *
 * A session owns the state of a single provisioning run: the container
 * identifier, the root volume, the furthest stage reached and whether the
 * root filesystem is mounted on the host. The sequence is strictly
 * linear:
 *
 * ```
 * Init -> StorageAllocated -> FilesystemReady -> ContainerCreated -> Mounted
 *      -> TimezoneSynced -> Started -> SetupPushed -> SetupExecuted -> Complete
 * ```
 *
 * FilesystemReady is skipped for subvolume disks. The first failing step
 * stops the run, hands the session to a RollbackController and produces a
 * failed ProvisionResult.
 *
 * @date 2025
 */

#pragma once

#include "ctforge/core/errors.hpp"
#include "ctforge/core/types.hpp"
#include "ctforge/host/host_capability.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ctforge {
namespace core {

// ============================================================================
// Provisioning constants
// ============================================================================

inline constexpr std::uint64_t kDiskSizeBytes = 20ULL * 1024 * 1024 * 1024;
inline constexpr int kMemoryMb = 2048;
inline constexpr int kSwapMb = kMemoryMb;
inline constexpr const char* kHostname = "UnifiNetworkController";
inline constexpr int kManagementPort = 8443;
inline constexpr const char* kInterfaceName = "eth0";
inline constexpr const char* kSetupRemotePath = "/setup.sh";
inline constexpr int kSetupMode = 0755;

/**
 * @struct SessionOptions
 * @brief Per-run inputs that are not host-derived
 */
struct SessionOptions {
    std::string ostype{"debian"};                 ///< Container ostype, same as the OS family
    std::string template_storage{"local"};        ///< Storage holding the template
    std::string bridge{"vmbr0"};                  ///< Bridge for the DHCP interface
    std::filesystem::path setup_script;           ///< Local copy of the second-stage script
};

/**
 * @struct ProvisionResult
 * @brief Outcome of a provisioning run
 */
struct ProvisionResult {
    bool success{false};
    Stage stage_reached{Stage::INIT};
    std::optional<int> container_id;
    std::string storage_tag;
    std::string template_name;
    std::string ip_address;
    std::vector<std::string> endpoints;           ///< Management URLs, IP first
    std::string description;

    // Failure details (error_kind == NONE on success)
    ErrorKind error_kind{ErrorKind::NONE};
    int exit_code{0};
    std::string error_message;
    std::string error_context;
    std::vector<std::string> rollback_warnings;

    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
};

/**
 * @brief Process exit status for a result
 *
 * 0 on success, the failing command's exit code when it fits 1..255,
 * otherwise 1.
 */
int ProcessExitCode(const ProvisionResult& result);

/**
 * @class ProvisioningSession
 * @brief Drives one container from nothing to a running, configured guest
 *
 * **Usage Example**:
 * @code
 * ProvisioningSession session(host, pool, reference, options);
 * ProvisionResult result = session.Run();
 * if (!result.success) {
 *     // host state has already been rolled back
 * }
 * @endcode
 */
class ProvisioningSession {
public:
    ProvisioningSession(host::HostCapability& host,
                        StoragePool storage,
                        TemplateReference template_ref,
                        SessionOptions options);

    ProvisioningSession(const ProvisioningSession&) = delete;
    ProvisioningSession& operator=(const ProvisioningSession&) = delete;

    /**
     * @brief Execute the forward sequence
     *
     * Never throws ProvisionError; failures are rolled back and returned
     * in the result.
     *
     * @throws std::logic_error if called more than once
     */
    ProvisionResult Run();

    Stage GetStage() const { return stage_; }
    bool IsMounted() const { return mounted_; }
    const std::optional<int>& GetContainerId() const { return container_id_; }
    const StoragePool& GetStorage() const { return storage_; }
    const DiskSpec& GetDisk() const { return disk_; }

private:
    void ObtainIdentifier();
    void AllocateStorage();
    void PrepareFilesystem();
    void CreateContainer();
    void MountRootFilesystem();
    void SyncTimezone();
    void StartContainer();
    void PushSetup();
    void ExecuteSetup();
    void Finalize();

    /// Move to a later stage; going backwards is a programming error
    void Advance(Stage next);

    /// Record the failure in the result and roll the host back
    void Abort(const ProvisionError& error, ProvisionResult& result);

    host::HostCapability& host_;
    StoragePool storage_;
    TemplateReference template_;
    SessionOptions options_;

    Stage stage_{Stage::INIT};
    std::optional<int> container_id_;
    DiskSpec disk_;
    bool mounted_{false};
    std::string mount_path_;
    std::string ip_address_;
    std::string description_;
    bool consumed_{false};
};

} // namespace core
} // namespace ctforge
