/**
 * @file provisioning_session.cpp
 * @brief Forward provisioning sequence and per-stage failure mapping
 *
 * Each step runs its host operations through Guarded(), which turns a
 * HostCommandError into the ProvisionError kind for that step. The stage
 * only advances after every operation of the step succeeded, so on
 * failure GetStage() names the last step that fully completed.
 *
 * @date 2025
 */

#include "ctforge/core/provisioning_session.hpp"
#include "ctforge/core/disk_layout.hpp"
#include "ctforge/core/rollback_controller.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace ctforge {
namespace core {

namespace {

template <typename Fn>
auto Guarded(ErrorKind kind, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    }
    catch (const host::HostCommandError& e) {
        throw ProvisionError(kind, e.what(), e.GetExitCode(), e.GetCommand());
    }
}

std::string ManagementUrl(const std::string& host) {
    return "https://" + host + ":" + std::to_string(kManagementPort);
}

} // namespace

int ProcessExitCode(const ProvisionResult& result) {
    if (result.success) {
        return 0;
    }
    // Exec failures are reported as -1, and exit() keeps only the low byte
    if (result.exit_code < 1 || result.exit_code > 255) {
        return 1;
    }
    return result.exit_code;
}

ProvisioningSession::ProvisioningSession(host::HostCapability& host,
                                         StoragePool storage,
                                         TemplateReference template_ref,
                                         SessionOptions options)
    : host_(host)
    , storage_(std::move(storage))
    , template_(std::move(template_ref))
    , options_(std::move(options)) {
}

ProvisionResult ProvisioningSession::Run() {
    if (consumed_) {
        throw std::logic_error("Provisioning session has already run");
    }
    consumed_ = true;

    ProvisionResult result;
    result.started_at = std::chrono::system_clock::now();
    result.storage_tag = storage_.tag;
    result.template_name = template_.full_name;

    try {
        ObtainIdentifier();
        AllocateStorage();
        PrepareFilesystem();
        CreateContainer();
        MountRootFilesystem();
        SyncTimezone();
        StartContainer();
        PushSetup();
        ExecuteSetup();
        Finalize();

        result.success = true;
        result.ip_address = ip_address_;
        result.endpoints = {ManagementUrl(ip_address_), ManagementUrl(kHostname)};
        result.description = description_;
    }
    catch (const ProvisionError& e) {
        Abort(e, result);
    }
    catch (const std::exception& e) {
        // A binding that fails outside HostCommandError still gets rolled back
        Abort(ProvisionError(ErrorKind::HOST_CAPABILITY_UNAVAILABLE, e.what(), 1, "host binding"),
              result);
    }

    result.stage_reached = stage_;
    result.container_id = container_id_;
    result.finished_at = std::chrono::system_clock::now();
    return result;
}

void ProvisioningSession::Abort(const ProvisionError& error, ProvisionResult& result) {
    spdlog::debug("Provisioning stopped after stage {}: {}",
                  StageToString(stage_), ErrorKindToString(error.GetKind()));

    result.error_kind = error.GetKind();
    result.exit_code = error.GetExitCode();
    result.error_message = error.what();
    result.error_context = error.GetContext();

    RollbackController rollback(host_);
    rollback.Rollback(*this);
    result.rollback_warnings = rollback.GetWarnings();
}

// ============================================================================
// Forward steps
// ============================================================================

void ProvisioningSession::ObtainIdentifier() {
    container_id_ = Guarded(ErrorKind::HOST_CAPABILITY_UNAVAILABLE,
                            [&] { return host_.NextContainerId(); });
    spdlog::debug("Container id {}", *container_id_);
}

void ProvisioningSession::AllocateStorage() {
    disk_ = BuildDiskSpec(storage_, *container_id_, kDiskSizeBytes);

    spdlog::info("Allocating storage for LXC container...");
    Guarded(ErrorKind::ALLOCATION_FAILED, [&] { host_.AllocateDisk(disk_); });
    Advance(Stage::STORAGE_ALLOCATED);
}

void ProvisioningSession::PrepareFilesystem() {
    if (!RequiresFilesystem(disk_)) {
        spdlog::warn("Some containers may not work properly due to ZFS not supporting 'fallocate'.");
        return;
    }

    Guarded(ErrorKind::FILESYSTEM_CREATION_FAILED, [&] {
        auto path = host_.DiskPath(disk_.volume_id);
        host_.MakeFilesystem(path);
    });
    Advance(Stage::FILESYSTEM_READY);
}

void ProvisioningSession::CreateContainer() {
    spdlog::info("Creating LXC container...");

    ContainerSpec spec;
    spec.id = *container_id_;
    spec.template_storage = options_.template_storage;
    spec.template_name = template_.full_name;
    spec.features = {"nesting=1"};
    spec.hostname = kHostname;
    spec.interface_name = kInterfaceName;
    spec.bridge = options_.bridge;
    spec.ostype = options_.ostype;
    spec.disk = disk_;
    spec.memory_mb = kMemoryMb;
    spec.swap_mb = kSwapMb;
    spec.onboot = true;

    spec.arch = Guarded(ErrorKind::HOST_CAPABILITY_UNAVAILABLE,
                        [&] { return host_.HostArchitecture(); });
    Guarded(ErrorKind::CONTAINER_CREATION_FAILED, [&] { host_.CreateContainer(spec); });
    Advance(Stage::CONTAINER_CREATED);
}

void ProvisioningSession::MountRootFilesystem() {
    mount_path_ = Guarded(ErrorKind::MOUNT_FAILED,
                          [&] { return host_.Mount(*container_id_); });
    mounted_ = true;

    // Timezone link is written while mounted; a failure here leaves the
    // rootfs mounted for the rollback to release.
    auto target = Guarded(ErrorKind::HOST_CAPABILITY_UNAVAILABLE,
                          [&] { return host_.HostLocaltimeTarget(); });
    Guarded(ErrorKind::MOUNT_FAILED, [&] { host_.LinkLocaltime(mount_path_, target); });
    Advance(Stage::MOUNTED);
}

void ProvisioningSession::SyncTimezone() {
    Guarded(ErrorKind::MOUNT_FAILED, [&] { host_.Unmount(*container_id_); });
    mounted_ = false;
    Advance(Stage::TIMEZONE_SYNCED);
}

void ProvisioningSession::StartContainer() {
    spdlog::info("Starting LXC container...");
    Guarded(ErrorKind::START_FAILED, [&] { host_.Start(*container_id_); });
    Advance(Stage::STARTED);
}

void ProvisioningSession::PushSetup() {
    Guarded(ErrorKind::SETUP_PUSH_FAILED, [&] {
        host_.PushFile(*container_id_, options_.setup_script.string(),
                       kSetupRemotePath, kSetupMode);
    });
    Advance(Stage::SETUP_PUSHED);
}

void ProvisioningSession::ExecuteSetup() {
    Guarded(ErrorKind::SETUP_EXECUTION_FAILED, [&] {
        host_.Exec(*container_id_, {kSetupRemotePath});
    });
    Advance(Stage::SETUP_EXECUTED);
}

void ProvisioningSession::Finalize() {
    ip_address_ = Guarded(ErrorKind::HOST_CAPABILITY_UNAVAILABLE,
                          [&] { return host_.QueryInterfaceAddress(*container_id_, kInterfaceName); });
    description_ = "Access web interface using the following URL.\n\n" + ManagementUrl(ip_address_);
    Guarded(ErrorKind::HOST_CAPABILITY_UNAVAILABLE,
            [&] { host_.SetDescription(*container_id_, description_); });
    Advance(Stage::COMPLETE);

    spdlog::info("Successfully created a UniFi Network Controller LXC to {}.", *container_id_);
    spdlog::info("UniFi Network Controller should be reachable by going to the following URLs.");
    spdlog::info("      {}", ManagementUrl(ip_address_));
    spdlog::info("      {}", ManagementUrl(kHostname));
}

void ProvisioningSession::Advance(Stage next) {
    if (next <= stage_) {
        throw std::logic_error("Stage " + StageToString(next) +
                               " does not follow " + StageToString(stage_));
    }
    spdlog::debug("Stage {} -> {}", StageToString(stage_), StageToString(next));
    stage_ = next;
}

} // namespace core
} // namespace ctforge
