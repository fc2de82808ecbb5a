/**
 * @file pve_host.cpp
 * @brief Proxmox VE command-line binding of HostCapability
 *
 * Each operation builds an argument vector, runs it with ExecuteCommand
 * and turns a non-zero exit status into HostCommandError. Output parsing
 * is kept in static members so captured tool output can be tested
 * directly.
 *
 * **Exit Codes**:
 * The exit status of the failing tool is preserved in HostCommandError and
 * becomes the process exit code after rollback. Failures that happen
 * outside a tool (filesystem calls, unexpected output) use exit code 1.
 *
 * @date 2025
 */

#include "ctforge/host/pve_host.hpp"
#include "ctforge/utils/command_utils.hpp"
#include "ctforge/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <system_error>
#include <utility>

using json = nlohmann::json;

namespace ctforge {
namespace host {

using utils::StringUtils;

namespace {

constexpr const char* kTemplateSection = "system";
constexpr std::uint64_t kKiB = 1024;

std::string FormatMode(int mode) {
    std::ostringstream oss;
    oss << std::oct << mode;
    return oss.str();
}

} // anonymous namespace

PveHost::PveHost(std::filesystem::path localtime_path)
    : localtime_path_(std::move(localtime_path)) {
    spdlog::debug("Proxmox host binding initialized");
}

PveHost::~PveHost() = default;

std::string PveHost::Run(const std::vector<std::string>& args) {
    auto result = utils::ExecuteCommand(args);
    if (!result.success) {
        throw HostCommandError(utils::BuildCommandLine(args), result.exit_code, result.output);
    }
    return result.output;
}

// ============================================================================
// STORAGE
// ============================================================================

std::vector<core::StoragePool> PveHost::ListStoragePools() {
    return ParseStorageStatus(Run({"pvesm", "status", "-content", "rootdir"}), true);
}

void PveHost::AllocateDisk(const core::DiskSpec& disk) {
    Run({"pvesm", "alloc", disk.storage_tag, std::to_string(disk.container_id),
         disk.name, FormatSizeArgument(disk.size_bytes),
         "--format", core::DiskFormatToString(disk.format)});
}

void PveHost::FreeDisk(const std::string& volume_id) {
    Run({"pvesm", "free", volume_id});
}

std::vector<std::string> PveHost::ListStorageVolumes(const std::string& storage_tag,
                                                     int container_id) {
    return ParseVolumeList(Run({"pvesm", "list", storage_tag,
                                "--vmid", std::to_string(container_id)}));
}

std::string PveHost::DiskPath(const std::string& volume_id) {
    auto path = StringUtils::Trim(Run({"pvesm", "path", volume_id}));
    if (path.empty()) {
        throw HostCommandError("pvesm path " + volume_id, 1, "no path reported");
    }
    return path;
}

void PveHost::MakeFilesystem(const std::string& disk_path) {
    Run({"mkfs.ext4", disk_path});
}

// ============================================================================
// IDENTIFIERS AND HOST FACTS
// ============================================================================

int PveHost::NextContainerId() {
    const std::string command = "pvesh get /cluster/nextid";
    auto output = Run({"pvesh", "get", "/cluster/nextid", "--output-format", "json"});
    auto id = ParseNextId(output);
    if (!id) {
        throw HostCommandError(command, 1, "unexpected answer: " + StringUtils::Trim(output));
    }
    return *id;
}

std::string PveHost::HostArchitecture() {
    auto arch = StringUtils::Trim(Run({"dpkg", "--print-architecture"}));
    if (arch.empty()) {
        throw HostCommandError("dpkg --print-architecture", 1, "no architecture reported");
    }
    return arch;
}

std::string PveHost::HostLocaltimeTarget() {
    std::error_code ec;
    auto target = std::filesystem::read_symlink(localtime_path_, ec);
    if (ec) {
        throw HostCommandError("readlink " + localtime_path_.string(), 1, ec.message());
    }
    return target.string();
}

// ============================================================================
// TEMPLATES
// ============================================================================

void PveHost::RefreshTemplateIndex() {
    Run({"pveam", "update"});
}

std::vector<std::string> PveHost::ListAvailableTemplates(const std::string& os_family) {
    return ParseAvailableTemplates(Run({"pveam", "available", "-section", kTemplateSection}),
                                   os_family);
}

bool PveHost::IsTemplateCached(const std::string& storage_tag, const std::string& name) {
    auto cached = ParseCachedTemplates(Run({"pveam", "list", storage_tag}));
    for (const auto& entry : cached) {
        if (entry == name) {
            return true;
        }
    }
    return false;
}

void PveHost::DownloadTemplate(const std::string& storage_tag, const std::string& name) {
    Run({"pveam", "download", storage_tag, name});
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

void PveHost::CreateContainer(const core::ContainerSpec& spec) {
    std::vector<std::string> args = {
        "pct", "create", std::to_string(spec.id),
        spec.template_storage + ":vztmpl/" + spec.template_name,
        "-arch", spec.arch
    };

    if (!spec.features.empty()) {
        args.push_back("-features");
        args.push_back(StringUtils::Join(spec.features, ","));
    }

    args.insert(args.end(), {
        "-hostname", spec.hostname,
        "-net0", "name=" + spec.interface_name + ",bridge=" + spec.bridge + ",ip=dhcp",
        "-onboot", spec.onboot ? "1" : "0",
        "-ostype", spec.ostype,
        "-rootfs", spec.disk.volume_id + ",size=" + FormatSizeArgument(spec.disk.size_bytes),
        "-swap", std::to_string(spec.swap_mb),
        "-memory", std::to_string(spec.memory_mb),
        "-storage", spec.disk.storage_tag
    });

    Run(args);
}

std::string PveHost::Mount(int container_id) {
    auto output = Run({"pct", "mount", std::to_string(container_id)});
    auto path = ParseMountPath(output);
    if (!path) {
        throw HostCommandError("pct mount " + std::to_string(container_id), 1,
                               "mount path not reported: " + StringUtils::Trim(output));
    }
    return *path;
}

void PveHost::LinkLocaltime(const std::string& mount_path, const std::string& target) {
    const auto link = std::filesystem::path(mount_path) / "etc" / "localtime";
    std::error_code ec;

    // Same as `ln -fs`: replace whatever is there
    std::filesystem::remove(link, ec);
    if (ec) {
        throw HostCommandError("ln -fs " + target + " " + link.string(), 1, ec.message());
    }

    std::filesystem::create_symlink(target, link, ec);
    if (ec) {
        throw HostCommandError("ln -fs " + target + " " + link.string(), 1, ec.message());
    }
}

void PveHost::Unmount(int container_id) {
    Run({"pct", "unmount", std::to_string(container_id)});
}

void PveHost::Start(int container_id) {
    Run({"pct", "start", std::to_string(container_id)});
}

void PveHost::Stop(int container_id) {
    Run({"pct", "stop", std::to_string(container_id)});
}

void PveHost::Destroy(int container_id) {
    Run({"pct", "destroy", std::to_string(container_id)});
}

core::ContainerStatus PveHost::Status(int container_id) {
    // pct status fails when no container has this identifier
    auto result = utils::ExecuteCommand({"pct", "status", std::to_string(container_id)});
    if (!result.success) {
        spdlog::debug("pct status {}: exit {}", container_id, result.exit_code);
        return core::ContainerStatus{};
    }
    auto status = ParseContainerStatus(result.output);

    // pct mount leaves "lock: mounted" in the container config
    if (status.defined) {
        auto config = utils::ExecuteCommand({"pct", "config", std::to_string(container_id)});
        if (config.success) {
            status.mounted = ParseMountLock(config.output);
        }
        else {
            spdlog::debug("pct config {}: exit {}", container_id, config.exit_code);
        }
    }
    return status;
}

// ============================================================================
// GUEST INTERACTION
// ============================================================================

void PveHost::PushFile(int container_id, const std::string& local_path,
                       const std::string& remote_path, int mode) {
    Run({"pct", "push", std::to_string(container_id), local_path, remote_path,
         "-perms", FormatMode(mode)});
}

void PveHost::Exec(int container_id, const std::vector<std::string>& command) {
    std::vector<std::string> args = {"pct", "exec", std::to_string(container_id), "--"};
    args.insert(args.end(), command.begin(), command.end());

    auto output = Run(args);
    for (const auto& line : StringUtils::SplitLines(output)) {
        spdlog::debug("[CT {}] {}", container_id, line);
    }
}

std::string PveHost::QueryInterfaceAddress(int container_id, const std::string& iface) {
    auto output = Run({"pct", "exec", std::to_string(container_id), "--",
                       "ip", "address", "show", "dev", iface});
    auto address = ParseInterfaceAddress(output);
    if (!address) {
        throw HostCommandError("ip address show dev " + iface, 1,
                               "no IPv4 address on " + iface);
    }
    return *address;
}

void PveHost::SetDescription(int container_id, const std::string& text) {
    Run({"pct", "set", std::to_string(container_id), "-description", text});
}

// ============================================================================
// OUTPUT PARSERS
// ============================================================================

std::vector<core::StoragePool> PveHost::ParseStorageStatus(const std::string& output,
                                                           bool rootdir_query) {
    std::vector<core::StoragePool> pools;

    for (const auto& line : StringUtils::SplitLines(output)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.size() < 6 || fields[0] == "Name") {
            continue;
        }

        core::StoragePool pool;
        pool.tag = fields[0];
        pool.type_name = fields[1];
        pool.kind = core::StorageKindFromString(fields[1]);
        pool.supports_rootdir = rootdir_query;

        try {
            pool.free_bytes = std::stoull(fields[5]) * kKiB;
        }
        catch (const std::exception&) {
            spdlog::debug("Skipping storage row with unreadable size: {}", line);
            continue;
        }

        pools.push_back(pool);
    }

    return pools;
}

std::vector<std::string> PveHost::ParseAvailableTemplates(const std::string& output,
                                                          const std::string& os_family) {
    std::vector<std::string> names;

    for (const auto& line : StringUtils::SplitLines(output)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.size() < 2) {
            continue;
        }
        if (StringUtils::Contains(fields[1], os_family)) {
            names.push_back(fields[1]);
        }
    }

    return names;
}

std::vector<std::string> PveHost::ParseCachedTemplates(const std::string& output) {
    std::vector<std::string> names;

    for (const auto& line : StringUtils::SplitLines(output)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.empty() || fields[0] == "NAME") {
            continue;
        }

        // local:vztmpl/<name>
        const auto& volume = fields[0];
        auto slash = volume.find('/');
        names.push_back(slash == std::string::npos ? volume : volume.substr(slash + 1));
    }

    return names;
}

std::vector<std::string> PveHost::ParseVolumeList(const std::string& output) {
    std::vector<std::string> volumes;

    for (const auto& line : StringUtils::SplitLines(output)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.empty() || fields[0] == "Volid") {
            continue;
        }
        volumes.push_back(fields[0]);
    }

    return volumes;
}

std::optional<int> PveHost::ParseNextId(const std::string& output) {
    try {
        json j = json::parse(output);
        if (j.is_number_integer()) {
            return j.get<int>();
        }
        if (j.is_string()) {
            return std::stoi(j.get<std::string>());
        }
    }
    catch (const std::exception& e) {
        spdlog::debug("Unreadable nextid answer: {}", e.what());
    }
    return std::nullopt;
}

std::optional<std::string> PveHost::ParseMountPath(const std::string& output) {
    auto open = output.find('\'');
    if (open == std::string::npos) {
        return std::nullopt;
    }
    auto close = output.find('\'', open + 1);
    if (close == std::string::npos || close == open + 1) {
        return std::nullopt;
    }
    return output.substr(open + 1, close - open - 1);
}

core::ContainerStatus PveHost::ParseContainerStatus(const std::string& output) {
    core::ContainerStatus status;

    for (const auto& line : StringUtils::SplitLines(output)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.size() >= 2 && fields[0] == "status:") {
            status.defined = true;
            status.running = fields[1] == "running";
            break;
        }
    }

    return status;
}

bool PveHost::ParseMountLock(const std::string& output) {
    for (const auto& line : StringUtils::SplitLines(output)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.size() >= 2 && fields[0] == "lock:") {
            return fields[1] == "mounted";
        }
    }
    return false;
}

std::optional<std::string> PveHost::ParseInterfaceAddress(const std::string& output) {
    for (const auto& line : StringUtils::SplitLines(output)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.size() >= 2 && fields[0] == "inet") {
            auto slash = fields[1].find('/');
            return fields[1].substr(0, slash);
        }
    }
    return std::nullopt;
}

std::string PveHost::FormatSizeArgument(std::uint64_t bytes) {
    constexpr std::uint64_t kMiB = kKiB * 1024;
    constexpr std::uint64_t kGiB = kMiB * 1024;

    if (bytes >= kGiB && bytes % kGiB == 0) {
        return std::to_string(bytes / kGiB) + "G";
    }
    if (bytes >= kMiB && bytes % kMiB == 0) {
        return std::to_string(bytes / kMiB) + "M";
    }
    return std::to_string((bytes + kKiB - 1) / kKiB) + "K";
}

} // namespace host
} // namespace ctforge
