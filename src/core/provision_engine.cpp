/**
 * @file provision_engine.cpp
 * @brief Top-level orchestration of a provisioning run
 *
 * @date 2025
 */

#include "ctforge/core/provision_engine.hpp"
#include "ctforge/core/template_resolver.hpp"
#include "ctforge/host/host_preparation.hpp"
#include "ctforge/reporters/json_reporter.hpp"
#include "ctforge/utils/temp_directory.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace ctforge {
namespace core {

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

class ProvisionEngine::Impl {
public:
    Impl(host::HostCapability& host, SelectionPrompt prompt, const std::string& template_storage)
        : host(host)
        , selector(std::move(prompt))
        , resolver(host, template_storage) {}

    host::HostCapability& host;
    StorageSelector selector;
    TemplateResolver resolver;
};

ProvisionEngine::ProvisionEngine(host::HostCapability& host, ProvisionConfig config,
                                 SelectionPrompt prompt)
    : config_(std::move(config))
    , impl_(std::make_unique<Impl>(host, std::move(prompt), config_.template_storage)) {
}

ProvisionEngine::~ProvisionEngine() = default;

ProvisionResult ProvisionEngine::Run() {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("ctforge container provisioning");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    auto started_at = std::chrono::system_clock::now();
    ProvisionResult result;

    try {
        result = Provision();
    }
    catch (const ProvisionError& e) {
        result.error_kind = e.GetKind();
        result.exit_code = e.GetExitCode();
        result.error_message = e.what();
        result.error_context = e.GetContext();
    }
    catch (const std::filesystem::filesystem_error& e) {
        result.error_kind = ErrorKind::HOST_CAPABILITY_UNAVAILABLE;
        result.exit_code = 1;
        result.error_message = e.what();
        result.error_context = "working directory";
    }
    catch (const std::exception& e) {
        result.error_kind = ErrorKind::HOST_CAPABILITY_UNAVAILABLE;
        result.exit_code = 1;
        result.error_message = e.what();
        result.error_context = "provisioning";
    }

    result.started_at = started_at;
    result.finished_at = std::chrono::system_clock::now();

    WriteReport(result);
    return result;
}

ProvisionResult ProvisionEngine::Provision() {
    utils::TempDirectory workdir;
    auto setup_script = StageSetupScript(config_.setup_script, workdir.GetPath());

    if (config_.prepare_host) {
        host::HostPreparation::Config prep;
        prep.modules = config_.kernel_modules;
        prep.modules_file = config_.modules_file;
        host::HostPreparation(prep).Prepare();
    }

    std::vector<StoragePool> pools;
    try {
        pools = impl_->host.ListStoragePools();
    }
    catch (const host::HostCommandError& e) {
        throw ProvisionError(ErrorKind::HOST_CAPABILITY_UNAVAILABLE, e.what(),
                             e.GetExitCode(), e.GetCommand());
    }

    auto storage = impl_->selector.Select(pools);
    auto reference = impl_->resolver.Resolve(config_.os_family, config_.os_version);

    SessionOptions options;
    options.ostype = config_.os_family;
    options.template_storage = config_.template_storage;
    options.bridge = config_.bridge;
    options.setup_script = setup_script;

    ProvisioningSession session(impl_->host, storage, reference, options);
    return session.Run();
}

std::filesystem::path ProvisionEngine::StageSetupScript(const std::filesystem::path& script,
                                                        const std::filesystem::path& workdir) {
    namespace fs = std::filesystem;

    auto staged = workdir / script.filename();
    fs::copy_file(script, staged, fs::copy_options::overwrite_existing);
    fs::permissions(staged,
                    fs::perms::owner_all |
                    fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);

    spdlog::debug("Staged setup script at {}", staged.string());
    return staged;
}

void ProvisionEngine::WriteReport(const ProvisionResult& result) const {
    if (config_.report_path.empty()) {
        return;
    }

    try {
        reporters::JsonReporter reporter;
        reporter.GenerateReport(result, config_.report_path);
        spdlog::info("Report written to {}", config_.report_path.string());
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to write report {}: {}", config_.report_path.string(), e.what());
    }
}

} // namespace core
} // namespace ctforge
