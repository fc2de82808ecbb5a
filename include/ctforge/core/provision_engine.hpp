/**
 * @file provision_engine.hpp
 * @brief Top-level orchestration of a provisioning run
 *
 * Ties host preparation, storage selection, template resolution and the
 * provisioning session together, inside a scoped working directory, and
 * writes the optional JSON report.
 *
 * **Run Flow**:
 * ```
 * TempDirectory -> stage setup script -> HostPreparation (optional)
 *   -> ListStoragePools -> StorageSelector -> TemplateResolver
 *   -> ProvisioningSession (rollback on failure) -> JsonReporter
 * ```
 *
 * Failures before the session starts leave no host state behind, so they
 * are reported without a rollback.
 *
 * @date 2025
 */

#pragma once

#include "ctforge/core/config.hpp"
#include "ctforge/core/provisioning_session.hpp"
#include "ctforge/core/storage_selector.hpp"
#include "ctforge/host/host_capability.hpp"

#include <filesystem>
#include <memory>

namespace ctforge {
namespace core {

/**
 * @class ProvisionEngine
 * @brief Runs one complete provisioning attempt
 *
 * **Usage Example**:
 * @code
 * host::PveHost host;
 * ProvisionEngine engine(host, config, ui::WhiptailStoragePrompt);
 * ProvisionResult result = engine.Run();
 * return result.success ? 0 : result.exit_code;
 * @endcode
 */
class ProvisionEngine {
public:
    /**
     * @param host Host binding
     * @param config Validated run configuration
     * @param prompt Interactive storage prompt, may be empty
     */
    ProvisionEngine(host::HostCapability& host, ProvisionConfig config, SelectionPrompt prompt);
    ~ProvisionEngine();

    ProvisionEngine(const ProvisionEngine&) = delete;
    ProvisionEngine& operator=(const ProvisionEngine&) = delete;

    /**
     * @brief Provision the container
     *
     * ProvisionError and working-directory failures are reported through
     * the result; the report file is written in both cases.
     */
    ProvisionResult Run();

    /**
     * @brief Copy the setup script into the working directory as 0755
     * @return Path of the staged copy
     * @throws std::filesystem::filesystem_error on copy failure
     */
    static std::filesystem::path StageSetupScript(const std::filesystem::path& script,
                                                  const std::filesystem::path& workdir);

private:
    ProvisionResult Provision();
    void WriteReport(const ProvisionResult& result) const;

    class Impl;
    ProvisionConfig config_;
    std::unique_ptr<Impl> impl_;
};

} // namespace core
} // namespace ctforge
