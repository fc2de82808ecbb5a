/**
 * @file template_resolver.hpp
 * @brief Newest-template lookup for an OS family and version
 *
 * @date 2025
 */

#pragma once

#include "ctforge/core/types.hpp"
#include "ctforge/host/host_capability.hpp"

#include <string>
#include <vector>

namespace ctforge {
namespace core {

/**
 * @class TemplateResolver
 * @brief Finds the newest matching template and makes sure it is cached
 *
 * The available-template index is refreshed first. Candidates are the
 * names containing `<family>-<version>`, ordered with
 * CompareTemplateNames; the last one wins. A template missing from the
 * template storage is downloaded once, and a failed download is fatal.
 */
class TemplateResolver {
public:
    /**
     * @param host Host binding
     * @param template_storage Storage that holds vztmpl images
     */
    TemplateResolver(host::HostCapability& host, std::string template_storage);

    /**
     * @brief Resolve and fetch the newest template
     * @throws ProvisionError TEMPLATE_NOT_FOUND, TEMPLATE_DOWNLOAD_FAILED or
     *         HOST_CAPABILITY_UNAVAILABLE when the index cannot be queried
     */
    TemplateReference Resolve(const std::string& os_family, const std::string& os_version);

    /**
     * @brief Candidates for a family/version, oldest first
     *
     * Each name is cut to start at the `<family>-<version>` match.
     */
    static std::vector<std::string> SelectCandidates(const std::vector<std::string>& names,
                                                     const std::string& os_family,
                                                     const std::string& os_version);

    /**
     * @brief Strict weak ordering of template names
     *
     * Names are split on '-' and compared segment by segment with
     * version-aware ordering; a name that runs out of segments first sorts
     * first. Equal-ranking names fall back to plain string order so the
     * result is total.
     */
    static bool CompareTemplateNames(const std::string& lhs, const std::string& rhs);

private:
    host::HostCapability& host_;
    std::string template_storage_;
};

} // namespace core
} // namespace ctforge
