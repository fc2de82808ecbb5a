/**
 * @file template_resolver.cpp
 * @brief Newest-template lookup for an OS family and version
 *
 * @date 2025
 */

#include "ctforge/core/template_resolver.hpp"
#include "ctforge/core/errors.hpp"
#include "ctforge/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace ctforge {
namespace core {

using utils::StringUtils;

TemplateResolver::TemplateResolver(host::HostCapability& host, std::string template_storage)
    : host_(host)
    , template_storage_(std::move(template_storage)) {
}

TemplateReference TemplateResolver::Resolve(const std::string& os_family,
                                            const std::string& os_version) {
    std::vector<std::string> available;

    try {
        spdlog::info("Updating LXC template list...");
        host_.RefreshTemplateIndex();
        available = host_.ListAvailableTemplates(os_family);
    }
    catch (const host::HostCommandError& e) {
        throw ProvisionError(ErrorKind::HOST_CAPABILITY_UNAVAILABLE, e.what(),
                             e.GetExitCode(), "template index");
    }

    auto candidates = SelectCandidates(available, os_family, os_version);
    if (candidates.empty()) {
        throw ProvisionError(ErrorKind::TEMPLATE_NOT_FOUND,
                             "No template matches '" + os_family + "-" + os_version + "'.",
                             1, "template lookup");
    }

    TemplateReference reference{os_family, os_version, candidates.back()};
    spdlog::debug("Template candidates: {}", StringUtils::Join(candidates, ", "));

    try {
        if (host_.IsTemplateCached(template_storage_, reference.full_name)) {
            spdlog::info("Using cached LXC template {}", reference.full_name);
            return reference;
        }

        spdlog::info("Downloading LXC template...");
        host_.DownloadTemplate(template_storage_, reference.full_name);
    }
    catch (const host::HostCommandError& e) {
        throw ProvisionError(ErrorKind::TEMPLATE_DOWNLOAD_FAILED,
                             "A problem occurred while downloading the LXC template.",
                             e.GetExitCode(), e.GetCommand());
    }

    spdlog::info("Template {} ready on '{}'", reference.full_name, template_storage_);
    return reference;
}

std::vector<std::string> TemplateResolver::SelectCandidates(const std::vector<std::string>& names,
                                                            const std::string& os_family,
                                                            const std::string& os_version) {
    const std::string prefix = os_family + "-" + os_version;
    std::vector<std::string> candidates;

    for (const auto& name : names) {
        auto pos = name.find(prefix);
        if (pos != std::string::npos) {
            candidates.push_back(name.substr(pos));
        }
    }

    std::sort(candidates.begin(), candidates.end(), CompareTemplateNames);
    return candidates;
}

bool TemplateResolver::CompareTemplateNames(const std::string& lhs, const std::string& rhs) {
    auto lhs_segments = StringUtils::Split(lhs, '-', true);
    auto rhs_segments = StringUtils::Split(rhs, '-', true);

    const auto common = std::min(lhs_segments.size(), rhs_segments.size());
    for (std::size_t i = 0; i < common; ++i) {
        int cmp = StringUtils::CompareVersions(lhs_segments[i], rhs_segments[i]);
        if (cmp != 0) {
            return cmp < 0;
        }
    }

    if (lhs_segments.size() != rhs_segments.size()) {
        return lhs_segments.size() < rhs_segments.size();
    }

    return lhs < rhs;
}

} // namespace core
} // namespace ctforge
