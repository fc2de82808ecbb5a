/**
 * @file whiptail_prompt.cpp
 * @brief Terminal radiolist prompt for storage selection
 *
 * @date 2025
 */

#include "ctforge/ui/whiptail_prompt.hpp"
#include "ctforge/utils/command_utils.hpp"
#include "ctforge/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace ctforge {
namespace ui {

std::vector<std::string> BuildWhiptailArgs(const core::StorageMenu& menu) {
    std::vector<std::string> args = {
        "whiptail", "--title", "Storage Pools", "--radiolist",
        "Which storage pool you would like to use for the container?\n\n",
        std::to_string(kWhiptailHeight),
        std::to_string(menu.width + kWhiptailFrameWidth),
        std::to_string(kWhiptailListHeight)
    };

    for (const auto& row : menu.rows) {
        args.push_back(row.tag);
        args.push_back(row.label);
        args.push_back("OFF");
    }

    return args;
}

std::optional<std::string> WhiptailStoragePrompt(const core::StorageMenu& menu) {
    auto result = utils::ExecuteInteractive(BuildWhiptailArgs(menu));

    // 1 = Cancel, 255 = Esc
    if (!result.success) {
        spdlog::debug("whiptail exited with {}", result.exit_code);
        return std::nullopt;
    }

    return utils::StringUtils::Trim(result.output);
}

} // namespace ui
} // namespace ctforge
