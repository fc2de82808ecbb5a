/**
 * @file storage_selector.cpp
 * @brief Storage pool filtering, menu formatting and selection
 *
 * **Label Layout**:
 * ```
 * "  Type: " + type (left-aligned, 10) + " Free: " + size (right-aligned, 9) + "B "
 * ```
 * Sizes use IEC binary units with two decimals, so every label has the
 * same length unless a type name or size overflows its column.
 *
 * @date 2025
 */

#include "ctforge/core/storage_selector.hpp"
#include "ctforge/core/errors.hpp"
#include "ctforge/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace ctforge {
namespace core {

using utils::StringUtils;

std::string FormatStorageLabel(const StoragePool& pool) {
    return "  Type: " + StringUtils::PadRight(pool.type_name, kMenuTypeWidth) +
           " Free: " + StringUtils::PadLeft(StringUtils::FormatIecSize(pool.free_bytes), kMenuFreeWidth) +
           "B ";
}

StorageMenu FormatStorageMenu(const std::vector<StoragePool>& pools) {
    StorageMenu menu;
    menu.rows.reserve(pools.size());

    for (const auto& pool : pools) {
        StorageMenuRow row{pool.tag, FormatStorageLabel(pool)};
        menu.width = std::max(menu.width, row.label.size() + kMenuColumnOffset);
        menu.rows.push_back(std::move(row));
    }

    return menu;
}

StorageSelector::StorageSelector(SelectionPrompt prompt)
    : prompt_(std::move(prompt)) {
}

std::vector<StoragePool> StorageSelector::FilterEligible(const std::vector<StoragePool>& pools) {
    std::vector<StoragePool> eligible;
    std::copy_if(pools.begin(), pools.end(), std::back_inserter(eligible),
                 [](const StoragePool& pool) { return pool.supports_rootdir; });
    return eligible;
}

StoragePool StorageSelector::Select(const std::vector<StoragePool>& pools) const {
    auto eligible = FilterEligible(pools);

    if (eligible.empty()) {
        spdlog::warn("'Container' needs to be selected for at least one storage location.");
        throw ProvisionError(ErrorKind::NO_ELIGIBLE_STORAGE,
                             "Unable to detect valid storage location.", 1, "storage selection");
    }

    if (eligible.size() == 1) {
        spdlog::info("Using '{}' for storage location.", eligible.front().tag);
        return eligible.front();
    }

    if (!prompt_) {
        throw ProvisionError(ErrorKind::SELECTION_CANCELLED,
                             "Several storage locations qualify and no prompt is available.",
                             1, "storage selection");
    }

    auto menu = FormatStorageMenu(eligible);

    // Keep asking until the prompt yields one of the offered tags
    while (true) {
        auto choice = prompt_(menu);
        if (!choice) {
            throw ProvisionError(ErrorKind::SELECTION_CANCELLED,
                                 "Storage selection cancelled.", 1, "storage selection");
        }

        auto it = std::find_if(eligible.begin(), eligible.end(),
                               [&](const StoragePool& pool) { return pool.tag == *choice; });
        if (it != eligible.end()) {
            spdlog::info("Using '{}' for storage location.", it->tag);
            return *it;
        }

        spdlog::debug("Prompt returned unknown storage '{}'", *choice);
    }
}

} // namespace core
} // namespace ctforge
