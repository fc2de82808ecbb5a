/**
 * @file storage_selector.hpp
 * @brief Storage pool selection for the container root volume
 *
 * Selection is non-interactive whenever a single pool can hold container
 * root filesystems. With several candidates a single-select prompt is
 * shown. The menu text is produced by a pure formatter so the column
 * arithmetic can be checked without a terminal.
 *
 * **Usage Example**:
 * @code
 * StorageSelector selector(ui::WhiptailStoragePrompt);
 * StoragePool pool = selector.Select(host.ListStoragePools());
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "ctforge/core/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ctforge {
namespace core {

/// Added to the longest label when sizing the menu column
inline constexpr std::size_t kMenuColumnOffset = 2;

/// Width of the left-aligned storage type column
inline constexpr std::size_t kMenuTypeWidth = 10;

/// Width of the right-aligned free space figure (before the trailing "B")
inline constexpr std::size_t kMenuFreeWidth = 9;

/**
 * @struct StorageMenuRow
 * @brief One selectable entry
 */
struct StorageMenuRow {
    std::string tag;     ///< Value returned when chosen
    std::string label;   ///< e.g. "  Type: dir        Free:    50.00GB "
};

/**
 * @struct StorageMenu
 * @brief Formatted single-select list
 */
struct StorageMenu {
    std::size_t width{0};                ///< Longest label plus kMenuColumnOffset
    std::vector<StorageMenuRow> rows;
};

/**
 * @brief Prompt presenting a menu and returning the chosen tag
 *
 * Returns nullopt when the user cancels.
 */
using SelectionPrompt = std::function<std::optional<std::string>(const StorageMenu&)>;

/**
 * @brief Render a menu label for one pool
 */
std::string FormatStorageLabel(const StoragePool& pool);

/**
 * @brief Format all candidates and compute the column width
 */
StorageMenu FormatStorageMenu(const std::vector<StoragePool>& pools);

/**
 * @class StorageSelector
 * @brief Picks the storage pool for the root volume
 */
class StorageSelector {
public:
    explicit StorageSelector(SelectionPrompt prompt);

    /**
     * @brief Choose one pool
     *
     * @param pools Pools reported by the host
     * @return The only eligible pool, or the one chosen at the prompt
     * @throws ProvisionError NO_ELIGIBLE_STORAGE when no pool accepts
     *         container root filesystems, SELECTION_CANCELLED when the
     *         prompt is cancelled
     */
    StoragePool Select(const std::vector<StoragePool>& pools) const;

    /**
     * @brief Pools able to hold container root filesystems
     */
    static std::vector<StoragePool> FilterEligible(const std::vector<StoragePool>& pools);

private:
    SelectionPrompt prompt_;
};

} // namespace core
} // namespace ctforge
