/**
 * @file whiptail_prompt.hpp
 * @brief Terminal radiolist prompt for storage selection
 *
 * @date 2025
 */

#pragma once

#include "ctforge/core/storage_selector.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ctforge {
namespace ui {

/// Extra columns whiptail needs around the label column
inline constexpr std::size_t kWhiptailFrameWidth = 23;
inline constexpr int kWhiptailHeight = 16;
inline constexpr int kWhiptailListHeight = 6;

/**
 * @brief Arguments for a whiptail radiolist built from a storage menu
 */
std::vector<std::string> BuildWhiptailArgs(const core::StorageMenu& menu);

/**
 * @brief Show the menu with whiptail and return the chosen tag
 *
 * Returns nullopt when the dialog is cancelled or escaped, or when
 * whiptail is not available.
 */
std::optional<std::string> WhiptailStoragePrompt(const core::StorageMenu& menu);

} // namespace ui
} // namespace ctforge
