/**
 * @file string_utils.hpp
 * @brief String helpers for parsing host tool output and formatting sizes
 *
 * Provides trimming, splitting and prefix checks used by the Proxmox CLI
 * output parsers, plus version-aware ordering (the `sort -V` rules) and
 * IEC binary size formatting (the `numfmt --to=iec` rules).
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ctforge {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 */
class StringUtils {
public:
    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Delimiter character
     * @param keep_empty Keep empty tokens between adjacent delimiters
     * @return Vector of tokens
     */
    static std::vector<std::string> Split(const std::string& str,
                                          char delimiter,
                                          bool keep_empty = false);

    /**
     * @brief Split string by any whitespace
     */
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /**
     * @brief Split text into lines, dropping blank ones
     */
    static std::vector<std::string> SplitLines(const std::string& text);

    /**
     * @brief Join strings with delimiter
     */
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Pad string on the right with spaces up to width
     *
     * Strings already at or over width are returned unchanged.
     */
    static std::string PadRight(const std::string& str, std::size_t width);

    /**
     * @brief Pad string on the left with spaces up to width
     */
    static std::string PadLeft(const std::string& str, std::size_t width);

    /**
     * @brief Compare two strings with version-aware ordering
     *
     * Runs of digits are compared by numeric value, everything else by
     * character value. `10.10` sorts after `10.9`.
     *
     * @return Negative, zero or positive like strcmp
     */
    static int CompareVersions(const std::string& lhs, const std::string& rhs);

    /**
     * @brief Format byte count in IEC binary units with two decimals
     *
     * Matches `numfmt --to=iec --format %.2f`: the value is divided by 1024
     * until it drops below 1024, rounded away from zero to two decimals and
     * suffixed with K, M, G, T, P or E (no suffix below 1024).
     *
     * @param bytes Byte count
     * @return Formatted size such as "48.83G"
     */
    static std::string FormatIecSize(std::uint64_t bytes);
};

} // namespace utils
} // namespace ctforge
