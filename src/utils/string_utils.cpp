/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers for host output parsing
 *
 * Host tools print whitespace-separated tables with a header row. The
 * helpers here split those tables apart and format the numbers that go
 * back into the interactive menu.
 *
 * **Version Ordering**:
 * Mirrors `sort -V` closely enough for template names: digit runs compare
 * by value (leading zeros ignored), any other character compares by its
 * byte value.
 *
 * @date 2025
 */

#include "ctforge/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ctforge {
namespace utils {

// ============================================================================
// TRIMMING AND SPLITTING
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::vector<std::string> StringUtils::Split(const std::string& str,
                                            char delimiter,
                                            bool keep_empty) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (keep_empty || !token.empty()) {
            tokens.push_back(token);
        }
    }

    // getline drops a trailing empty field
    if (keep_empty && !str.empty() && str.back() == delimiter) {
        tokens.emplace_back();
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!Trim(line).empty()) {
            lines.push_back(line);
        }
    }

    return lines;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

std::string StringUtils::PadRight(const std::string& str, std::size_t width) {
    if (str.size() >= width) {
        return str;
    }
    return str + std::string(width - str.size(), ' ');
}

std::string StringUtils::PadLeft(const std::string& str, std::size_t width) {
    if (str.size() >= width) {
        return str;
    }
    return std::string(width - str.size(), ' ') + str;
}

// ============================================================================
// VERSION-AWARE COMPARISON
// ============================================================================

int StringUtils::CompareVersions(const std::string& lhs, const std::string& rhs) {
    std::size_t i = 0;
    std::size_t j = 0;

    while (i < lhs.size() && j < rhs.size()) {
        const bool lhs_digit = std::isdigit(static_cast<unsigned char>(lhs[i])) != 0;
        const bool rhs_digit = std::isdigit(static_cast<unsigned char>(rhs[j])) != 0;

        if (lhs_digit && rhs_digit) {
            // Skip leading zeros, then the longer run is the larger number
            while (i < lhs.size() && lhs[i] == '0') ++i;
            while (j < rhs.size() && rhs[j] == '0') ++j;

            std::size_t lhs_end = i;
            std::size_t rhs_end = j;
            while (lhs_end < lhs.size() && std::isdigit(static_cast<unsigned char>(lhs[lhs_end]))) ++lhs_end;
            while (rhs_end < rhs.size() && std::isdigit(static_cast<unsigned char>(rhs[rhs_end]))) ++rhs_end;

            const std::size_t lhs_len = lhs_end - i;
            const std::size_t rhs_len = rhs_end - j;
            if (lhs_len != rhs_len) {
                return lhs_len < rhs_len ? -1 : 1;
            }

            const int cmp = lhs.compare(i, lhs_len, rhs, j, rhs_len);
            if (cmp != 0) {
                return cmp < 0 ? -1 : 1;
            }

            i = lhs_end;
            j = rhs_end;
            continue;
        }

        if (lhs[i] != rhs[j]) {
            return static_cast<unsigned char>(lhs[i]) < static_cast<unsigned char>(rhs[j]) ? -1 : 1;
        }
        ++i;
        ++j;
    }

    if (i < lhs.size()) return 1;
    if (j < rhs.size()) return -1;
    return 0;
}

// ============================================================================
// SIZE FORMATTING
// ============================================================================

std::string StringUtils::FormatIecSize(std::uint64_t bytes) {
    static const char* const suffixes[] = {"", "K", "M", "G", "T", "P", "E"};
    int suffix_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && suffix_index < 6) {
        size /= 1024.0;
        suffix_index++;
    }

    // numfmt rounds away from zero; the epsilon absorbs division noise
    double rounded = std::ceil(size * 100.0 - 1e-9) / 100.0;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << rounded << suffixes[suffix_index];
    return oss.str();
}

} // namespace utils
} // namespace ctforge
