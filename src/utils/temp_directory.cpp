/**
 * @file temp_directory.cpp
 * @brief Scoped temporary working directory
 *
 * @date 2025
 */

#include "ctforge/utils/temp_directory.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

namespace ctforge {
namespace utils {

TempDirectory::TempDirectory(const std::string& prefix) {
    auto pattern = (std::filesystem::temp_directory_path() / (prefix + ".XXXXXX")).string();

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::filesystem::filesystem_error(
            "Failed to create temporary directory", pattern,
            std::error_code(errno, std::generic_category()));
    }

    path_ = buffer.data();
    spdlog::debug("Working directory: {}", path_.string());
}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", path_.string(), ec.message());
    }
}

} // namespace utils
} // namespace ctforge
