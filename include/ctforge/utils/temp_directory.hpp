/**
 * @file temp_directory.hpp
 * @brief Scoped temporary working directory
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>

namespace ctforge {
namespace utils {

/**
 * @class TempDirectory
 * @brief Creates a unique directory with mkdtemp and removes it on destruction
 */
class TempDirectory {
public:
    /**
     * @brief Create the directory under the system temp location
     * @param prefix Directory name prefix
     * @throws std::filesystem::filesystem_error if creation fails
     */
    explicit TempDirectory(const std::string& prefix = "ctforge");
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& GetPath() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace utils
} // namespace ctforge
