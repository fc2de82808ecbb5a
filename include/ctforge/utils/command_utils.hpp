/**
 * @file command_utils.hpp
 * @brief Host command execution with captured output
 *
 * Thin wrapper over popen used to drive the Proxmox command-line tools.
 * Arguments are passed as a vector and shell-quoted, so values such as
 * multi-line container descriptions survive intact.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace ctforge {
namespace utils {

/**
 * @struct CommandResult
 * @brief Outcome of a host command
 */
struct CommandResult {
    int exit_code{0};      ///< Process exit status (-1 if it could not run)
    std::string output;    ///< Captured output
    bool success{false};   ///< exit_code == 0
};

/**
 * @brief Quote a single argument for /bin/sh
 * @param arg Raw argument
 * @return Argument wrapped in single quotes when needed
 */
std::string ShellQuote(const std::string& arg);

/**
 * @brief Build a shell command line from an argument vector
 */
std::string BuildCommandLine(const std::vector<std::string>& args);

/**
 * @brief Run a command, capturing stdout and stderr together
 * @param args Program and arguments
 * @return Exit code and combined output
 */
CommandResult ExecuteCommand(const std::vector<std::string>& args);

/**
 * @brief Run an interactive command, capturing only its stderr
 *
 * The command's stdout is redirected to the terminal's stderr so dialog
 * tools such as whiptail can draw their UI while the selected value,
 * which they write to stderr, is captured.
 */
CommandResult ExecuteInteractive(const std::vector<std::string>& args);

} // namespace utils
} // namespace ctforge
