/**
 * @file command_utils.cpp
 * @brief popen-based host command execution
 *
 * @date 2025
 */

#include "ctforge/utils/command_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>

#include <sys/wait.h>

namespace ctforge {
namespace utils {

namespace {

bool NeedsQuoting(const std::string& arg) {
    if (arg.empty()) {
        return true;
    }
    for (char c : arg) {
        const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                          c == '.' || c == '/' || c == ':' || c == '=' ||
                          c == ',' || c == '+' || c == '@';
        if (!safe) {
            return true;
        }
    }
    return false;
}

CommandResult RunPipe(const std::string& command) {
    CommandResult result;

    spdlog::debug("exec: {}", command);

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "Failed to execute command";
        return result;
    }

    std::array<char, 256> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result.output += buffer.data();
    }

    // pclose reports a wait status, not an exit code
    int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }

    result.success = result.exit_code == 0;
    return result;
}

} // anonymous namespace

std::string ShellQuote(const std::string& arg) {
    if (!NeedsQuoting(arg)) {
        return arg;
    }

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string BuildCommandLine(const std::vector<std::string>& args) {
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) {
            line += ' ';
        }
        line += ShellQuote(arg);
    }
    return line;
}

CommandResult ExecuteCommand(const std::vector<std::string>& args) {
    // Redirect stderr to stdout (2>&1)
    return RunPipe(BuildCommandLine(args) + " 2>&1");
}

CommandResult ExecuteInteractive(const std::vector<std::string>& args) {
    // Swap stdout and stderr so the pipe receives what the tool writes to stderr
    return RunPipe(BuildCommandLine(args) + " 3>&1 1>&2 2>&3");
}

} // namespace utils
} // namespace ctforge
