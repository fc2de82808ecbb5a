/**
 * @file errors.hpp
 * @brief Provisioning failure taxonomy
 *
 * Every fatal condition in a provisioning run is a ProvisionError with one
 * of the kinds below. Host command failures carry the exit code of the
 * failing tool so the process can exit with it.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ctforge {
namespace core {

/**
 * @enum ErrorKind
 * @brief Why a provisioning run stopped
 */
enum class ErrorKind {
    NONE,
    NO_ELIGIBLE_STORAGE,
    SELECTION_CANCELLED,
    TEMPLATE_NOT_FOUND,
    TEMPLATE_DOWNLOAD_FAILED,
    ALLOCATION_FAILED,
    FILESYSTEM_CREATION_FAILED,
    CONTAINER_CREATION_FAILED,
    MOUNT_FAILED,
    START_FAILED,
    SETUP_PUSH_FAILED,
    SETUP_EXECUTION_FAILED,
    HOST_CAPABILITY_UNAVAILABLE
};

std::string ErrorKindToString(ErrorKind kind);

/**
 * @class ProvisionError
 * @brief Terminal failure of the current provisioning run
 */
class ProvisionError : public std::runtime_error {
public:
    /**
     * @param kind Failure category
     * @param message Human-readable reason
     * @param exit_code Process exit code to report (1 when no host tool failed)
     * @param context Operation that failed, e.g. "pct start"
     */
    ProvisionError(ErrorKind kind, const std::string& message,
                   int exit_code = 1, std::string context = {})
        : std::runtime_error(message)
        , kind_(kind)
        , exit_code_(exit_code)
        , context_(std::move(context)) {}

    ErrorKind GetKind() const { return kind_; }
    int GetExitCode() const { return exit_code_; }
    const std::string& GetContext() const { return context_; }

private:
    ErrorKind kind_;
    int exit_code_;
    std::string context_;
};

} // namespace core
} // namespace ctforge
