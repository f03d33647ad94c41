#pragma once

#include <exception>
#include <string>
#include <system_error>

namespace dock_dash {

/**
 * @brief Error codes for dashboard operations
 */
enum class ErrorCode {
    // Container errors
    CONTAINER_NOT_FOUND = 1000,
    INVALID_OPERATION = 1001,
    CONTAINER_START_FAILED = 1002,
    CONTAINER_STOP_FAILED = 1003,
    CONTAINER_RESTART_FAILED = 1004,

    // Runtime transport errors
    RUNTIME_UNAVAILABLE = 2000,
    RUNTIME_REQUEST_FAILED = 2001,
    RUNTIME_RESPONSE_INVALID = 2002,

    // Best-effort enrichment errors
    STATS_UNAVAILABLE = 3000,
    LOGS_UNAVAILABLE = 3001,

    // Streaming errors
    SUBSCRIBER_SEND_FAILED = 4000,

    // System errors
    IO_ERROR = 8001,

    // Configuration errors
    CONFIG_INVALID = 9000,
    FILE_NOT_FOUND = 9003,

    // Generic error
    UNKNOWN_ERROR = 9999
};

/**
 * @brief Custom error category for dashboard errors
 */
class DashboardErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "dock-dash";
    }

    std::string message(int ev) const override
    {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::CONTAINER_NOT_FOUND:
                return "Container not found";
            case ErrorCode::INVALID_OPERATION:
                return "Invalid operation";
            case ErrorCode::CONTAINER_START_FAILED:
                return "Failed to start container";
            case ErrorCode::CONTAINER_STOP_FAILED:
                return "Failed to stop container";
            case ErrorCode::CONTAINER_RESTART_FAILED:
                return "Failed to restart container";

            case ErrorCode::RUNTIME_UNAVAILABLE:
                return "Container runtime unavailable";
            case ErrorCode::RUNTIME_REQUEST_FAILED:
                return "Container runtime request failed";
            case ErrorCode::RUNTIME_RESPONSE_INVALID:
                return "Invalid response from container runtime";

            case ErrorCode::STATS_UNAVAILABLE:
                return "Container stats unavailable";
            case ErrorCode::LOGS_UNAVAILABLE:
                return "Container logs unavailable";

            case ErrorCode::SUBSCRIBER_SEND_FAILED:
                return "Failed to send to subscriber";

            case ErrorCode::IO_ERROR:
                return "I/O error";

            case ErrorCode::CONFIG_INVALID:
                return "Invalid configuration";
            case ErrorCode::FILE_NOT_FOUND:
                return "File not found";

            case ErrorCode::UNKNOWN_ERROR:
            default:
                return "Unknown error";
        }
    }
};

/**
 * @brief Get the dashboard error category instance
 */
const DashboardErrorCategory& getDashboardErrorCategory();

/**
 * @brief Dashboard exception class
 */
class ContainerError : public std::exception {
public:
    /**
     * @brief Construct a dashboard error
     * @param code The error code
     * @param message The error message
     */
    ContainerError(ErrorCode code, const std::string& message);

    ContainerError(const ContainerError& other) = default;
    ContainerError(ContainerError&& other) noexcept;
    ContainerError& operator=(const ContainerError& other) = default;
    ContainerError& operator=(ContainerError&& other) noexcept;
    ~ContainerError() noexcept override = default;

    /**
     * @brief Get the formatted error message
     */
    const char* what() const noexcept override;

    /**
     * @brief Get the error code
     */
    ErrorCode getErrorCode() const noexcept;

    /**
     * @brief Get the detail message without the category prefix
     */
    const std::string& getMessage() const noexcept;

    /**
     * @brief Get the error code as std::error_code
     */
    std::error_code code() const noexcept;

private:
    ErrorCode error_code_;
    std::string message_;
    std::string full_message_;
};

/**
 * @brief Create a dashboard error from a system error
 * @param code The dashboard error code
 * @param sys_error The system error
 * @return Dashboard error with system error information
 */
ContainerError makeSystemError(ErrorCode code, const std::system_error& sys_error);

/**
 * @brief Status code the HTTP surface answers with for a failure kind
 *
 * Invalid operations map to 400, missing containers to 404, an unreachable
 * runtime to 503 and everything else to 500.
 */
int httpStatusFor(ErrorCode code) noexcept;

} // namespace dock_dash
