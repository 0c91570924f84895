#pragma once

#include <exception>
#include <string>
#include <system_error>

namespace dtop {

/**
 * @brief Error codes for dashboard operations
 */
enum class ErrorCode {
    // Connection errors
    CONNECTION_FAILED = 1000,
    PING_TIMEOUT = 1001,
    INVALID_HOST_SPEC = 1003,
    NO_HOSTS_CONNECTED = 1004,

    // Stream errors
    STREAM_ERROR = 2000,
    HTTP_ERROR = 2001,
    STREAM_CANCELLED = 2002,

    // Daemon / action errors
    API_ERROR = 3000,
    CONTAINER_NOT_FOUND = 3001,
    ACTION_FAILED = 3002,

    // Parse errors
    PARSE_ERROR = 4000,

    // System errors
    SYSTEM_ERROR = 8000,
    IO_ERROR = 8002,

    // Configuration errors
    CONFIG_INVALID = 9000,
    CONFIG_MISSING = 9001,
    INVALID_TYPE = 9002,
    FILE_NOT_FOUND = 9003,

    // Generic error
    UNKNOWN_ERROR = 9999
};

/**
 * @brief Error category for dtop errors
 */
class DtopErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "dtop";
    }

    std::string message(int ev) const override
    {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::CONNECTION_FAILED:
                return "Failed to connect to Docker host";
            case ErrorCode::PING_TIMEOUT:
                return "Docker host did not answer ping in time";
            case ErrorCode::INVALID_HOST_SPEC:
                return "Invalid host specification";
            case ErrorCode::NO_HOSTS_CONNECTED:
                return "Failed to connect to any Docker host";

            case ErrorCode::STREAM_ERROR:
                return "Stream read failed";
            case ErrorCode::HTTP_ERROR:
                return "Malformed HTTP response";
            case ErrorCode::STREAM_CANCELLED:
                return "Stream cancelled";

            case ErrorCode::API_ERROR:
                return "Docker API error";
            case ErrorCode::CONTAINER_NOT_FOUND:
                return "Container not found";
            case ErrorCode::ACTION_FAILED:
                return "Container action failed";

            case ErrorCode::PARSE_ERROR:
                return "Parse error";

            case ErrorCode::SYSTEM_ERROR:
                return "System error";
            case ErrorCode::IO_ERROR:
                return "I/O error";

            case ErrorCode::CONFIG_INVALID:
                return "Invalid configuration";
            case ErrorCode::CONFIG_MISSING:
                return "Missing configuration: Configuration key not found";
            case ErrorCode::INVALID_TYPE:
                return "Invalid type for configuration value";
            case ErrorCode::FILE_NOT_FOUND:
                return "File not found";

            case ErrorCode::UNKNOWN_ERROR:
            default:
                return "Unknown error";
        }
    }
};

/**
 * @brief Get the dtop error category instance
 */
const DtopErrorCategory& getDtopErrorCategory();

/**
 * @brief Exception type thrown by every dtop layer
 *
 * Producer tasks catch it at their boundary and turn it into an event;
 * only main() lets it terminate the process.
 */
class DtopError : public std::exception {
public:
    /**
     * @brief Construct an error
     * @param code The error code
     * @param message Detail appended to the category message
     */
    DtopError(ErrorCode code, std::string message);

    DtopError(const DtopError& other) noexcept;
    DtopError(DtopError&& other) noexcept;
    DtopError& operator=(const DtopError& other) noexcept;
    DtopError& operator=(DtopError&& other) noexcept;
    ~DtopError() noexcept override = default;

    /**
     * @brief Full message: "[dtop <code>] <category message>: <detail>"
     */
    const char* what() const noexcept override;

    /**
     * @brief Detail message only, as handed to the constructor
     */
    const std::string& detail() const noexcept;

    ErrorCode getErrorCode() const noexcept;

    std::error_code code() const noexcept;

private:
    ErrorCode error_code_;
    std::string message_;
    mutable std::string full_message_; // Cache for what() result
};

/**
 * @brief Create an error from the current errno
 * @param code The dtop error code
 * @param context What was being attempted, e.g. "connect /var/run/docker.sock"
 */
DtopError makeErrnoError(ErrorCode code, const std::string& context);

} // namespace dtop
