#include <cerrno>
#include <cstring>
#include <dtop/core/error.hpp>
#include <sstream>

namespace dtop {

const DtopErrorCategory& getDtopErrorCategory()
{
    static DtopErrorCategory category;
    return category;
}

DtopError::DtopError(ErrorCode code, std::string message)
    : error_code_(code), message_(std::move(message))
{}

DtopError::DtopError(const DtopError& other) noexcept
    : error_code_(other.error_code_), message_(other.message_), full_message_(other.full_message_)
{}

DtopError::DtopError(DtopError&& other) noexcept
    : error_code_(other.error_code_), message_(std::move(other.message_)),
      full_message_(std::move(other.full_message_))
{
    other.error_code_ = ErrorCode::UNKNOWN_ERROR;
}

DtopError& DtopError::operator=(const DtopError& other) noexcept
{
    if (this != &other) {
        error_code_ = other.error_code_;
        message_ = other.message_;
        full_message_ = other.full_message_;
    }
    return *this;
}

DtopError& DtopError::operator=(DtopError&& other) noexcept
{
    if (this != &other) {
        error_code_ = other.error_code_;
        message_ = std::move(other.message_);
        full_message_ = std::move(other.full_message_);

        other.error_code_ = ErrorCode::UNKNOWN_ERROR;
    }
    return *this;
}

const char* DtopError::what() const noexcept
{
    if (full_message_.empty()) {
        std::ostringstream oss;
        oss << "[" << getDtopErrorCategory().name() << " " << static_cast<int>(error_code_) << "] "
            << getDtopErrorCategory().message(static_cast<int>(error_code_));

        if (!message_.empty()) {
            oss << ": " << message_;
        }

        full_message_ = oss.str();
    }
    return full_message_.c_str();
}

const std::string& DtopError::detail() const noexcept
{
    return message_;
}

ErrorCode DtopError::getErrorCode() const noexcept
{
    return error_code_;
}

std::error_code DtopError::code() const noexcept
{
    return std::error_code(static_cast<int>(error_code_), getDtopErrorCategory());
}

DtopError makeErrnoError(ErrorCode code, const std::string& context)
{
    int saved = errno;
    std::ostringstream oss;
    oss << context << ": " << std::strerror(saved) << " (errno " << saved << ")";
    return DtopError(code, oss.str());
}

} // namespace dtop
