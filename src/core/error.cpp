#include <dock-dash/core/error.hpp>
#include <sstream>

namespace dock_dash {

namespace {

std::string formatFullMessage(ErrorCode code, const std::string& message)
{
    std::ostringstream oss;
    oss << "[" << getDashboardErrorCategory().name() << " " << static_cast<int>(code) << "] "
        << getDashboardErrorCategory().message(static_cast<int>(code));

    if (!message.empty()) {
        oss << ": " << message;
    }
    return oss.str();
}

} // namespace

const DashboardErrorCategory& getDashboardErrorCategory()
{
    static DashboardErrorCategory category;
    return category;
}

ContainerError::ContainerError(ErrorCode code, const std::string& message)
    : error_code_(code), message_(message), full_message_(formatFullMessage(code, message))
{}

ContainerError::ContainerError(ContainerError&& other) noexcept
    : error_code_(other.error_code_), message_(std::move(other.message_)),
      full_message_(std::move(other.full_message_))
{
    other.error_code_ = ErrorCode::UNKNOWN_ERROR;
}

ContainerError& ContainerError::operator=(ContainerError&& other) noexcept
{
    if (this != &other) {
        error_code_ = other.error_code_;
        message_ = std::move(other.message_);
        full_message_ = std::move(other.full_message_);

        other.error_code_ = ErrorCode::UNKNOWN_ERROR;
    }
    return *this;
}

const char* ContainerError::what() const noexcept
{
    return full_message_.c_str();
}

ErrorCode ContainerError::getErrorCode() const noexcept
{
    return error_code_;
}

const std::string& ContainerError::getMessage() const noexcept
{
    return message_;
}

std::error_code ContainerError::code() const noexcept
{
    return std::error_code(static_cast<int>(error_code_), getDashboardErrorCategory());
}

ContainerError makeSystemError(ErrorCode code, const std::system_error& sys_error)
{
    std::ostringstream oss;
    oss << sys_error.what() << " (system error " << sys_error.code().value() << ")";
    return ContainerError(code, oss.str());
}

int httpStatusFor(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::INVALID_OPERATION:
            return 400;
        case ErrorCode::CONTAINER_NOT_FOUND:
            return 404;
        case ErrorCode::RUNTIME_UNAVAILABLE:
            return 503;
        default:
            return 500;
    }
}

} // namespace dock_dash
