#ifndef PEERSHARE_BASE_ERROR_CODE_H
#define PEERSHARE_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace peershare {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    AlreadyExists = 1003,
    Cancelled = 1005,
    InternalError = 1006,
    InvalidState = 1008,

    // Network errors (2000-2999)
    ConnectionFailed = 2002,
    SendFailed = 2004,

    // Transfer errors (4000-4999)
    ProtocolError = 4004,
    IntegrityError = 4005,
    RemoteError = 4006,

    // Storage errors (5000-5999)
    IoError = 5001
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class PeerShareError : public std::exception {
public:
    PeerShareError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

    // Message without the error code prefix
    const std::string& detail() const { return detail_; }

    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string detail_;
    std::string message_;
};

} // namespace peershare

#endif // PEERSHARE_BASE_ERROR_CODE_H
