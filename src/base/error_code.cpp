#include "peershare/base/error_code.h"

namespace peershare {

namespace {

class PeerShareCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "PeerShare";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const PeerShareCategory& get_category() {
    static PeerShareCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Cancelled: return "Transfer cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::ConnectionFailed: return "Peer not connected";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::IntegrityError: return "Hash verification failed";
        case ErrorCode::RemoteError: return "Remote peer reported failure";
        case ErrorCode::IoError: return "File read failed";
        default: return "Unknown error";
    }
}

PeerShareError::PeerShareError(ErrorCode code, const std::string& message)
    : code_(code), detail_(message), message_(to_string(code) + ": " + message) {}

const char* PeerShareError::what() const noexcept {
    return message_.c_str();
}

} // namespace peershare
