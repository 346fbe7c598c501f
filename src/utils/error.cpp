#include "powgate/error.hpp"
#include <sstream>

namespace powgate {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        
        case ErrorCode::NetworkConnectionFailed: return "Connection failed";
        case ErrorCode::NetworkTimeout: return "Network timeout";
        case ErrorCode::NetworkInvalidMessage: return "Invalid server response";
        
        case ErrorCode::ServerRejected: return "Rejected by server";
        case ErrorCode::SessionRejected: return "Session rejected";
        
        case ErrorCode::ValidationFailed: return "Validation failed";
        case ErrorCode::RequestInFlight: return "Request already in flight";
        
        case ErrorCode::PoWInvalidSolution: return "Invalid PoW solution";
        case ErrorCode::PoWCancelled: return "PoW search cancelled";
        
        case ErrorCode::StorageWriteFailed: return "Storage write failed";
        
        default: return "Unknown error code";
    }
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network: return "network";
        case ErrorKind::Server: return "server";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::StaleSession: return "stale-session";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Internal: return "internal";
        default: return "unknown";
    }
}

ErrorKind error_kind(ErrorCode code) {
    switch (code) {
        case ErrorCode::NetworkConnectionFailed:
        case ErrorCode::NetworkTimeout:
            return ErrorKind::Network;
        
        case ErrorCode::ServerRejected:
        case ErrorCode::NetworkInvalidMessage:
            return ErrorKind::Server;
        
        case ErrorCode::ValidationFailed:
        case ErrorCode::InvalidArgument:
        case ErrorCode::RequestInFlight:
            return ErrorKind::Validation;
        
        case ErrorCode::SessionRejected:
            return ErrorKind::StaleSession;
        
        case ErrorCode::PoWCancelled:
            return ErrorKind::Cancelled;
        
        default:
            return ErrorKind::Internal;
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

std::string user_message(const Error& error, const std::string& fallback) {
    if (!error.details().empty()) {
        return error.details();
    }
    return fallback;
}

} // namespace powgate
