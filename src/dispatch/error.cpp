#include "error.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::CONNECTION:     return "ConnectionError";
    case ErrorKind::AUTHENTICATION: return "AuthenticationError";
    case ErrorKind::TIMEOUT:        return "Timeout";
    case ErrorKind::EXECUTION:      return "ExecutionError";
    case ErrorKind::TRANSFER:       return "TransferError";
    case ErrorKind::CANCELLED:      return "Cancelled";
    case ErrorKind::UNKNOWN_HOST:   return "UnknownHostError";
    }
    return "Error";
}

std::string HostError::what() const {
    std::string out = std::string(error_kind_name(kind)) + ": " + message;
    if (!detail.empty()) {
        out += ", Error output: " + detail;
    }
    return out;
}
