#include "errors.hpp"

NimbusError::NimbusError(ErrorKind kind, const std::string& message, size_t missing_blocks)
    : std::runtime_error(message), kind_(kind), missing_blocks_(missing_blocks) {
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Usage:              return "Usage error";
    case ErrorKind::Config:             return "Configuration error";
    case ErrorKind::DependencyMissing:  return "Missing dependency";
    case ErrorKind::Endpoint:           return "Endpoint error";
    case ErrorKind::AuthFailed:         return "Authentication failed";
    case ErrorKind::Unreachable:        return "Host unreachable";
    case ErrorKind::TransferIncomplete: return "Transfer incomplete";
    case ErrorKind::Reassembly:         return "Reassembly error";
    case ErrorKind::Interrupted:        return "Interrupted";
    case ErrorKind::Internal:           return "Internal error";
    }
    return "Internal error";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Usage:
    case ErrorKind::Config:             return 2;
    case ErrorKind::DependencyMissing:  return 3;
    case ErrorKind::Endpoint:           return 4;
    case ErrorKind::AuthFailed:
    case ErrorKind::Unreachable:        return 5;
    case ErrorKind::TransferIncomplete: return 6;
    case ErrorKind::Reassembly:         return 7;
    case ErrorKind::Interrupted:        return 130;
    case ErrorKind::Internal:           return 1;
    }
    return 1;
}
