#include "netpilot/errors.hpp"

namespace netpilot {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SESSION_EXPIRED:    return "SessionExpired";
        case ErrorKind::CONNECTION_FAILURE: return "ConnectionFailure";
        case ErrorKind::COMMAND_FAILURE:    return "CommandFailure";
        case ErrorKind::INVALID_FORMAT:     return "InvalidFormat";
        case ErrorKind::DUPLICATE_DEVICE:   return "DuplicateDevice";
        case ErrorKind::PROTECTED_GROUP:    return "ProtectedGroup";
        case ErrorKind::POOL_EXHAUSTED:     return "PoolExhausted";
        case ErrorKind::CONFIGURATION:      return "Configuration";
        default:                            return "Unknown";
    }
}

} // namespace netpilot
