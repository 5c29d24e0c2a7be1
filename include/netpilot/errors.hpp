#ifndef NETPILOT_ERRORS_HPP
#define NETPILOT_ERRORS_HPP

#include <stdexcept> // For std::runtime_error
#include <string>

namespace netpilot {

enum class ErrorKind {
    SESSION_EXPIRED,
    CONNECTION_FAILURE,
    COMMAND_FAILURE,
    INVALID_FORMAT,
    DUPLICATE_DEVICE,
    PROTECTED_GROUP,
    POOL_EXHAUSTED,
    CONFIGURATION
};

std::string error_kind_to_string(ErrorKind kind);

class PilotError : public std::runtime_error {
public:
    PilotError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Caller must start a new session before retrying.
class SessionExpiredError : public PilotError {
public:
    explicit SessionExpiredError(const std::string& session_id)
        : PilotError(ErrorKind::SESSION_EXPIRED, "Session '" + session_id + "' is not active"),
          session_id_(session_id) {}

    const std::string& session_id() const { return session_id_; }

private:
    std::string session_id_;
};

class ConnectionError : public PilotError {
public:
    explicit ConnectionError(const std::string& message)
        : PilotError(ErrorKind::CONNECTION_FAILURE, message) {}
};

// A command ran on the device and reported an error that is not idempotent-equivalent.
class CommandFailureError : public PilotError {
public:
    CommandFailureError(const std::string& phase, const std::string& command, const std::string& output)
        : PilotError(ErrorKind::COMMAND_FAILURE,
                     "Phase '" + phase + "' failed on command [" + command + "]: " + output),
          phase_(phase), command_(command), output_(output) {}

    const std::string& phase() const { return phase_; }
    const std::string& command() const { return command_; }
    const std::string& output() const { return output_; }

private:
    std::string phase_;
    std::string command_;
    std::string output_;
};

class InvalidFormatError : public PilotError {
public:
    explicit InvalidFormatError(const std::string& message)
        : PilotError(ErrorKind::INVALID_FORMAT, message) {}
};

class DuplicateDeviceError : public PilotError {
public:
    DuplicateDeviceError(const std::string& message, int conflicting_group)
        : PilotError(ErrorKind::DUPLICATE_DEVICE, message), conflicting_group_(conflicting_group) {}

    int conflicting_group() const { return conflicting_group_; }

private:
    int conflicting_group_;
};

class ProtectedGroupError : public PilotError {
public:
    explicit ProtectedGroupError(const std::string& message)
        : PilotError(ErrorKind::PROTECTED_GROUP, message) {}
};

class PoolExhaustedError : public PilotError {
public:
    explicit PoolExhaustedError(const std::string& message)
        : PilotError(ErrorKind::POOL_EXHAUSTED, message) {}
};

class ConfigurationError : public PilotError {
public:
    explicit ConfigurationError(const std::string& message)
        : PilotError(ErrorKind::CONFIGURATION, message) {}
};

} // namespace netpilot

#endif // NETPILOT_ERRORS_HPP
