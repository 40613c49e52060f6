#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include "protocol/packet.hpp"

namespace errors {

// Process exit codes
enum class ExitCode : int {
    SUCCESS = 0,
    GENERAL_ERROR = 1,
    PROTOCOL_ERROR = 2,
    IO_ERROR = 3,
    PERMISSION_DENIED = 4,
    CHECKSUM_MISMATCH = 5,
    NO_SPACE = 6,
    MAX_RETRIES_EXCEEDED = 11
};

// Base of everything ncp throws; carries the exit code it maps to
class NcpError : public std::runtime_error {
public:
    NcpError(const std::string& what, ExitCode code)
        : std::runtime_error(what), code_(code) {}

    ExitCode exit_code() const { return code_; }

private:
    ExitCode code_;
};

enum class ProtocolErrorKind {
    MALFORMED,
    OVERSIZED_MESSAGE,
    TRUNCATED,
    UNEXPECTED_MESSAGE,
    UNKNOWN_MESSAGE_TYPE,
    SESSION_MISMATCH,
    VERSION_MISMATCH
};

const char* kind_name(ProtocolErrorKind kind);

// Fatal to the connection it happened on
class ProtocolError : public NcpError {
public:
    ProtocolError(ProtocolErrorKind kind, const std::string& what);

    ProtocolErrorKind kind() const { return kind_; }

private:
    ProtocolErrorKind kind_;
};

// Receiver refused an entry
class AdmissionError : public NcpError {
public:
    AdmissionError(protocol::ErrorCode code, const std::string& reason);

    protocol::ErrorCode error_code() const { return code_; }

private:
    protocol::ErrorCode code_;
};

class IntegrityError : public NcpError {
public:
    explicit IntegrityError(const std::string& what)
        : NcpError(what, ExitCode::CHECKSUM_MISMATCH) {}
};

class IoError : public NcpError {
public:
    explicit IoError(const std::string& what, ExitCode code = ExitCode::IO_ERROR)
        : NcpError(what, code) {}
};

class RetriesExhausted : public NcpError {
public:
    RetriesExhausted(int attempts, const std::string& last_error, ExitCode last_code);

    int attempts() const { return attempts_; }
    ExitCode last_exit_code() const { return last_code_; }

private:
    int attempts_;
    ExitCode last_code_;
};

ExitCode exit_code_for(protocol::ErrorCode code);

// Wraps a std::error_code (filesystem or socket) as IoError, permission
// failures get their own exit code
IoError io_error(const std::string& context, const std::error_code& ec);

} // namespace errors
