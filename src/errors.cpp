#include "errors.hpp"

namespace errors {

const char* kind_name(ProtocolErrorKind kind) {
    switch (kind) {
        case ProtocolErrorKind::MALFORMED: return "malformed message";
        case ProtocolErrorKind::OVERSIZED_MESSAGE: return "oversized message";
        case ProtocolErrorKind::TRUNCATED: return "truncated stream";
        case ProtocolErrorKind::UNEXPECTED_MESSAGE: return "unexpected message";
        case ProtocolErrorKind::UNKNOWN_MESSAGE_TYPE: return "unknown message type";
        case ProtocolErrorKind::SESSION_MISMATCH: return "session id mismatch";
        case ProtocolErrorKind::VERSION_MISMATCH: return "version mismatch";
    }
    return "protocol error";
}

ProtocolError::ProtocolError(ProtocolErrorKind kind, const std::string& what)
    : NcpError(std::string("Protocol error (") + kind_name(kind) + "): " + what,
               ExitCode::PROTOCOL_ERROR),
      kind_(kind) {}

AdmissionError::AdmissionError(protocol::ErrorCode code, const std::string& reason)
    : NcpError(reason, exit_code_for(code)), code_(code) {}

RetriesExhausted::RetriesExhausted(int attempts, const std::string& last_error, ExitCode last_code)
    : NcpError("All " + std::to_string(attempts) + " attempts failed. Last error: " + last_error,
               ExitCode::MAX_RETRIES_EXCEEDED),
      attempts_(attempts),
      last_code_(last_code) {}

ExitCode exit_code_for(protocol::ErrorCode code) {
    switch (code) {
        case protocol::ErrorCode::NONE: return ExitCode::SUCCESS;
        case protocol::ErrorCode::PROTOCOL:
        case protocol::ErrorCode::UNEXPECTED_EOF: return ExitCode::PROTOCOL_ERROR;
        case protocol::ErrorCode::IO:
        case protocol::ErrorCode::TIMEOUT: return ExitCode::IO_ERROR;
        case protocol::ErrorCode::PERMISSION: return ExitCode::PERMISSION_DENIED;
        case protocol::ErrorCode::CHECKSUM: return ExitCode::CHECKSUM_MISMATCH;
        case protocol::ErrorCode::NO_SPACE: return ExitCode::NO_SPACE;
        case protocol::ErrorCode::CONFLICT:
        case protocol::ErrorCode::UNKNOWN: return ExitCode::GENERAL_ERROR;
    }
    return ExitCode::GENERAL_ERROR;
}

IoError io_error(const std::string& context, const std::error_code& ec) {
    ExitCode code = ExitCode::IO_ERROR;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = ExitCode::PERMISSION_DENIED;
    }
    return IoError(context + ": " + ec.message(), code);
}

} // namespace errors
