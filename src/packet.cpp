#include "protocol/packet.hpp"
#include <arpa/inet.h>
#include <cstring>

namespace protocol {

std::array<uint8_t, HEADER_SIZE> serialize_header(const PacketHeader& header) {
    std::array<uint8_t, HEADER_SIZE> buffer;
    uint32_t payload = htonl(header.payload_size);

    buffer[0] = header.type;
    std::memcpy(buffer.data() + 1, &payload, 4);

    return buffer;
}

PacketHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer) {
    PacketHeader header;
    uint32_t payload;

    std::memcpy(&payload, buffer.data() + 1, 4);

    header.type = buffer[0];
    header.payload_size = ntohl(payload);

    return header;
}

std::string encode_envelope(MessageType type, const std::string& payload) {
    PacketHeader header{static_cast<uint8_t>(type), static_cast<uint32_t>(payload.size())};
    auto buf = serialize_header(header);

    std::string out(reinterpret_cast<const char*>(buf.data()), buf.size());
    out += payload;
    return out;
}

bool is_known_type(uint8_t type) {
    return type >= static_cast<uint8_t>(MessageType::PROBE) &&
           type <= static_cast<uint8_t>(MessageType::TRANSFER_RESULT);
}

const char* type_name(MessageType type) {
    switch (type) {
        case MessageType::PROBE: return "Probe";
        case MessageType::ESTABLISHED: return "Established";
        case MessageType::META: return "Meta";
        case MessageType::PREFLIGHT_OK: return "PreflightOk";
        case MessageType::PREFLIGHT_FAIL: return "PreflightFail";
        case MessageType::TRANSFER_START: return "TransferStart";
        case MessageType::TRANSFER_RESULT: return "TransferResult";
    }
    return "Unknown";
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::UNKNOWN: return "unknown";
        case ErrorCode::PROTOCOL: return "protocol";
        case ErrorCode::IO: return "io";
        case ErrorCode::PERMISSION: return "permission";
        case ErrorCode::CHECKSUM: return "checksum";
        case ErrorCode::NO_SPACE: return "no-space";
        case ErrorCode::CONFLICT: return "conflict";
        case ErrorCode::UNEXPECTED_EOF: return "unexpected-eof";
        case ErrorCode::TIMEOUT: return "timeout";
    }
    return "unknown";
}

} // namespace protocol
