#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>

namespace protocol {

enum class MessageType : uint8_t {
    PROBE = 1,
    ESTABLISHED = 2,
    META = 3,
    PREFLIGHT_OK = 4,
    PREFLIGHT_FAIL = 5,
    TRANSFER_START = 6,
    TRANSFER_RESULT = 7
};

// Error codes carried in PreflightFail and TransferResult
enum class ErrorCode : int32_t {
    NONE = 0,
    UNKNOWN = 1,
    PROTOCOL = 2,
    IO = 3,
    PERMISSION = 4,
    CHECKSUM = 5,
    NO_SPACE = 6,
    CONFLICT = 7,
    UNEXPECTED_EOF = 8,
    TIMEOUT = 9
};

constexpr uint32_t MAX_PAYLOAD_SIZE = 1024 * 1024; // 1 MiB
constexpr size_t HEADER_SIZE = 5;
constexpr size_t CHUNK_SIZE = 8 * 1024;

// Fixed 5-byte header: [type:u8][payload_size:u32 big-endian]
struct PacketHeader {
    uint8_t type;
    uint32_t payload_size;
};

struct Envelope {
    MessageType type;
    std::string payload;
};

std::array<uint8_t, HEADER_SIZE> serialize_header(const PacketHeader& header);
PacketHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer);

// Header followed by payload, exactly as it goes on the wire
std::string encode_envelope(MessageType type, const std::string& payload);

bool is_known_type(uint8_t type);
const char* type_name(MessageType type);
const char* error_code_name(ErrorCode code);

} // namespace protocol
