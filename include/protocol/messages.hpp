#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "protocol/packet.hpp"
#include "errors.hpp"

namespace protocol {

constexpr const char* PROTOCOL_VERSION = "0.1.0";
constexpr uint32_t DEFAULT_KEEPALIVE_SECONDS = 30;

struct Probe {
    static constexpr MessageType TYPE = MessageType::PROBE;

    std::string session_id;
    std::string protocol_version;
    std::string client_name;
    std::vector<std::string> capabilities;
    uint32_t keepalive_seconds = DEFAULT_KEEPALIVE_SECONDS;
};

struct Established {
    static constexpr MessageType TYPE = MessageType::ESTABLISHED;

    std::string session_id;
    std::string protocol_version;
    std::vector<std::string> capabilities;
    int64_t server_time = 0; // unix seconds
};

struct FileMeta {
    std::string name; // relative path, '/' separated
    uint64_t size = 0;
    bool is_dir = false;
    uint32_t mode = 0644;
    int64_t mtime = 0;
    std::string checksum_alg;
    std::vector<uint8_t> checksum;
    std::map<std::string, std::string> attrs;
};

struct Meta {
    static constexpr MessageType TYPE = MessageType::META;

    std::string session_id;
    FileMeta file;
};

struct PreflightOk {
    static constexpr MessageType TYPE = MessageType::PREFLIGHT_OK;

    std::string session_id;
    bool destination_exists = false;
    uint64_t available_space = 0;
};

struct PreflightFail {
    static constexpr MessageType TYPE = MessageType::PREFLIGHT_FAIL;

    std::string session_id;
    ErrorCode code = ErrorCode::UNKNOWN;
    std::string reason;
};

struct TransferStart {
    static constexpr MessageType TYPE = MessageType::TRANSFER_START;

    std::string session_id;
    uint64_t file_size = 0;
};

struct TransferResult {
    static constexpr MessageType TYPE = MessageType::TRANSFER_RESULT;

    std::string session_id;
    bool ok = false;
    ErrorCode code = ErrorCode::NONE;
    std::string reason;
    std::vector<uint8_t> checksum;
    uint64_t received_bytes = 0;
};

// Map JSON parsing automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Probe, session_id, protocol_version, client_name, capabilities, keepalive_seconds)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Established, session_id, protocol_version, capabilities, server_time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileMeta, name, size, is_dir, mode, mtime, checksum_alg, checksum, attrs)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Meta, session_id, file)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PreflightOk, session_id, destination_exists, available_space)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PreflightFail, session_id, code, reason)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TransferStart, session_id, file_size)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TransferResult, session_id, ok, code, reason, checksum, received_bytes)

// Throws ProtocolError if a string field is not valid UTF-8
template <typename Message>
std::string encode(const Message& message) {
    try {
        nlohmann::json j = message;
        return j.dump();
    } catch (const nlohmann::json::exception& e) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::MALFORMED,
            std::string("cannot encode ") + type_name(Message::TYPE) + ": " + e.what());
    }
}

// Throws ProtocolError if the envelope is not a Message or does not parse
template <typename Message>
Message decode(const Envelope& envelope) {
    if (envelope.type != Message::TYPE) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::UNEXPECTED_MESSAGE,
            std::string("expected ") + type_name(Message::TYPE) + ", got " + type_name(envelope.type));
    }
    try {
        nlohmann::json j = nlohmann::json::parse(envelope.payload);
        return j.get<Message>();
    } catch (const nlohmann::json::exception& e) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::MALFORMED,
            std::string(type_name(Message::TYPE)) + " payload: " + e.what());
    }
}

} // namespace protocol
