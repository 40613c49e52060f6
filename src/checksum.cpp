#include "checksum.hpp"
#include "errors.hpp"
#include "protocol/packet.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace checksum {

StreamingChecksum::StreamingChecksum() {
    if (sodium_init() < 0) {
        throw errors::NcpError("libsodium initialization failed", errors::ExitCode::GENERAL_ERROR);
    }
    crypto_generichash_init(&state_, nullptr, 0, DIGEST_SIZE);
}

void StreamingChecksum::update(const void* data, size_t size) {
    if (finalized_) {
        throw std::logic_error("StreamingChecksum::update after finalize");
    }
    if (size == 0) return;
    crypto_generichash_update(&state_, static_cast<const unsigned char*>(data), size);
}

std::vector<uint8_t> StreamingChecksum::finalize() {
    if (finalized_) {
        throw std::logic_error("StreamingChecksum::finalize called twice");
    }
    finalized_ = true;

    std::vector<uint8_t> digest(DIGEST_SIZE);
    crypto_generichash_final(&state_, digest.data(), digest.size());
    return digest;
}

std::vector<uint8_t> checksum_bytes(const void* data, size_t size) {
    StreamingChecksum hasher;
    hasher.update(data, size);
    return hasher.finalize();
}

std::vector<uint8_t> checksum_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw errors::IoError("Could not open file for checksum: " + path.string());
    }

    StreamingChecksum hasher;
    std::vector<char> buffer(protocol::CHUNK_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        hasher.update(buffer.data(), static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw errors::IoError("Read failed while computing checksum: " + path.string());
    }
    return hasher.finalize();
}

std::string to_hex(const std::vector<uint8_t>& digest) {
    std::ostringstream oss;
    for (uint8_t byte : digest) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

} // namespace checksum
