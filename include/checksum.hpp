#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>
#include <filesystem>
#include <sodium.h>

namespace checksum {

constexpr const char* ALGORITHM_BLAKE2B = "blake2b";
constexpr const char* ALGORITHM_NONE = "none";
constexpr size_t DIGEST_SIZE = crypto_generichash_BYTES; // 32 bytes

// Incremental BLAKE2b over libsodium crypto_generichash.
// Feeding the same bytes in any chunking yields the same digest.
class StreamingChecksum {
public:
    StreamingChecksum();

    void update(const void* data, size_t size);
    void update(const std::string& data) { update(data.data(), data.size()); }

    // Consumes the state; calling update() or finalize() afterwards throws
    std::vector<uint8_t> finalize();

private:
    crypto_generichash_state state_;
    bool finalized_ = false;
};

std::vector<uint8_t> checksum_bytes(const void* data, size_t size);

// Hashes a whole file, throws errors::IoError if it cannot be read
std::vector<uint8_t> checksum_file(const std::filesystem::path& path);

std::string to_hex(const std::vector<uint8_t>& digest);

} // namespace checksum
