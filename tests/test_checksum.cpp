#include <gtest/gtest.h>
#include <stdexcept>
#include "checksum.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using checksum::StreamingChecksum;

namespace {

std::vector<uint8_t> digest_in_chunks(const std::string& data, size_t chunk) {
    StreamingChecksum hasher;
    for (size_t pos = 0; pos < data.size(); pos += chunk) {
        hasher.update(data.data() + pos, std::min(chunk, data.size() - pos));
    }
    return hasher.finalize();
}

} // namespace

TEST(Checksum, DigestIsFixedSize) {
    EXPECT_EQ(checksum::checksum_bytes("", 0).size(), checksum::DIGEST_SIZE);
    EXPECT_EQ(checksum::checksum_bytes("hello world", 11).size(), 32u);
}

TEST(Checksum, HelloWorldSplitMatchesWhole) {
    StreamingChecksum stream;
    stream.update(std::string("hello "));
    stream.update(std::string("world"));

    EXPECT_EQ(stream.finalize(), checksum::checksum_bytes("hello world", 11));
}

TEST(Checksum, StreamingEquivalenceForAnyChunking) {
    std::string data = test_support::make_payload(100000, 7);
    std::vector<uint8_t> whole = checksum::checksum_bytes(data.data(), data.size());

    for (size_t chunk : {1u, 3u, 64u, 127u, 4096u, 8192u, 65537u, 100000u}) {
        EXPECT_EQ(digest_in_chunks(data, chunk), whole) << "chunk size " << chunk;
    }
}

TEST(Checksum, IrregularChunksAndEmptyUpdates) {
    std::string data = test_support::make_payload(5000, 9);
    std::vector<uint8_t> whole = checksum::checksum_bytes(data.data(), data.size());

    StreamingChecksum hasher;
    size_t pos = 0;
    size_t step = 1;
    while (pos < data.size()) {
        size_t n = std::min(step, data.size() - pos);
        hasher.update(data.data() + pos, n);
        hasher.update(data.data() + pos, 0);
        pos += n;
        step = step * 3 % 997 + 1;
    }
    EXPECT_EQ(hasher.finalize(), whole);
}

TEST(Checksum, DetectsSingleBitFlip) {
    std::string data = test_support::make_payload(4096, 1);
    auto original = checksum::checksum_bytes(data.data(), data.size());
    data[2000] ^= 0x01;
    EXPECT_NE(checksum::checksum_bytes(data.data(), data.size()), original);
}

TEST(Checksum, FinalizeConsumesState) {
    StreamingChecksum hasher;
    hasher.update(std::string("abc"));
    hasher.finalize();

    EXPECT_THROW(hasher.finalize(), std::logic_error);
    EXPECT_THROW(hasher.update(std::string("more")), std::logic_error);
}

TEST(Checksum, FileMatchesBytes) {
    test_support::TempDir dir;
    std::string data = test_support::make_payload(3 * 8192 + 17, 3);
    test_support::write_file(dir / "data.bin", data);

    EXPECT_EQ(checksum::checksum_file(dir / "data.bin"), checksum::checksum_bytes(data.data(), data.size()));
}

TEST(Checksum, MissingFileIsIoError) {
    test_support::TempDir dir;
    EXPECT_THROW(checksum::checksum_file(dir / "missing.bin"), errors::IoError);
}

TEST(Checksum, HexEncoding) {
    EXPECT_EQ(checksum::to_hex({0x00, 0x0f, 0xab, 0xff}), "000fabff");
    EXPECT_EQ(checksum::to_hex({}), "");
}
