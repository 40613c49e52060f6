#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <fstream>
#include <filesystem>

namespace storage {

constexpr const char* PART_SUFFIX = ".ncp_part";

// Temporary file for one incoming entry. Bytes go to <final>.ncp_part and
// only reach the final path through commit(). An uncommitted PendingWrite
// removes its temp file when destroyed.
class PendingWrite {
public:
    explicit PendingWrite(const std::filesystem::path& final_path);
    ~PendingWrite();

    PendingWrite(const PendingWrite&) = delete;
    PendingWrite& operator=(const PendingWrite&) = delete;

    void write(const char* data, size_t size);

    // Flush, close and rename over the final path
    void commit();
    void discard();

    const std::filesystem::path& final_path() const { return final_path_; }
    const std::filesystem::path& temp_path() const { return temp_path_; }
    uint64_t bytes_written() const { return written_; }

private:
    std::filesystem::path final_path_;
    std::filesystem::path temp_path_;
    std::ofstream file_;
    uint64_t written_ = 0;
    bool done_ = false;
};

} // namespace storage
