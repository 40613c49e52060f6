#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <filesystem>
#include "protocol/messages.hpp"

namespace entries {

struct Entry {
    std::filesystem::path source_path;   // where the sender reads it from
    std::filesystem::path relative_path; // what the receiver is told
    bool is_directory = false;
    uint64_t size = 0;
    uint32_t mode = 0;
    int64_t mtime = 0;
    std::string checksum_alg = "none";
    std::vector<uint8_t> checksum;
};

// Walks root into transferable entries.
// A file yields one entry named after the file. A directory yields every
// directory and regular file below it (not the root itself), each
// directory before its contents, directories before files at one level,
// names in lexicographic order. Symlinked directories are not descended.
std::vector<Entry> enumerate(const std::filesystem::path& root);

uint64_t total_size(const std::vector<Entry>& entries);

// Fills checksum and checksum_alg of every file entry
void attach_checksums(std::vector<Entry>& entries);

// tree_member marks entries that came from a directory source
protocol::FileMeta to_file_meta(const Entry& entry, bool tree_member);

} // namespace entries
