#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

namespace storage {

// Bytes available to an unprivileged user on the filesystem holding path.
// path does not have to exist yet: its nearest existing ancestor is queried.
uint64_t available_bytes(const std::filesystem::path& path);

std::string format_size(uint64_t bytes);

} // namespace storage
