#include "diskspace.hpp"
#include "errors.hpp"
#include <cstdio>
#include <cerrno>
#include <system_error>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace storage {

uint64_t available_bytes(const fs::path& path) {
    fs::path check_path = path.empty() ? fs::path(".") : path;
    std::error_code ec;
    while (!fs::exists(check_path, ec)) {
        fs::path parent = check_path.parent_path();
        if (parent.empty() || parent == check_path) {
            check_path = ".";
            break;
        }
        check_path = parent;
    }

    struct statvfs disk_stat;
    if (statvfs(check_path.c_str(), &disk_stat) != 0) {
        throw errors::io_error("statvfs " + check_path.string(),
                               std::error_code(errno, std::generic_category()));
    }
    return static_cast<uint64_t>(disk_stat.f_bavail) * disk_stat.f_frsize;
}

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

} // namespace storage
