#include "entries.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <system_error>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace entries {

namespace {

Entry make_entry(const fs::path& source, const fs::path& relative, bool is_directory) {
    struct stat st;
    if (::stat(source.c_str(), &st) != 0) {
        throw errors::io_error("stat " + source.string(), std::error_code(errno, std::generic_category()));
    }

    Entry entry;
    entry.source_path = source;
    entry.relative_path = relative;
    entry.is_directory = is_directory;
    entry.size = is_directory ? 0 : static_cast<uint64_t>(st.st_size);
    entry.mode = static_cast<uint32_t>(st.st_mode & 07777);
    entry.mtime = static_cast<int64_t>(st.st_mtime);
    return entry;
}

void walk(const fs::path& dir, const fs::path& relative, std::vector<Entry>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw errors::io_error("Cannot read directory " + dir.string(), ec);
    }

    std::vector<fs::path> dirs;
    std::vector<fs::path> files;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw errors::io_error("Cannot read directory " + dir.string(), ec);
        }
        const fs::directory_entry& item = *it;
        bool is_link = item.is_symlink(ec);
        if (ec) throw errors::io_error("stat " + item.path().string(), ec);
        fs::file_status status = item.status(ec);
        if (ec) {
            if (!is_link) throw errors::io_error("stat " + item.path().string(), ec);
            ec.clear(); // dangling link
            continue;
        }

        if (fs::is_directory(status)) {
            if (!is_link) dirs.push_back(item.path());
        } else if (fs::is_regular_file(status)) {
            files.push_back(item.path());
        }
        // sockets and fifos are skipped
    }
    if (ec) {
        throw errors::io_error("Cannot read directory " + dir.string(), ec);
    }

    auto by_name = [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    };
    std::sort(dirs.begin(), dirs.end(), by_name);
    std::sort(files.begin(), files.end(), by_name);

    for (const auto& d : dirs) {
        fs::path rel = relative / d.filename();
        out.push_back(make_entry(d, rel, true));
        walk(d, rel, out);
    }
    for (const auto& f : files) {
        out.push_back(make_entry(f, relative / f.filename(), false));
    }
}

} // namespace

std::vector<Entry> enumerate(const fs::path& root) {
    std::error_code ec;
    fs::file_status status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        throw errors::IoError("Source path does not exist: " + root.string());
    }

    std::vector<Entry> entries;
    if (fs::is_directory(status)) {
        walk(root, fs::path(), entries);
    } else if (fs::is_regular_file(status)) {
        fs::path name = root.filename();
        if (name.empty()) {
            throw errors::IoError("Invalid filename: " + root.string());
        }
        entries.push_back(make_entry(root, name, false));
    } else {
        throw errors::IoError("Not a regular file or directory: " + root.string());
    }
    return entries;
}

uint64_t total_size(const std::vector<Entry>& entries) {
    uint64_t total = 0;
    for (const auto& entry : entries) {
        if (!entry.is_directory) total += entry.size;
    }
    return total;
}

void attach_checksums(std::vector<Entry>& entries) {
    for (auto& entry : entries) {
        if (entry.is_directory) continue;
        entry.checksum = checksum::checksum_file(entry.source_path);
        entry.checksum_alg = checksum::ALGORITHM_BLAKE2B;
    }
}

protocol::FileMeta to_file_meta(const Entry& entry, bool tree_member) {
    protocol::FileMeta meta;
    meta.name = entry.relative_path.generic_string();
    meta.size = entry.size;
    meta.is_dir = entry.is_directory;
    meta.mode = entry.mode;
    meta.mtime = entry.mtime;
    meta.checksum_alg = entry.checksum_alg;
    meta.checksum = entry.checksum;
    if (tree_member) {
        meta.attrs["tree"] = "1";
    }
    return meta;
}

} // namespace entries
