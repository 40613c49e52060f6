#include "pending_write.hpp"
#include "errors.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace storage {

PendingWrite::PendingWrite(const fs::path& final_path)
    : final_path_(final_path), temp_path_(final_path.string() + PART_SUFFIX) {
    file_.open(temp_path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        throw errors::IoError("Could not open file for writing: " + temp_path_.string());
    }
}

PendingWrite::~PendingWrite() {
    if (!done_) {
        file_.close();
        std::error_code ec;
        fs::remove(temp_path_, ec);
    }
}

void PendingWrite::write(const char* data, size_t size) {
    file_.write(data, static_cast<std::streamsize>(size));
    if (!file_) {
        throw errors::IoError("Failed to write to " + temp_path_.string());
    }
    written_ += size;
}

void PendingWrite::commit() {
    if (done_) return;

    file_.flush();
    file_.close();
    if (file_.fail()) {
        throw errors::IoError("Failed to close " + temp_path_.string());
    }

    std::error_code ec;
    fs::rename(temp_path_, final_path_, ec);
    if (ec) {
        throw errors::io_error("Failed to rename temp file to " + final_path_.string(), ec);
    }
    done_ = true;
}

void PendingWrite::discard() {
    if (done_) return;
    done_ = true;

    file_.close();
    std::error_code ec;
    fs::remove(temp_path_, ec);
    if (ec) {
        throw errors::io_error("Failed to remove " + temp_path_.string(), ec);
    }
}

} // namespace storage
