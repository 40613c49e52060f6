#include "admission.hpp"
#include "diskspace.hpp"
#include "errors.hpp"
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

namespace admission {

AdmissionDecision AdmissionDecision::accept(const fs::path& final_path,
                                            bool destination_exists, uint64_t available_space) {
    AdmissionDecision decision;
    decision.accepted = true;
    decision.final_path = final_path;
    decision.destination_exists = destination_exists;
    decision.available_space = available_space;
    return decision;
}

AdmissionDecision AdmissionDecision::reject(protocol::ErrorCode code, const std::string& reason) {
    AdmissionDecision decision;
    decision.accepted = false;
    decision.error_code = code;
    decision.reason = reason;
    return decision;
}

uint64_t required_space(uint64_t size) {
    uint64_t margin = size / 10;
    if (size > std::numeric_limits<uint64_t>::max() - margin) {
        return std::numeric_limits<uint64_t>::max();
    }
    return size + margin;
}

bool parse_overwrite_policy(const std::string& text, OverwritePolicy& policy) {
    if (text == "ask") {
        policy = OverwritePolicy::ASK;
    } else if (text == "yes") {
        policy = OverwritePolicy::ALWAYS_YES;
    } else if (text == "no") {
        policy = OverwritePolicy::ALWAYS_NO;
    } else {
        return false;
    }
    return true;
}

namespace {

// Relative, non-empty, and never escaping the target root
bool is_safe_relative(const fs::path& rel) {
    if (rel.empty() || rel.is_absolute() || rel.has_root_name()) return false;
    for (const auto& part : rel) {
        if (part == "..") return false;
    }
    return true;
}

bool is_tree_member(const protocol::FileMeta& file) {
    auto it = file.attrs.find("tree");
    return it != file.attrs.end() && it->second == "1";
}

} // namespace

AdmissionController::AdmissionController(fs::path target_root,
                                         OverwritePolicy policy,
                                         DiskSpaceQuery disk_space,
                                         OverwritePrompt prompt)
    : target_root_(std::move(target_root)),
      policy_(policy),
      disk_space_(std::move(disk_space)),
      prompt_(std::move(prompt)) {
    if (!disk_space_) {
        disk_space_ = storage::available_bytes;
    }
}

fs::path AdmissionController::resolve_final_path(const protocol::FileMeta& file) const {
    std::error_code ec;
    if (fs::is_directory(target_root_, ec)) {
        return target_root_ / fs::path(file.name);
    }
    // single-entry transfer: the target root names the entry itself
    return target_root_;
}

AdmissionDecision AdmissionController::evaluate(const protocol::FileMeta& file) {
    fs::path rel(file.name);
    if (!is_safe_relative(rel)) {
        return AdmissionDecision::reject(protocol::ErrorCode::CONFLICT,
                                         "Invalid entry path: " + file.name);
    }

    std::error_code ec;
    if (is_tree_member(file) && fs::exists(target_root_, ec) && !fs::is_directory(target_root_, ec)) {
        return AdmissionDecision::reject(protocol::ErrorCode::CONFLICT,
                                         "Cannot receive directory to existing file: " + target_root_.string());
    }
    if (is_tree_member(file) && !fs::exists(target_root_, ec)) {
        fs::create_directories(target_root_, ec);
        if (ec) {
            throw errors::io_error("Failed to create directory " + target_root_.string(), ec);
        }
    }

    fs::path final_path = resolve_final_path(file);
    fs::file_status status = fs::status(final_path, ec);
    bool exists = fs::exists(status);

    if (file.is_dir && exists && !fs::is_directory(status)) {
        return AdmissionDecision::reject(protocol::ErrorCode::CONFLICT,
                                         "Cannot receive directory to existing file: " + final_path.string());
    }
    if (!file.is_dir && fs::is_directory(status)) {
        return AdmissionDecision::reject(protocol::ErrorCode::CONFLICT,
                                         "Cannot receive file over existing directory: " + final_path.string());
    }

    // An existing directory is merged into, not overwritten
    if (exists && !file.is_dir) {
        switch (policy_) {
            case OverwritePolicy::ALWAYS_YES:
                break;
            case OverwritePolicy::ALWAYS_NO:
                return AdmissionDecision::reject(protocol::ErrorCode::PERMISSION, "exists, skipping");
            case OverwritePolicy::ASK:
                if (!prompt_ || !prompt_(final_path)) {
                    return AdmissionDecision::reject(protocol::ErrorCode::PERMISSION, "declined");
                }
                break;
        }
    }

    uint64_t available = 0;
    if (!file.is_dir) {
        available = disk_space_(final_path);
        uint64_t required = required_space(file.size);
        if (available < required) {
            return AdmissionDecision::reject(protocol::ErrorCode::NO_SPACE,
                "Insufficient disk space. Need: " + storage::format_size(required) +
                ", Available: " + storage::format_size(available));
        }
    }

    fs::path to_create = file.is_dir ? final_path : final_path.parent_path();
    if (!to_create.empty()) {
        fs::create_directories(to_create, ec);
        if (ec) {
            throw errors::io_error("Failed to create directory " + to_create.string(), ec);
        }
    }

    return AdmissionDecision::accept(final_path, exists, available);
}

} // namespace admission
