#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <filesystem>
#include "protocol/messages.hpp"

namespace admission {

enum class OverwritePolicy {
    ASK,
    ALWAYS_YES,
    ALWAYS_NO
};

// Available bytes on the filesystem holding a path
using DiskSpaceQuery = std::function<uint64_t(const std::filesystem::path&)>;
// Asked under OverwritePolicy::ASK, true means overwrite
using OverwritePrompt = std::function<bool(const std::filesystem::path&)>;

struct AdmissionDecision {
    bool accepted = false;

    // Accepted
    std::filesystem::path final_path;
    bool destination_exists = false;
    uint64_t available_space = 0;

    // Rejected
    protocol::ErrorCode error_code = protocol::ErrorCode::NONE;
    std::string reason;

    static AdmissionDecision accept(const std::filesystem::path& final_path,
                                    bool destination_exists, uint64_t available_space);
    static AdmissionDecision reject(protocol::ErrorCode code, const std::string& reason);
};

// size plus a 10% margin, saturating at UINT64_MAX
uint64_t required_space(uint64_t size);

bool parse_overwrite_policy(const std::string& text, OverwritePolicy& policy);

class AdmissionController {
public:
    AdmissionController(std::filesystem::path target_root,
                        OverwritePolicy policy,
                        DiskSpaceQuery disk_space,
                        OverwritePrompt prompt = nullptr);

    std::filesystem::path resolve_final_path(const protocol::FileMeta& file) const;

    // May create directories, never removes or overwrites anything
    AdmissionDecision evaluate(const protocol::FileMeta& file);

private:
    std::filesystem::path target_root_;
    OverwritePolicy policy_;
    DiskSpaceQuery disk_space_;
    OverwritePrompt prompt_;
};

} // namespace admission
