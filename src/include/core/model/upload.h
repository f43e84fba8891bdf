#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace deckhand::core {

enum class UploadStatus {
    kPending,
    kInProgress,
    kCompleted,
    kFailed,
    kCancelled,
};

NLOHMANN_JSON_SERIALIZE_ENUM(UploadStatus,
                             {
                                 {UploadStatus::kPending, "pending"},
                                 {UploadStatus::kInProgress, "in_progress"},
                                 {UploadStatus::kCompleted, "completed"},
                                 {UploadStatus::kFailed, "failed"},
                                 {UploadStatus::kCancelled, "cancelled"},
                             });

inline bool IsTerminal(UploadStatus status) {
    return status == UploadStatus::kCompleted || status == UploadStatus::kFailed
           || status == UploadStatus::kCancelled;
}

// Destination and launch metadata of an upload
struct UploadConfig {
    std::string game_name;
    std::string install_path; // empty means the agent's configured install directory
    std::string executable;   // relative to the game directory
    std::string launch_options;
    std::vector<std::string> tags;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
        UploadConfig, game_name, install_path, executable, launch_options, tags)
};

struct FileEntry {
    std::string relative_path; // always '/' separated
    std::uint64_t size = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(FileEntry, relative_path, size)
};

struct UploadProgress {
    std::string upload_id;
    UploadStatus status = UploadStatus::kPending;
    std::uint64_t total_bytes = 0;
    std::uint64_t transferred_bytes = 0;
    std::string current_file;
    double percentage = 0.0;
    double speed_bps = 0.0;
    double eta_seconds = 0.0;
    std::string error;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(UploadProgress,
                                                upload_id,
                                                status,
                                                total_bytes,
                                                transferred_bytes,
                                                current_file,
                                                percentage,
                                                speed_bps,
                                                eta_seconds,
                                                error)
};

} // namespace deckhand::core
