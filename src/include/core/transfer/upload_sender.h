#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <core/constant/transfer.h>
#include <core/model/upload.h>
#include <core/network/client/capabilities.h>
#include <core/util/event_queue.h>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace deckhand::core {

struct UploadOptions {
    UploadConfig config;
    bool create_shortcut = false;
    std::string user_id;
    std::optional<ShortcutConfig> shortcut;
};

struct UploadResult {
    std::string upload_id;
    UploadStatus status = UploadStatus::kPending;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_sent = 0;    // this run only, resumed bytes excluded
    std::uint64_t bytes_resumed = 0; // already on the agent
    std::map<std::string, std::uint64_t> chunks_sent; // per relative path
    CompleteUploadResponse completion;
};

// Hub side of a transfer: manifest, init, chunk stream with checksum retries and
// resume, then completion
class UploadSender {
public:
    explicit UploadSender(UploaderCapability& uploader,
                          EventQueue<UploadProgress>* progress = nullptr,
                          int max_retries = transfer::kMaxChunkRetries);

    // Throws TransferError or RemoteError when the upload fails; a cancelled
    // upload returns with status kCancelled
    boost::asio::awaitable<UploadResult> Upload(const std::filesystem::path& root, UploadOptions options);

    // Stops before the next chunk and cancels the session on the agent
    void Cancel() { cancel_requested_ = true; }

private:
    UploaderCapability& uploader_;
    EventQueue<UploadProgress>* progress_;
    const int max_retries_;
    std::atomic<bool> cancel_requested_{false};
};

} // namespace deckhand::core
