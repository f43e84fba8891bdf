#include <utility>
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>
#include <core/transfer/chunk_reader.h>
#include <core/transfer/progress_tracker.h>
#include <core/transfer/transfer_error.h>
#include <core/transfer/upload_sender.h>
#include <core/protocol/message.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace deckhand::core {

UploadSender::UploadSender(UploaderCapability& uploader,
                           EventQueue<UploadProgress>* progress,
                           int max_retries)
    : uploader_(uploader)
    , progress_(progress)
    , max_retries_(max_retries) {}

net::awaitable<UploadResult> UploadSender::Upload(const std::filesystem::path& root,
                                                  UploadOptions options) {
    auto manifest = BuildManifest(root);
    if (manifest.files.empty()) {
        throw TransferError(TransferErrorKind::kNotFound, "nothing to upload in " + root.string());
    }

    auto init = co_await uploader_.InitUpload(
        InitUploadRequest{options.config, manifest.total_size, manifest.files});
    auto chunk_size = std::clamp<std::uint64_t>(init.chunk_size == 0 ? transfer::kDefaultChunkSize
                                                                     : init.chunk_size,
                                                1,
                                                transfer::kMaxChunkSize);
    spdlog::info("Upload {} started: {} files, {} bytes, {} byte chunks",
                 init.upload_id,
                 manifest.files.size(),
                 manifest.total_size,
                 chunk_size);

    UploadResult result;
    result.upload_id = init.upload_id;
    result.total_bytes = manifest.total_size;

    auto executor = co_await net::this_coro::executor;
    auto tracker = std::make_shared<ProgressTracker>(executor,
                                                     init.upload_id,
                                                     manifest.total_size,
                                                     progress_);
    net::co_spawn(executor, [tracker]() { return tracker->Run(); }, net::detached);

    try {
        for (const auto& file : manifest.files) {
            std::uint64_t offset = 0;
            if (auto it = init.resume_from.find(file.relative_path); it != init.resume_from.end()) {
                offset = std::min(it->second, file.size);
            }
            if (offset > 0) {
                result.bytes_resumed += offset;
                tracker->AddResumed(offset);
                if (offset == file.size) {
                    spdlog::debug("Skipping {}, already on the agent", file.relative_path);
                    continue;
                }
                spdlog::info("Resuming {} at offset {}", file.relative_path, offset);
            }

            ChunkReader reader(root, file.relative_path, chunk_size, offset);
            while (auto chunk = reader.Next()) {
                if (cancel_requested_) {
                    co_await uploader_.CancelUpload(init.upload_id);
                    tracker->SetStatus(UploadStatus::kCancelled);
                    tracker->Stop();
                    result.status = UploadStatus::kCancelled;
                    spdlog::info("Upload {} cancelled", init.upload_id);
                    co_return result;
                }

                for (int attempt = 0;; ++attempt) {
                    try {
                        co_await uploader_.UploadChunk(init.upload_id, *chunk);
                        break;
                    } catch (const RemoteError& e) {
                        if (e.code() != static_cast<int>(ErrorCode::kChecksumMismatch)
                            || attempt >= max_retries_) {
                            throw;
                        }
                        spdlog::warn("Chunk {}@{} rejected ({}), resending",
                                     chunk->file_path,
                                     chunk->offset,
                                     e.what());
                    }
                }
                result.bytes_sent += chunk->size();
                ++result.chunks_sent[file.relative_path];
                tracker->Add(chunk->size(), file.relative_path);
            }
        }

        result.completion = co_await uploader_.CompleteUpload(CompleteUploadRequest{init.upload_id,
                                                                                    options.create_shortcut,
                                                                                    options.user_id,
                                                                                    options.shortcut});
    } catch (const std::exception& e) {
        tracker->SetStatus(UploadStatus::kFailed, e.what());
        tracker->Stop();
        spdlog::error("Upload {} failed: {}", init.upload_id, e.what());
        throw;
    }

    result.status = UploadStatus::kCompleted;
    tracker->SetStatus(UploadStatus::kCompleted);
    tracker->Stop();
    if (!result.completion.finalize_error.empty()) {
        spdlog::warn("Upload {} transferred but finalize failed: {}",
                     init.upload_id,
                     result.completion.finalize_error);
    }
    co_return result;
}

} // namespace deckhand::core
