#pragma once

#include <boost/asio/awaitable.hpp>
#include <core/model/agent_info.h>
#include <core/protocol/payloads.h>
#include <core/transfer/chunk.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace deckhand::core {

// Error envelope returned by the agent; code is one of ErrorCode
class RemoteError : public std::runtime_error {
public:
    RemoteError(int code, const std::string& message);

    int code() const { return code_; }

private:
    int code_;
};

// Every agent connection can at least describe itself and be closed. What else
// it can do is found by probing for the capability interfaces below with
// dynamic_cast.
class AgentConnection {
public:
    virtual ~AgentConnection() = default;

    virtual boost::asio::awaitable<AgentInfo> GetInfo() = 0;
    virtual void Close() = 0;
};

class UploaderCapability {
public:
    virtual ~UploaderCapability() = default;

    virtual boost::asio::awaitable<InitUploadResponse> InitUpload(const InitUploadRequest& request) = 0;
    virtual boost::asio::awaitable<UploadChunkResponse> UploadChunk(const std::string& upload_id,
                                                                    const Chunk& chunk) = 0;
    virtual boost::asio::awaitable<CompleteUploadResponse> CompleteUpload(
        const CompleteUploadRequest& request) = 0;
    virtual boost::asio::awaitable<void> CancelUpload(const std::string& upload_id) = 0;
};

class ShortcutManagerCapability {
public:
    virtual ~ShortcutManagerCapability() = default;

    virtual boost::asio::awaitable<ShortcutsResponse> ListShortcuts(const std::string& user_id) = 0;
    virtual boost::asio::awaitable<std::uint32_t> CreateShortcut(const std::string& user_id,
                                                                 const ShortcutConfig& shortcut) = 0;
    virtual boost::asio::awaitable<void> DeleteShortcut(const std::string& user_id,
                                                        std::uint32_t app_id) = 0;
    virtual boost::asio::awaitable<ArtworkResponse> ApplyArtwork(const std::string& user_id,
                                                                 std::uint32_t app_id,
                                                                 const ArtworkConfig& artwork) = 0;
};

class GameManagerCapability {
public:
    virtual ~GameManagerCapability() = default;

    virtual boost::asio::awaitable<std::vector<SteamUserInfo>> GetSteamUsers() = 0;
    virtual boost::asio::awaitable<void> DeleteGame(const std::string& user_id,
                                                    std::uint32_t app_id) = 0;
};

} // namespace deckhand::core
