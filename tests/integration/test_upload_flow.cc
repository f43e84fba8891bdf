#include "loopback_agent.h"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/steam/shortcuts.h>
#include <core/transfer/transfer_error.h>
#include <core/transfer/upload_sender.h>

using namespace deckhand::core;
using deckhand::test::LoopbackAgent;
using deckhand::test::Pattern;
using deckhand::test::ReadFile;
using deckhand::test::TempDir;
using deckhand::test::WriteFile;
namespace net = boost::asio;

namespace {

constexpr std::uint64_t kChunk = 1048576;

// 2,500,000 bytes over three files; big.bin needs two full chunks and a partial one
void writeGame(const TempDir& game) {
    WriteFile(game / "big.bin", Pattern(2200000, 1));
    WriteFile(game / "data/level1.pak", Pattern(200000, 2));
    WriteFile(game / "readme.txt", Pattern(100000, 3));
}

UploadResult upload(UploadSender& sender, const std::filesystem::path& root, UploadOptions options) {
    net::io_context ioc;
    auto future = net::co_spawn(ioc, sender.Upload(root, std::move(options)), net::use_future);
    ioc.run();
    return future.get();
}

UploadOptions gameOptions() {
    UploadOptions options;
    options.config.game_name = "Hollow Quest";
    options.config.executable = "big.bin";
    return options;
}

} // namespace

TEST_CASE("A three file upload arrives whole", "[upload][integration]") {
    TempDir game;
    writeGame(game);
    LoopbackAgent agent(kChunk);
    agent.Pair();

    deckhand::EventQueue<UploadProgress> progress(64);
    UploadSender sender(agent, &progress);
    auto result = upload(sender, game.path(), gameOptions());

    REQUIRE(result.status == UploadStatus::kCompleted);
    REQUIRE(result.total_bytes == 2500000);
    REQUIRE(result.bytes_sent == 2500000);
    REQUIRE(result.bytes_resumed == 0);
    REQUIRE(result.chunks_sent["big.bin"] == 3);
    REQUIRE(result.chunks_sent["data/level1.pak"] == 1);
    REQUIRE(result.chunks_sent["readme.txt"] == 1);

    auto session = agent.uploads().Get(result.upload_id);
    REQUIRE(session);
    REQUIRE(session->status() == UploadStatus::kCompleted);
    REQUIRE(session->transferred_bytes() == 2500000);

    auto installed = agent.dir() / "games/Hollow Quest";
    REQUIRE(result.completion.success);
    REQUIRE(result.completion.path == installed.string());
    REQUIRE(ReadFile(installed / "big.bin") == Pattern(2200000, 1));
    REQUIRE(ReadFile(installed / "data/level1.pak") == Pattern(200000, 2));
    REQUIRE(ReadFile(installed / "readme.txt") == Pattern(100000, 3));
    REQUIRE_FALSE(result.completion.shortcut_created);

    std::optional<UploadProgress> last;
    while (auto update = progress.Poll()) {
        last = update;
    }
    REQUIRE(last);
    REQUIRE(last->status == UploadStatus::kCompleted);
    REQUIRE(last->transferred_bytes == 2500000);

    auto operations = agent.sink().OfType(MessageType::kOperationEvent);
    REQUIRE(operations.size() == 2);
    REQUIRE(operations.back().payload["status"] == "complete");
}

TEST_CASE("An interrupted upload resumes where the agent left off", "[upload][integration]") {
    TempDir game;
    writeGame(game);
    LoopbackAgent agent(kChunk);
    agent.Pair();

    // first attempt got one chunk of big.bin and all of readme.txt across
    auto installed = agent.dir() / "games/Hollow Quest";
    auto big = Pattern(2200000, 1);
    WriteFile(installed / "big.bin", std::vector<std::uint8_t>(big.begin(), big.begin() + kChunk));
    WriteFile(installed / "readme.txt", Pattern(100000, 3));

    UploadSender sender(agent);
    auto result = upload(sender, game.path(), gameOptions());

    REQUIRE(result.status == UploadStatus::kCompleted);
    REQUIRE(result.bytes_resumed == kChunk + 100000);
    REQUIRE(result.bytes_sent == 2500000 - kChunk - 100000);
    REQUIRE(result.chunks_sent["big.bin"] == 2);
    REQUIRE_FALSE(result.chunks_sent.contains("readme.txt"));

    REQUIRE(agent.uploads().Get(result.upload_id)->transferred_bytes() == 2500000);
    REQUIRE(ReadFile(installed / "big.bin") == big);
}

TEST_CASE("Corrupted chunks are resent", "[upload][integration]") {
    TempDir game;
    writeGame(game);
    LoopbackAgent agent(kChunk);
    agent.Pair();

    SECTION("within the retry limit") {
        agent.CorruptNextChunks(2);
        UploadSender sender(agent);
        auto result = upload(sender, game.path(), gameOptions());

        REQUIRE(result.status == UploadStatus::kCompleted);
        REQUIRE(agent.chunk_calls() == agent.chunks_received() + 2);
        REQUIRE(ReadFile(agent.dir() / "games/Hollow Quest/big.bin") == Pattern(2200000, 1));
    }

    SECTION("until the retries run out") {
        agent.CorruptNextChunks(100);
        UploadSender sender(agent, nullptr, 3);

        try {
            upload(sender, game.path(), gameOptions());
            FAIL("upload should have failed");
        } catch (const RemoteError& e) {
            REQUIRE(e.code() == static_cast<int>(ErrorCode::kChecksumMismatch));
        }
        REQUIRE(agent.chunk_calls() == 4);
        REQUIRE(agent.chunks_received() == 0);
        // nothing of the rejected chunk reached the disk
        REQUIRE_FALSE(std::filesystem::exists(agent.dir() / "games/Hollow Quest/big.bin"));
    }
}

TEST_CASE("A cancelled upload leaves the session cancelled", "[upload][integration]") {
    TempDir game;
    writeGame(game);
    LoopbackAgent agent(kChunk);
    agent.Pair();

    UploadSender sender(agent);
    sender.Cancel();
    auto result = upload(sender, game.path(), gameOptions());

    REQUIRE(result.status == UploadStatus::kCancelled);
    REQUIRE(agent.uploads().Get(result.upload_id)->status() == UploadStatus::kCancelled);
    REQUIRE(agent.uploads().ActiveUploads().empty());
}

TEST_CASE("Uploading an empty directory fails before contacting the agent", "[upload][integration]") {
    TempDir game;
    LoopbackAgent agent(kChunk);
    agent.Pair();

    UploadSender sender(agent);
    REQUIRE_THROWS_AS(upload(sender, game.path(), gameOptions()), TransferError);
    REQUIRE(agent.uploads().ActiveUploads().empty());
}

TEST_CASE("A completed upload can become a library shortcut", "[upload][integration][steam]") {
    TempDir game;
    writeGame(game);
    LoopbackAgent agent(kChunk, true);
    std::filesystem::create_directories(agent.dir() / "steam/userdata/12345/config");
    agent.Pair();

    auto options = gameOptions();
    options.create_shortcut = true;
    options.user_id = "12345";
    options.config.tags = {"RPG", "Action"};

    UploadSender sender(agent);
    auto result = upload(sender, game.path(), options);

    REQUIRE(result.completion.shortcut_created);
    REQUIRE(result.completion.finalize_error.empty());
    REQUIRE((result.completion.app_id & 0x80000000u) != 0);

    ShortcutsFile shortcuts(agent.dir() / "steam/userdata/12345/config/shortcuts.vdf");
    shortcuts.Load();
    auto entry = shortcuts.Find(result.completion.app_id);
    REQUIRE(entry);
    REQUIRE(entry->name == "Hollow Quest");
    REQUIRE(entry->tags == std::vector<std::string>{"RPG", "Action"});
}

TEST_CASE("A shortcut for an unknown user is reported, the upload still stands", "[upload][integration][steam]") {
    TempDir game;
    writeGame(game);
    LoopbackAgent agent(kChunk, true);
    agent.Pair();

    auto options = gameOptions();
    options.create_shortcut = true;
    options.user_id = "777";

    UploadSender sender(agent);
    auto result = upload(sender, game.path(), options);

    REQUIRE(result.status == UploadStatus::kCompleted);
    REQUIRE(result.completion.success);
    REQUIRE_FALSE(result.completion.shortcut_created);
    REQUIRE_FALSE(result.completion.finalize_error.empty());
}
