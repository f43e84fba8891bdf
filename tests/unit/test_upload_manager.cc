#include "../test_helpers.h"
#include <algorithm>
#include <array>
#include <catch2/catch_test_macros.hpp>
#include <core/security/file_hasher.h>
#include <core/transfer/transfer_error.h>
#include <core/transfer/upload_manager.h>

using namespace deckhand::core;
using deckhand::test::Pattern;
using deckhand::test::ReadFile;
using deckhand::test::TempDir;
using deckhand::test::WriteFile;

namespace {

Chunk chunkOf(const std::string& path, std::uint64_t offset, std::vector<std::uint8_t> data) {
    Chunk chunk;
    chunk.file_path = path;
    chunk.offset = offset;
    chunk.checksum = FileHasher::CalculateDataChecksum(data);
    chunk.data = std::move(data);
    return chunk;
}

} // namespace

TEST_CASE("UploadManager receives a whole game", "[transfer][upload_manager]") {
    TempDir dir;
    UploadManager manager(dir.path(), 64);
    auto session = manager.Init(UploadConfig{.game_name = "Game"},
                                150,
                                {FileEntry{"a.bin", 100}, FileEntry{"sub/b.bin", 50}});
    auto a = Pattern(100, 1);
    auto b = Pattern(50, 2);

    manager.WriteChunk(session->id(), chunkOf("a.bin", 0, {a.begin(), a.begin() + 64}));
    manager.WriteChunk(session->id(), chunkOf("a.bin", 64, {a.begin() + 64, a.end()}));
    auto progress = manager.WriteChunk(session->id(), chunkOf("sub/b.bin", 0, b));

    REQUIRE(progress.transferred_bytes == 150);
    REQUIRE(progress.status == UploadStatus::kInProgress);

    auto completed = manager.Complete(session->id());
    REQUIRE(completed->status() == UploadStatus::kCompleted);
    REQUIRE(ReadFile(dir / "Game/a.bin") == a);
    REQUIRE(ReadFile(dir / "Game/sub/b.bin") == b);

    SECTION("a finished session stays inspectable but inactive") {
        REQUIRE(manager.Get(session->id()) == completed);
        REQUIRE(manager.ActiveUploads().empty());
        try {
            manager.WriteChunk(session->id(), chunkOf("a.bin", 0, a));
            FAIL("expected not_active");
        } catch (const TransferError& e) {
            REQUIRE(e.kind() == TransferErrorKind::kNotActive);
        }
    }
}

TEST_CASE("UploadManager keeps a session alive after a checksum mismatch", "[transfer][upload_manager]") {
    TempDir dir;
    UploadManager manager(dir.path());
    auto session = manager.Init(UploadConfig{.game_name = "Game"}, 10, {FileEntry{"a.bin", 10}});

    auto bad = chunkOf("a.bin", 0, Pattern(10));
    bad.data[0] ^= 0x01;
    try {
        manager.WriteChunk(session->id(), bad);
        FAIL("expected checksum mismatch");
    } catch (const TransferError& e) {
        REQUIRE(e.kind() == TransferErrorKind::kChecksumMismatch);
    }
    REQUIRE(session->IsActive());
    REQUIRE(session->transferred_bytes() == 0);

    manager.WriteChunk(session->id(), chunkOf("a.bin", 0, Pattern(10)));
    REQUIRE(session->transferred_bytes() == 10);
}

TEST_CASE("UploadManager reports resume offsets from files on disk", "[transfer][upload_manager]") {
    TempDir dir;
    WriteFile(dir / "Game/a.bin", Pattern(40));
    WriteFile(dir / "Game/b.bin", Pattern(80));
    UploadManager manager(dir.path());

    auto session = manager.Init(UploadConfig{.game_name = "Game"},
                                150,
                                {FileEntry{"a.bin", 100}, FileEntry{"b.bin", 50}});

    auto offsets = session->resume_offsets();
    REQUIRE(offsets.at("a.bin") == 40);
    REQUIRE(offsets.at("b.bin") == 50);
    REQUIRE(session->transferred_bytes() == 90);
}

TEST_CASE("UploadManager refuses incomplete completion", "[transfer][upload_manager]") {
    TempDir dir;
    UploadManager manager(dir.path());
    auto session = manager.Init(UploadConfig{.game_name = "Game"}, 10, {FileEntry{"a.bin", 10}});

    try {
        manager.Complete(session->id());
        FAIL("expected incomplete");
    } catch (const TransferError& e) {
        REQUIRE(e.kind() == TransferErrorKind::kIncomplete);
    }
    REQUIRE(session->IsActive());
}

TEST_CASE("UploadManager cancels and forgets unknown ids", "[transfer][upload_manager]") {
    TempDir dir;
    UploadManager manager(dir.path());
    auto session = manager.Init(UploadConfig{.game_name = "Game"}, 10, {FileEntry{"a.bin", 10}});

    manager.Cancel(session->id());
    REQUIRE(session->status() == UploadStatus::kCancelled);

    try {
        manager.Cancel("no-such-upload");
        FAIL("expected not_found");
    } catch (const TransferError& e) {
        REQUIRE(e.kind() == TransferErrorKind::kNotFound);
    }
}

TEST_CASE("UploadManager validates the manifest", "[transfer][upload_manager]") {
    TempDir dir;
    UploadManager manager(dir.path());

    REQUIRE_THROWS_AS(manager.Init(UploadConfig{.game_name = ".."}, 0, {}), TransferError);
    REQUIRE_THROWS_AS(manager.Init(UploadConfig{.game_name = "Game"}, 2,
                                   {FileEntry{"a.bin", 1}, FileEntry{"a.bin", 1}}),
                      TransferError);
    REQUIRE_THROWS_AS(manager.Init(UploadConfig{.game_name = "Game"}, 1, {FileEntry{"../x", 1}}),
                      TransferError);
}

TEST_CASE("UploadManager rejects a declared total that disagrees with the files", "[transfer][upload_manager]") {
    TempDir dir;
    UploadManager manager(dir.path());

    for (std::uint64_t declared : {std::uint64_t{0}, std::uint64_t{11}, std::uint64_t{9}}) {
        try {
            manager.Init(UploadConfig{.game_name = "Game"}, declared, {FileEntry{"a.bin", 10}});
            FAIL("expected bad_manifest for " << declared);
        } catch (const TransferError& e) {
            REQUIRE(e.kind() == TransferErrorKind::kBadManifest);
        }
    }
    REQUIRE(manager.ActiveUploads().empty());
    REQUIRE_FALSE(std::filesystem::exists(dir / "Game/a.bin"));
}

TEST_CASE("UploadManager assembles a file from chunks in any order", "[transfer][upload_manager]") {
    TempDir dir;
    UploadManager manager(dir.path(), 25);
    auto data = Pattern(100, 7);

    std::array<std::size_t, 4> order{0, 1, 2, 3};
    int round = 0;
    do {
        auto game = "Game" + std::to_string(round++);
        auto session = manager.Init(UploadConfig{.game_name = game}, data.size(), {FileEntry{"a.bin", data.size()}});

        for (auto index : order) {
            auto begin = data.begin() + static_cast<std::ptrdiff_t>(index * 25);
            manager.WriteChunk(session->id(), chunkOf("a.bin", index * 25, {begin, begin + 25}));
        }

        REQUIRE(session->transferred_bytes() == data.size());
        REQUIRE(ReadFile(dir / game / "a.bin") == data);
        REQUIRE(manager.Complete(session->id())->status() == UploadStatus::kCompleted);
    } while (std::next_permutation(order.begin(), order.end()));

    REQUIRE(round == 24);
}
