#include "../test_helpers.h"
#include <catch2/catch_test_macros.hpp>
#include <core/security/file_hasher.h>
#include <core/transfer/chunk_reader.h>
#include <core/transfer/transfer_error.h>

using namespace deckhand::core;
using deckhand::test::Pattern;
using deckhand::test::TempDir;
using deckhand::test::WriteFile;

TEST_CASE("BuildManifest lists regular files sorted by path", "[transfer][chunk_reader]") {
    TempDir dir;
    WriteFile(dir / "game.sh", Pattern(10));
    WriteFile(dir / "data/level1.pak", Pattern(20));
    WriteFile(dir / "data/a.pak", Pattern(5));
    std::filesystem::create_directories(dir / "empty_dir");

    auto manifest = BuildManifest(dir.path());

    REQUIRE(manifest.files.size() == 3);
    REQUIRE(manifest.files[0].relative_path == "data/a.pak");
    REQUIRE(manifest.files[1].relative_path == "data/level1.pak");
    REQUIRE(manifest.files[2].relative_path == "game.sh");
    REQUIRE(manifest.total_size == 35);
}

TEST_CASE("BuildManifest requires a directory", "[transfer][chunk_reader]") {
    TempDir dir;
    REQUIRE_THROWS_AS(BuildManifest(dir / "nope"), TransferError);
}

TEST_CASE("ChunkReader splits a file into full chunks and a partial tail", "[transfer][chunk_reader]") {
    TempDir dir;
    auto data = Pattern(2500);
    WriteFile(dir / "big.bin", data);

    ChunkReader reader(dir.path(), "big.bin", 1024);
    std::vector<Chunk> chunks;
    while (auto chunk = reader.Next()) {
        chunks.push_back(std::move(*chunk));
    }

    REQUIRE(chunks.size() == 3);
    REQUIRE(chunks[0].offset == 0);
    REQUIRE(chunks[0].size() == 1024);
    REQUIRE(chunks[1].offset == 1024);
    REQUIRE(chunks[1].size() == 1024);
    REQUIRE(chunks[2].offset == 2048);
    REQUIRE(chunks[2].size() == 452);
    for (const auto& chunk : chunks) {
        REQUIRE(chunk.checksum == FileHasher::CalculateDataChecksum(chunk.data));
        REQUIRE(chunk.file_path == "big.bin");
    }
}

TEST_CASE("ChunkReader resumes from an offset", "[transfer][chunk_reader]") {
    TempDir dir;
    WriteFile(dir / "big.bin", Pattern(2500));

    SECTION("mid file") {
        ChunkReader reader(dir.path(), "big.bin", 1024, 2000);
        auto chunk = reader.Next();
        REQUIRE(chunk);
        REQUIRE(chunk->offset == 2000);
        REQUIRE(chunk->size() == 500);
        REQUIRE_FALSE(reader.Next());
    }

    SECTION("past the end") {
        ChunkReader reader(dir.path(), "big.bin", 1024, 9000);
        REQUIRE_FALSE(reader.Next());
    }
}

TEST_CASE("ChunkReader emits one empty chunk for an empty file", "[transfer][chunk_reader]") {
    TempDir dir;
    WriteFile(dir / "empty.txt", {});

    ChunkReader reader(dir.path(), "empty.txt", 1024);
    auto chunk = reader.Next();
    REQUIRE(chunk);
    REQUIRE(chunk->size() == 0);
    REQUIRE(chunk->offset == 0);
    REQUIRE_FALSE(reader.Next());
}

TEST_CASE("ChunkReader rejects a zero chunk size", "[transfer][chunk_reader]") {
    TempDir dir;
    WriteFile(dir / "a.bin", Pattern(4));
    REQUIRE_THROWS_AS(ChunkReader(dir.path(), "a.bin", 0), std::invalid_argument);
}
