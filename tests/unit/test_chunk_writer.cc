#include "../test_helpers.h"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <core/security/file_hasher.h>
#include <core/transfer/chunk_writer.h>
#include <core/transfer/transfer_error.h>

using namespace deckhand::core;
using deckhand::test::Pattern;
using deckhand::test::ReadFile;
using deckhand::test::TempDir;

namespace {

Chunk makeChunk(std::string path, std::uint64_t offset, std::vector<std::uint8_t> data) {
    Chunk chunk;
    chunk.file_path = std::move(path);
    chunk.offset = offset;
    chunk.checksum = FileHasher::CalculateDataChecksum(data);
    chunk.data = std::move(data);
    return chunk;
}

} // namespace

TEST_CASE("ChunkWriter writes chunks at their offsets", "[transfer][chunk_writer]") {
    TempDir dir;
    ChunkWriter writer(dir.path());
    auto first = Pattern(100, 1);
    auto second = Pattern(50, 2);

    writer.WriteChunk(makeChunk("bin/game.sh", 0, first));
    writer.WriteChunk(makeChunk("bin/game.sh", 100, second));

    auto on_disk = ReadFile(dir / "bin/game.sh");
    REQUIRE(on_disk.size() == 150);
    REQUIRE(std::equal(first.begin(), first.end(), on_disk.begin()));
    REQUIRE(std::equal(second.begin(), second.end(), on_disk.begin() + 100));
    REQUIRE(writer.ExistingSize("bin/game.sh") == 150);
    REQUIRE(writer.ExistingSize("missing.bin") == 0);
}

TEST_CASE("A corrupted chunk is rejected and leaves the file untouched", "[transfer][chunk_writer]") {
    TempDir dir;
    ChunkWriter writer(dir.path());
    auto original = Pattern(200, 3);
    writer.WriteChunk(makeChunk("data.pak", 0, original));

    auto corrupt = makeChunk("data.pak", 100, Pattern(100, 9));
    corrupt.data[10] ^= 0xff;

    try {
        writer.WriteChunk(corrupt);
        FAIL("expected a checksum mismatch");
    } catch (const TransferError& e) {
        REQUIRE(e.kind() == TransferErrorKind::kChecksumMismatch);
        REQUIRE(e.file() == "data.pak");
        REQUIRE(e.offset() == 100);
    }

    REQUIRE(ReadFile(dir / "data.pak") == original);
}

TEST_CASE("A corrupted first chunk does not create the file", "[transfer][chunk_writer]") {
    TempDir dir;
    ChunkWriter writer(dir.path());
    auto chunk = makeChunk("new.bin", 0, Pattern(64));
    chunk.checksum = FileHasher::CalculateDataChecksum(Pattern(64, 1));

    REQUIRE_THROWS_AS(writer.WriteChunk(chunk), TransferError);
    REQUIRE_FALSE(std::filesystem::exists(dir / "new.bin"));
}

TEST_CASE("An empty chunk creates an empty file", "[transfer][chunk_writer]") {
    TempDir dir;
    ChunkWriter writer(dir.path());

    writer.WriteChunk(makeChunk("empty.txt", 0, {}));

    REQUIRE(std::filesystem::exists(dir / "empty.txt"));
    REQUIRE(std::filesystem::file_size(dir / "empty.txt") == 0);
}

TEST_CASE("ResolveUploadPath refuses paths outside the root", "[transfer][chunk_writer]") {
    TempDir dir;

    REQUIRE(ResolveUploadPath(dir.path(), "a/b.txt") == (dir.path() / "a/b.txt").lexically_normal());

    for (const auto* bad : {"", "/etc/passwd", "../escape.txt", "a/../../escape.txt"}) {
        try {
            ResolveUploadPath(dir.path(), bad);
            FAIL("accepted " << bad);
        } catch (const TransferError& e) {
            REQUIRE(e.kind() == TransferErrorKind::kInvalidPath);
        }
    }
}

TEST_CASE("FileHasher produces SHA-256 hex digests", "[transfer][hash]") {
    std::string abc = "abc";
    std::vector<std::uint8_t> data(abc.begin(), abc.end());

    REQUIRE(FileHasher::CalculateDataChecksum(data)
            == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(FileHasher::CalculateDataChecksum({})
            == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    TempDir dir;
    deckhand::test::WriteFile(dir / "abc.txt", data);
    REQUIRE(FileHasher::CalculateFileChecksum(dir / "abc.txt")
            == FileHasher::CalculateDataChecksum(data));

    Sha256 incremental;
    incremental.Update(std::span<const std::uint8_t>(data).first(1));
    incremental.Update(std::span<const std::uint8_t>(data).subspan(1));
    REQUIRE(incremental.HexDigest() == FileHasher::CalculateDataChecksum(data));
}
