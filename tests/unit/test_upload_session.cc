#include <catch2/catch_test_macros.hpp>
#include <core/transfer/transfer_error.h>
#include <core/transfer/upload_session.h>

using namespace deckhand::core;

namespace {

UploadSession makeSession() {
    return UploadSession("u1",
                         UploadConfig{.game_name = "Game"},
                         {FileEntry{"a.bin", 100}, FileEntry{"b.bin", 50}},
                         150);
}

} // namespace

TEST_CASE("UploadSession follows its state machine", "[transfer][session]") {
    auto session = makeSession();
    REQUIRE(session.status() == UploadStatus::kPending);

    SECTION("completion is final") {
        REQUIRE(session.Start());
        REQUIRE(session.status() == UploadStatus::kInProgress);
        REQUIRE_FALSE(session.Start());
        REQUIRE(session.Complete());
        REQUIRE_FALSE(session.Fail("late"));
        REQUIRE_FALSE(session.Cancel());
        REQUIRE(session.status() == UploadStatus::kCompleted);
    }

    SECTION("failure keeps its reason") {
        REQUIRE(session.Fail("disk full"));
        REQUIRE(session.status() == UploadStatus::kFailed);
        REQUIRE(session.error() == "disk full");
        REQUIRE(session.Progress().error == "disk full");
        REQUIRE_FALSE(session.IsActive());
    }

    SECTION("cancel from pending") {
        REQUIRE(session.Cancel());
        REQUIRE(session.status() == UploadStatus::kCancelled);
    }
}

TEST_CASE("UploadSession counts each byte once", "[transfer][session]") {
    auto session = makeSession();

    REQUIRE(session.RecordChunk("a.bin", 0, 60) == 60);
    REQUIRE(session.status() == UploadStatus::kInProgress);
    // retried chunk
    REQUIRE(session.RecordChunk("a.bin", 0, 60) == 0);
    // overlapping chunk
    REQUIRE(session.RecordChunk("a.bin", 40, 60) == 40);
    REQUIRE(session.RecordChunk("b.bin", 0, 50) == 50);

    REQUIRE(session.transferred_bytes() == 150);
    REQUIRE(session.Progress().percentage == 100.0);
}

TEST_CASE("UploadSession counts resumed bytes as transferred", "[transfer][session]") {
    auto session = makeSession();
    session.MarkResumed("a.bin", 70);
    session.MarkResumed("unknown.bin", 10);
    session.MarkResumed("b.bin", 500);

    REQUIRE(session.transferred_bytes() == 120);
    REQUIRE(session.resume_offsets().at("a.bin") == 70);
    REQUIRE(session.resume_offsets().at("b.bin") == 50);
    REQUIRE(session.resume_offsets().count("unknown.bin") == 0);

    REQUIRE(session.RecordChunk("a.bin", 70, 30) == 30);
    REQUIRE(session.transferred_bytes() == 150);
}

TEST_CASE("UploadSession validates chunks against the manifest", "[transfer][session]") {
    auto session = makeSession();

    REQUIRE_NOTHROW(session.ValidateChunk("a.bin", 90, 10));

    try {
        session.ValidateChunk("a.bin", 90, 11);
        FAIL("expected overflow");
    } catch (const TransferError& e) {
        REQUIRE(e.kind() == TransferErrorKind::kOverflow);
        REQUIRE(e.offset() == 90);
    }

    try {
        session.ValidateChunk("c.bin", 0, 1);
        FAIL("expected invalid path");
    } catch (const TransferError& e) {
        REQUIRE(e.kind() == TransferErrorKind::kInvalidPath);
    }
}

TEST_CASE("UploadSession refuses chunks once terminal", "[transfer][session]") {
    auto session = makeSession();
    session.Cancel();

    REQUIRE_THROWS_AS(session.RecordChunk("a.bin", 0, 10), TransferError);
    REQUIRE(session.transferred_bytes() == 0);
}
