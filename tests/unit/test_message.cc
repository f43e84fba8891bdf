#include <catch2/catch_test_macros.hpp>
#include <core/protocol/message.h>
#include <core/protocol/payloads.h>
#include <core/util/binary_message.h>

using namespace deckhand;
using namespace deckhand::core;

TEST_CASE("Message serializes to the envelope format", "[protocol]") {
    auto message = Message::Create("req-1", MessageType::kListShortcuts, ListShortcutsRequest{"12345"});

    auto j = nlohmann::json::parse(message.Serialize());

    REQUIRE(j["id"] == "req-1");
    REQUIRE(j["type"] == "list_shortcuts");
    REQUIRE(j["payload"]["user_id"] == "12345");
    REQUIRE_FALSE(j.contains("error"));
}

TEST_CASE("Message::Parse reads payload and error", "[protocol]") {
    auto message = Message::Parse(
        R"({"id":"r9","type":"error","error":{"code":401,"message":"not paired"}})");

    REQUIRE(message.id == "r9");
    REQUIRE(message.type == MessageType::kError);
    REQUIRE(message.IsError());
    REQUIRE(message.error->code == 401);
    REQUIRE(message.error->message == "not paired");

    auto reply = Message::Parse(
        R"({"id":"r1","type":"upload_init_response","payload":{"upload_id":"u","chunk_size":1048576,"resume_from":{"a.bin":10}}})");
    auto init = reply.PayloadAs<InitUploadResponse>();
    REQUIRE(init.upload_id == "u");
    REQUIRE(init.chunk_size == 1048576);
    REQUIRE(init.resume_from.at("a.bin") == 10);
}

TEST_CASE("Message::Parse rejects malformed envelopes", "[protocol]") {
    REQUIRE_THROWS_AS(Message::Parse("not json"), ProtocolError);
    REQUIRE_THROWS_AS(Message::Parse("[1,2]"), ProtocolError);
    REQUIRE_THROWS_AS(Message::Parse(R"({"id":"x"})"), ProtocolError);
    REQUIRE_THROWS_AS(Message::Parse(R"({"id":7,"type":"ping"})"), ProtocolError);
    REQUIRE_THROWS_AS(Message::Parse(R"({"id":"x","type":"launch_missiles"})"), ProtocolError);
}

TEST_CASE("A payload of the wrong shape is a protocol error", "[protocol]") {
    auto message = Message::Parse(R"({"id":"x","type":"delete_game","payload":{"app_id":"abc"}})");

    REQUIRE_THROWS_AS(message.PayloadAs<DeleteGameRequest>(), ProtocolError);
}

TEST_CASE("Replies echo the request id", "[protocol]") {
    auto request = Message::Create(Message::NewId(), MessageType::kGetInfo);

    auto reply = request.Reply(MessageType::kInfoResponse, InfoResponse{});
    auto error = request.ErrorReply(ErrorCode::kNotFound, "gone");

    REQUIRE(reply.id == request.id);
    REQUIRE(error.id == request.id);
    REQUIRE(error.error->code == 404);
    REQUIRE(Message::NewId() != Message::NewId());
}

TEST_CASE("Message types are classified", "[protocol]") {
    REQUIRE(ClassOf(MessageType::kHubConnected) == MessageClass::kHandshake);
    REQUIRE(ClassOf(MessageType::kInitUpload) == MessageClass::kRequest);
    REQUIRE(ClassOf(MessageType::kUploadCompleteResponse) == MessageClass::kResponse);
    REQUIRE(ClassOf(MessageType::kUploadProgress) == MessageClass::kEvent);

    REQUIRE(ResponseTypeOf(MessageType::kCompleteUpload) == MessageType::kUploadCompleteResponse);
    REQUIRE(ResponseTypeOf(MessageType::kCreateShortcut) == MessageType::kOperationResult);
    REQUIRE_FALSE(ResponseTypeOf(MessageType::kOperationResult).has_value());
    REQUIRE(ToString(MessageType::kPairConfirm) == "pair_confirm");
}

TEST_CASE("Binary frames carry a JSON header and raw bytes", "[protocol][binary]") {
    std::vector<std::uint8_t> data{1, 2, 3, 0, 255};
    nlohmann::json header{{"type", "upload_chunk"}, {"offset", 42}};

    auto frame = CreateBinaryMessage(header, data);
    auto parsed = ParseBinaryMessage(frame);

    REQUIRE(parsed);
    REQUIRE(parsed->header == header);
    REQUIRE(parsed->data == data);

    SECTION("truncated frames are rejected") {
        frame.resize(3);
        REQUIRE_FALSE(ParseBinaryMessage(frame));
    }

    SECTION("a header length past the end is rejected") {
        frame[0] = 0x7f;
        REQUIRE_FALSE(ParseBinaryMessage(frame));
    }
}
