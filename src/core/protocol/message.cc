#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/protocol/message.h>

namespace deckhand::core {

using json = nlohmann::json;

Message Message::Create(std::string id, MessageType type) {
    Message message;
    message.id = std::move(id);
    message.type = type;
    return message;
}

Message Message::Reply(MessageType type) const {
    return Create(id, type);
}

Message Message::ErrorReply(ErrorCode code, std::string text) const {
    Message message = Create(id, MessageType::kError);
    message.error = MessageError{static_cast<int>(code), std::move(text)};
    return message;
}

std::string Message::Serialize() const {
    if (type == MessageType::kUnknown) {
        throw ProtocolError("cannot send a message of unknown type");
    }
    json j{
        {"id", id},
        {"type", type},
    };
    if (!payload.is_null()) {
        j["payload"] = payload;
    }
    if (error) {
        j["error"] = *error;
    }
    try {
        return j.dump();
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("failed to encode message: ") + e.what());
    }
}

Message Message::Parse(std::string_view text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("malformed message: ") + e.what());
    }
    if (!j.is_object()) {
        throw ProtocolError("malformed message: envelope is not an object");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        throw ProtocolError("malformed message: missing type");
    }
    if (j.contains("id") && !j["id"].is_string()) {
        throw ProtocolError("malformed message: id is not a string");
    }

    Message message;
    message.id = j.value("id", "");
    message.type = j["type"].get<MessageType>();
    if (message.type == MessageType::kUnknown) {
        throw ProtocolError("unknown message type: " + j["type"].get<std::string>());
    }
    if (j.contains("payload")) {
        message.payload = std::move(j["payload"]);
    }
    if (j.contains("error") && !j["error"].is_null()) {
        try {
            message.error = j["error"].get<MessageError>();
        } catch (const json::exception& e) {
            throw ProtocolError(std::string("malformed error field: ") + e.what());
        }
    }
    return message;
}

std::string Message::NewId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace deckhand::core
