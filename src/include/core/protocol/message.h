#pragma once

#include <core/protocol/message_type.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace deckhand::core {

// Malformed envelope, unknown message type, or a payload that cannot be encoded
// or decoded
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ErrorCode : int {
    kBadRequest = 400,
    kUnauthorized = 401,
    kNotFound = 404,
    kNotAccepted = 406,
    kConflict = 409,
    kChecksumMismatch = 422,
    kInternal = 500,
    kNotImplemented = 501,
};

struct MessageError {
    int code = static_cast<int>(ErrorCode::kInternal);
    std::string message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(MessageError, code, message)
};

// The wire envelope. `id` is chosen by the requester and echoed verbatim in the
// reply; events carry a fresh id nobody waits on.
struct Message {
    std::string id;
    MessageType type = MessageType::kUnknown;
    nlohmann::json payload;
    std::optional<MessageError> error;

    template <typename T>
    static Message Create(std::string id, MessageType type, const T& payload) {
        Message message;
        message.id = std::move(id);
        message.type = type;
        try {
            message.payload = payload;
            // rejects strings that are not valid UTF-8 here rather than at send time
            (void) message.payload.dump();
        } catch (const nlohmann::json::exception& e) {
            throw ProtocolError(std::string("failed to encode payload: ") + e.what());
        }
        return message;
    }

    static Message Create(std::string id, MessageType type);

    template <typename T>
    Message Reply(MessageType type, const T& payload) const {
        return Create(id, type, payload);
    }

    Message Reply(MessageType type) const;
    Message ErrorReply(ErrorCode code, std::string text) const;

    // Leaves `out` untouched when the payload is empty
    template <typename T>
    void ParsePayload(T& out) const {
        if (payload.is_null() || (payload.is_object() && payload.empty())) {
            return;
        }
        try {
            payload.get_to(out);
        } catch (const nlohmann::json::exception& e) {
            throw ProtocolError(std::string("invalid ") + ToString(type)
                                + " payload: " + e.what());
        }
    }

    template <typename T>
    T PayloadAs() const {
        T out{};
        ParsePayload(out);
        return out;
    }

    bool IsError() const { return error.has_value(); }

    std::string Serialize() const;

    // Throws ProtocolError for anything that is not a well-formed envelope of a
    // known type
    static Message Parse(std::string_view text);

    static std::string NewId();
};

} // namespace deckhand::core
