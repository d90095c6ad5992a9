#include "../include/message_codec.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

InboundMessage decode_message(const std::string& raw, std::size_t max_bytes) {
    if (raw.size() > max_bytes) {
        throw ProtocolError(ProtocolErrorKind::OversizedMessage,
                            "message of " + std::to_string(raw.size()) + " bytes exceeds " +
                            std::to_string(max_bytes));
    }
    auto first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || raw[first] != '{') return InboundMessage{raw, Encoding::PlainText};

    auto j = json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return InboundMessage{raw, Encoding::PlainText};

    if (j.contains("type")) {
        if (!j["type"].is_string() || j["type"].get<std::string>() != "chat") {
            throw ProtocolError(ProtocolErrorKind::Malformed, "unsupported message type");
        }
    }
    for (const char* key : {"content", "payload", "text"}) {
        auto it = j.find(key);
        if (it == j.end()) continue;
        if (!it->is_string()) {
            throw ProtocolError(ProtocolErrorKind::Malformed, std::string("'") + key + "' must be a string");
        }
        return InboundMessage{it->get<std::string>(), Encoding::Json};
    }
    throw ProtocolError(ProtocolErrorKind::Malformed, "message has no content, payload or text field");
}

std::string encode_response(const std::string& text, Encoding encoding) {
    if (encoding == Encoding::PlainText) return text;
    return json{{"type", "response"}, {"content", text}}.dump();
}

std::string encode_error(const std::string& message, Encoding encoding) {
    if (encoding == Encoding::PlainText) return message;
    return json{{"type", "error"}, {"message", message}}.dump();
}
