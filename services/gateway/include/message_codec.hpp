#pragma once
#include <cstddef>
#include <string>

enum class Encoding { PlainText, Json };

struct InboundMessage {
    std::string content;
    Encoding encoding{Encoding::PlainText};
};

// Text frames are either plain text or a JSON object carrying the query in
// "content", "payload" or "text". Throws ProtocolError.
InboundMessage decode_message(const std::string& raw, std::size_t max_bytes);

// Replies mirror the encoding of the message they answer.
std::string encode_response(const std::string& text, Encoding encoding);
std::string encode_error(const std::string& message, Encoding encoding);
