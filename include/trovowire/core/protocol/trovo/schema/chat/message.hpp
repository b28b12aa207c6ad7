#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "trovowire/core/protocol/trovo/enums/chat_message_type.hpp"
#include "lcr/optional.hpp"


namespace trovowire::core::protocol::trovo::schema::chat {

// ===============================================
// EMOTE
// ===============================================
// Image variants are published inconsistently: any of them may be missing.
struct Emote {
    std::string name;
    lcr::optional<std::string> url;
    lcr::optional<std::string> gifp;
    lcr::optional<std::string> webp;

    friend inline bool operator==(const Emote& a, const Emote& b) {
        return a.name == b.name && a.url == b.url && a.gifp == b.gifp && a.webp == b.webp;
    }
};

// ===============================================
// CHAT MESSAGE (one entry of a CHAT frame)
// ===============================================
//
// Required: message_id, nick_name, content.
// Everything else is optional: absent and JSON null both decode to "not
// present" and never fail the message.
struct ChatMessage {
    std::string message_id;
    std::string nick_name;
    std::string content;

    lcr::optional<ChatMessageType> type;        // Unknown when the code is not recognized
    lcr::optional<std::uint64_t> type_code;     // raw numeric "type"
    lcr::optional<std::int64_t> sender_id;      // absent on some system / anonymous messages
    lcr::optional<std::int64_t> send_time;      // unix seconds
    lcr::optional<std::string> avatar;
    lcr::optional<std::string> sub_lv;          // e.g. "sub_L1"
    lcr::optional<std::string> custom_role;     // JSON text as sent by the platform
    lcr::optional<std::string> content_data;    // raw JSON object text

    std::vector<std::string> medals;
    std::vector<std::string> decos;
    std::vector<std::string> roles;
    std::vector<Emote> emotes;
};

inline std::ostream& operator<<(std::ostream& os, const ChatMessage& m) {
    os << "[CHAT] id=" << m.message_id
       << " type=" << (m.type.has() ? to_string(m.type.value()) : std::string_view("null"))
       << " sender=" << lcr::to_string(m.sender_id)
       << " nick=" << m.nick_name
       << " content=" << m.content;
    return os;
}

// ===============================================
// DECODE FAILURE (one malformed entry)
// ===============================================
struct DecodeFailure {
    std::size_t index{0};                       // position inside the batch
    lcr::optional<std::string> message_id;      // when it could still be read
    std::string reason;
};

inline std::ostream& operator<<(std::ostream& os, const DecodeFailure& f) {
    return os << "[DECODE] index=" << f.index << " message_id=" << lcr::to_string(f.message_id) << " reason=" << f.reason;
}

} // namespace trovowire::core::protocol::trovo::schema::chat
