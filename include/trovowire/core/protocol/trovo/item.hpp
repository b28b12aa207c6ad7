#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include "trovowire/core/protocol/trovo/error.hpp"
#include "trovowire/core/protocol/trovo/schema/chat/message.hpp"


namespace trovowire::core::protocol::trovo {

// ===============================================
// ITEM (one element of the chat sequence)
// ===============================================
//
//   Message      a decoded chat message
//   DecodeError  a malformed frame or entry, in arrival order
//   Fatal        terminal error, always the last item
struct Item {
    enum class Kind : std::uint8_t {
        Message,
        DecodeError,
        Fatal
    };

    Kind kind{Kind::Message};
    schema::chat::ChatMessage message;   // Kind::Message
    ChatError error;                     // Kind::DecodeError / Kind::Fatal

    [[nodiscard]]
    inline bool is_message() const noexcept {
        return kind == Kind::Message;
    }

    [[nodiscard]]
    static inline Item make_message(schema::chat::ChatMessage&& msg) {
        Item it;
        it.kind = Kind::Message;
        it.message = std::move(msg);
        return it;
    }

    [[nodiscard]]
    static inline Item make_decode_error(ChatError&& err) {
        Item it;
        it.kind = Kind::DecodeError;
        it.error = std::move(err);
        return it;
    }

    [[nodiscard]]
    static inline Item make_fatal(ChatError&& err) {
        Item it;
        it.kind = Kind::Fatal;
        it.error = std::move(err);
        return it;
    }
};

[[nodiscard]]
inline constexpr std::string_view to_string(Item::Kind k) noexcept {
    switch (k) {
        case Item::Kind::Message:     return "Message";
        case Item::Kind::DecodeError: return "DecodeError";
        case Item::Kind::Fatal:       return "Fatal";
        default:                      return "Unknown";
    }
}

} // namespace trovowire::core::protocol::trovo
