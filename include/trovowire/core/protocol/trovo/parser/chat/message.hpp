#pragma once

#include <string_view>

#include "trovowire/core/protocol/trovo/schema/chat/message.hpp"
#include "trovowire/core/protocol/trovo/parser/helpers.hpp"
#include "trovowire/core/protocol/trovo/parser/adapters.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace trovowire::core::protocol::trovo::parser::chat {

// Decodes one entry of a CHAT frame's "chats" array.
//
// On failure `field` names the offending field so the caller can report a
// per-message decode failure; the rest of the batch is unaffected.
struct message {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::chat::ChatMessage& out, std::string_view& field) noexcept {
        field = {};

        // Root must be an object
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            field = "<root>";
            TW_DEBUG("[PARSER] Chat entry is not an object -> skip entry.");
            return r;
        }

        // ---- Required fields ------------------------------------------------

        // message_id (required)
        r = helper::parse_string_required(root, "message_id", out.message_id);
        if (r != Result::Parsed) {
            field = "message_id";
            TW_WARN("[PARSER] Field 'message_id' missing or invalid in chat entry -> skip entry.");
            return r;
        }

        // nick_name (required)
        r = helper::parse_string_required(root, "nick_name", out.nick_name);
        if (r != Result::Parsed) {
            field = "nick_name";
            TW_WARN("[PARSER] Field 'nick_name' missing or invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        // content (required)
        r = helper::parse_string_required(root, "content", out.content);
        if (r != Result::Parsed) {
            field = "content";
            TW_WARN("[PARSER] Field 'content' missing or invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        // ---- Optional fields (absent / null never fail) ---------------------

        // type (optional)
        r = adapter::parse_chat_message_type_optional(root, out.type, out.type_code);
        if (r != Result::Parsed) {
            field = "type";
            TW_DEBUG("[PARSER] Field 'type' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        // sender_id (optional)
        r = adapter::parse_id_optional(root, "sender_id", out.sender_id);
        if (r != Result::Parsed) {
            field = "sender_id";
            TW_DEBUG("[PARSER] Field 'sender_id' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        // send_time (optional)
        r = helper::parse_int64_optional(root, "send_time", out.send_time);
        if (r != Result::Parsed) {
            field = "send_time";
            TW_DEBUG("[PARSER] Field 'send_time' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        // avatar (optional)
        r = helper::parse_string_optional(root, "avatar", out.avatar);
        if (r != Result::Parsed) {
            field = "avatar";
            TW_DEBUG("[PARSER] Field 'avatar' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        // sub_lv (optional)
        r = helper::parse_string_optional(root, "sub_lv", out.sub_lv);
        if (r != Result::Parsed) {
            field = "sub_lv";
            TW_DEBUG("[PARSER] Field 'sub_lv' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        // custom_role (optional)
        r = helper::parse_string_optional(root, "custom_role", out.custom_role);
        if (r != Result::Parsed) {
            field = "custom_role";
            TW_DEBUG("[PARSER] Field 'custom_role' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        // medals / decos / roles (optional lists)
        r = helper::parse_string_list_optional(root, "medals", out.medals);
        if (r != Result::Parsed) {
            field = "medals";
            TW_DEBUG("[PARSER] Field 'medals' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }
        r = helper::parse_string_list_optional(root, "decos", out.decos);
        if (r != Result::Parsed) {
            field = "decos";
            TW_DEBUG("[PARSER] Field 'decos' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }
        r = helper::parse_string_list_optional(root, "roles", out.roles);
        if (r != Result::Parsed) {
            field = "roles";
            TW_DEBUG("[PARSER] Field 'roles' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        // content_data (optional, kept as raw JSON)
        r = helper::parse_raw_json_optional(root, "content_data", out.content_data);
        if (r != Result::Parsed) {
            field = "content_data";
            return r;
        }

        // emotes (optional)
        r = adapter::parse_emotes_optional(root, out.emotes);
        if (r != Result::Parsed) {
            field = "emotes";
            TW_DEBUG("[PARSER] Field 'emotes' invalid in chat entry " << out.message_id << " -> skip entry.");
            return r;
        }

        return Result::Parsed;
    }
};

} // namespace trovowire::core::protocol::trovo::parser::chat
