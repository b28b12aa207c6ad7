#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "trovowire/core/protocol/trovo/schema/chat/batch.hpp"
#include "trovowire/core/protocol/trovo/parser/helpers.hpp"
#include "trovowire/core/protocol/trovo/parser/chat/message.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace trovowire::core::protocol::trovo::parser::chat {

// Decodes a CHAT frame.
//
// Frame-level problems (root or "data" of the wrong type) fail the whole
// frame. Entry-level problems never do: each entry of "chats" is decoded on
// its own and a malformed one becomes a DecodeFailure at its position.
struct batch {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::chat::Batch& out) noexcept {
        out.entries.clear();

        // Root must be an object
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            TW_DEBUG("[PARSER] Root not an object in CHAT -> ignore message.");
            return r;
        }

        // channel_info.channel_id (optional)
        out.channel_id.reset();
        simdjson::dom::element channel_info;
        bool present = false;
        r = helper::parse_object_optional(root, "channel_info", channel_info, present);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Field 'channel_info' invalid in CHAT -> ignore message.");
            return r;
        }
        if (present) {
            r = helper::parse_string_optional(channel_info, "channel_id", out.channel_id);
            if (r != Result::Parsed) {
                TW_WARN("[PARSER] Field 'channel_info.channel_id' invalid in CHAT -> ignore message.");
                return r;
            }
        }

        // data (optional: a CHAT frame without data carries no messages)
        out.eid.reset();
        simdjson::dom::element data;
        r = helper::parse_object_optional(root, "data", data, present);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Field 'data' invalid in CHAT -> ignore message.");
            return r;
        }
        if (!present) {
            return Result::Parsed;
        }

        // data.eid (optional)
        r = helper::parse_string_optional(data, "eid", out.eid);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Field 'data.eid' invalid in CHAT -> ignore message.");
            return r;
        }

        // data.chats (optional, default empty)
        simdjson::dom::array chats;
        r = helper::parse_array_optional(data, "chats", chats, present);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Field 'data.chats' invalid in CHAT -> ignore message.");
            return r;
        }
        if (!present) {
            return Result::Parsed;
        }

        std::size_t index = 0;
        for (auto item : chats) {
            schema::chat::Batch::Entry entry;
            schema::chat::ChatMessage msg;
            std::string_view field;
            const Result mr = message::parse(item, msg, field);
            if (mr == Result::Parsed) {
                entry.message = std::move(msg);
            }
            else {
                entry.failure.index = index;
                if (!msg.message_id.empty()) {
                    entry.failure.message_id = msg.message_id;
                }
                entry.failure.reason = "field '" + std::string(field) + "': " + std::string(to_string(mr));
            }
            out.entries.push_back(std::move(entry));
            ++index;
        }

        return Result::Parsed;
    }
};

} // namespace trovowire::core::protocol::trovo::parser::chat
