#pragma once

#include <charconv>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "trovowire/core/protocol/trovo/enums/frame_type.hpp"
#include "trovowire/core/protocol/trovo/enums/chat_message_type.hpp"
#include "trovowire/core/protocol/trovo/schema/chat/message.hpp"
#include "trovowire/core/protocol/trovo/parser/result.hpp"
#include "trovowire/core/protocol/trovo/parser/helpers.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
Trovo Parsing Adapters (Domain-Level Converters)
================================================================================

Adapters sit between the low-level helpers (helper::parse_*) and the message
parsers, converting validated JSON primitives into Trovo domain values.

Responsibilities:
  • Convert primitive fields into domain types (FrameType, ChatMessageType,
    sender ids, emotes)
  • Absorb the platform's encoding inconsistencies (ids sent either as
    numbers or as numeric strings, nulls in place of missing fields)
  • Distinguish between invalid schema and invalid values

Separation of concerns:
  - helper::*   → JSON mechanics and type extraction
  - adapter::*  → Domain semantics and validation
  - parser::*   → Message orchestration, logging, and control flow

Adapters do NOT log.
================================================================================
*/


namespace trovowire::core::protocol::trovo::parser::adapter {

// ------------------------------------------------------------
// Frame type ("type" discriminant of every inbound frame)
// ------------------------------------------------------------
// A missing or non-string "type" is reported as FrameType::Unknown, not as a
// schema error: unknown frames are ignored, never fatal.
[[nodiscard]]
inline Result parse_frame_type(const simdjson::dom::element& root, FrameType& out) noexcept {
    out = FrameType::Unknown;
    if (helper::require_object(root) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (root["type"].get(sv)) {
        return Result::Parsed;
    }
    out = to_frame_type_fast(sv);
    return Result::Parsed;
}

// ------------------------------------------------------------
// Chat message type (numeric, optional)
// ------------------------------------------------------------
// Unrecognized codes decode to Unknown; the raw code is kept.
[[nodiscard]]
inline Result parse_chat_message_type_optional(const simdjson::dom::element& obj,
                                               lcr::optional<ChatMessageType>& out,
                                               lcr::optional<std::uint64_t>& raw) noexcept {
    out.reset();
    auto r = helper::parse_uint64_optional(obj, "type", raw);
    if (r != Result::Parsed || !raw.has()) {
        return r;
    }
    out = to_chat_message_type(raw.value());
    return Result::Parsed;
}

// ------------------------------------------------------------
// Integer id (optional): JSON integer or numeric string
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_id_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (helper::require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element field;
    if (!helper::lookup_present(obj, key, field)) {
        return Result::Parsed;
    }
    std::int64_t value{};
    if (!field.get(value)) {
        out = value;
        return Result::Parsed;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    if (sv.empty()) {
        return Result::Parsed; // "" carries no id
    }
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return Result::InvalidValue;
    }
    out = value;
    return Result::Parsed;
}

// ------------------------------------------------------------
// Emote list (optional)
// ------------------------------------------------------------
// Each emote requires a name; every image variant may be missing.
[[nodiscard]]
inline Result parse_emotes_optional(const simdjson::dom::element& obj, std::vector<schema::chat::Emote>& out) noexcept {
    out.clear();
    simdjson::dom::array arr;
    bool present = false;
    auto r = helper::parse_array_optional(obj, "emotes", arr, present);
    if (r != Result::Parsed || !present) {
        return r;
    }
    for (auto item : arr) {
        schema::chat::Emote emote;
        r = helper::parse_string_required(item, "name", emote.name);
        if (r != Result::Parsed) {
            return r;
        }
        if (emote.name.empty()) {
            return Result::InvalidValue;
        }
        r = helper::parse_string_optional(item, "url", emote.url);
        if (r != Result::Parsed) {
            return r;
        }
        r = helper::parse_string_optional(item, "gifp", emote.gifp);
        if (r != Result::Parsed) {
            return r;
        }
        r = helper::parse_string_optional(item, "webp", emote.webp);
        if (r != Result::Parsed) {
            return r;
        }
        out.push_back(std::move(emote));
    }
    return Result::Parsed;
}

} // namespace trovowire::core::protocol::trovo::parser::adapter
