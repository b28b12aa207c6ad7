#pragma once

#include <string_view>
#include <utility>

#include <simdjson.h>

#include "trovowire/core/protocol/trovo/enums.hpp"
#include "trovowire/core/protocol/trovo/context.hpp"
#include "trovowire/core/protocol/trovo/parser/adapters.hpp"
#include "trovowire/core/protocol/trovo/parser/control/response.hpp"
#include "trovowire/core/protocol/trovo/parser/system/pong.hpp"
#include "trovowire/core/protocol/trovo/parser/chat/batch.hpp"
#include "lcr/log/logger.hpp"


namespace trovowire::core::protocol::trovo::parser {

/*
================================================================================
Trovo Chat WebSocket Parsing Architecture
================================================================================

The parser layer is structured into four roles.

-------------------------------------------------------------------------------
1) Parser Router (Frame Dispatch)
-------------------------------------------------------------------------------
  • Parses the raw text frame into a DOM
  • Reads the "type" discriminant and selects the message parser
  • Delivers the decoded frame into the Context rings

Unknown discriminants (including a missing "type") are counted and ignored,
so server-side additions never break a session.

-------------------------------------------------------------------------------
2) Message Parsers (Protocol-Level Validation)
-------------------------------------------------------------------------------
RESPONSE, PONG and CHAT. They validate required vs optional fields, log
actionable diagnostics and populate the schema structures. The CHAT parser
decodes each entry independently: one malformed message becomes a
DecodeFailure at its position, the others are kept.

-------------------------------------------------------------------------------
3) Adapters (Domain-Aware Field Parsing)
-------------------------------------------------------------------------------
Frame type, chat message type, ids sent as numbers or strings, emotes.

-------------------------------------------------------------------------------
4) Helpers (Low-Level JSON Primitives)
-------------------------------------------------------------------------------
Strict type extraction. Missing and null optional fields both mean absent.

================================================================================
*/

class Router {
public:
    explicit Router(ContextView& ctx)
        : ctx_view_(ctx)
    {
    }

    // Main entry point
    [[nodiscard]]
    inline Result parse_and_route(std::string_view raw_msg) noexcept {
        // Parse JSON message
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            TW_WARN("[PARSER] JSON parse error: " << simdjson::error_message(error) << " in message: " << raw_msg);
            return Result::InvalidJson;
        }
        // TYPE DISPATCH
        FrameType type;
        auto r = adapter::parse_frame_type(root, type);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Frame root is not an object -> ignore message.");
            return r;
        }
        switch (type) {
            case FrameType::Response:
                return parse_response_(root);
            case FrameType::Pong:
                return parse_pong_(root);
            case FrameType::Chat:
                return parse_chat_(root);
            default:
                ++ctx_view_.unknown_frames;
                TW_DEBUG("[PARSER] Unhandled frame type -> ignore: " << raw_msg);
                return Result::Ignored;
        }
    }

private:
    // Context view (non-owning)
    ContextView& ctx_view_;

    // Underlying simdjson parser
    simdjson::dom::parser parser_;

private:
    [[nodiscard]]
    inline Result parse_response_(const simdjson::dom::element& root) noexcept {
        schema::control::Response resp;
        auto r = control::response::parse(root, resp);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Failed to parse RESPONSE.");
            return r;
        }
        if (!ctx_view_.response_ring.push(std::move(resp))) {
            TW_WARN("[PARSER] Response ring full - message has not been delivered.");
            return Result::Backpressure;
        }
        return Result::Delivered;
    }

    [[nodiscard]]
    inline Result parse_pong_(const simdjson::dom::element& root) noexcept {
        schema::system::Pong pong;
        auto r = system::pong::parse(root, pong);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Failed to parse PONG.");
            return r;
        }
        if (!ctx_view_.pong_ring.push(std::move(pong))) {
            TW_WARN("[PARSER] Pong ring full - message has not been delivered.");
            return Result::Backpressure;
        }
        return Result::Delivered;
    }

    [[nodiscard]]
    inline Result parse_chat_(const simdjson::dom::element& root) noexcept {
        schema::chat::Batch batch;
        auto r = chat::batch::parse(root, batch);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Failed to parse CHAT.");
            return r;
        }
        if (batch.entries.empty()) {
            TW_TRACE("[PARSER] CHAT frame without messages (eid " << lcr::to_string(batch.eid) << ")");
            return Result::Delivered;
        }
        if (!ctx_view_.chat_ring.push(std::move(batch))) {
            TW_WARN("[PARSER] Chat ring full - message has not been delivered.");
            return Result::Backpressure;
        }
        return Result::Delivered;
    }
};

} // namespace trovowire::core::protocol::trovo::parser
