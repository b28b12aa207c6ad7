#pragma once

#include "trovowire/core/protocol/trovo/schema/system/pong.hpp"
#include "trovowire/core/protocol/trovo/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace trovowire::core::protocol::trovo::parser::system {

struct pong {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::system::Pong& out) noexcept {
        // Root must be an object
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            TW_DEBUG("[PARSER] Root not an object in PONG -> ignore message.");
            return r;
        }

        // nonce (optional)
        r = helper::parse_string_optional(root, "nonce", out.nonce);
        if (r != Result::Parsed) {
            TW_DEBUG("[PARSER] Field 'nonce' invalid in PONG -> ignore message.");
            return r;
        }

        // data (optional)
        out.gap.reset();
        simdjson::dom::element data;
        bool present = false;
        r = helper::parse_object_optional(root, "data", data, present);
        if (r != Result::Parsed) {
            TW_DEBUG("[PARSER] Field 'data' invalid in PONG -> ignore message.");
            return r;
        }
        if (present) {
            // gap (optional)
            r = helper::parse_uint64_optional(data, "gap", out.gap);
            if (r != Result::Parsed) {
                TW_DEBUG("[PARSER] Field 'data.gap' invalid in PONG -> ignore message.");
                return r;
            }
        }

        return Result::Parsed;
    }
};

} // namespace trovowire::core::protocol::trovo::parser::system
