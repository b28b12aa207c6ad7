#pragma once

#include "trovowire/core/protocol/trovo/schema/control/response.hpp"
#include "trovowire/core/protocol/trovo/parser/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

namespace trovowire::core::protocol::trovo::parser::control {

struct response {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::control::Response& out) noexcept {
        // Root must be an object
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            TW_DEBUG("[PARSER] Root not an object in RESPONSE -> ignore message.");
            return r;
        }

        // nonce (optional)
        r = helper::parse_string_optional(root, "nonce", out.nonce);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Field 'nonce' invalid in RESPONSE -> ignore message.");
            return r;
        }

        // error (optional): its presence turns the response into a rejection
        r = helper::parse_string_optional(root, "error", out.error);
        if (r != Result::Parsed) {
            TW_WARN("[PARSER] Field 'error' invalid in RESPONSE -> ignore message.");
            return r;
        }

        // code (optional)
        r = helper::parse_int64_optional(root, "code", out.code);
        if (r != Result::Parsed) {
            TW_DEBUG("[PARSER] Field 'code' invalid in RESPONSE -> ignore message.");
            return r;
        }

        return Result::Parsed;
    }
};

} // namespace trovowire::core::protocol::trovo::parser::control
