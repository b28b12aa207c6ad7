#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "trovowire/core/auth/access_token.hpp"
#include "trovowire/core/http/error.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
REST response bodies
================================================================================

Decoders for the few JSON bodies the client consumes. Each returns false when
the body is not valid JSON or lacks a required field; the caller reports that
as a transient RequestError. Optional fields are left at their defaults.
================================================================================
*/

namespace trovowire::core::http {

// Entry of the /getusers response.
struct User {
    std::string user_id;
    std::string channel_id;
    std::string username;
    std::string nickname;
};

namespace response {

namespace detail {

[[nodiscard]]
inline bool copy_string(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    std::string_view sv;
    if (obj[key].get(sv)) {
        return false;
    }
    out.assign(sv.data(), sv.size());
    return true;
}

} // namespace detail

// {"status":<int>,"message":"..."}
[[nodiscard]]
inline bool parse_api_error(std::string_view body, ApiError& out) noexcept {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(body.data(), body.size()).get(root)) {
        return false;
    }
    std::int64_t status{};
    if (root["status"].get(status)) {
        return false;
    }
    out.status = static_cast<std::int32_t>(status);
    out.message.clear();
    (void)detail::copy_string(root, "message", out.message);
    return true;
}

// {"token":"..."}
[[nodiscard]]
inline bool parse_chat_token(std::string_view body, auth::ChatToken& out) noexcept {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(body.data(), body.size()).get(root)) {
        return false;
    }
    return detail::copy_string(root, "token", out.token) && !out.token.empty();
}

// {"access_token":"..","token_type":"..","expires_in":<n>,"refresh_token":".."}
[[nodiscard]]
inline bool parse_token_grant(std::string_view body, auth::TokenGrant& out) noexcept {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(body.data(), body.size()).get(root)) {
        return false;
    }
    if (!detail::copy_string(root, "access_token", out.access_token)) {
        return false;
    }
    out.refresh_token.clear();
    (void)detail::copy_string(root, "refresh_token", out.refresh_token);
    std::int64_t expires_in{0};
    if (root["expires_in"].get(expires_in)) {
        expires_in = 0;
    }
    out.expires_in = std::chrono::seconds(expires_in);
    return true;
}

// {"users":[{"user_id":"..","channel_id":"..","username":"..","nickname":".."}, ...]}
[[nodiscard]]
inline bool parse_users(std::string_view body, std::vector<User>& out) noexcept {
    out.clear();
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (parser.parse(body.data(), body.size()).get(root)) {
        return false;
    }
    simdjson::dom::array users;
    if (root["users"].get(users)) {
        return false;
    }
    for (auto entry : users) {
        User user;
        if (!detail::copy_string(entry, "channel_id", user.channel_id)) {
            return false;
        }
        (void)detail::copy_string(entry, "user_id", user.user_id);
        (void)detail::copy_string(entry, "username", user.username);
        (void)detail::copy_string(entry, "nickname", user.nickname);
        out.push_back(std::move(user));
    }
    return true;
}

} // namespace response
} // namespace trovowire::core::http
