#pragma once

#include <string>
#include <vector>

#include "trovowire/core/auth/access_token.hpp"
#include "trovowire/core/auth/concepts.hpp"
#include "trovowire/core/http/concepts.hpp"
#include "trovowire/core/http/config.hpp"
#include "trovowire/core/http/error.hpp"
#include "trovowire/core/http/response.hpp"
#include "lcr/optional.hpp"

/*
================================================================================
http::Client (Boost.Beast over OpenSSL)
================================================================================

Blocking request/response client for the platform's open REST API.

  • One TLS connection per request, bounded by Config::timeout.
  • No retry policy: every failure is reported once, classified through
    http::classify() into RequestError (transient) or
    AuthenticatedRequestError (credentials rejected).
  • The last API error body, when one was returned, is kept for diagnostics.
  • Access tokens are never logged in full.

Satisfies http::ChatTokenSourceConcept (consumed by the chat session) and
auth::RefreshApiConcept (consumed by OAuthTokenProvider).
================================================================================
*/

namespace trovowire::core::http {

class Client {
public:
    explicit Client(Config config);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // GET /chat/channel-token/{channel_id}
    [[nodiscard]]
    Error exchange_chat_token(const auth::AccessToken& token, const std::string& channel_id, auth::ChatToken& out) noexcept;

    // GET /chat/token (chat token for the authenticated user's own channel)
    [[nodiscard]]
    Error chat_token_for_user(const auth::AccessToken& token, auth::ChatToken& out) noexcept;

    // POST /refreshtoken
    [[nodiscard]]
    Error refresh(const std::string& refresh_token, const std::string& client_secret, auth::TokenGrant& out) noexcept;

    // POST /getusers
    [[nodiscard]]
    Error users(const std::vector<std::string>& usernames, std::vector<User>& out) noexcept;

    // Channel id of a single user, through users().
    [[nodiscard]]
    Error lookup_channel_id(const std::string& username, std::string& out) noexcept;

    // POST /chat/send
    [[nodiscard]]
    Error send_chat_message(const auth::AccessToken& token, const std::string& content,
                            const lcr::optional<std::string>& channel_id = {}) noexcept;

    [[nodiscard]]
    const lcr::optional<ApiError>& last_api_error() const noexcept {
        return last_api_error_;
    }

    [[nodiscard]]
    const Config& config() const noexcept {
        return config_;
    }

private:
    enum class Method { Get, Post };

    struct Request {
        Method method{Method::Get};
        std::string target;          // path below Config::base
        std::string body;            // JSON, POST only
        std::string authorization;   // empty: header omitted
    };

    struct Response {
        unsigned status{0};          // 0: no HTTP response received
        std::string body;
    };

    // Performs one request. Returns false when no HTTP response was received.
    [[nodiscard]]
    bool perform_(const Request& request, Response& response) noexcept;

    // Classifies a completed exchange and records the API error body, if any.
    [[nodiscard]]
    Error conclude_(const char* what, const Response& res) noexcept;

    Config config_;
    lcr::optional<ApiError> last_api_error_;
};

static_assert(ChatTokenSourceConcept<Client>);
static_assert(auth::RefreshApiConcept<Client>);

} // namespace trovowire::core::http
