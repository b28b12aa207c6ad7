#include "trovowire/core/http/client.hpp"

#include <exception>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>

#include "trovowire/core/config/endpoints.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

namespace bb    = boost::beast;
namespace bhttp = boost::beast::http;
namespace net   = boost::asio;
namespace ssl   = boost::asio::ssl;
using tcp       = boost::asio::ip::tcp;

namespace trovowire::core::http {

Client::Client(Config config)
    : config_(std::move(config))
{}

// ============================================================================
// TRANSPORT
// ============================================================================

bool Client::perform_(const Request& request, Response& response) noexcept {
    response.status = 0;
    response.body.clear();
    const std::string target = config_.base + request.target;
    const char* verb = (request.method == Method::Get) ? "GET" : "POST";
    TW_DEBUG("[HTTP] " << verb << " " << target);

    try {
        net::io_context ioc;
        ssl::context ctx(ssl::context::tlsv12_client);
        bb::error_code trust_ec;
        ctx.set_default_verify_paths(trust_ec);
        if (trust_ec) {
            TW_WARN("[HTTP] Unable to load system trust store: " << trust_ec.message());
        }
        ctx.set_verify_mode(config_.verify_peer ? ssl::verify_peer : ssl::verify_none);

        bb::ssl_stream<bb::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), config_.host.c_str())) {
            TW_ERROR("[HTTP] Failed to set SNI host name");
            return false;
        }
        if (config_.verify_peer) {
            stream.set_verify_callback(ssl::host_name_verification(config_.host));
        }

        bhttp::request<bhttp::string_body> req{
            request.method == Method::Get ? bhttp::verb::get : bhttp::verb::post, target, 11};
        req.set(bhttp::field::host, config_.host);
        req.set(bhttp::field::user_agent, std::string(config::USER_AGENT));
        req.set(bhttp::field::accept, "application/json");
        req.set("Client-ID", config_.client_id.str());
        if (!request.authorization.empty()) {
            req.set(bhttp::field::authorization, request.authorization);
        }
        if (request.method == Method::Post) {
            req.set(bhttp::field::content_type, "application/json");
            req.body() = request.body;
            req.prepare_payload();
        }

        bb::flat_buffer buffer;
        bhttp::response<bhttp::string_body> res;
        tcp::resolver resolver(ioc);
        bool received = false;
        bool done = false;
        auto& lowest = bb::get_lowest_layer(stream);

        auto fail = [&](const char* stage, const bb::error_code& ec) {
            TW_WARN("[HTTP] " << stage << " failed: " << ec.message());
            done = true;
        };

        resolver.async_resolve(config_.host, config_.port, [&](const bb::error_code& ec, tcp::resolver::results_type results) {
            if (ec) { fail("Resolve", ec); return; }
            lowest.expires_after(config_.timeout);
            lowest.async_connect(results, [&](const bb::error_code& ec, const tcp::endpoint&) {
                if (ec) { fail("Connect", ec); return; }
                stream.async_handshake(ssl::stream_base::client, [&](const bb::error_code& ec) {
                    if (ec) { fail("TLS handshake", ec); return; }
                    bhttp::async_write(stream, req, [&](const bb::error_code& ec, std::size_t) {
                        if (ec) { fail("Write", ec); return; }
                        bhttp::async_read(stream, buffer, res, [&](const bb::error_code& ec, std::size_t) {
                            if (ec) { fail("Read", ec); return; }
                            received = true;
                            done = true;
                            // Graceful TLS shutdown is skipped: one request per connection.
                            bb::error_code ignored;
                            lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);
                        });
                    });
                });
            });
        });

        ioc.run_for(config_.timeout);
        if (!done) {
            TW_WARN("[HTTP] Request timed out after " << config_.timeout.count() << " ms");
            resolver.cancel();
            bb::error_code ignored;
            lowest.socket().close(ignored);
            ioc.restart();
            ioc.run(); // drain aborted handlers, they reference this frame
            return false;
        }
        if (!received) {
            return false;
        }
        response.status = res.result_int();
        response.body = std::move(res.body());
        TW_DEBUG("[HTTP] " << verb << " " << target << " -> " << response.status);
        return true;
    }
    catch (const std::exception& ex) {
        TW_ERROR("[HTTP] Request failed: " << ex.what());
        return false;
    }
}

Error Client::conclude_(const char* what, const Response& res) noexcept {
    last_api_error_.reset();
    if (res.status == 0) {
        TW_WARN("[HTTP] " << what << ": no response");
        return Error::RequestError;
    }
    if (res.status < 200 || res.status >= 300) {
        ApiError api;
        if (response::parse_api_error(res.body, api)) {
            last_api_error_ = api;
        }
    }
    const Error err = classify(res.status, last_api_error_);
    if (err != Error::None) {
        if (last_api_error_.has()) {
            TW_WARN("[HTTP] " << what << " rejected: HTTP " << res.status
                    << ", status " << last_api_error_.value().status << " (" << last_api_error_.value().message << ") -> " << to_string(err));
        } else {
            TW_WARN("[HTTP] " << what << " rejected: HTTP " << res.status << " -> " << to_string(err));
        }
    }
    return err;
}

// ============================================================================
// ENDPOINTS
// ============================================================================

Error Client::exchange_chat_token(const auth::AccessToken& token, const std::string& channel_id, auth::ChatToken& out) noexcept {
    Request req;
    req.method = Method::Get;
    req.target = "/chat/channel-token/" + channel_id;
    if (!token.value.empty()) {
        req.authorization = "OAuth " + token.value;
    }
    Response res;
    (void)perform_(req, res);
    const Error err = conclude_("Chat token exchange", res);
    if (err != Error::None) {
        return err;
    }
    if (!response::parse_chat_token(res.body, out)) {
        TW_WARN("[HTTP] Chat token response could not be decoded");
        return Error::RequestError;
    }
    TW_DEBUG("[HTTP] Chat token obtained for channel " << channel_id << " (" << auth::redact(out.token) << ")");
    return Error::None;
}

Error Client::chat_token_for_user(const auth::AccessToken& token, auth::ChatToken& out) noexcept {
    Request req;
    req.method = Method::Get;
    req.target = "/chat/token";
    req.authorization = "OAuth " + token.value;
    Response res;
    (void)perform_(req, res);
    const Error err = conclude_("User chat token", res);
    if (err != Error::None) {
        return err;
    }
    if (!response::parse_chat_token(res.body, out)) {
        TW_WARN("[HTTP] Chat token response could not be decoded");
        return Error::RequestError;
    }
    return Error::None;
}

Error Client::refresh(const std::string& refresh_token, const std::string& client_secret, auth::TokenGrant& out) noexcept {
    Request req;
    req.method = Method::Post;
    req.target = "/refreshtoken";
    req.body.reserve(128 + refresh_token.size() + client_secret.size());
    req.body += '{';
    lcr::json::append_string_field(req.body, "client_secret", client_secret);
    req.body += ',';
    lcr::json::append_string_field(req.body, "grant_type", "refresh_token");
    req.body += ',';
    lcr::json::append_string_field(req.body, "refresh_token", refresh_token);
    req.body += '}';
    Response res;
    (void)perform_(req, res);
    const Error err = conclude_("Token refresh", res);
    if (err != Error::None) {
        return err;
    }
    if (!response::parse_token_grant(res.body, out)) {
        TW_WARN("[HTTP] Token refresh response could not be decoded");
        return Error::RequestError;
    }
    return Error::None;
}

Error Client::users(const std::vector<std::string>& usernames, std::vector<User>& out) noexcept {
    Request req;
    req.method = Method::Post;
    req.target = "/getusers";
    req.body = "{\"user\":[";
    for (std::size_t i = 0; i < usernames.size(); ++i) {
        if (i > 0) {
            req.body += ',';
        }
        req.body += '"';
        lcr::json::append_escaped(req.body, usernames[i]);
        req.body += '"';
    }
    req.body += "]}";
    Response res;
    (void)perform_(req, res);
    const Error err = conclude_("User lookup", res);
    if (err != Error::None) {
        return err;
    }
    if (!response::parse_users(res.body, out)) {
        TW_WARN("[HTTP] User lookup response could not be decoded");
        return Error::RequestError;
    }
    return Error::None;
}

Error Client::lookup_channel_id(const std::string& username, std::string& out) noexcept {
    std::vector<User> found;
    const Error err = users({username}, found);
    if (err != Error::None) {
        return err;
    }
    // The platform answers with an empty list if the user does not exist.
    if (found.empty()) {
        TW_WARN("[HTTP] User '" << username << "' not found");
        return Error::RequestError;
    }
    out = found.front().channel_id;
    return Error::None;
}

Error Client::send_chat_message(const auth::AccessToken& token, const std::string& content,
                                const lcr::optional<std::string>& channel_id) noexcept {
    Request req;
    req.method = Method::Post;
    req.target = "/chat/send";
    req.authorization = "OAuth " + token.value;
    req.body += '{';
    lcr::json::append_string_field(req.body, "content", content);
    if (channel_id.has()) {
        req.body += ',';
        lcr::json::append_string_field(req.body, "channel_id", channel_id.value());
    }
    req.body += '}';
    Response res;
    (void)perform_(req, res);
    return conclude_("Chat send", res);
}

} // namespace trovowire::core::http
