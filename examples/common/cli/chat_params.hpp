#pragma once

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "trovowire/core/auth/access_token.hpp"
#include "trovowire/core/config/endpoints.hpp"
#include "lcr/log/logger.hpp"

namespace trovowire::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator (TLS only)
// -------------------------------------------------------------
inline auto wss_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with wss://";
    },
    "Secure WebSocket URL validator"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl;
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace | debug | info | warn | error | fatal";
    },
    "Log level validator"
);


struct ChatParams {
    std::string client_id;
    std::string token;
    std::string channel;
    std::string user;
    std::string url        = core::config::CHAT_WS_URL;
    std::string log_level  = "info";
    unsigned heartbeat_s   = 30;
    unsigned staleness_s   = 60;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Client ID : " << client_id << "\n"
           << "  Token     : " << core::auth::redact(token) << "\n"
           << "  Channel   : " << (channel.empty() ? "(lookup)" : channel) << "\n"
           << "  User      : " << (user.empty() ? "-" : user) << "\n"
           << "  URL       : " << url << "\n"
           << "  Heartbeat : " << heartbeat_s << " s\n"
           << "  Staleness : " << staleness_s << " s\n"
           << "  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline ChatParams configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    ChatParams params{};

    app.add_option("--client-id", params.client_id, "Application client id")->required();
    app.add_option("--token", params.token, "OAuth access token (sent as 'OAuth <token>')")->required();
    auto* channel = app.add_option("-c,--channel", params.channel, "Channel id to read");
    auto* user = app.add_option("-u,--user", params.user, "Username whose channel to read (looked up over HTTP)");
    channel->excludes(user);
    user->excludes(channel);
    app.add_option("--url", params.url, "Chat WebSocket endpoint")->check(wss_url_validator)->default_val(params.url);
    app.add_option("--heartbeat", params.heartbeat_s, "PING interval in seconds")->check(CLI::Range(5u, 300u))->default_val(params.heartbeat_s);
    app.add_option("--staleness", params.staleness_s, "Silence (seconds) before the link is presumed dead")->check(CLI::PositiveNumber)->default_val(params.staleness_s);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Prints chat messages of one channel as they arrive.\n"
        "Reconnection is transparent; Ctrl-C stops the stream."
    );

    try {
        app.parse(argc, argv);
        if (params.channel.empty() && params.user.empty()) {
            throw CLI::RequiredError("--channel or --user");
        }
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr) == 0 ? EXIT_SUCCESS : EXIT_FAILURE);
    }

    lcr::log::Level lvl = lcr::log::Level::Info;
    (void)lcr::log::parse_level(params.log_level, lvl);
    lcr::log::Logger::instance().set_level(lvl);
    return params;
}

} // namespace trovowire::examples::cli
