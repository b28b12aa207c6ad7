#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "trovowire/core/transport/error.hpp"


namespace trovowire::core::transport {

    // Parsed URL components
    struct ParsedUrl {
        bool secure{true};    // true = wss/https, false = ws/http
        std::string host;
        std::string port;
        std::string path;
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser for ws://, wss://, http:// and https://
    //
    // Accepts the endpoints this library talks to and rejects malformed
    // input without attempting full RFC 3986 compliance (no userinfo,
    // no IPv6 literals, query strings are kept inside `path`).
    //
    // Example inputs:
    //   wss://open-chat.trovo.live/chat
    //   ws://127.0.0.1:8080/chat
    //   https://open-api.trovo.live/openplatform
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) {
        out = ParsedUrl{};
        // 1) Extract scheme
        struct Scheme { std::string_view prefix; bool secure; const char* port; };
        static constexpr Scheme schemes[] = {
            {"wss://",   true,  "443"},
            {"ws://",    false, "80"},
            {"https://", true,  "443"},
            {"http://",  false, "80"},
        };
        std::size_t pos = std::string_view::npos;
        const char* default_port = nullptr;
        for (const auto& s : schemes) {
            if (url.substr(0, s.prefix.size()) == s.prefix) {
                out.secure = s.secure;
                default_port = s.port;
                pos = s.prefix.size();
                break;
            }
        }
        if (pos == std::string_view::npos) {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port]
        const std::size_t slash = url.find('/', pos);
        const std::string_view hostport = (slash == std::string_view::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        const std::size_t colon = hostport.find(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = default_port;
        }
        // 4) Path (default "/" if missing)
        out.path = (slash == std::string_view::npos) ? std::string("/") : std::string(url.substr(slash));

        // Invariants --------------------------------------
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        return Error::None;
    }

} // namespace trovowire::core::transport
