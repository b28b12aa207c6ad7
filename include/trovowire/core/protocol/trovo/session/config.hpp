#pragma once

#include <chrono>
#include <string>

#include "trovowire/core/config/endpoints.hpp"


namespace trovowire::core::protocol::trovo::session {

/*
===============================================================================
 session::Config
===============================================================================

Runtime knobs of one chat session. Every field has a working default.

  heartbeat_interval   PING period while Active. When honor_server_gap is set,
                       the "gap" announced by PONG replaces it, clamped to
                       [MIN_HEARTBEAT_INTERVAL, MAX_HEARTBEAT_INTERVAL].
  staleness_window     Maximum silence (no inbound frame of any kind) before
                       the link is presumed dead. Never shorter than two
                       heartbeat intervals, so a long server gap cannot make
                       a quiet channel look dead.
  handshake_timeout    Maximum wait for the AUTH / JOIN acknowledgement.
  max_missed_pongs     Unanswered PINGs tolerated before the link is presumed
                       dead.
  backoff_base/max     Reconnect delay: min(max, base * 2^(attempt-1)).
  send_join            Send JOIN after the AUTH acknowledgement. When false the
                       session becomes Active as soon as AUTH is acknowledged.
===============================================================================
*/

inline constexpr std::chrono::seconds MIN_HEARTBEAT_INTERVAL{5};
inline constexpr std::chrono::seconds MAX_HEARTBEAT_INTERVAL{300};

struct Config {
    std::string url{config::CHAT_WS_URL};

    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
    bool honor_server_gap{true};

    std::chrono::milliseconds staleness_window{std::chrono::seconds(60)};
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds(10)};
    unsigned max_missed_pongs{2};

    std::chrono::milliseconds backoff_base{250};
    std::chrono::milliseconds backoff_max{std::chrono::seconds(30)};

    bool send_join{true};
};

} // namespace trovowire::core::protocol::trovo::session
