#pragma once

#include <string_view>

namespace trovowire::core::config {

// Trovo chat WebSocket
inline constexpr std::string_view CHAT_WS_URL  = "wss://open-chat.trovo.live/chat";

// Trovo open platform REST API
inline constexpr std::string_view API_HOST     = "open-api.trovo.live";
inline constexpr std::string_view API_PORT     = "443";
inline constexpr std::string_view API_BASE     = "/openplatform";

inline constexpr std::string_view USER_AGENT   = "trovowire/1.0";

} // namespace trovowire::core::config
