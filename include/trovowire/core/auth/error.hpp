#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace trovowire::core::auth {

/*
===============================================================================
 auth::Error
===============================================================================

Failure to produce a usable access token.

  Expired          Static token passed its expiry, no way to refresh
  Missing          Provider holds no token at all
  RefreshRejected  Platform rejected the refresh token (credentials are bad)
  RefreshFailed    Refresh call failed for a transient reason (network, 5xx)

Every value except None and RefreshFailed is fatal for a chat session.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    Expired,
    Missing,
    RefreshRejected,
    RefreshFailed,
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:            return "None";
        case Error::Expired:         return "Expired";
        case Error::Missing:         return "Missing";
        case Error::RefreshRejected: return "RefreshRejected";
        case Error::RefreshFailed:   return "RefreshFailed";
        default:                     return "Unknown";
    }
}

[[nodiscard]]
inline constexpr bool is_fatal(Error e) noexcept {
    return e != Error::None && e != Error::RefreshFailed;
}

inline std::ostream& operator<<(std::ostream& os, Error e) {
    return os << to_string(e);
}

} // namespace trovowire::core::auth
