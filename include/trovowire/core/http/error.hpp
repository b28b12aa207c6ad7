#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "lcr/optional.hpp"

namespace trovowire::core::http {

/*
===============================================================================
 http::Error
===============================================================================

Outcome of one request to the platform's REST API, reduced to the only
distinction the chat session acts on:

  RequestError               transient (network, timeout, 5xx, rate limit,
                             unparsable body, other 4xx). Worth retrying.
  AuthenticatedRequestError  the credentials themselves were rejected.
                             Retrying with the same credentials cannot help.

The platform's own status code is kept in ApiError for diagnostics.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    RequestError,
    AuthenticatedRequestError,
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:                      return "None";
        case Error::RequestError:              return "RequestError";
        case Error::AuthenticatedRequestError: return "AuthenticatedRequestError";
        default:                               return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Error e) {
    return os << to_string(e);
}

// ===============================================================
// PLATFORM STATUS CODES
// ===============================================================
enum class ApiStatus : std::int16_t {
    InternalFetch               = -1201,
    InternalTimeout             = -1000,
    InvalidParameters           = 1002,
    InternalUnknown             = 1111,
    Conflict                    = 1203,
    InvalidUser                 = 10505,
    AuthorizationFailed         = 10703,
    InvalidAuthCode1            = 10710,
    MessageSpam                 = 10908,
    InvalidCategory             = 11000,
    Moderated1                  = 11101,
    Moderated2                  = 11103,
    AccountBlocked              = 11400,
    InvalidHeader               = 11701,
    InvalidScope                = 11703,
    InvalidAccessToken          = 11704,
    RateLimitExceeded           = 11706,
    MissingChatPermission       = 11707,
    InvalidShardValue           = 11708,
    MissingShardTokenPermission = 11709,
    InvalidAuthCode2            = 11710,
    UsedAuthCode                = 11711,
    RefreshTokenExpired         = 11712,
    InvalidRefreshToken         = 11713,
    AccessTokenExpired          = 11714,
    InvalidGrantType            = 11715,
    InvalidRedirectUri          = 11716,
    InvalidClientSecret         = 11717,
    AccessTokenLimit            = 11718,
    UnauthorizedScope           = 11730,
    BannedInChannel             = 12400,
    SlowMode                    = 12401,
    FollowerOnly                = 12402,
    UnauthorizedHyperlink       = 12905,
    ModeratedMessage            = 12906,
    Unknown                     = 20000,
};

// Status codes that mean "these credentials are bad".
[[nodiscard]]
inline constexpr bool is_credential_status(std::int32_t status) noexcept {
    switch (static_cast<ApiStatus>(status)) {
        case ApiStatus::AuthorizationFailed:
        case ApiStatus::AccountBlocked:
        case ApiStatus::InvalidHeader:
        case ApiStatus::InvalidScope:
        case ApiStatus::InvalidAccessToken:
        case ApiStatus::RefreshTokenExpired:
        case ApiStatus::InvalidRefreshToken:
        case ApiStatus::AccessTokenExpired:
        case ApiStatus::InvalidGrantType:
        case ApiStatus::InvalidClientSecret:
        case ApiStatus::UnauthorizedScope:
            return true;
        default:
            return false;
    }
}

// Error body returned by the platform: {"status":<code>,"message":"..."}
struct ApiError {
    std::int32_t status{0};
    std::string message;
};

// -----------------------------------------------------------------------------
// Single classification point for REST outcomes.
//
//   http_status  0 when no HTTP response was received (network / timeout)
//   api          error body, when one could be parsed
// -----------------------------------------------------------------------------
[[nodiscard]]
inline Error classify(unsigned http_status, const lcr::optional<ApiError>& api) noexcept {
    if (http_status >= 200 && http_status < 300 && !api.has()) {
        return Error::None;
    }
    if (http_status == 401 || http_status == 403) {
        return Error::AuthenticatedRequestError;
    }
    if (api.has() && is_credential_status(api.value().status)) {
        return Error::AuthenticatedRequestError;
    }
    return Error::RequestError;
}

} // namespace trovowire::core::http
