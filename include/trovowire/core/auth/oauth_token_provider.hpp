#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "trovowire/core/auth/access_token.hpp"
#include "trovowire/core/auth/concepts.hpp"
#include "trovowire/core/auth/error.hpp"
#include "trovowire/core/http/error.hpp"
#include "lcr/log/logger.hpp"

namespace trovowire::core::auth {

/*
===============================================================================
 OAuthTokenProvider<RefreshApi>
===============================================================================

Access token plus refresh token and client secret. When the access token is
expired, or expires within the configured skew, refresh_if_needed() exchanges
the refresh token through RefreshApi and replaces both tokens.

Refresh outcome mapping:
  http::Error::AuthenticatedRequestError  -> Error::RefreshRejected (fatal)
  http::Error::RequestError               -> Error::RefreshFailed   (transient)

The RefreshApi object is not owned and must outlive the provider.
===============================================================================
*/

constexpr auto DEFAULT_REFRESH_SKEW = std::chrono::seconds(60);

template<RefreshApiConcept RefreshApi>
class OAuthTokenProvider {
public:
    struct Credentials {
        std::string access_token;
        std::string refresh_token;
        std::string client_secret;
        lcr::optional<Clock::time_point> expires_at{};
    };

    OAuthTokenProvider(RefreshApi& api, Credentials credentials,
                       std::chrono::seconds skew = DEFAULT_REFRESH_SKEW)
        : api_(api)
        , refresh_token_(std::move(credentials.refresh_token))
        , client_secret_(std::move(credentials.client_secret))
        , skew_(skew)
    {
        token_.value = std::move(credentials.access_token);
        token_.expires_at = credentials.expires_at;
    }

    [[nodiscard]]
    inline Error access_token(AccessToken& out) noexcept {
        if (token_.value.empty()) {
            TW_ERROR("[AUTH] No access token available.");
            return Error::Missing;
        }
        out = token_;
        return Error::None;
    }

    [[nodiscard]]
    inline Error refresh_if_needed() noexcept {
        const auto now = Clock::now();
        if (!force_refresh_ && !token_.value.empty() && !token_.expires_within(skew_, now)) {
            return Error::None;
        }
        if (refresh_token_.empty()) {
            TW_ERROR("[AUTH] Access token needs refreshing but no refresh token is available.");
            return token_.value.empty() ? Error::Missing : Error::Expired;
        }

        TW_DEBUG("[AUTH] Refreshing access token (refresh token " << redact(refresh_token_) << ")");
        TokenGrant grant;
        const http::Error err = api_.refresh(refresh_token_, client_secret_, grant);
        switch (err) {
            case http::Error::None:
                break;
            case http::Error::AuthenticatedRequestError:
                TW_ERROR("[AUTH] Refresh token rejected by the platform.");
                return Error::RefreshRejected;
            case http::Error::RequestError:
            default:
                TW_WARN("[AUTH] Refresh request failed (" << to_string(err) << "), will retry.");
                return Error::RefreshFailed;
        }

        if (grant.access_token.empty()) {
            TW_WARN("[AUTH] Refresh response carried an empty access token.");
            return Error::RefreshFailed;
        }

        token_.value = std::move(grant.access_token);
        if (grant.expires_in.count() > 0) {
            token_.expires_at = now + grant.expires_in;
        } else {
            token_.expires_at.reset();
        }
        if (!grant.refresh_token.empty()) {
            refresh_token_ = std::move(grant.refresh_token);
        }
        force_refresh_ = false;
        ++refresh_count_;
        TW_INFO("[AUTH] Access token refreshed (" << redact(token_.value) << ", expires in " << grant.expires_in.count() << "s)");
        return Error::None;
    }

    // Forces the next refresh_if_needed() to refresh regardless of expiry.
    inline void invalidate() noexcept {
        force_refresh_ = true;
    }

    [[nodiscard]]
    inline std::uint64_t refresh_count() const noexcept {
        return refresh_count_;
    }

    [[nodiscard]]
    inline const std::string& refresh_token() const noexcept {
        return refresh_token_;
    }

private:
    RefreshApi& api_;
    AccessToken token_;
    std::string refresh_token_;
    std::string client_secret_;
    std::chrono::seconds skew_;
    bool force_refresh_{false};
    std::uint64_t refresh_count_{0};
};

} // namespace trovowire::core::auth
