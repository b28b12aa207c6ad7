#pragma once

#include <string>
#include <utility>

#include "trovowire/core/auth/access_token.hpp"
#include "trovowire/core/auth/concepts.hpp"
#include "trovowire/core/auth/error.hpp"
#include "lcr/log/logger.hpp"

namespace trovowire::core::auth {

/*
===============================================================================
 StaticTokenProvider
===============================================================================

Holds one access token supplied by the caller. It cannot be refreshed:
refresh_if_needed() is a no-op and access_token() fails with Expired once the
known expiry (if any) has passed.
===============================================================================
*/
class StaticTokenProvider {
public:
    StaticTokenProvider() = default;

    explicit StaticTokenProvider(std::string token)
        : token_{std::move(token), {}}
    {}

    StaticTokenProvider(std::string token, Clock::time_point expires_at)
        : token_{std::move(token), expires_at}
    {}

    [[nodiscard]]
    inline Error access_token(AccessToken& out) noexcept {
        if (token_.value.empty()) {
            TW_ERROR("[AUTH] No access token configured.");
            return Error::Missing;
        }
        if (token_.expired()) {
            TW_ERROR("[AUTH] Access token expired and doesn't support refreshing.");
            return Error::Expired;
        }
        out = token_;
        return Error::None;
    }

    [[nodiscard]]
    inline Error refresh_if_needed() noexcept {
        return Error::None;
    }

private:
    AccessToken token_;
};

static_assert(TokenProviderConcept<StaticTokenProvider>);

} // namespace trovowire::core::auth
