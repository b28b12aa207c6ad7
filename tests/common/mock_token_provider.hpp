#pragma once

#include <string>

#include "trovowire/core/auth/access_token.hpp"
#include "trovowire/core/auth/concepts.hpp"
#include "trovowire/core/auth/error.hpp"


namespace trovowire::core::auth::test {

// -----------------------------------------------------------------------------
// Token provider with injectable outcomes
// -----------------------------------------------------------------------------
class MockTokenProvider {
public:
    std::string token{"access-token-1234"};
    Error access_result{Error::None};
    Error refresh_result{Error::None};

    int access_calls{0};
    int refresh_calls{0};

    [[nodiscard]]
    inline Error access_token(AccessToken& out) noexcept {
        ++access_calls;
        if (access_result != Error::None) {
            return access_result;
        }
        out.value = token;
        out.expires_at.reset();
        return Error::None;
    }

    [[nodiscard]]
    inline Error refresh_if_needed() noexcept {
        ++refresh_calls;
        return refresh_result;
    }
};

static_assert(TokenProviderConcept<MockTokenProvider>);


// -----------------------------------------------------------------------------
// Refresh API with injectable outcome (drives OAuthTokenProvider)
// -----------------------------------------------------------------------------
class MockRefreshApi {
public:
    http::Error result{http::Error::None};
    TokenGrant grant{"new-access-token", "new-refresh-token", std::chrono::seconds(14400)};

    int calls{0};
    std::string last_refresh_token;
    std::string last_client_secret;

    [[nodiscard]]
    inline http::Error refresh(const std::string& refresh_token, const std::string& client_secret, TokenGrant& out) noexcept {
        ++calls;
        last_refresh_token = refresh_token;
        last_client_secret = client_secret;
        if (result != http::Error::None) {
            return result;
        }
        out = grant;
        return http::Error::None;
    }
};

static_assert(RefreshApiConcept<MockRefreshApi>);

} // namespace trovowire::core::auth::test
