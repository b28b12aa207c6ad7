#pragma once

#include <concepts>
#include <string>

#include "trovowire/core/auth/access_token.hpp"
#include "trovowire/core/auth/error.hpp"
#include "trovowire/core/http/error.hpp"

namespace trovowire::core::auth {

// -----------------------------------------------------------------------------
// TokenProviderConcept
// -----------------------------------------------------------------------------
//
// Capability set the session is written against. Both the static and the
// OAuth provider satisfy it; the session never names a concrete provider.
//
//   access_token(out)    current credential, or why none can be produced
//   refresh_if_needed()  no-op when nothing to do, refresh otherwise
//
// -----------------------------------------------------------------------------
template<class P>
concept TokenProviderConcept =
    requires(P p, AccessToken& out)
{
    { p.access_token(out) } noexcept -> std::same_as<Error>;
    { p.refresh_if_needed() } noexcept -> std::same_as<Error>;
};

// -----------------------------------------------------------------------------
// RefreshApiConcept
// -----------------------------------------------------------------------------
//
// What the OAuth provider needs from the HTTP layer: exchange a refresh token
// (plus client secret) for a new grant.
//
// -----------------------------------------------------------------------------
template<class A>
concept RefreshApiConcept =
    requires(A a, const std::string& refresh_token, const std::string& client_secret, TokenGrant& out)
{
    { a.refresh(refresh_token, client_secret, out) } noexcept -> std::same_as<http::Error>;
};

} // namespace trovowire::core::auth
