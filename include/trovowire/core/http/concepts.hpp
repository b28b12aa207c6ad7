#pragma once

#include <concepts>
#include <string>

#include "trovowire/core/auth/access_token.hpp"
#include "trovowire/core/http/error.hpp"

namespace trovowire::core::http {

// -----------------------------------------------------------------------------
// ChatTokenSourceConcept
// -----------------------------------------------------------------------------
//
// The HTTP collaborator consumed by the chat session: exchange the current
// access token for a chat token scoped to one channel.
//
// -----------------------------------------------------------------------------
template<class S>
concept ChatTokenSourceConcept =
    requires(S s, const auth::AccessToken& token, const std::string& channel_id, auth::ChatToken& out)
{
    { s.exchange_chat_token(token, channel_id, out) } noexcept -> std::same_as<Error>;
};

} // namespace trovowire::core::http
