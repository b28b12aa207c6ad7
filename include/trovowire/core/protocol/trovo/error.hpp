#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "lcr/optional.hpp"


namespace trovowire::core::protocol::trovo {

/*
===============================================================================
 ChatError
===============================================================================

Error item of the chat sequence.

  ConnectError               DNS / TLS / upgrade failure. Fatal only for an
                             unusable URL, otherwise recovered by reconnect.
  LinkError                  Mid-session I/O failure (recovered by reconnect).
  DecodeError                One malformed frame or one malformed message of a
                             batch. Surfaced in arrival order, never fatal.
  AuthError                  The token provider cannot produce a credential.
  AuthenticatedRequestError  The platform rejected the credentials.
  RequestError               Transient failure of the token exchange.

Only DecodeError items and one terminal (fatal) item ever reach the caller;
transient kinds are absorbed by the reconnect loop and only logged.
===============================================================================
*/
struct ChatError {
    enum class Kind : std::uint8_t {
        ConnectError,
        LinkError,
        DecodeError,
        AuthError,
        AuthenticatedRequestError,
        RequestError
    };

    Kind kind{Kind::LinkError};
    std::string detail;
    lcr::optional<std::size_t> index;          // position inside the batch (DecodeError)
    lcr::optional<std::string> message_id;     // offending message, when readable
};

[[nodiscard]]
inline constexpr std::string_view to_string(ChatError::Kind k) noexcept {
    switch (k) {
        case ChatError::Kind::ConnectError:              return "ConnectError";
        case ChatError::Kind::LinkError:                 return "LinkError";
        case ChatError::Kind::DecodeError:               return "DecodeError";
        case ChatError::Kind::AuthError:                 return "AuthError";
        case ChatError::Kind::AuthenticatedRequestError: return "AuthenticatedRequestError";
        case ChatError::Kind::RequestError:              return "RequestError";
        default:                                         return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, ChatError::Kind k) {
    return os << to_string(k);
}

inline std::ostream& operator<<(std::ostream& os, const ChatError& e) {
    os << to_string(e.kind) << ": " << e.detail;
    if (e.index.has()) {
        os << " (index " << e.index.value() << ")";
    }
    if (e.message_id.has()) {
        os << " (message " << e.message_id.value() << ")";
    }
    return os;
}

} // namespace trovowire::core::protocol::trovo
