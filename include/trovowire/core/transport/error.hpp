#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace trovowire::core::transport {

/*
===============================================================================
 transport::Error
===============================================================================

Semantic transport failures, abstracted away from Boost.Asio / Beast / OpenSSL
error codes. The WebSocket implementation maps library errors onto this enum
once; every layer above reasons only in these terms.

The enum is policy-free: whether a value is worth a reconnect is decided by
the session's single classification point, not here.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state
    Cancelled,        // Operation aborted by a local lifecycle decision

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Closed intentionally by the local endpoint
    RemoteClosed,     // Peer closed the connection (CLOSE frame or EOF)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Connect, handshake or close exceeded its time budget
    ConnectionFailed, // DNS resolution or TCP connect failed
    HandshakeFailed,  // TLS or WebSocket upgrade failed

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation

    // --- Unspecified transport failure --------------------------------------
    TransportFailure, // Unclassified I/O failure on an open link

    // --- Consumer too slow --------------------------------------------------
    Backpressure,     // Receive ring stayed full past its tolerance
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::Cancelled:         return "Cancelled";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    case Error::Backpressure:      return "Backpressure";
    default:                       return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Error err) {
    return os << to_string(err);
}

} // namespace trovowire::core::transport
