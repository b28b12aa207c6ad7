#pragma once

/*
===============================================================================
 trovowire::core::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket implementation and delivered to
the owning session through a lock-free SPSC ring.

Threading:
    - The WebSocket IO thread produces events
    - The session drains them from poll() on the caller's thread
    - No cross-thread callbacks, no state shared beyond the ring

Contract:
    - Close is delivered exactly once per link
    - An abnormal termination delivers Error before Close
    - Control events must not be dropped; the ring is sized so that a link
      can never produce more than a handful of them

Frames (data plane) travel on a separate ring, see WebSocketConcept.
===============================================================================
*/

#include <cstdint>
#include <string_view>

#include "trovowire/core/transport/error.hpp"

namespace trovowire::core::transport::websocket {

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1,
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::Close: return "Close";
        case EventType::Error: return "Error";
        default:               return "Unknown";
    }
}

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None}; // meaningful only if type == Error

    static constexpr Event make_close() noexcept {
        return Event{EventType::Close, transport::Error::None};
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        return Event{EventType::Error, e};
    }
};

} // namespace trovowire::core::transport::websocket
