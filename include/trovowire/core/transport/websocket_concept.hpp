#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "trovowire/core/transport/error.hpp"
#include "trovowire/core/transport/websocket/events.hpp"

namespace trovowire::core::transport {

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Minimal contract the session requires from one physical WebSocket link.
//
// The implementation:
//
//   • Is default constructible; one instance lives for one link only
//   • connect() blocks until the link is open or has failed (bounded)
//   • Owns its IO thread and publishes complete text frames and control
//     events into internal SPSC rings
//   • Exposes poll_message() / poll_event() for the session to drain
//   • close() is idempotent, bounded in time and joins the IO thread
//
// -----------------------------------------------------------------------------

template<class WS>
concept WebSocketConcept =
    std::default_initializable<WS> &&
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        std::string_view text,
        std::string& frame,
        websocket::Event& ev
    )
{
    // Lifecycle
    { ws.connect(host, port, path) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // Sending (false: link not open, frame not accepted)
    { ws.send(text) } noexcept -> std::same_as<bool>;

    // Data-plane polling (one complete text frame per call)
    { ws.poll_message(frame) } noexcept -> std::same_as<bool>;

    // Control-plane polling
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace trovowire::core::transport
