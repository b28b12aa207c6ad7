#pragma once

#include <cstddef>

namespace trovowire::core::config {

/*
===============================================================================
SPSC Ring Buffer Sizes
===============================================================================

Ring sizes are chosen based on expected frame frequency and burst behavior.

  - Control-plane rings are tiny: a link emits at most an Error and a Close
  - The receive ring absorbs the history burst Trovo sends right after AUTH
  - The output ring bounds what the caller may leave unconsumed before the
    session stops reading from the transport
  - All sizes are compile-time constants (power of two, usable = size - 1)
===============================================================================
*/

// -----------------------------------------------------------------------------
// Transport → session
// -----------------------------------------------------------------------------
inline constexpr std::size_t WS_EVENT_RING_CAPACITY = 1 << 4; // 16
inline constexpr std::size_t WS_RX_RING_CAPACITY    = 1 << 8; // 256

// -----------------------------------------------------------------------------
// Router → session (decoded frames awaiting the state machine)
// -----------------------------------------------------------------------------
inline constexpr std::size_t CONTROL_RING_CAPACITY  = 1 << 3; // 8
inline constexpr std::size_t PONG_RING_CAPACITY     = 1 << 3; // 8
inline constexpr std::size_t CHAT_RING_CAPACITY     = 1 << 1; // 2 (one batch in flight)

// -----------------------------------------------------------------------------
// Session → caller
// -----------------------------------------------------------------------------
inline constexpr std::size_t OUTPUT_RING_CAPACITY   = 1 << 8; // 256

// -----------------------------------------------------------------------------
// Frame processing limits
// -----------------------------------------------------------------------------
inline constexpr std::size_t MAX_FRAMES_PER_POLL    = 64;

} // namespace trovowire::core::config
