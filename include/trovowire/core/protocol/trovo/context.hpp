#pragma once

#include <cstdint>

#include "trovowire/core/config/ring_sizes.hpp"
#include "trovowire/core/protocol/trovo/schema/control/response.hpp"
#include "trovowire/core/protocol/trovo/schema/system/pong.hpp"
#include "trovowire/core/protocol/trovo/schema/chat/batch.hpp"
#include "lcr/local/ring_buffer.hpp"


namespace trovowire::core::protocol::trovo {

/*
===============================================================================
Context (OWNING STORE)
===============================================================================

Owns all parser-visible state:
- Output rings for decoded frames
- Frame counters

The Context lifetime is controlled by the session.
Parsers NEVER own this object, they only receive ContextView.
===============================================================================
*/
struct Context {
    // Decoded RESPONSE frames (AUTH / JOIN acknowledgements and rejections)
    lcr::local::ring_buffer<schema::control::Response, config::CONTROL_RING_CAPACITY> response_ring{};

    // Decoded PONG frames
    lcr::local::ring_buffer<schema::system::Pong, config::PONG_RING_CAPACITY> pong_ring{};

    // Decoded CHAT frames
    lcr::local::ring_buffer<schema::chat::Batch, config::CHAT_RING_CAPACITY> chat_ring{};

    // Frames with an unknown "type"
    std::uint64_t unknown_frames{0};

    // Helper to check if all rings are empty
    [[nodiscard]]
    inline bool empty() const noexcept {
        return response_ring.empty() && pong_ring.empty() && chat_ring.empty();
    }

    inline void clear() {
        response_ring.clear();
        pong_ring.clear();
        chat_ring.clear();
    }
};


/*
===============================================================================
Parser ContextView (Non-owning)
===============================================================================

Lightweight, non-nullable view over Context.
Passed to the router.
===============================================================================
*/
struct ContextView {
    lcr::local::ring_buffer<schema::control::Response, config::CONTROL_RING_CAPACITY>& response_ring;
    lcr::local::ring_buffer<schema::system::Pong, config::PONG_RING_CAPACITY>& pong_ring;
    lcr::local::ring_buffer<schema::chat::Batch, config::CHAT_RING_CAPACITY>& chat_ring;
    std::uint64_t& unknown_frames;

    explicit ContextView(Context& ctx) noexcept
        : response_ring(ctx.response_ring)
        , pong_ring(ctx.pong_ring)
        , chat_ring(ctx.chat_ring)
        , unknown_frames(ctx.unknown_frames)
    {}
};

} // namespace trovowire::core::protocol::trovo
