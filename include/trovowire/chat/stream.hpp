#pragma once

/*
===============================================================================
Trovo Chat Stream
===============================================================================

ChatStream is the caller-facing handle over one chat Session: a lazy,
ordered sequence of chat items for one channel.

  - Lazy: nothing is connected until the first poll()
  - Non-restartable: once finished (fatal error or cancel) it stays finished.
    Reading the channel again requires a fresh open_chat()
  - Reconnection is invisible: after a link failure the sequence simply
    continues with messages that arrived on the new link
  - Move-only. cancel() and the destructor close the link deterministically

Items:
  Message      decoded chat message
  DecodeError  one malformed frame or batch entry (the rest still arrives)
  Fatal        terminal error, always the last item

Typical loop:

    auto chat = trovowire::chat::open_chat("100000031", provider, api);
    while (!chat.finished()) {
        chat.poll();
        chat.drain([](const trovowire::chat::Item& item) { ... });
    }

Threading:
  - Not thread-safe: poll(), pop(), drain() and cancel() belong to one thread
===============================================================================
*/

#include <memory>
#include <string>
#include <utility>

#include "trovowire/core/auth/concepts.hpp"
#include "trovowire/core/http/concepts.hpp"
#include "trovowire/core/transport/websocket_concept.hpp"
#include "trovowire/core/transport/beast/websocket.hpp"
#include "trovowire/core/protocol/trovo/item.hpp"
#include "trovowire/core/protocol/trovo/error.hpp"
#include "trovowire/core/protocol/trovo/session.hpp"
#include "trovowire/core/protocol/trovo/session/config.hpp"
#include "lcr/log/logger.hpp"


namespace trovowire::chat {

using Item        = core::protocol::trovo::Item;
using ChatError   = core::protocol::trovo::ChatError;
using ChatMessage = core::protocol::trovo::schema::chat::ChatMessage;
using Config      = core::protocol::trovo::session::Config;
using State       = core::protocol::trovo::session::State;


template<
    core::auth::TokenProviderConcept TokenProvider,
    core::http::ChatTokenSourceConcept ChatTokenSource,
    core::transport::WebSocketConcept WS = core::transport::beast::WebSocket
>
class ChatStream {
public:
    using SessionType = core::protocol::trovo::Session<WS, TokenProvider, ChatTokenSource>;

    ChatStream(std::string channel_id, TokenProvider& provider, ChatTokenSource& token_source, Config config = {})
        : session_(std::make_unique<SessionType>(std::move(channel_id), provider, token_source, std::move(config)))
    {}

    ~ChatStream() {
        cancel();
    }

    ChatStream(const ChatStream&) = delete;
    ChatStream& operator=(const ChatStream&) = delete;

    ChatStream(ChatStream&&) noexcept = default;

    ChatStream& operator=(ChatStream&& other) noexcept {
        if (this != &other) {
            cancel();
            session_ = std::move(other.session_);
        }
        return *this;
    }

    // Advances the session. The first call opens it.
    inline void poll() noexcept {
        if (!session_) {
            return;
        }
        if (session_->state() == State::Idle) {
            TW_DEBUG("[STREAM] First poll: opening chat for channel " << session_->channel_id());
            (void)session_->open();
        }
        session_->poll();
    }

    // Next item in arrival order. Returns false when nothing is ready.
    [[nodiscard]]
    inline bool pop(Item& out) noexcept {
        return session_ && session_->pop(out);
    }

    // Hands every ready item to fn, in order. Returns the number of items.
    template<class F>
    inline std::size_t drain(F&& fn) {
        std::size_t n = 0;
        Item item;
        while (pop(item)) {
            fn(item);
            ++n;
        }
        return n;
    }

    // True once the session is closed and every item was handed out.
    [[nodiscard]]
    inline bool finished() const noexcept {
        return !session_ || session_->finished();
    }

    // Stops the stream: no send or receive happens afterwards.
    inline void cancel() noexcept {
        if (session_ && !session_->cancelled()) {
            TW_DEBUG("[STREAM] Cancelling chat for channel " << session_->channel_id());
            session_->close();
        }
    }

    [[nodiscard]]
    inline State state() const noexcept {
        return session_ ? session_->state() : State::Closed;
    }

    // Underlying session (counters, configuration). Null once moved from.
    [[nodiscard]]
    inline const SessionType* session() const noexcept {
        return session_.get();
    }

#ifdef TW_UNIT_TEST
    SessionType* session() noexcept {
        return session_.get();
    }
#endif // TW_UNIT_TEST

private:
    std::unique_ptr<SessionType> session_;
};


// -----------------------------------------------------------------------------
// open_chat(): fresh, not yet connected stream for one channel
// -----------------------------------------------------------------------------
template<
    core::transport::WebSocketConcept WS = core::transport::beast::WebSocket,
    core::auth::TokenProviderConcept TokenProvider,
    core::http::ChatTokenSourceConcept ChatTokenSource
>
[[nodiscard]]
inline ChatStream<TokenProvider, ChatTokenSource, WS>
open_chat(std::string channel_id, TokenProvider& provider, ChatTokenSource& token_source, Config config = {}) {
    return ChatStream<TokenProvider, ChatTokenSource, WS>(std::move(channel_id), provider, token_source, std::move(config));
}

} // namespace trovowire::chat
