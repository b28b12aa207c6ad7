#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "trovowire/core/transport/error.hpp"
#include "trovowire/core/transport/websocket/events.hpp"
#include "trovowire/core/transport/websocket_concept.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast over OpenSSL)
================================================================================

One instance owns exactly one physical TLS WebSocket link.

  • Single-link primitive: no retries, no reconnection, no protocol knowledge.
    Recovery policy lives in the session.
  • connect() runs the resolve → TCP → TLS → upgrade chain on the calling
    thread, bounded by Options::connect_timeout.
  • Once open, an internal IO thread keeps one read outstanding and publishes
    each complete text frame into an SPSC ring (poll_message). Writes are
    posted to the same thread, so the TLS stream is only ever touched by it.
  • If the receive ring is full the IO thread stops reading and retries after
    a short delay. Frames are never dropped and never reordered.
  • Failure is signaled as Error (abnormal only) followed by exactly one Close.
  • close() performs the close handshake bounded by Options::close_timeout,
    then shuts the socket down abruptly and joins the IO thread.

Boost headers stay out of this header (pimpl), so protocol code and tests
compile without Beast.
================================================================================
*/

namespace trovowire::core::transport::beast {

struct Options {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds close_timeout{3000};
    std::chrono::milliseconds backpressure_retry{1};
    bool verify_peer{true};
};

class WebSocket {
public:
    WebSocket();
    explicit WebSocket(const Options& options);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept;

    // Queues a text frame for transmission. Returns false if the link is not open.
    // Write failures are reported asynchronously through poll_event().
    [[nodiscard]]
    bool send(std::string_view text) noexcept;

    void close() noexcept;

    [[nodiscard]]
    bool poll_message(std::string& out) noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& out) noexcept;

    [[nodiscard]]
    bool is_open() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace trovowire::core::transport::beast
