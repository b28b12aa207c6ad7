#include "trovowire/core/transport/beast/websocket.hpp"

#include <atomic>
#include <deque>
#include <exception>
#include <thread>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include "trovowire/core/config/endpoints.hpp"
#include "trovowire/core/config/ring_sizes.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"

namespace bb   = boost::beast;
namespace bbws = boost::beast::websocket;
namespace net  = boost::asio;
namespace ssl  = boost::asio::ssl;
using tcp      = boost::asio::ip::tcp;

namespace trovowire::core::transport::beast {

namespace {

using ws_stream = bbws::stream<bb::ssl_stream<bb::tcp_stream>>;

// Maps a Beast/Asio failure on an open link onto transport::Error.
[[nodiscard]]
Error classify_io_error(const bb::error_code& ec) noexcept {
    if (ec == bbws::error::closed) {
        return Error::RemoteClosed;         // peer sent a CLOSE frame
    }
    if (ec == net::error::eof || ec == net::error::connection_reset || ec == ssl::error::stream_truncated) {
        return Error::RemoteClosed;         // peer went away without CLOSE
    }
    if (ec == bb::error::timeout) {
        return Error::Timeout;
    }
    if (ec == net::error::operation_aborted) {
        return Error::LocalShutdown;
    }
    return Error::TransportFailure;
}

// Maps a failure during the connect chain onto transport::Error.
[[nodiscard]]
Error classify_connect_error(const bb::error_code& ec, bool handshake_stage) noexcept {
    if (ec == bb::error::timeout) {
        return Error::Timeout;
    }
    return handshake_stage ? Error::HandshakeFailed : Error::ConnectionFailed;
}

} // namespace


struct WebSocket::Impl {
    explicit Impl(const Options& o)
        : options(o)
        , ssl_ctx(ssl::context::tlsv12_client)
        , retry_timer(ioc)
        , close_timer(ioc)
    {}

    Options options;

    net::io_context ioc;
    ssl::context ssl_ctx;
    std::unique_ptr<ws_stream> ws;
    bb::flat_buffer rx_buffer;
    std::deque<std::string> tx_queue;  // IO thread only
    std::string pending_frame;         // IO thread only (backpressure)
    bool backpressure_logged{false};   // IO thread only
    net::steady_timer retry_timer;
    net::steady_timer close_timer;
    std::thread io_thread;

    std::atomic<bool> open{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> error_signaled{false};
    std::atomic<bool> close_signaled{false};
    bool connect_attempted{false};

    lcr::lockfree::spsc_ring<std::string, config::WS_RX_RING_CAPACITY> rx_ring;
    lcr::lockfree::spsc_ring<websocket::Event, config::WS_EVENT_RING_CAPACITY> events;

    // ------------------------------------------------------------------
    // Signaling (IO thread)
    // ------------------------------------------------------------------
    void signal_error_(Error e) noexcept {
        if (error_signaled.exchange(true)) {
            return;
        }
        if (!events.push(websocket::Event::make_error(e))) {
            TW_FATAL("[WS] Control event ring full - error '" << to_string(e) << "' lost");
        }
    }

    void signal_close_() noexcept {
        open.store(false, std::memory_order_release);
        if (close_signaled.exchange(true)) {
            return;
        }
        if (!events.push(websocket::Event::make_close())) {
            TW_FATAL("[WS] Control event ring full - close lost");
        }
    }

    // Abnormal termination of an open link.
    void fail_(Error e) noexcept {
        if (!closing.load(std::memory_order_acquire)) {
            signal_error_(e);
        }
        bb::error_code ignored;
        bb::get_lowest_layer(*ws).socket().close(ignored);
    }

    // ------------------------------------------------------------------
    // Read loop (IO thread)
    // ------------------------------------------------------------------
    void do_read_() {
        ws->async_read(rx_buffer, [this](const bb::error_code& ec, std::size_t) {
            on_read_(ec);
        });
    }

    void on_read_(const bb::error_code& ec) {
        if (ec) {
            const Error e = classify_io_error(ec);
            if (closing.load(std::memory_order_acquire)) {
                TW_TRACE("[WS] Read loop finished during local close (" << ec.message() << ")");
            }
            else if (e == Error::RemoteClosed) {
                TW_INFO("[WS] Connection closed by peer (" << ec.message() << ")");
                signal_error_(e);
            }
            else {
                TW_WARN("[WS] Receive failed: " << ec.message());
                signal_error_(e);
            }
            signal_close_();
            return;
        }
        std::string frame = bb::buffers_to_string(rx_buffer.data());
        rx_buffer.consume(rx_buffer.size());
        deliver_(std::move(frame));
    }

    void deliver_(std::string&& frame) {
        if (rx_ring.push(std::move(frame))) [[likely]] {
            if (backpressure_logged) {
                TW_INFO("[WS] Receive ring drained, reading resumed");
                backpressure_logged = false;
            }
            do_read_();
            return;
        }
        // Ring full: hold the frame and stop reading until the consumer catches up.
        if (!backpressure_logged) {
            TW_WARN("[WS] Receive ring full - pausing reads until frames are consumed");
            backpressure_logged = true;
        }
        pending_frame = std::move(frame);
        retry_timer.expires_after(options.backpressure_retry);
        retry_timer.async_wait([this](const bb::error_code& ec) {
            if (ec || closing.load(std::memory_order_acquire)) {
                signal_close_();
                return;
            }
            deliver_(std::move(pending_frame));
        });
    }

    // ------------------------------------------------------------------
    // Write queue (IO thread)
    // ------------------------------------------------------------------
    void do_write_() {
        ws->async_write(net::buffer(tx_queue.front()), [this](const bb::error_code& ec, std::size_t) {
            if (ec) {
                TW_WARN("[WS] Send failed: " << ec.message());
                tx_queue.clear();
                fail_(classify_io_error(ec));
                return;
            }
            tx_queue.pop_front();
            if (!tx_queue.empty()) {
                do_write_();
            }
        });
    }

    // ------------------------------------------------------------------
    // Close (IO thread)
    // ------------------------------------------------------------------
    void start_close_() {
        retry_timer.cancel();
        close_timer.expires_after(options.close_timeout);
        close_timer.async_wait([this](const bb::error_code& ec) {
            if (ec) {
                return; // cancelled: handshake completed in time
            }
            TW_WARN("[WS] Close handshake timed out - forcing shutdown");
            bb::error_code ignored;
            bb::get_lowest_layer(*ws).socket().close(ignored);
        });
        ws->async_close(bbws::close_code::normal, [this](const bb::error_code& ec) {
            close_timer.cancel();
            if (ec) {
                TW_TRACE("[WS] Close handshake ended with: " << ec.message());
            }
            bb::error_code ignored;
            bb::get_lowest_layer(*ws).socket().close(ignored);
        });
    }

    void run_io_() noexcept {
        try {
            ioc.run();
        }
        catch (const std::exception& ex) {
            TW_ERROR("[WS] IO thread terminated by exception: " << ex.what());
            signal_error_(Error::TransportFailure);
        }
        signal_close_();
    }
};


WebSocket::WebSocket()
    : WebSocket(Options{})
{}

WebSocket::WebSocket(const Options& options)
    : impl_(std::make_unique<Impl>(options))
{}

WebSocket::~WebSocket() {
    close();
}

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
    Impl& s = *impl_;
    if (s.connect_attempted) {
        TW_WARN("[WS] connect() called twice on the same link. Ignoring.");
        return Error::InvalidState;
    }
    s.connect_attempted = true;
    TW_DEBUG("[WS] Connecting to " << host << ":" << port << path);

    try {
        bb::error_code trust_ec;
        s.ssl_ctx.set_default_verify_paths(trust_ec);
        if (trust_ec) {
            TW_WARN("[WS] Unable to load system trust store: " << trust_ec.message());
        }
        s.ssl_ctx.set_verify_mode(s.options.verify_peer ? ssl::verify_peer : ssl::verify_none);

        s.ws = std::make_unique<ws_stream>(s.ioc, s.ssl_ctx);
        if (!SSL_set_tlsext_host_name(s.ws->next_layer().native_handle(), host.c_str())) {
            TW_ERROR("[WS] Failed to set SNI host name");
            return Error::HandshakeFailed;
        }
        if (s.options.verify_peer) {
            s.ws->next_layer().set_verify_callback(ssl::host_name_verification(host));
        }

        const std::string host_header = (port == "443") ? host : host + ":" + port;
        Error result = Error::None;
        bool done = false;
        tcp::resolver resolver(s.ioc);
        auto& lowest = bb::get_lowest_layer(*s.ws);

        auto finish = [&](Error e) {
            result = e;
            done = true;
        };

        resolver.async_resolve(host, port, [&](const bb::error_code& ec, tcp::resolver::results_type results) {
            if (ec) {
                TW_ERROR("[WS] Resolve failed: " << ec.message());
                finish(Error::ConnectionFailed);
                return;
            }
            lowest.expires_after(s.options.connect_timeout);
            lowest.async_connect(results, [&](const bb::error_code& ec, const tcp::endpoint&) {
                if (ec) {
                    TW_ERROR("[WS] TCP connect failed: " << ec.message());
                    finish(classify_connect_error(ec, false));
                    return;
                }
                lowest.expires_after(s.options.connect_timeout);
                s.ws->next_layer().async_handshake(ssl::stream_base::client, [&](const bb::error_code& ec) {
                    if (ec) {
                        TW_ERROR("[WS] TLS handshake failed: " << ec.message());
                        finish(classify_connect_error(ec, true));
                        return;
                    }
                    // The websocket stream applies its own timeouts from here on.
                    lowest.expires_never();
                    s.ws->set_option(bbws::stream_base::timeout{
                        s.options.connect_timeout,        // handshake (also bounds close)
                        bbws::stream_base::none(),        // idle: liveness is the session's job
                        false
                    });
                    s.ws->set_option(bbws::stream_base::decorator([](bbws::request_type& req) {
                        req.set(bb::http::field::user_agent, std::string(config::USER_AGENT));
                    }));
                    s.ws->async_handshake(host_header, path, [&](const bb::error_code& ec) {
                        if (ec) {
                            TW_ERROR("[WS] WebSocket upgrade failed: " << ec.message());
                            finish(classify_connect_error(ec, true));
                            return;
                        }
                        finish(Error::None);
                    });
                });
            });
        });

        // Bound the whole chain: the resolver has no timeout of its own.
        s.ioc.run_for(s.options.connect_timeout * 2);
        if (!done) {
            TW_ERROR("[WS] Connect timed out after " << (s.options.connect_timeout * 2).count() << " ms");
            resolver.cancel();
            bb::error_code ignored;
            lowest.socket().close(ignored);
            s.ioc.restart();
            s.ioc.run(); // drain aborted handlers, they reference this frame
            result = Error::Timeout;
        }
        s.ioc.restart();
        if (result != Error::None) {
            return result;
        }

        s.ws->text(true);
        s.open.store(true, std::memory_order_release);
        s.do_read_();
        s.io_thread = std::thread([&s] { s.run_io_(); });
        TW_INFO("[WS] Connected to " << host_header << path);
        return Error::None;
    }
    catch (const std::exception& ex) {
        TW_ERROR("[WS] connect() failed: " << ex.what());
        return Error::TransportFailure;
    }
}

bool WebSocket::send(std::string_view text) noexcept {
    Impl& s = *impl_;
    if (!s.open.load(std::memory_order_acquire) || s.closing.load(std::memory_order_acquire)) {
        TW_WARN("[WS] send() called on a link that is not open");
        return false;
    }
    try {
        net::post(s.ioc, [&s, msg = std::string(text)]() mutable {
            if (!s.open.load(std::memory_order_acquire)) {
                return;
            }
            s.tx_queue.push_back(std::move(msg));
            if (s.tx_queue.size() == 1) {
                s.do_write_();
            }
        });
        TW_TRACE("[WS] Queued frame (" << text.size() << " bytes)");
        return true;
    }
    catch (const std::exception& ex) {
        TW_ERROR("[WS] send() failed: " << ex.what());
        return false;
    }
}

void WebSocket::close() noexcept {
    if (!impl_) {
        return;
    }
    Impl& s = *impl_;
    if (s.closing.exchange(true)) {
        return; // idempotent
    }
    if (!s.io_thread.joinable()) {
        return; // never opened
    }
    TW_TRACE("[WS] Closing link ...");
    try {
        net::post(s.ioc, [&s] { s.start_close_(); });
    }
    catch (const std::exception& ex) {
        TW_ERROR("[WS] Failed to schedule close handshake: " << ex.what());
        s.ioc.stop();
    }
    s.io_thread.join();
    s.open.store(false, std::memory_order_release);
    TW_TRACE("[WS] Link closed.");
}

bool WebSocket::poll_message(std::string& out) noexcept {
    return impl_->rx_ring.pop(out);
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    return impl_->events.pop(out);
}

bool WebSocket::is_open() const noexcept {
    return impl_->open.load(std::memory_order_acquire);
}

} // namespace trovowire::core::transport::beast
