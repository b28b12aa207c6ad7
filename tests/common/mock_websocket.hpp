#pragma once

#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "trovowire/core/transport/error.hpp"
#include "trovowire/core/transport/websocket/events.hpp"
#include "trovowire/core/transport/websocket_concept.hpp"
#include "lcr/log/logger.hpp"


namespace trovowire::core::transport::test {

/*
===============================================================================
 MockWebSocket
===============================================================================

Deterministic, thread-free stand-in for one physical WebSocket link.

The session creates a fresh instance per connection attempt, so everything a
test needs to observe or inject across links is static:

  - connect results are scripted with push_connect_result(); when the script
    is empty, connect() succeeds
  - every frame accepted by send() is recorded in sent() (all links)
  - counters for connect / close calls

Per-link injection (emit_message / emit_error / emit_close) goes through the
instance the session currently owns (Session::ws() in unit-test builds).
===============================================================================
*/
class MockWebSocket {
public:
    MockWebSocket() {
        TW_TRACE("[MockWebSocket] constructed");
        ++instances_;
    }

    ~MockWebSocket() {
        TW_TRACE("[MockWebSocket] destructed");
    }

    // ---------------------------------------------------------------------
    // transport::WebSocketConcept API
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
        TW_DEBUG("[MockWebSocket] connect() to " << host << ":" << port << path);
        ++connect_count_;
        last_host_ = host;
        last_path_ = path;
        Error result = Error::None;
        if (!connect_results_.empty()) {
            result = connect_results_.front();
            connect_results_.pop_front();
        }
        open_ = (result == Error::None);
        return result;
    }

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (!open_ || reject_sends_) {
            TW_DEBUG("[MockWebSocket] send() rejected");
            return false;
        }
        sent_.emplace_back(text);
        return true;
    }

    inline void close() noexcept {
        TW_DEBUG("[MockWebSocket] close() called");
        if (!open_) {
            return;
        }
        open_ = false;
        ++close_count_;
    }

    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        if (rx_.empty()) {
            return false;
        }
        out = std::move(rx_.front());
        rx_.pop_front();
        return true;
    }

    [[nodiscard]]
    inline bool poll_event(websocket::Event& out) noexcept {
        if (events_.empty()) {
            return false;
        }
        out = events_.front();
        events_.pop_front();
        return true;
    }

    // ---------------------------------------------------------------------
    // Test helpers (per link)
    // ---------------------------------------------------------------------

    inline void emit_message(std::string msg) {
        rx_.push_back(std::move(msg));
    }

    inline void emit_error(Error err = Error::TransportFailure) {
        events_.push_back(websocket::Event::make_error(err));
    }

    inline void emit_close() {
        open_ = false;
        events_.push_back(websocket::Event::make_close());
    }

    // Abnormal termination: Error followed by Close
    inline void fail(Error err = Error::RemoteClosed) {
        emit_error(err);
        emit_close();
    }

    [[nodiscard]] inline bool is_open() const noexcept { return open_; }
    [[nodiscard]] inline std::size_t pending_messages() const noexcept { return rx_.size(); }

    // ---------------------------------------------------------------------
    // Test helpers (all links)
    // ---------------------------------------------------------------------

    static inline void push_connect_result(Error err) {
        connect_results_.push_back(err);
    }

    static inline void set_reject_sends(bool reject) {
        reject_sends_ = reject;
    }

    static inline const std::vector<std::string>& sent() { return sent_; }
    static inline int connect_count() { return connect_count_; }
    static inline int close_count() { return close_count_; }
    static inline int instances() { return instances_; }
    static inline const std::string& last_host() { return last_host_; }
    static inline const std::string& last_path() { return last_path_; }

    // Number of sent frames whose text contains needle
    static inline int sent_count(std::string_view needle) {
        int n = 0;
        for (const auto& f : sent_) {
            if (f.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    static inline void reset() {
        connect_results_.clear();
        sent_.clear();
        reject_sends_ = false;
        connect_count_ = 0;
        close_count_ = 0;
        instances_ = 0;
        last_host_.clear();
        last_path_.clear();
    }

private:
    bool open_{false};
    std::deque<std::string> rx_;
    std::deque<websocket::Event> events_;

    static inline std::deque<Error> connect_results_{};
    static inline std::vector<std::string> sent_{};
    static inline bool reject_sends_{false};
    static inline int connect_count_{0};
    static inline int close_count_{0};
    static inline int instances_{0};
    static inline std::string last_host_{};
    static inline std::string last_path_{};
};

// Assert that MockWebSocket conforms to transport::WebSocketConcept concept
static_assert(WebSocketConcept<MockWebSocket>);

} // namespace trovowire::core::transport::test
