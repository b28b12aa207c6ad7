/*
===============================================================================
Trovo chat Session
===============================================================================

The session turns one channel subscription into a single, ordered sequence of
decoded chat items, regardless of how many physical links are used underneath.

Design principles:
  - Composition over inheritance
  - Zero runtime polymorphism: every collaborator is a C++20 concept
  - Poll-driven: all progress happens inside poll() on the caller's thread
  - One transition function, one failure classification point

Collaborators:
  - WS               transport::WebSocketConcept, one instance per link
  - TokenProvider    auth::TokenProviderConcept (static or OAuth)
  - ChatTokenSource  http::ChatTokenSourceConcept (channel-scoped chat token)

Lifecycle:

    Idle ──open()──► Connecting ──link open──► Authenticating ──AUTH ack──►
         Joining ──JOIN ack──► Active
                      │
    any link failure, handshake rejection/timeout, staleness
                      ▼
                 Reconnecting ──retry timer──► Connecting

    Closed is reached from any state on close() (cancellation) or on a fatal
    failure (credentials rejected, unusable URL). A fatal failure surfaces
    exactly one terminal item, always the last one.

Every attempt re-fetches the chat token: tokens are short-lived and never
reused across links.

Reconnect policy:
  - Unbounded retries, capped exponential backoff
  - The first retry after a link that reached Active is immediate
  - Subsequent delays: min(backoff_max, backoff_base * 2^(attempt-1))
  - The attempt counter resets once Active is reached again

Liveness (per link, evaluated in Authenticating, Joining and Active):
  - No inbound frame within the staleness window, or more unanswered PINGs
    than max_missed_pongs: exactly one StalenessDetected per link
  - Neither is judged while output backpressure keeps the session from
    reading; the silence window restarts when reading resumes
  - Only a PONG answering a newer PING than the last acknowledged one counts,
    and only such a PONG may change the heartbeat interval (server gap)
  - AUTH / JOIN not acknowledged within handshake_timeout: HandshakeTimedOut

Data-plane model:
  - Each CHAT frame is decoded entry by entry; malformed entries become
    DecodeError items at their position
  - Decoded items go to a bounded output ring. While it is full the session
    stops consuming frames from the transport (the transport in turn stops
    reading from the socket). Nothing is dropped and nothing is reordered.
===============================================================================
*/

#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "trovowire/core/config/ring_sizes.hpp"
#include "trovowire/core/auth/concepts.hpp"
#include "trovowire/core/auth/error.hpp"
#include "trovowire/core/http/concepts.hpp"
#include "trovowire/core/http/error.hpp"
#include "trovowire/core/transport/error.hpp"
#include "trovowire/core/transport/parse_url.hpp"
#include "trovowire/core/transport/websocket/events.hpp"
#include "trovowire/core/transport/websocket_concept.hpp"
#include "trovowire/core/protocol/concept/json_writable.hpp"
#include "trovowire/core/protocol/trovo/context.hpp"
#include "trovowire/core/protocol/trovo/error.hpp"
#include "trovowire/core/protocol/trovo/item.hpp"
#include "trovowire/core/protocol/trovo/parser/router.hpp"
#include "trovowire/core/protocol/trovo/schema/control/auth.hpp"
#include "trovowire/core/protocol/trovo/schema/control/join.hpp"
#include "trovowire/core/protocol/trovo/schema/control/ping.hpp"
#include "trovowire/core/protocol/trovo/session/config.hpp"
#include "trovowire/core/protocol/trovo/session/state.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"
#include "lcr/sequence.hpp"


namespace trovowire::core::protocol::trovo {

template<
    transport::WebSocketConcept WS,
    auth::TokenProviderConcept TokenProvider,
    http::ChatTokenSourceConcept ChatTokenSource
>
class Session {
    using clock = std::chrono::steady_clock;

public:
    Session(std::string channel_id, TokenProvider& provider, ChatTokenSource& token_source, session::Config config = {})
        : channel_id_(std::move(channel_id))
        , provider_(provider)
        , token_source_(token_source)
        , config_(std::move(config))
        , heartbeat_interval_(config_.heartbeat_interval)
        , ctx_view_{ctx_}
        , router_(ctx_view_)
    {}

    // Cancellation on destruction: the link is closed deterministically.
    ~Session() {
        close();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // open(): Idle → Connecting, then the first connection attempt.
    // Returns false if the session was already opened.
    // -------------------------------------------------------------------------
    inline bool open() noexcept {
        if (state_ != session::State::Idle) {
            TW_WARN("[SESSION] open() called while not idle (state: " << to_string(state_) << "). Ignoring.");
            return false;
        }
        transport::ParsedUrl parsed;
        transport::Error err = transport::parse_url(config_.url, parsed);
        if (err == transport::Error::None && !parsed.secure) {
            TW_ERROR("[SESSION] Plain-text URL not supported: " << config_.url);
            err = transport::Error::InvalidUrl;
        }
        if (err != transport::Error::None) {
            TW_ERROR("[SESSION] Invalid chat URL '" << config_.url << "' (" << to_string(err) << ")");
            fail_(Failure::connect(err, "invalid chat URL '" + config_.url + "'"));
            return true;
        }
        parsed_url_ = std::move(parsed);
        TW_INFO("[SESSION] Opening chat for channel " << channel_id_);
        transition_(session::Event::OpenRequested);
        attempt_connect_();
        return true;
    }

    // -------------------------------------------------------------------------
    // close(): cancellation. From any state: the link is closed, buffered
    // items are discarded, no heartbeat or reconnect happens afterwards.
    // Idempotent.
    // -------------------------------------------------------------------------
    inline void close() noexcept {
        if (state_ == session::State::Closed && !ws_) {
            return;
        }
        transition_(session::Event::CloseRequested);
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    inline void poll() noexcept {
        if (state_ == session::State::Idle || cancelled_) {
            return;
        }

        // Items held back by a full output ring go first
        (void)deliver_pending_();

        if (has_link_()) {
            poll_link_();
        }

        // === Reconnection logic ===
        if (state_ == session::State::Reconnecting && clock::now() >= next_retry_) {
            transition_(session::Event::RetryTimerExpired);
            attempt_connect_();
        }
    }

    // -------------------------------------------------------------------------
    // Output sequence (arrival order, terminal item last)
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline bool pop(Item& out) noexcept {
        if (output_.pop(out)) {
            return true;
        }
        if (deliver_pending_() && output_.pop(out)) {
            return true;
        }
        if (!has_pending_ && output_.empty() && terminal_.has()) {
            out = std::move(terminal_.value());
            terminal_.reset();
            return true;
        }
        return false;
    }

    // True once Closed and every item has been handed out.
    [[nodiscard]]
    inline bool finished() const noexcept {
        return state_ == session::State::Closed && output_.empty() && !has_pending_ && !terminal_.has();
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------
    [[nodiscard]] inline session::State state() const noexcept { return state_; }
    [[nodiscard]] inline const std::string& channel_id() const noexcept { return channel_id_; }
    [[nodiscard]] inline const session::Config& config() const noexcept { return config_; }
    [[nodiscard]] inline bool cancelled() const noexcept { return cancelled_; }
    [[nodiscard]] inline std::chrono::milliseconds heartbeat_interval() const noexcept { return heartbeat_interval_; }

    // Observability counters
    [[nodiscard]] inline std::uint64_t link_epoch() const noexcept { return link_epoch_; }
    [[nodiscard]] inline std::uint64_t reconnect_attempts() const noexcept { return reconnect_attempts_; }
    [[nodiscard]] inline std::uint64_t rx_frames() const noexcept { return rx_frames_; }
    [[nodiscard]] inline std::uint64_t tx_frames() const noexcept { return tx_frames_; }
    [[nodiscard]] inline std::uint64_t heartbeats_sent() const noexcept { return heartbeats_sent_; }
    [[nodiscard]] inline std::uint64_t pongs_received() const noexcept { return pongs_received_; }
    [[nodiscard]] inline std::uint64_t decode_failures() const noexcept { return decode_failures_; }
    [[nodiscard]] inline std::uint64_t stale_links() const noexcept { return stale_links_; }

#ifdef TW_UNIT_TEST
public:
    [[nodiscard]] inline bool has_ws() const noexcept { return static_cast<bool>(ws_); }

    WS& ws() {
        return *ws_;
    }

    inline void force_last_inbound(clock::time_point ts) noexcept {
        last_inbound_ts_ = ts;
    }

    inline void force_next_retry(clock::time_point ts) noexcept {
        next_retry_ = ts;
    }

    inline void force_next_heartbeat(clock::time_point ts) noexcept {
        next_heartbeat_ = ts;
    }

    inline void force_handshake_deadline(clock::time_point ts) noexcept {
        handshake_deadline_ = ts;
    }

    [[nodiscard]] inline clock::time_point next_retry() const noexcept { return next_retry_; }
    [[nodiscard]] inline clock::time_point next_heartbeat() const noexcept { return next_heartbeat_; }
#endif // TW_UNIT_TEST

private:
    // =========================================================================
    // Failure model
    // =========================================================================

    enum class Source : std::uint8_t {
        Connect,     // opening a link
        Link,        // open link lost (error, close, send failure)
        Auth,        // token provider
        Http,        // chat token exchange
        Handshake,   // AUTH / JOIN rejected or not acknowledged
        Liveness     // staleness
    };

    struct Failure {
        Source source{Source::Link};
        transport::Error transport{transport::Error::None};
        auth::Error auth{auth::Error::None};
        http::Error http{http::Error::None};
        std::string detail;

        static Failure connect(transport::Error e, std::string d) { Failure f; f.source = Source::Connect; f.transport = e; f.detail = std::move(d); return f; }
        static Failure link(transport::Error e, std::string d)    { Failure f; f.source = Source::Link; f.transport = e; f.detail = std::move(d); return f; }
        static Failure from_auth(auth::Error e, std::string d)    { Failure f; f.source = Source::Auth; f.auth = e; f.detail = std::move(d); return f; }
        static Failure from_http(http::Error e, std::string d)    { Failure f; f.source = Source::Http; f.http = e; f.detail = std::move(d); return f; }
        static Failure handshake(std::string d)                   { Failure f; f.source = Source::Handshake; f.detail = std::move(d); return f; }
        static Failure liveness(std::string d)                    { Failure f; f.source = Source::Liveness; f.detail = std::move(d); return f; }
    };

    // Single classification point: is this failure worth another attempt?
    // Only bad credentials and an unusable URL end the session.
    [[nodiscard]]
    inline bool is_transient_(const Failure& f) const noexcept {
        bool transient = true;
        switch (f.source) {
            case Source::Connect:
                transient = (f.transport != transport::Error::InvalidUrl);
                break;
            case Source::Auth:
                transient = !auth::is_fatal(f.auth);
                break;
            case Source::Http:
                transient = (f.http != http::Error::AuthenticatedRequestError);
                break;
            case Source::Link:
            case Source::Handshake:
            case Source::Liveness:
            default:
                transient = true;
                break;
        }
        TW_TRACE("[SESSION] retry after '" << f.detail << "'? -> " << (transient ? "YES" : "NO"));
        return transient;
    }

    [[nodiscard]]
    static inline ChatError::Kind error_kind_(const Failure& f) noexcept {
        switch (f.source) {
            case Source::Connect: return ChatError::Kind::ConnectError;
            case Source::Auth:    return ChatError::Kind::AuthError;
            case Source::Http:
                return (f.http == http::Error::AuthenticatedRequestError)
                    ? ChatError::Kind::AuthenticatedRequestError
                    : ChatError::Kind::RequestError;
            default:              return ChatError::Kind::LinkError;
        }
    }

    inline void fail_(Failure&& f) noexcept {
        if (is_transient_(f)) {
            TW_WARN("[SESSION] " << to_string(error_kind_(f)) << ": " << f.detail << " (will reconnect)");
            transition_(session::Event::LinkFailed);
            return;
        }
        TW_ERROR("[SESSION] Fatal " << to_string(error_kind_(f)) << ": " << f.detail);
        ChatError err;
        err.kind = error_kind_(f);
        err.detail = std::move(f.detail);
        terminal_ = Item::make_fatal(std::move(err));
        transition_(session::Event::FatalError);
    }

private:
    // =========================================================================
    // State machine
    // =========================================================================

    inline void set_state_(session::State new_state) noexcept {
        TW_TRACE("[SESSION] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    inline void transition_(session::Event event) noexcept {
        using session::State;
        using session::Event;
        const State state = state_;

        TW_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        // Cancellation and fatal errors are accepted from every state
        if (event == Event::CloseRequested) {
            cancelled_ = true;
            teardown_link_();
            clear_output_();
            set_state_(State::Closed);
            TW_INFO("[SESSION] Chat for channel " << channel_id_ << " closed by caller.");
            return;
        }
        if (event == Event::FatalError) {
            teardown_link_();
            set_state_(State::Closed);
            return;
        }

        switch (state) {

        // ================================================================
        case State::Idle:
            switch (event) {
            case Event::OpenRequested:
                set_state_(State::Connecting);
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::LinkOpened:
                set_state_(State::Authenticating);
                ++link_epoch_;
                reset_link_tracking_();
                break;
            case Event::LinkFailed:
                enter_reconnecting_();
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Authenticating:
            switch (event) {
            case Event::AuthAcked:
                if (config_.send_join) {
                    set_state_(State::Joining);
                    handshake_deadline_ = clock::now() + config_.handshake_timeout;
                } else {
                    enter_active_();
                }
                break;
            case Event::LinkFailed:
            case Event::HandshakeRejected:
            case Event::HandshakeTimedOut:
            case Event::StalenessDetected:
                enter_reconnecting_();
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Joining:
            switch (event) {
            case Event::JoinAcked:
                enter_active_();
                break;
            case Event::LinkFailed:
            case Event::HandshakeRejected:
            case Event::HandshakeTimedOut:
            case Event::StalenessDetected:
                enter_reconnecting_();
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Active:
            switch (event) {
            case Event::LinkFailed:
            case Event::StalenessDetected:
                enter_reconnecting_();
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::RetryTimerExpired:
                ++reconnect_attempts_;
                set_state_(State::Connecting);
                break;
            default:
                break;
            }
            break;

        // ================================================================
        case State::Closed:
        default:
            break;
        }
    }

    inline void enter_active_() noexcept {
        set_state_(session::State::Active);
        reached_active_ = true;
        retry_attempt_ = 0;
        next_heartbeat_ = clock::now() + heartbeat_interval_;
        TW_INFO("[SESSION] Chat for channel " << channel_id_ << " is active (link " << link_epoch_ << ").");
    }

    inline void enter_reconnecting_() noexcept {
        teardown_link_();
        set_state_(session::State::Reconnecting);
        const auto now = clock::now();
        if (reached_active_ && retry_attempt_ == 0) {
            // The link was healthy: retry right away
            retry_attempt_ = 1;
            next_retry_ = now;
            TW_INFO("[SESSION] Reconnecting immediately.");
        } else {
            ++retry_attempt_;
            const auto delay = backoff_(retry_attempt_);
            next_retry_ = now + delay;
            TW_INFO("[SESSION] Next reconnection attempt in " << delay.count() << " ms (attempt " << retry_attempt_ << ")");
        }
        reached_active_ = false;
    }

    [[nodiscard]]
    inline std::chrono::milliseconds backoff_(std::uint32_t attempt) const noexcept {
        // Clamp exponent to avoid overflow
        const std::uint32_t exponent = std::min<std::uint32_t>(attempt > 0 ? attempt - 1 : 0, 16);
        const auto delay = config_.backoff_base * (std::int64_t{1} << exponent);
        return std::min(delay, config_.backoff_max);
    }

private:
    // =========================================================================
    // Connection attempt (Connecting)
    // =========================================================================

    inline void attempt_connect_() noexcept {
        if (state_ != session::State::Connecting) {
            return;
        }
        TW_DEBUG("[SESSION] Connection attempt for channel " << channel_id_ << " (retry " << retry_attempt_ << ")");

        // 1) Credential
        auth::Error aerr = provider_.refresh_if_needed();
        if (aerr != auth::Error::None) {
            fail_(Failure::from_auth(aerr, "token refresh failed (" + std::string(to_string(aerr)) + ")"));
            return;
        }
        auth::AccessToken access;
        aerr = provider_.access_token(access);
        if (aerr != auth::Error::None) {
            fail_(Failure::from_auth(aerr, "no usable access token (" + std::string(to_string(aerr)) + ")"));
            return;
        }

        // 2) Fresh chat token (never reused across links)
        chat_token_ = auth::ChatToken{};
        const http::Error herr = token_source_.exchange_chat_token(access, channel_id_, chat_token_);
        if (herr != http::Error::None) {
            fail_(Failure::from_http(herr, "chat token exchange failed (" + std::string(to_string(herr)) + ")"));
            return;
        }

        // 3) Fresh link
        teardown_link_();
        ws_ = std::make_unique<WS>();
        const auto& url = parsed_url_.value();
        const transport::Error terr = ws_->connect(url.host, url.port, url.path);
        if (terr != transport::Error::None) {
            teardown_link_();
            fail_(Failure::connect(terr, "connect to " + config_.url + " failed (" + std::string(to_string(terr)) + ")"));
            return;
        }

        // 4) Authenticate
        transition_(session::Event::LinkOpened);
        schema::control::Auth auth_frame;
        auth_frame.nonce = auth_nonce_();
        auth_frame.token = chat_token_.token;
        TW_DEBUG("[SESSION] Sending AUTH (nonce " << auth_frame.nonce << ", token " << auth::redact(chat_token_.token) << ")");
        if (!send_(auth_frame)) {
            fail_(Failure::link(transport::Error::RemoteClosed, "AUTH could not be sent"));
        }
    }

    // =========================================================================
    // Link processing (Authenticating / Joining / Active)
    // =========================================================================

    [[nodiscard]]
    inline bool has_link_() const noexcept {
        return ws_ && (state_ == session::State::Authenticating
                    || state_ == session::State::Joining
                    || state_ == session::State::Active);
    }

    inline void poll_link_() noexcept {
        // === Drain transport events ===

        {
            transport::websocket::Event ev;
            while (ws_->poll_event(ev)) {
                switch (ev.type) {
                    case transport::websocket::EventType::Error:
                        TW_WARN("[SESSION] Transport error: " << to_string(ev.error));
                        link_error_ = ev.error;
                        break;
                    case transport::websocket::EventType::Close:
                        link_closed_ = true;
                        break;
                }
            }
        }

        // === Consume frames ===
        const bool drained = consume_frames_();
        if (!has_link_()) {
            return; // a frame changed the state (rejection, ...)
        }

        // === Link loss (only once every frame before it was consumed) ===
        if (link_closed_ && drained) {
            const transport::Error e = (link_error_ != transport::Error::None) ? link_error_ : transport::Error::RemoteClosed;
            fail_(Failure::link(e, "link lost (" + std::string(to_string(e)) + ")"));
            return;
        }

        const auto now = clock::now();

        // === Handshake timeout ===
        if ((state_ == session::State::Authenticating || state_ == session::State::Joining) && now >= handshake_deadline_) {
            TW_WARN("[SESSION] No acknowledgement within " << config_.handshake_timeout.count() << " ms in " << to_string(state_));
            transition_(session::Event::HandshakeTimedOut);
            return;
        }

        // === Output backpressure ===
        // Nothing is read while the caller leaves the output full, so silence
        // and unanswered PINGs are judged again only once reading resumes.
        if (reading_paused_) {
            last_inbound_ts_ = now;
            return;
        }

        // === Staleness ===
        if (!staleness_emitted_ && is_stale_(now)) {
            staleness_emitted_ = true;
            ++stale_links_;
            TW_WARN("[SESSION] Link presumed dead (silence " << std::chrono::duration_cast<std::chrono::milliseconds>(now - last_inbound_ts_).count()
                    << " ms, unanswered pings " << outstanding_pings_() << ")");
            transition_(session::Event::StalenessDetected);
            return;
        }

        // === Heartbeat ===
        if (state_ == session::State::Active && now >= next_heartbeat_) {
            send_heartbeat_(now);
        }
    }

    // Returns true when the transport has no frame left (as opposed to
    // stopping on the per-poll budget or on output backpressure).
    [[nodiscard]]
    inline bool consume_frames_() noexcept {
        reading_paused_ = false;
        for (std::size_t n = 0; n < config::MAX_FRAMES_PER_POLL; ++n) {
            if (has_pending_ || output_.full()) {
                reading_paused_ = true;
                return false; // backpressure: leave frames in the transport
            }
            if (!ws_->poll_message(frame_)) {
                return true;
            }
            ++rx_frames_;
            last_inbound_ts_ = clock::now();
            handle_frame_(frame_);
            if (!has_link_()) {
                return false;
            }
        }
        return false;
    }

    inline void handle_frame_(std::string_view frame) noexcept {
        const parser::Result r = router_.parse_and_route(frame);
        switch (r) {
            case parser::Result::InvalidJson:
            case parser::Result::InvalidSchema:
            case parser::Result::InvalidValue: {
                ++decode_failures_;
                ChatError err;
                err.kind = ChatError::Kind::DecodeError;
                err.detail = "malformed frame (" + std::string(parser::to_string(r)) + ")";
                (void)output_.push(Item::make_decode_error(std::move(err))); // room checked by caller
                return;
            }
            case parser::Result::Backpressure:
                TW_ERROR("[SESSION] Decoded frame lost to backpressure");
                return;
            default:
                break;
        }

        schema::control::Response resp;
        while (ctx_.response_ring.pop(resp)) {
            on_response_(resp);
            if (!has_link_()) {
                ctx_.clear();
                return;
            }
        }
        schema::system::Pong pong;
        while (ctx_.pong_ring.pop(pong)) {
            on_pong_(pong);
        }
        schema::chat::Batch batch;
        while (ctx_.chat_ring.pop(batch)) {
            on_chat_(std::move(batch));
        }
    }

    // ------------------------------------------------------------------
    // RESPONSE
    // ------------------------------------------------------------------
    inline void on_response_(const schema::control::Response& resp) noexcept {
        const session::State state = state_;
        const bool for_auth = (state == session::State::Authenticating);
        const bool for_join = (state == session::State::Joining);
        if (!for_auth && !for_join) {
            TW_DEBUG("[SESSION] Unsolicited " << resp << " in " << to_string(state) << " -> ignore");
            return;
        }
        const std::string expected = for_auth ? auth_nonce_() : join_nonce_();
        if (resp.nonce.has() && resp.nonce.value() != expected) {
            TW_DEBUG("[SESSION] RESPONSE for nonce " << resp.nonce.value() << " while waiting for " << expected << " -> ignore");
            return;
        }
        if (!resp.is_ack()) {
            TW_WARN("[SESSION] " << (for_auth ? "AUTH" : "JOIN") << " rejected: " << resp.error.value()
                    << (resp.code.has() ? " (code " + std::to_string(resp.code.value()) + ")" : std::string()));
            transition_(session::Event::HandshakeRejected);
            return;
        }
        if (for_auth) {
            TW_DEBUG("[SESSION] AUTH acknowledged");
            transition_(session::Event::AuthAcked);
            if (state_ == session::State::Joining) {
                schema::control::Join join;
                join.nonce = join_nonce_();
                join.channel_id = channel_id_;
                TW_DEBUG("[SESSION] Sending JOIN for channel " << channel_id_);
                if (!send_(join)) {
                    fail_(Failure::link(transport::Error::RemoteClosed, "JOIN could not be sent"));
                }
            }
        } else {
            TW_DEBUG("[SESSION] JOIN acknowledged");
            transition_(session::Event::JoinAcked);
        }
    }

    // ------------------------------------------------------------------
    // PONG
    // ------------------------------------------------------------------
    inline void on_pong_(const schema::system::Pong& pong) noexcept {
        ++pongs_received_;
        if (pong.nonce.has()) {
            const std::string& n = pong.nonce.value();
            std::uint64_t iteration = 0;
            auto [ptr, ec] = std::from_chars(n.data(), n.data() + n.size(), iteration);
            if (ec == std::errc{} && ptr == n.data() + n.size()
                && iteration > last_acked_ping_ && iteration <= ping_seq_.last()) {
                last_acked_ping_ = iteration;
                if (pong.gap.has()) {
                    apply_server_gap_(pong.gap.value());
                }
                return;
            }
            TW_DEBUG("[SESSION] PONG with stale or foreign nonce '" << n << "' -> not counted");
        }
    }

    // Only the answer to the newest acknowledged PING may reschedule the heartbeat.
    inline void apply_server_gap_(std::uint64_t gap_s) noexcept {
        if (!config_.honor_server_gap) {
            return;
        }
        const std::chrono::milliseconds gap = std::chrono::seconds(std::clamp<std::uint64_t>(
            gap_s,
            static_cast<std::uint64_t>(session::MIN_HEARTBEAT_INTERVAL.count()),
            static_cast<std::uint64_t>(session::MAX_HEARTBEAT_INTERVAL.count())));
        if (gap != heartbeat_interval_) {
            TW_DEBUG("[SESSION] Heartbeat interval set by server: " << gap.count() << " ms");
            next_heartbeat_ = next_heartbeat_ - heartbeat_interval_ + gap;
            heartbeat_interval_ = gap;
        }
    }

    // ------------------------------------------------------------------
    // CHAT
    // ------------------------------------------------------------------
    inline void on_chat_(schema::chat::Batch&& batch) noexcept {
        if (state_ == session::State::Authenticating) {
            TW_WARN("[SESSION] CHAT frame before AUTH acknowledgement -> dropped (" << batch << ")");
            return;
        }
        if (state_ == session::State::Joining) {
            // Messages for the channel: the join took effect
            TW_DEBUG("[SESSION] CHAT frame received while joining -> join confirmed");
            transition_(session::Event::JoinAcked);
        }
        TW_TRACE("[SESSION] " << batch);
        pending_ = std::move(batch);
        pending_cursor_ = 0;
        has_pending_ = true;
        (void)deliver_pending_();
    }

    // Moves decoded entries into the output ring. Returns true if anything was delivered.
    inline bool deliver_pending_() noexcept {
        if (!has_pending_) {
            return false;
        }
        bool delivered = false;
        while (pending_cursor_ < pending_.entries.size() && !output_.full()) {
            auto& entry = pending_.entries[pending_cursor_];
            if (entry.ok()) {
                (void)output_.push(Item::make_message(std::move(entry.message.value())));
            } else {
                ++decode_failures_;
                ChatError err;
                err.kind = ChatError::Kind::DecodeError;
                err.detail = std::move(entry.failure.reason);
                err.index = entry.failure.index;
                err.message_id = std::move(entry.failure.message_id);
                TW_WARN("[SESSION] Chat entry " << entry.failure.index << " could not be decoded: " << err.detail);
                (void)output_.push(Item::make_decode_error(std::move(err)));
            }
            ++pending_cursor_;
            delivered = true;
        }
        if (pending_cursor_ >= pending_.entries.size()) {
            pending_.entries.clear();
            pending_cursor_ = 0;
            has_pending_ = false;
        }
        return delivered;
    }

    // ------------------------------------------------------------------
    // Heartbeat
    // ------------------------------------------------------------------
    inline void send_heartbeat_(clock::time_point now) noexcept {
        schema::control::Ping ping;
        ping.iteration = ping_seq_.next();
        if (!send_(ping)) {
            fail_(Failure::link(transport::Error::RemoteClosed, "PING could not be sent"));
            return;
        }
        ++heartbeats_sent_;
        next_heartbeat_ = now + heartbeat_interval_;
        TW_TRACE("[SESSION] PING " << ping.iteration << " sent (unanswered: " << outstanding_pings_() << ")");
    }

    [[nodiscard]]
    inline std::uint64_t outstanding_pings_() const noexcept {
        return ping_seq_.last() - last_acked_ping_;
    }

    [[nodiscard]]
    inline bool is_stale_(clock::time_point now) const noexcept {
        const auto window = std::max(config_.staleness_window, 2 * heartbeat_interval_);
        return (now - last_inbound_ts_) >= window || outstanding_pings_() > config_.max_missed_pongs;
    }

    // ------------------------------------------------------------------
    // Sending
    // ------------------------------------------------------------------
    template<JsonWritable Frame>
    [[nodiscard]]
    inline bool send_(const Frame& frame) noexcept {
        if (!ws_) {
            return false;
        }
        tx_buffer_.resize(frame.max_json_size());
        tx_buffer_.resize(frame.write_json(tx_buffer_.data()));
        if (!ws_->send(tx_buffer_)) {
            TW_WARN("[SESSION] send() rejected by transport");
            return false;
        }
        ++tx_frames_;
        return true;
    }

    // ------------------------------------------------------------------
    // Link bookkeeping
    // ------------------------------------------------------------------
    inline void reset_link_tracking_() noexcept {
        const auto now = clock::now();
        last_inbound_ts_ = now;
        handshake_deadline_ = now + config_.handshake_timeout;
        staleness_emitted_ = false;
        reading_paused_ = false;
        link_closed_ = false;
        link_error_ = transport::Error::None;
        last_acked_ping_ = ping_seq_.last();
        heartbeat_interval_ = config_.heartbeat_interval;
        ctx_.clear();
    }

    inline void teardown_link_() noexcept {
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
        ctx_.clear();
    }

    inline void clear_output_() noexcept {
        Item discard;
        while (output_.pop(discard)) {}
        pending_.entries.clear();
        pending_cursor_ = 0;
        has_pending_ = false;
        terminal_.reset();
    }

    [[nodiscard]]
    inline std::string auth_nonce_() const {
        return "auth-" + std::to_string(link_epoch_);
    }

    [[nodiscard]]
    inline std::string join_nonce_() const {
        return "join-" + std::to_string(link_epoch_);
    }

private:
    std::string channel_id_;
    TokenProvider& provider_;
    ChatTokenSource& token_source_;
    session::Config config_;
    lcr::optional<transport::ParsedUrl> parsed_url_;

    // State machine
    session::State state_{session::State::Idle};
    bool cancelled_{false};
    bool reached_active_{false};
    std::uint32_t retry_attempt_{0};     // ordinal of the next retry, 0 after reaching Active
    clock::time_point next_retry_{};

    // Current link
    std::unique_ptr<WS> ws_;
    auth::ChatToken chat_token_;
    bool link_closed_{false};
    transport::Error link_error_{transport::Error::None};
    clock::time_point last_inbound_ts_{};
    clock::time_point handshake_deadline_{};
    bool staleness_emitted_{false};
    bool reading_paused_{false};

    // Heartbeat
    std::chrono::milliseconds heartbeat_interval_;
    clock::time_point next_heartbeat_{};
    lcr::sequence ping_seq_{1};
    std::uint64_t last_acked_ping_{0};

    // Decoding
    Context ctx_;
    ContextView ctx_view_;
    parser::Router router_;
    std::string frame_;
    std::string tx_buffer_;

    // Output
    lcr::local::ring_buffer<Item, config::OUTPUT_RING_CAPACITY> output_;
    schema::chat::Batch pending_;
    std::size_t pending_cursor_{0};
    bool has_pending_{false};
    lcr::optional<Item> terminal_;

    // Observability
    std::uint64_t link_epoch_{0};
    std::uint64_t reconnect_attempts_{0};
    std::uint64_t rx_frames_{0};
    std::uint64_t tx_frames_{0};
    std::uint64_t heartbeats_sent_{0};
    std::uint64_t pongs_received_{0};
    std::uint64_t decode_failures_{0};
    std::uint64_t stale_links_{0};
};

} // namespace trovowire::core::protocol::trovo
