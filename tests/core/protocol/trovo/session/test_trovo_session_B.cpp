/*
===============================================================================
 protocol::trovo::Session - Group B Reconnect Tests
===============================================================================

Scope:
------
Validate that transient failures are absorbed by the reconnect loop and
that the chat sequence continues across links.

Covered:
B1 Link loss while active: immediate reconnect, messages continue
B2 Connect failure: retry after backoff
B3 Backoff doubles and is capped
B4 Every attempt exchanges a fresh chat token
B5 Transient token exchange failure is retried
B6 AUTH rejection is retried
B7 Handshake timeout is retried
B8 Frames received before the close are delivered first

These tests assume:
- MockWebSocket
- Deterministic poll-driven execution
- No real network I/O

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>

#include "common/harness/session.hpp"

using namespace std::chrono_literals;
using clock_type = std::chrono::steady_clock;


// ----------------------------------------------------------------------------
// B1 Link loss while active
// ----------------------------------------------------------------------------

void test_link_loss_reconnects() {
    std::cout << "[TEST] B1 Link loss while active reconnects immediately\n";

    test::SessionHarness h;
    h.activate();

    h.emit(json::trovo::chat({ json::trovo::chat_entry("m1", "alice", "before") }));
    h.session.poll();

    h.drop_link(transport::Error::TransportFailure);

    // Same poll: immediate retry, new link authenticating
    TEST_CHECK(h.session.state() == session::State::Authenticating);
    TEST_CHECK(h.session.link_epoch() == 2);
    TEST_CHECK(h.session.reconnect_attempts() == 1);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 2);
    TEST_CHECK(WebSocketUnderTest::sent().back() == R"({"type":"AUTH","nonce":"auth-2","data":{"token":"chat-token-2"}})");

    h.activate();
    h.emit(json::trovo::chat({ json::trovo::chat_entry("m2", "bob", "after") }));
    h.session.poll();

    // Transient failures never reach the caller
    auto items = h.drain();
    TEST_CHECK(items.size() == 2);
    TEST_CHECK(items[0].is_message() && items[0].message.message_id == "m1");
    TEST_CHECK(items[1].is_message() && items[1].message.message_id == "m2");

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B2 Connect failure
// ----------------------------------------------------------------------------

void test_connect_failure_backoff() {
    std::cout << "[TEST] B2 Connect failure is retried after backoff\n";

    test::SessionHarness h;
    WebSocketUnderTest::push_connect_result(transport::Error::ConnectionFailed);

    TEST_CHECK(h.session.open());
    TEST_CHECK(h.session.state() == session::State::Reconnecting);
    TEST_CHECK(h.session.next_retry() > clock_type::now());
    TEST_CHECK(h.session.next_retry() <= clock_type::now() + 250ms);

    // Not due yet: nothing happens
    h.session.poll();
    TEST_CHECK(h.session.state() == session::State::Reconnecting);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 1);

    h.fire_retry();
    TEST_CHECK(h.session.state() == session::State::Authenticating);
    TEST_CHECK(h.session.reconnect_attempts() == 1);
    TEST_CHECK(h.session.link_epoch() == 1);
    TEST_CHECK(h.drain().empty());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B3 Backoff growth
// ----------------------------------------------------------------------------

static void check_delay(const SessionUnderTest& s, std::chrono::milliseconds expected) {
    const auto remaining = s.next_retry() - clock_type::now();
    TEST_CHECK(remaining <= expected);
    TEST_CHECK(remaining > expected - 50ms);
}

void test_backoff_growth() {
    std::cout << "[TEST] B3 Backoff doubles and is capped\n";

    session::Config cfg;
    cfg.backoff_base = 100ms;
    cfg.backoff_max = 400ms;
    test::SessionHarness h{cfg};

    for (int i = 0; i < 4; ++i) {
        WebSocketUnderTest::push_connect_result(transport::Error::Timeout);
    }

    TEST_CHECK(h.session.open());
    check_delay(h.session, 100ms);
    h.fire_retry();
    check_delay(h.session, 200ms);
    h.fire_retry();
    check_delay(h.session, 400ms);
    h.fire_retry();
    check_delay(h.session, 400ms);

    // Fifth attempt succeeds
    h.fire_retry();
    TEST_CHECK(h.session.state() == session::State::Authenticating);
    TEST_CHECK(h.session.reconnect_attempts() == 4);

    // Reaching Active resets the schedule: the next loss retries immediately
    h.activate();
    h.drop_link();
    TEST_CHECK(h.session.state() == session::State::Authenticating);
    TEST_CHECK(h.session.reconnect_attempts() == 5);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B4 Fresh chat token
// ----------------------------------------------------------------------------

void test_fresh_chat_token_per_attempt() {
    std::cout << "[TEST] B4 Fresh chat token per attempt\n";

    test::SessionHarness h;
    h.activate();
    h.drop_link();
    h.activate();
    h.drop_link();

    TEST_CHECK(h.source.calls() == 3);
    TEST_CHECK(h.source.issued() == 3);
    TEST_CHECK(WebSocketUnderTest::sent_count("chat-token-1") == 1);
    TEST_CHECK(WebSocketUnderTest::sent_count("chat-token-2") == 1);
    TEST_CHECK(WebSocketUnderTest::sent_count("chat-token-3") == 1);
    TEST_CHECK(h.provider.refresh_calls == 3);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B5 Transient token exchange failure
// ----------------------------------------------------------------------------

void test_request_error_is_transient() {
    std::cout << "[TEST] B5 Token exchange RequestError is retried\n";

    test::SessionHarness h;
    h.source.push_result(http::Error::RequestError);

    TEST_CHECK(h.session.open());
    TEST_CHECK(h.session.state() == session::State::Reconnecting);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 0);

    h.fire_retry();
    TEST_CHECK(h.session.state() == session::State::Authenticating);
    TEST_CHECK(h.source.calls() == 2);
    TEST_CHECK(h.drain().empty());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B6 AUTH rejection
// ----------------------------------------------------------------------------

void test_auth_rejection_is_transient() {
    std::cout << "[TEST] B6 AUTH rejection is retried\n";

    test::SessionHarness h;
    h.open();

    h.emit(json::trovo::response_error(h.auth_nonce(), "invalid token", 11701));
    h.session.poll();

    TEST_CHECK(h.session.state() == session::State::Reconnecting);
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(h.drain().empty());

    h.fire_retry();
    TEST_CHECK(h.session.state() == session::State::Authenticating);
    TEST_CHECK(h.session.link_epoch() == 2);

    // JOIN rejection behaves the same
    h.ack_auth();
    h.emit(json::trovo::response_error(h.join_nonce(), "channel not found", 20000));
    h.session.poll();
    TEST_CHECK(h.session.state() == session::State::Reconnecting);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B7 Handshake timeout
// ----------------------------------------------------------------------------

void test_handshake_timeout() {
    std::cout << "[TEST] B7 Handshake timeout is retried\n";

    test::SessionHarness h;
    h.open();

    h.session.poll();
    TEST_CHECK(h.session.state() == session::State::Authenticating);

    h.session.force_handshake_deadline(clock_type::now() - 1ms);
    h.session.poll();
    TEST_CHECK(h.session.state() == session::State::Reconnecting);

    h.fire_retry();
    h.ack_auth();
    TEST_CHECK(h.session.state() == session::State::Joining);

    h.session.force_handshake_deadline(clock_type::now() - 1ms);
    h.session.poll();
    TEST_CHECK(h.session.state() == session::State::Reconnecting);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// B8 Frames before close
// ----------------------------------------------------------------------------

void test_frames_before_close_delivered() {
    std::cout << "[TEST] B8 Frames received before the close come first\n";

    test::SessionHarness h;
    h.activate();

    h.emit(json::trovo::chat({
        json::trovo::chat_entry("m1", "alice", "one"),
        json::trovo::chat_entry("m2", "bob", "two")
    }));
    h.drop_link();

    TEST_CHECK(h.session.link_epoch() == 2);
    auto items = h.drain();
    TEST_CHECK(items.size() == 2);
    TEST_CHECK(items[0].message.message_id == "m1");
    TEST_CHECK(items[1].message.message_id == "m2");

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_link_loss_reconnects();
    test_connect_failure_backoff();
    test_backoff_growth();
    test_fresh_chat_token_per_attempt();
    test_request_error_is_transient();
    test_auth_rejection_is_transient();
    test_handshake_timeout();
    test_frames_before_close_delivered();

    std::cout << "\n[GROUP B - SESSION RECONNECT TESTS PASSED]\n";
    return 0;
}
