/*
===============================================================================
 protocol::trovo::Session - Group C Fatal Termination Tests
===============================================================================

Scope:
------
Validate that non-recoverable failures end the sequence with exactly one
terminal item, delivered last, and that nothing is attempted afterwards.

Covered:
C1 Credentials rejected on reconnect: one Fatal item, no further attempts
C2 Token provider without credential: AuthError
C3 Refresh failure is transient
C4 Buffered messages precede the terminal item
C5 Unusable URL: ConnectError
C6 close() after a fatal failure keeps the terminal item

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

using clock_type = std::chrono::steady_clock;


static int count_fatal(const std::vector<Item>& items) {
    int n = 0;
    for (const auto& it : items) {
        if (it.kind == Item::Kind::Fatal) {
            ++n;
        }
    }
    return n;
}


// ----------------------------------------------------------------------------
// C1 Credentials rejected on reconnect
// ----------------------------------------------------------------------------

void test_rejected_credentials_on_reconnect() {
    std::cout << "[TEST] C1 Rejected credentials on reconnect end the sequence\n";

    test::SessionHarness h;
    h.activate();

    h.source.push_result(http::Error::AuthenticatedRequestError);
    h.drop_link();

    TEST_CHECK(h.session.state() == session::State::Closed);
    TEST_CHECK(!h.session.finished());   // terminal item not handed out yet

    auto items = h.drain();
    TEST_CHECK(items.size() == 1);
    TEST_CHECK(items[0].kind == Item::Kind::Fatal);
    TEST_CHECK(items[0].error.kind == ChatError::Kind::AuthenticatedRequestError);
    TEST_CHECK(h.session.finished());

    // Nothing more: no item, no connection attempt
    for (int i = 0; i < 5; ++i) {
        h.session.force_next_retry(clock_type::now());
        h.session.poll();
    }
    TEST_CHECK(h.drain().empty());
    TEST_CHECK(WebSocketUnderTest::connect_count() == 1);
    TEST_CHECK(h.source.calls() == 2);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C2 Missing credential
// ----------------------------------------------------------------------------

void test_missing_credential_is_fatal() {
    std::cout << "[TEST] C2 Missing credential is fatal\n";

    test::SessionHarness h;
    h.provider.access_result = auth::Error::Missing;

    TEST_CHECK(h.session.open());
    TEST_CHECK(h.session.state() == session::State::Closed);
    TEST_CHECK(WebSocketUnderTest::connect_count() == 0);
    TEST_CHECK(h.source.calls() == 0);

    auto items = h.drain();
    TEST_CHECK(items.size() == 1);
    TEST_CHECK(items[0].kind == Item::Kind::Fatal);
    TEST_CHECK(items[0].error.kind == ChatError::Kind::AuthError);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C3 Refresh failure
// ----------------------------------------------------------------------------

void test_refresh_failure_is_transient() {
    std::cout << "[TEST] C3 Refresh failure is retried\n";

    test::SessionHarness h;
    h.provider.refresh_result = auth::Error::RefreshFailed;

    TEST_CHECK(h.session.open());
    TEST_CHECK(h.session.state() == session::State::Reconnecting);
    TEST_CHECK(h.drain().empty());

    h.provider.refresh_result = auth::Error::None;
    h.fire_retry();
    TEST_CHECK(h.session.state() == session::State::Authenticating);

    // A rejected refresh token is not
    test::SessionHarness h2;
    h2.provider.refresh_result = auth::Error::RefreshRejected;
    TEST_CHECK(h2.session.open());
    TEST_CHECK(h2.session.state() == session::State::Closed);
    auto items = h2.drain();
    TEST_CHECK(items.size() == 1);
    TEST_CHECK(items[0].error.kind == ChatError::Kind::AuthError);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C4 Terminal item is last
// ----------------------------------------------------------------------------

void test_terminal_item_is_last() {
    std::cout << "[TEST] C4 Buffered messages precede the terminal item\n";

    test::SessionHarness h;
    h.activate();

    h.emit(json::trovo::chat({
        json::trovo::chat_entry("m1", "alice", "one"),
        json::trovo::chat_entry_broken("m2"),
        json::trovo::chat_entry("m3", "carol", "three")
    }));
    h.session.poll();

    h.source.push_result(http::Error::AuthenticatedRequestError);
    h.drop_link();

    auto items = h.drain();
    TEST_CHECK(items.size() == 4);
    TEST_CHECK(items[0].is_message() && items[0].message.message_id == "m1");
    TEST_CHECK(items[1].kind == Item::Kind::DecodeError);
    TEST_CHECK(items[2].is_message() && items[2].message.message_id == "m3");
    TEST_CHECK(items[3].kind == Item::Kind::Fatal);
    TEST_CHECK(count_fatal(items) == 1);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C5 Unusable URL
// ----------------------------------------------------------------------------

void test_unusable_url() {
    std::cout << "[TEST] C5 Unusable URL is fatal\n";

    const char* urls[] = {
        "ws://open-chat.trovo.live/chat",   // plain text
        "open-chat.trovo.live/chat",        // no scheme
        "wss://:443/chat",                  // no host
        "wss://open-chat.trovo.live:99999/" // port out of range
    };

    for (const char* url : urls) {
        session::Config cfg;
        cfg.url = url;
        test::SessionHarness h{cfg};

        TEST_CHECK(h.session.open());
        TEST_CHECK(h.session.state() == session::State::Closed);
        TEST_CHECK(WebSocketUnderTest::connect_count() == 0);
        TEST_CHECK(h.source.calls() == 0);

        auto items = h.drain();
        TEST_CHECK(items.size() == 1);
        TEST_CHECK(items[0].kind == Item::Kind::Fatal);
        TEST_CHECK(items[0].error.kind == ChatError::Kind::ConnectError);
        TEST_CHECK(h.session.finished());
    }

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// C6 close() after fatal
// ----------------------------------------------------------------------------

void test_close_after_fatal() {
    std::cout << "[TEST] C6 close() after a fatal failure keeps the terminal item\n";

    test::SessionHarness h;
    h.provider.access_result = auth::Error::Expired;
    TEST_CHECK(h.session.open());

    h.session.close();
    h.session.close();

    Item item;
    TEST_CHECK(h.session.pop(item));
    TEST_CHECK(item.kind == Item::Kind::Fatal);
    TEST_CHECK(!h.session.pop(item));

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_rejected_credentials_on_reconnect();
    test_missing_credential_is_fatal();
    test_refresh_failure_is_transient();
    test_terminal_item_is_last();
    test_unusable_url();
    test_close_after_fatal();

    std::cout << "\n[GROUP C - SESSION FATAL TESTS PASSED]\n";
    return 0;
}
