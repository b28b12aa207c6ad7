/*
===============================================================================
 protocol::trovo::Session - Group F Data Plane Tests
===============================================================================

Scope:
------
Validate the chat sequence: ordering, per-entry decode failures and
backpressure.

Covered:
F1 One malformed entry: N-1 messages and one DecodeError, in wire order
F2 Malformed frame surfaces a DecodeError, session stays active
F3 CHAT before the AUTH acknowledgement is dropped
F4 Full output ring stops frame consumption, nothing lost or reordered
F5 Messages keep their optional fields
F6 A slow consumer does not make the link look dead

These tests assume:
- MockWebSocket
- Deterministic poll-driven execution
- No real network I/O

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "common/harness/session.hpp"

using namespace std::chrono_literals;
using clock_type = std::chrono::steady_clock;


// ----------------------------------------------------------------------------
// F1 Malformed entry
// ----------------------------------------------------------------------------

void test_malformed_entry_in_order() {
    std::cout << "[TEST] F1 Malformed entry keeps its position\n";

    test::SessionHarness h;
    h.activate();

    h.emit(json::trovo::chat({
        json::trovo::chat_entry("m1", "alice", "one"),
        json::trovo::chat_entry_broken("m2"),
        json::trovo::chat_entry("m3", "carol", "three"),
        json::trovo::chat_entry("m4", "dave", "four")
    }));
    h.session.poll();

    auto items = h.drain();
    TEST_CHECK(items.size() == 4);
    TEST_CHECK(items[0].is_message() && items[0].message.message_id == "m1");
    TEST_CHECK(items[1].kind == Item::Kind::DecodeError);
    TEST_CHECK(items[1].error.kind == ChatError::Kind::DecodeError);
    TEST_CHECK(items[1].error.index.has() && items[1].error.index.value() == 1);
    TEST_CHECK(items[1].error.message_id.has() && items[1].error.message_id.value() == "m2");
    TEST_CHECK(items[2].is_message() && items[2].message.message_id == "m3");
    TEST_CHECK(items[3].is_message() && items[3].message.message_id == "m4");
    TEST_CHECK(h.session.decode_failures() == 1);
    TEST_CHECK(h.session.state() == session::State::Active);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// F2 Malformed frame
// ----------------------------------------------------------------------------

void test_malformed_frame() {
    std::cout << "[TEST] F2 Malformed frame surfaces a DecodeError\n";

    test::SessionHarness h;
    h.activate();

    h.emit(R"({"type":"CHAT","data":)");
    h.emit(R"({"type":"CHAT","data":"not an object"})");
    h.emit(json::trovo::chat({ json::trovo::chat_entry("m1", "alice", "still here") }));
    h.session.poll();

    auto items = h.drain();
    TEST_CHECK(items.size() == 3);
    TEST_CHECK(items[0].kind == Item::Kind::DecodeError);
    TEST_CHECK(!items[0].error.index.has());
    TEST_CHECK(items[1].kind == Item::Kind::DecodeError);
    TEST_CHECK(items[2].is_message() && items[2].message.content == "still here");
    TEST_CHECK(h.session.decode_failures() == 2);
    TEST_CHECK(h.session.state() == session::State::Active);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// F3 CHAT before AUTH acknowledgement
// ----------------------------------------------------------------------------

void test_chat_before_auth_dropped() {
    std::cout << "[TEST] F3 CHAT before AUTH acknowledgement is dropped\n";

    test::SessionHarness h;
    h.open();

    h.emit(json::trovo::chat({ json::trovo::chat_entry("m0", "early", "too soon") }));
    h.session.poll();
    TEST_CHECK(h.session.state() == session::State::Authenticating);
    TEST_CHECK(h.drain().empty());

    h.activate();
    h.emit(json::trovo::chat({ json::trovo::chat_entry("m1", "alice", "on time") }));
    h.session.poll();

    auto items = h.drain();
    TEST_CHECK(items.size() == 1);
    TEST_CHECK(items[0].message.message_id == "m1");

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// F4 Backpressure
// ----------------------------------------------------------------------------

void test_output_backpressure() {
    std::cout << "[TEST] F4 Output backpressure\n";

    test::SessionHarness h;
    h.activate();

    constexpr std::size_t total = 300;   // more than the output ring holds
    std::vector<std::string> entries;
    for (std::size_t i = 0; i < total; ++i) {
        entries.push_back(json::trovo::chat_entry("m" + std::to_string(i), "user", "text"));
    }
    h.emit(json::trovo::chat(entries));
    h.emit(json::trovo::chat({ json::trovo::chat_entry("tail", "user", "last") }));

    h.session.poll();

    // The second frame stays in the transport while the first is pending
    TEST_CHECK(h.ws().pending_messages() == 1);
    h.session.poll();
    TEST_CHECK(h.ws().pending_messages() == 1);

    std::vector<Item> items = h.drain();
    TEST_CHECK(items.size() == total);
    for (std::size_t i = 0; i < total; ++i) {
        TEST_CHECK(items[i].message.message_id == "m" + std::to_string(i));
    }

    h.session.poll();
    TEST_CHECK(h.ws().pending_messages() == 0);
    items = h.drain();
    TEST_CHECK(items.size() == 1);
    TEST_CHECK(items[0].message.message_id == "tail");

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// F5 Optional fields
// ----------------------------------------------------------------------------

void test_optional_fields_preserved() {
    std::cout << "[TEST] F5 Optional fields are preserved\n";

    test::SessionHarness h;
    h.activate();

    h.emit(json::trovo::chat({
        json::trovo::chat_entry("m1", "alice", "with sender", 4242, 5003),
        json::trovo::chat_entry_no_sender("m2", "bob", "without sender")
    }));
    h.session.poll();

    auto items = h.drain();
    TEST_CHECK(items.size() == 2);

    const auto& m1 = items[0].message;
    TEST_CHECK(m1.sender_id.has() && m1.sender_id.value() == 4242);
    TEST_CHECK(m1.type.has() && m1.type.value() == ChatMessageType::Follow);
    TEST_CHECK(m1.sub_lv.has() && m1.sub_lv.value() == "sub_L1");

    const auto& m2 = items[1].message;
    TEST_CHECK(!m2.sender_id.has());
    TEST_CHECK(m2.nick_name == "bob");
    TEST_CHECK(m2.content == "without sender");
    TEST_CHECK(m2.send_time.has() && m2.send_time.value() == 1700000000);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// F6 Slow consumer
// ----------------------------------------------------------------------------

void test_slow_consumer_keeps_link() {
    std::cout << "[TEST] F6 Slow consumer does not make the link look dead\n";

    test::SessionHarness h;
    h.activate();

    constexpr std::size_t total = 300;
    std::vector<std::string> entries;
    for (std::size_t i = 0; i < total; ++i) {
        entries.push_back(json::trovo::chat_entry("m" + std::to_string(i), "user", "text"));
    }
    h.emit(json::trovo::chat(entries));
    h.emit(json::trovo::chat({ json::trovo::chat_entry("tail", "user", "last") }));
    h.session.poll();
    TEST_CHECK(h.ws().pending_messages() == 1);

    // The caller does not pop for longer than the staleness window
    h.session.force_last_inbound(clock_type::now() - 61s);
    h.session.force_next_heartbeat(clock_type::now());
    h.session.poll();
    h.session.poll();

    TEST_CHECK(h.session.stale_links() == 0);
    TEST_CHECK(h.session.link_epoch() == 1);
    TEST_CHECK(h.session.state() == session::State::Active);
    TEST_CHECK(WebSocketUnderTest::sent_count("\"PING\"") == 0);
    TEST_CHECK(h.ws().pending_messages() == 1);

    std::vector<Item> items = h.drain();
    TEST_CHECK(items.size() == total);

    h.session.poll();
    items = h.drain();
    TEST_CHECK(items.size() == 1);
    TEST_CHECK(items[0].message.message_id == "tail");
    TEST_CHECK(h.session.stale_links() == 0);

    // Real silence after reading resumed is still detected
    h.session.force_last_inbound(clock_type::now() - 61s);
    h.session.poll();
    TEST_CHECK(h.session.stale_links() == 1);
    TEST_CHECK(h.session.link_epoch() == 2);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_malformed_entry_in_order();
    test_malformed_frame();
    test_chat_before_auth_dropped();
    test_output_backpressure();
    test_optional_fields_preserved();
    test_slow_consumer_keeps_link();

    std::cout << "\n[GROUP F - SESSION DATA PLANE TESTS PASSED]\n";
    return 0;
}
