#include <iostream>
#include <string>
#include <string_view>

#include "simdjson.h"

#include "trovowire/core/protocol/trovo/parser/chat/batch.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace trovowire::core::protocol::trovo;

/*
================================================================================
Trovo CHAT Frame Parser — Unit Tests
================================================================================

A CHAT frame carries a batch of messages. Every entry is decoded on its own:
a malformed entry becomes a DecodeFailure at its position, the remaining
entries are still delivered, in wire order.
================================================================================
*/

static parser::Result parse(std::string_view json, schema::chat::Batch& out) {
    simdjson::dom::parser p;
    simdjson::dom::element root;
    TEST_CHECK(!p.parse(json.data(), json.size()).get(root));
    return parser::chat::batch::parse(root, out);
}

// ------------------------------------------------------------
// POSITIVE CASES
// ------------------------------------------------------------

void test_batch_all_valid() {
    std::cout << "[TEST] CHAT batch (all entries valid)..." << std::endl;

    const std::string json = json::trovo::chat({
        json::trovo::chat_entry("m1", "alice", "one"),
        json::trovo::chat_entry("m2", "bob", "two"),
        json::trovo::chat_entry("m3", "carol", "three")
    });

    schema::chat::Batch b{};
    TEST_CHECK(parse(json, b) == parser::Result::Parsed);

    TEST_CHECK(b.channel_id.has() && b.channel_id.value() == "100000031");
    TEST_CHECK(b.eid.has() && b.eid.value() == "eid-1");
    TEST_CHECK(b.entries.size() == 3);
    TEST_CHECK(b.failures() == 0);
    TEST_CHECK(b.entries[0].message.value().message_id == "m1");
    TEST_CHECK(b.entries[1].message.value().message_id == "m2");
    TEST_CHECK(b.entries[2].message.value().message_id == "m3");

    std::cout << "[TEST] OK\n";
}

void test_batch_second_without_sender_id() {
    std::cout << "[TEST] CHAT batch (message #2 lacks sender_id)..." << std::endl;

    const std::string json = json::trovo::chat({
        json::trovo::chat_entry("m1", "alice", "first", 1001),
        json::trovo::chat_entry_no_sender("m2", "bob", "second")
    });

    schema::chat::Batch b{};
    TEST_CHECK(parse(json, b) == parser::Result::Parsed);
    TEST_CHECK(b.entries.size() == 2);
    TEST_CHECK(b.failures() == 0);

    const auto& m1 = b.entries[0].message.value();
    TEST_CHECK(m1.sender_id.has() && m1.sender_id.value() == 1001);
    TEST_CHECK(m1.nick_name == "alice" && m1.content == "first");
    TEST_CHECK(m1.avatar.has() && m1.send_time.has());

    const auto& m2 = b.entries[1].message.value();
    TEST_CHECK(!m2.sender_id.has());
    TEST_CHECK(m2.message_id == "m2");
    TEST_CHECK(m2.nick_name == "bob" && m2.content == "second");
    TEST_CHECK(m2.type.has() && m2.type.value() == ChatMessageType::Normal);
    TEST_CHECK(m2.avatar.has());
    TEST_CHECK(m2.sub_lv.has() && m2.sub_lv.value() == "sub_L1");
    TEST_CHECK(m2.send_time.has() && m2.send_time.value() == 1700000000);
    TEST_CHECK(m2.medals.size() == 1 && m2.roles.size() == 1);

    std::cout << "[TEST] OK\n";
}

void test_batch_one_malformed_entry() {
    std::cout << "[TEST] CHAT batch (one malformed entry keeps the rest)..." << std::endl;

    const std::string json = json::trovo::chat({
        json::trovo::chat_entry("m1", "alice", "one"),
        json::trovo::chat_entry_broken("m2"),
        json::trovo::chat_entry("m3", "carol", "three"),
        json::trovo::chat_entry("m4", "dave", "four")
    });

    schema::chat::Batch b{};
    TEST_CHECK(parse(json, b) == parser::Result::Parsed);
    TEST_CHECK(b.entries.size() == 4);
    TEST_CHECK(b.failures() == 1);

    TEST_CHECK(b.entries[0].ok());
    TEST_CHECK(!b.entries[1].ok());
    TEST_CHECK(b.entries[2].ok());
    TEST_CHECK(b.entries[3].ok());

    const auto& f = b.entries[1].failure;
    TEST_CHECK(f.index == 1);
    TEST_CHECK(f.message_id.has() && f.message_id.value() == "m2");
    TEST_CHECK(f.reason.find("content") != std::string::npos);

    TEST_CHECK(b.entries[2].message.value().message_id == "m3");

    std::cout << "[TEST] OK\n";
}

void test_batch_entry_not_an_object() {
    std::cout << "[TEST] CHAT batch (entry is not an object)..." << std::endl;

    const std::string json = json::trovo::chat({
        "42",
        json::trovo::chat_entry("m1", "alice", "one")
    });

    schema::chat::Batch b{};
    TEST_CHECK(parse(json, b) == parser::Result::Parsed);
    TEST_CHECK(b.entries.size() == 2);
    TEST_CHECK(!b.entries[0].ok());
    TEST_CHECK(!b.entries[0].failure.message_id.has());
    TEST_CHECK(b.entries[1].ok());

    std::cout << "[TEST] OK\n";
}

void test_batch_without_chats() {
    std::cout << "[TEST] CHAT batch (no data / no chats)..." << std::endl;

    schema::chat::Batch b{};
    TEST_CHECK(parse(R"({"type":"CHAT","channel_info":{"channel_id":"1"}})", b) == parser::Result::Parsed);
    TEST_CHECK(b.entries.empty());

    TEST_CHECK(parse(R"({"type":"CHAT","data":{"eid":"e"}})", b) == parser::Result::Parsed);
    TEST_CHECK(b.entries.empty());
    TEST_CHECK(!b.channel_id.has());
    TEST_CHECK(b.eid.has());

    TEST_CHECK(parse(R"({"type":"CHAT","data":{"chats":null}})", b) == parser::Result::Parsed);
    TEST_CHECK(b.entries.empty());

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// NEGATIVE CASES (whole frame)
// ------------------------------------------------------------

void test_batch_frame_level_errors() {
    std::cout << "[TEST] CHAT batch (frame-level errors)..." << std::endl;

    schema::chat::Batch b{};
    TEST_CHECK(parse(R"({"type":"CHAT","data":"oops"})", b) == parser::Result::InvalidSchema);
    TEST_CHECK(parse(R"({"type":"CHAT","data":{"chats":{}}})", b) == parser::Result::InvalidSchema);
    TEST_CHECK(parse(R"({"type":"CHAT","channel_info":[]})", b) == parser::Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_batch_all_valid();
    test_batch_second_without_sender_id();
    test_batch_one_malformed_entry();
    test_batch_entry_not_an_object();
    test_batch_without_chats();
    test_batch_frame_level_errors();

    std::cout << "\n[TEST] ALL CHAT BATCH PARSER TESTS PASSED!\n";
    return 0;
}
