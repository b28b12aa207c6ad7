#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

// ----------------------------------------------------------------------------
// Helper builders for inbound Trovo chat frames
// ----------------------------------------------------------------------------

namespace json::trovo {

// -----------------------------------------------------------------------------
// RESPONSE
// -----------------------------------------------------------------------------

static std::string response_ok(const std::string& nonce) {
    return R"({"type":"RESPONSE","nonce":")" + nonce + R"("})";
}

static std::string response_error(const std::string& nonce, const std::string& error, std::int64_t code) {
    return R"({"type":"RESPONSE","nonce":")" + nonce +
           R"(","error":")" + error +
           R"(","data":{},"code":)" + std::to_string(code) + "}";
}

// -----------------------------------------------------------------------------
// PONG
// -----------------------------------------------------------------------------

static std::string pong(const std::string& nonce) {
    return R"({"type":"PONG","nonce":")" + nonce + R"("})";
}

static std::string pong(const std::string& nonce, std::uint64_t gap) {
    return R"({"type":"PONG","nonce":")" + nonce +
           R"(","data":{"gap":)" + std::to_string(gap) + "}}";
}

// -----------------------------------------------------------------------------
// CHAT
// -----------------------------------------------------------------------------

// One fully populated chat entry
static std::string chat_entry(const std::string& message_id, const std::string& nick, const std::string& content,
                              std::int64_t sender_id = 1001, int type = 0) {
    return R"({"message_id":")" + message_id +
           R"(","type":)" + std::to_string(type) +
           R"(,"content":")" + content +
           R"(","nick_name":")" + nick +
           R"(","avatar":"https://headicon.trovo.live/user/)" + nick +
           R"(.png","sub_lv":"sub_L1","sub_tier":"1","medals":["sub_L1_T1"],"decos":[],"roles":["subscriber"],"sender_id":)" +
           std::to_string(sender_id) +
           R"(,"send_time":1700000000,"uid":)" + std::to_string(sender_id) +
           R"(,"user_name":")" + nick + R"("})";
}

// A chat entry without "sender_id"
static std::string chat_entry_no_sender(const std::string& message_id, const std::string& nick, const std::string& content) {
    return R"({"message_id":")" + message_id +
           R"(","type":0,"content":")" + content +
           R"(","nick_name":")" + nick +
           R"(","avatar":"https://headicon.trovo.live/user/)" + nick +
           R"(.png","sub_lv":"sub_L1","medals":["sub_L1_T1"],"decos":[],"roles":["subscriber"],"send_time":1700000000})";
}

// A chat entry missing the required "content"
static std::string chat_entry_broken(const std::string& message_id) {
    return R"({"message_id":")" + message_id + R"(","type":0,"nick_name":"ghost","sender_id":7})";
}

static std::string chat(const std::vector<std::string>& entries, const std::string& channel_id = "100000031") {
    std::string out = R"({"type":"CHAT","channel_info":{"channel_id":")" + channel_id +
                      R"("},"data":{"eid":"eid-1","chats":[)";
    bool first = true;
    for (const auto& e : entries) {
        if (!first) {
            out += ',';
        }
        out += e;
        first = false;
    }
    out += "]}}";
    return out;
}

static std::string chat(std::initializer_list<std::string> entries, const std::string& channel_id = "100000031") {
    return chat(std::vector<std::string>(entries), channel_id);
}

} // namespace json::trovo
