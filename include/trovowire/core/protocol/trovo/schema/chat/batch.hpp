#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "trovowire/core/protocol/trovo/schema/chat/message.hpp"
#include "lcr/optional.hpp"


namespace trovowire::core::protocol::trovo::schema::chat {

// ===============================================
// CHAT BATCH (one CHAT frame)
// ===============================================
//   {"type":"CHAT","channel_info":{"channel_id":".."},"data":{"eid":"..","chats":[...]}}
//
// Every entry of "chats" is decoded on its own. Entries keep the wire order;
// each one holds either a message or the reason it could not be decoded.
struct Batch {
    struct Entry {
        lcr::optional<ChatMessage> message;
        DecodeFailure failure;                  // meaningful only when !ok()

        [[nodiscard]]
        inline bool ok() const noexcept {
            return message.has();
        }
    };

    lcr::optional<std::string> channel_id;      // absent on history replays
    lcr::optional<std::string> eid;
    std::vector<Entry> entries;

    [[nodiscard]]
    inline std::size_t failures() const noexcept {
        std::size_t n = 0;
        for (const auto& e : entries) {
            if (!e.ok()) {
                ++n;
            }
        }
        return n;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Batch& b) {
    return os << "[BATCH] channel=" << lcr::to_string(b.channel_id)
              << " eid=" << lcr::to_string(b.eid)
              << " entries=" << b.entries.size()
              << " failures=" << b.failures();
}

} // namespace trovowire::core::protocol::trovo::schema::chat
