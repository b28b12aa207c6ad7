#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "lcr/json.hpp"


namespace trovowire::core::protocol::trovo::schema::control {

// ===============================================
// PING (heartbeat)
// ===============================================
//   {"type":"PING","nonce":"<iteration>"}
//
// The nonce is the heartbeat iteration, echoed back by the matching PONG.
//
// PRECONDITION (write_json):
//   Caller must provide a buffer of at least max_json_size() bytes.
struct Ping {
    using control_tag = void;

    std::uint64_t iteration{0};

public:
    [[nodiscard]]
    static constexpr std::size_t max_json_size() noexcept {
        // Worst case:
        // {"type":"PING","nonce":"18446744073709551615"}
        return 64;
    }

    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        std::size_t pos = 0;

        static constexpr char prefix[] = "{\"type\":\"PING\",\"nonce\":\"";
        std::memcpy(buffer + pos, prefix, sizeof(prefix) - 1);
        pos += sizeof(prefix) - 1;

        pos += lcr::json::append(buffer + pos, iteration);

        buffer[pos++] = '"';
        buffer[pos++] = '}';

        return pos;
    }

    // Convenience method (allocating) for tests / logging.
    [[nodiscard]]
    std::string to_json() const {
        char buffer[max_json_size()];
        std::size_t size = write_json(buffer);
        return std::string(buffer, size);
    }
};

} // namespace trovowire::core::protocol::trovo::schema::control
