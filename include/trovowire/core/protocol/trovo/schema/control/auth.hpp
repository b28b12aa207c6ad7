#pragma once

#include <cstddef>
#include <cstring>
#include <string>

#include "lcr/json.hpp"


namespace trovowire::core::protocol::trovo::schema::control {

// ===============================================
// AUTH (first frame on every link)
// ===============================================
//   {"type":"AUTH","nonce":"<nonce>","data":{"token":"<chat token>"}}
//
// PRECONDITION (write_json):
//   Caller must provide a buffer of at least max_json_size() bytes.
struct Auth {
    using control_tag = void;

    std::string nonce;
    std::string token;

public:
    [[nodiscard]]
    inline std::size_t max_json_size() const noexcept {
        // Fixed framing + every character escaped as \u00XX in the worst case
        return sizeof(PREFIX) + sizeof(MIDDLE) + sizeof(SUFFIX) + 6 * (nonce.size() + token.size());
    }

    [[nodiscard]]
    inline std::size_t write_json(char* buffer) const noexcept {
        std::size_t pos = 0;

        std::memcpy(buffer + pos, PREFIX, sizeof(PREFIX) - 1);
        pos += sizeof(PREFIX) - 1;
        pos += lcr::json::append_escaped(buffer + pos, nonce);

        std::memcpy(buffer + pos, MIDDLE, sizeof(MIDDLE) - 1);
        pos += sizeof(MIDDLE) - 1;
        pos += lcr::json::append_escaped(buffer + pos, token);

        std::memcpy(buffer + pos, SUFFIX, sizeof(SUFFIX) - 1);
        pos += sizeof(SUFFIX) - 1;

        return pos;
    }

    // Convenience method (allocating) for tests / logging.
    [[nodiscard]]
    std::string to_json() const {
        std::string out(max_json_size(), '\0');
        out.resize(write_json(out.data()));
        return out;
    }

private:
    static constexpr char PREFIX[] = "{\"type\":\"AUTH\",\"nonce\":\"";
    static constexpr char MIDDLE[] = "\",\"data\":{\"token\":\"";
    static constexpr char SUFFIX[] = "\"}}";
};

} // namespace trovowire::core::protocol::trovo::schema::control
