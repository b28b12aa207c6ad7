#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "lcr/optional.hpp"


namespace trovowire::core::protocol::trovo::schema::system {

// ===============================================
// PONG (heartbeat answer)
// ===============================================
//   {"type":"PONG","nonce":"<iteration>","data":{"gap":30}}
//
// gap: the interval (seconds) the server expects between PINGs.
struct Pong {
    lcr::optional<std::string> nonce;
    lcr::optional<std::uint64_t> gap;
};

inline std::ostream& operator<<(std::ostream& os, const Pong& p) {
    return os << "[PONG] nonce=" << lcr::to_string(p.nonce) << " gap=" << lcr::to_string(p.gap);
}

} // namespace trovowire::core::protocol::trovo::schema::system
