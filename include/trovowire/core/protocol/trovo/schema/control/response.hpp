#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "lcr/optional.hpp"


namespace trovowire::core::protocol::trovo::schema::control {

// ===============================================
// RESPONSE (acknowledgement of AUTH / JOIN)
// ===============================================
//   {"type":"RESPONSE","nonce":"auth-1"}                          -> ack
//   {"type":"RESPONSE","nonce":"auth-1","error":"...","code":..}  -> rejection
struct Response {
    lcr::optional<std::string> nonce;
    lcr::optional<std::string> error;
    lcr::optional<std::int64_t> code;

    [[nodiscard]]
    inline bool is_ack() const noexcept {
        return !error.has();
    }
};

inline std::ostream& operator<<(std::ostream& os, const Response& r) {
    os << "[RESPONSE] nonce=" << lcr::to_string(r.nonce);
    if (r.error.has()) {
        os << " error=" << r.error.value();
    }
    if (r.code.has()) {
        os << " code=" << r.code.value();
    }
    return os;
}

} // namespace trovowire::core::protocol::trovo::schema::control
