#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "lcr/optional.hpp"

namespace trovowire::core::auth {

using Clock = std::chrono::system_clock;

// ===============================================
// CLIENT ID
// ===============================================
// Application identifier issued by the platform. Immutable once created,
// sent with every HTTP request.
class ClientId {
public:
    ClientId() = default;
    explicit ClientId(std::string value) : value_(std::move(value)) {}

    [[nodiscard]] const std::string& str() const noexcept { return value_; }
    [[nodiscard]] bool empty() const noexcept { return value_.empty(); }

private:
    std::string value_;
};

// ===============================================
// ACCESS TOKEN
// ===============================================
struct AccessToken {
    std::string value;
    lcr::optional<Clock::time_point> expires_at{};  // absent: no known expiry

    [[nodiscard]]
    inline bool expired(Clock::time_point now = Clock::now()) const noexcept {
        return expires_at.has() && now >= expires_at.value();
    }

    [[nodiscard]]
    inline bool expires_within(std::chrono::seconds skew, Clock::time_point now = Clock::now()) const noexcept {
        return expires_at.has() && (now + skew) >= expires_at.value();
    }
};

// ===============================================
// TOKEN GRANT (refresh endpoint response)
// ===============================================
struct TokenGrant {
    std::string access_token;
    std::string refresh_token;
    std::chrono::seconds expires_in{0};
};

// ===============================================
// CHAT TOKEN
// ===============================================
// Short-lived, channel-scoped credential for one chat WebSocket session.
struct ChatToken {
    std::string token;
};

// Log-safe rendering of a secret: first 4 characters, then its length.
[[nodiscard]]
inline std::string redact(std::string_view secret) {
    if (secret.size() <= 4) {
        return "****";
    }
    return std::string(secret.substr(0, 4)) + "...(" + std::to_string(secret.size()) + ")";
}

} // namespace trovowire::core::auth
