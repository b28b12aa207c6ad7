#pragma once

#include <cstdint>
#include <string_view>

#include "lcr/bit/pack.hpp"


namespace trovowire::core::protocol::trovo {

// ===============================================================
// FRAME TYPE ENUM (inbound "type" discriminant)
// ===============================================================
enum class FrameType : uint8_t {
    Response,
    Chat,
    Pong,
    Unknown
};

// ===============================================================
// 1) Standard conversion: enum → string (wire spelling)
// ===============================================================
[[nodiscard]] inline constexpr std::string_view to_string(FrameType t) noexcept {
    switch (t) {
        case FrameType::Response: return "RESPONSE";
        case FrameType::Chat:     return "CHAT";
        case FrameType::Pong:     return "PONG";
        default:                  return "UNKNOWN";
    }
}

// ===============================================================
// 2) Standard conversion: string → enum
//    (fallback version: readable, slower)
// ===============================================================
[[nodiscard]] inline constexpr FrameType to_frame_type(std::string_view s) noexcept {
    if (s == "RESPONSE") return FrameType::Response;
    if (s == "CHAT")     return FrameType::Chat;
    if (s == "PONG")     return FrameType::Pong;
    return FrameType::Unknown;
}

// ===============================================================
// 3) FAST lookup using 8-byte packing
// ===============================================================
// Every inbound discriminant fits in 8 chars, so the packed value
// identifies it exactly.
inline constexpr uint64_t TAG_RESPONSE = lcr::bit::pack8("RESPONSE");
inline constexpr uint64_t TAG_CHAT     = lcr::bit::pack8("CHAT");
inline constexpr uint64_t TAG_PONG     = lcr::bit::pack8("PONG");

[[nodiscard]] inline constexpr FrameType to_frame_type_fast(std::string_view s) noexcept {
    if (s.size() > 8) {
        return FrameType::Unknown;
    }
    switch (lcr::bit::pack8(s)) {
        case TAG_RESPONSE: return FrameType::Response;
        case TAG_CHAT:     return FrameType::Chat;
        case TAG_PONG:     return FrameType::Pong;
        default:           return FrameType::Unknown;
    }
}

} // namespace trovowire::core::protocol::trovo
