#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>


namespace trovowire::core::protocol::trovo {

// ===============================================================
// CHAT MESSAGE TYPE ENUM (numeric "type" of a chat entry)
// ===============================================================
enum class ChatMessageType : uint16_t {
    Normal            = 0,
    Spell             = 5,
    MagicSuperCap     = 6,
    MagicColorful     = 7,
    MagicSpell        = 8,
    MagicBulletScreen = 9,
    Subscription      = 5001,
    System            = 5002,
    Follow            = 5003,
    Welcome           = 5004,
    GiftSub           = 5005,
    GiftSubDetailed   = 5006,
    Event             = 5007,
    Raid              = 5008,
    CustomSpell       = 5009,
    Unknown           = 0xFFFF
};

[[nodiscard]] inline constexpr std::string_view to_string(ChatMessageType t) noexcept {
    switch (t) {
        case ChatMessageType::Normal:            return "Normal";
        case ChatMessageType::Spell:             return "Spell";
        case ChatMessageType::MagicSuperCap:     return "MagicSuperCap";
        case ChatMessageType::MagicColorful:     return "MagicColorful";
        case ChatMessageType::MagicSpell:        return "MagicSpell";
        case ChatMessageType::MagicBulletScreen: return "MagicBulletScreen";
        case ChatMessageType::Subscription:      return "Subscription";
        case ChatMessageType::System:            return "System";
        case ChatMessageType::Follow:            return "Follow";
        case ChatMessageType::Welcome:           return "Welcome";
        case ChatMessageType::GiftSub:           return "GiftSub";
        case ChatMessageType::GiftSubDetailed:   return "GiftSubDetailed";
        case ChatMessageType::Event:             return "Event";
        case ChatMessageType::Raid:              return "Raid";
        case ChatMessageType::CustomSpell:       return "CustomSpell";
        default:                                 return "Unknown";
    }
}

// Numeric code → enum. Codes the platform may add later map to Unknown;
// the raw code is kept separately by the message schema.
[[nodiscard]] inline constexpr ChatMessageType to_chat_message_type(std::uint64_t code) noexcept {
    switch (code) {
        case 0:    return ChatMessageType::Normal;
        case 5:    return ChatMessageType::Spell;
        case 6:    return ChatMessageType::MagicSuperCap;
        case 7:    return ChatMessageType::MagicColorful;
        case 8:    return ChatMessageType::MagicSpell;
        case 9:    return ChatMessageType::MagicBulletScreen;
        case 5001: return ChatMessageType::Subscription;
        case 5002: return ChatMessageType::System;
        case 5003: return ChatMessageType::Follow;
        case 5004: return ChatMessageType::Welcome;
        case 5005: return ChatMessageType::GiftSub;
        case 5006: return ChatMessageType::GiftSubDetailed;
        case 5007: return ChatMessageType::Event;
        case 5008: return ChatMessageType::Raid;
        case 5009: return ChatMessageType::CustomSpell;
        default:   return ChatMessageType::Unknown;
    }
}

inline std::ostream& operator<<(std::ostream& os, ChatMessageType t) {
    return os << to_string(t);
}

} // namespace trovowire::core::protocol::trovo
