#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>


namespace trovowire::core::protocol::trovo::session {

// ===============================================================
// SESSION STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Idle,            // created, nothing requested yet
    Connecting,      // fetching credentials and opening the link
    Authenticating,  // link open, AUTH sent
    Joining,         // AUTH acknowledged, JOIN sent
    Active,          // steady state: forwarding chat, heartbeating
    Reconnecting,    // link lost, waiting for the retry timer
    Closed           // terminal
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Idle:           return "Idle";
        case State::Connecting:     return "Connecting";
        case State::Authenticating: return "Authenticating";
        case State::Joining:        return "Joining";
        case State::Active:         return "Active";
        case State::Reconnecting:   return "Reconnecting";
        case State::Closed:         return "Closed";
        default:                    return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, State s) {
    return os << to_string(s);
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,

    // --- Link lifecycle ---
    LinkOpened,
    LinkFailed,          // connect failure, transport error, close, send failure

    // --- Handshake ---
    AuthAcked,
    JoinAcked,
    HandshakeRejected,
    HandshakeTimedOut,

    // --- Liveness ---
    StalenessDetected,

    // --- Retry ---
    RetryTimerExpired,

    // --- Classification ---
    FatalError
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:      return "OpenRequested";
        case Event::CloseRequested:     return "CloseRequested";
        case Event::LinkOpened:         return "LinkOpened";
        case Event::LinkFailed:         return "LinkFailed";
        case Event::AuthAcked:          return "AuthAcked";
        case Event::JoinAcked:          return "JoinAcked";
        case Event::HandshakeRejected:  return "HandshakeRejected";
        case Event::HandshakeTimedOut:  return "HandshakeTimedOut";
        case Event::StalenessDetected:  return "StalenessDetected";
        case Event::RetryTimerExpired:  return "RetryTimerExpired";
        case Event::FatalError:         return "FatalError";
        default:                        return "UnknownEvent";
    }
}

inline std::ostream& operator<<(std::ostream& os, Event e) {
    return os << to_string(e);
}

} // namespace trovowire::core::protocol::trovo::session
