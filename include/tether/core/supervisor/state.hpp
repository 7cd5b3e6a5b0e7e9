#pragma once

#include <cstdint>
#include <string_view>


namespace tether::core::supervisor {

// ===============================================================
// SUPERVISOR STATE ENUM
// ===============================================================
enum class State : uint8_t {
    Idle,              // not started
    Connecting,        // transport requested, not yet open
    Open,              // transport usable, liveness monitoring active
    Closing,           // resolving a session close (transient)
    WaitingReconnect   // reconnect timer armed
};

// ------------------------------------------------------------
// State → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Idle:             return "Idle";
        case State::Connecting:       return "Connecting";
        case State::Open:             return "Open";
        case State::Closing:          return "Closing";
        case State::WaitingReconnect: return "WaitingReconnect";
        default:                      return "Unknown";
    }
}

} // namespace tether::core::supervisor
