#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>


namespace tether::core::transport {

// ===============================================================
// Payload encoding (text and binary frames are both forwarded)
// ===============================================================
enum class Encoding : uint8_t {
    Text,
    Binary
};

[[nodiscard]]
inline constexpr std::string_view to_string(Encoding e) noexcept {
    switch (e) {
        case Encoding::Text:   return "Text";
        case Encoding::Binary: return "Binary";
        default:               return "Unknown";
    }
}

// ===============================================================
// Readiness as reported by the transport itself
// ===============================================================
enum class ReadyState : uint8_t {
    Connecting,
    Open,
    Closing,
    Closed
};

[[nodiscard]]
inline constexpr std::string_view to_string(ReadyState s) noexcept {
    switch (s) {
        case ReadyState::Connecting: return "Connecting";
        case ReadyState::Open:       return "Open";
        case ReadyState::Closing:    return "Closing";
        case ReadyState::Closed:     return "Closed";
        default:                     return "Unknown";
    }
}

// ===============================================================
// Transport events
// ===============================================================
namespace event {

// Handshake completed, frames may flow
struct Opened {};

// Non-fatal observability signal (a Closed event always follows)
struct Failed {
    std::string message;
};

// Transport is gone (either side initiated)
struct Closed {
    int code;
    std::string reason;
};

struct Message {
    std::string data;
    Encoding encoding;
};

} // namespace event

using Event = std::variant<event::Opened, event::Failed, event::Closed, event::Message>;

using Handler = std::function<void(Event&&)>;

} // namespace tether::core::transport
