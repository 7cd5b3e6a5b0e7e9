#pragma once

#include <string_view>

namespace tether::core {

/*
===============================================================================
 tether::core::Error
===============================================================================

Contract-violation classification for the supervisor surface.

Errors are returned synchronously from the call that violated the contract,
never thrown. Transport failures and protocol faults are NOT represented
here: they are resolved through lifecycle events (supervisor::Event).

Error::TransportUnavailable is the exception to the rule: it is never
returned from a call, only carried inside a Failure event when the
transport factory could not produce a transport.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidState,         // start() while already started
    InvalidCloseCode,     // Close code is neither 1000 nor in [3000, 4999]
    InvalidArgument,      // Empty callback or out-of-range configuration value
    NotConnected,         // close_connection() without an active session

    // --- Collaborator failures (reported through events) --------------------
    TransportUnavailable, // Transport factory returned nothing or threw
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                  return "None";
    case Error::InvalidState:          return "InvalidState";
    case Error::InvalidCloseCode:      return "InvalidCloseCode";
    case Error::InvalidArgument:       return "InvalidArgument";
    case Error::NotConnected:          return "NotConnected";
    case Error::TransportUnavailable:  return "TransportUnavailable";
    default:                           return "Unknown";
    }
}

} // namespace tether::core
