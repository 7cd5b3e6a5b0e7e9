/*
===============================================================================
 Supervisor lifecycle events
===============================================================================

supervisor::Event is the closed set of facts the supervisor reports to its
owner through the handler installed with Supervisor::on_event().

Events are delivered synchronously, on the thread driving the supervisor,
after the supervisor has finished updating its own state. A handler may call
back into the supervisor (stop(), close_connection(), ...).

A handler that throws never breaks the supervisor: the exception is caught
and reported as a Failure event (Fault::EventHandler).

-------------------------------------------------------------------------------
 Event Meanings
-------------------------------------------------------------------------------

Connecting
  A transport was requested from the factory for a new session.

Open
  The transport of the active session opened. Outbound frames flow and
  liveness probing has started.

TransportError
  The transport reported an error. Informational only: the session ends
  when the matching close arrives, never because of this event.

Close
  The active session ended. Emitted exactly once per session. Carries the
  reconnect decision and, when a reconnect was scheduled, its delay.

ProbeSuccess / ProbeFailure
  Outcome of one liveness probe of the active session.

Failure
  A caller-supplied callback threw, the transport factory failed, the
  protocol engine hit an internal error, or an outbound frame had no open
  transport to go to.

ProtocolError
  The protocol engine rejected a malformed inbound frame. The session
  stays open.

===============================================================================
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "tether/core/error.hpp"


namespace tether::core::supervisor {

// Origin of a Failure event
enum class Fault : uint8_t {
    EventHandler,       // lifecycle event handler threw
    BackoffCallback,    // backoff callback threw (default delay used instead)
    TransportFactory,   // factory threw or produced no transport
    EngineInternal,     // protocol engine internal error (session closed)
    OutboundDropped,    // engine emitted a frame without an open transport
};

[[nodiscard]]
inline constexpr std::string_view to_string(Fault f) noexcept {
    switch (f) {
        case Fault::EventHandler:     return "EventHandler";
        case Fault::BackoffCallback:  return "BackoffCallback";
        case Fault::TransportFactory: return "TransportFactory";
        case Fault::EngineInternal:   return "EngineInternal";
        case Fault::OutboundDropped:  return "OutboundDropped";
        default:                      return "Unknown";
    }
}

namespace event {

struct Connecting {
    std::uint64_t session;
    std::string url;
};

struct Open {
    std::uint64_t session;
};

struct TransportError {
    std::uint64_t session;
    std::string message;
};

struct Close {
    int code;
    std::string reason;
    bool closed_by_remote;
    bool reconnect;
    std::optional<std::chrono::milliseconds> reconnect_delay;   // present iff reconnect
};

struct ProbeSuccess {
    std::chrono::milliseconds delay;
};

struct ProbeFailure {
    std::uint32_t consecutive;
    std::string error;
};

struct Failure {
    Fault fault;
    Error error;
    std::string message;
};

struct ProtocolError {
    std::string message;
};

} // namespace event

using Event = std::variant<
    event::Connecting,
    event::Open,
    event::TransportError,
    event::Close,
    event::ProbeSuccess,
    event::ProbeFailure,
    event::Failure,
    event::ProtocolError
>;

using Handler = std::function<void(const Event&)>;

namespace event {

[[nodiscard]] inline constexpr std::string_view name(const Connecting&) noexcept     { return "Connecting"; }
[[nodiscard]] inline constexpr std::string_view name(const Open&) noexcept           { return "Open"; }
[[nodiscard]] inline constexpr std::string_view name(const TransportError&) noexcept { return "TransportError"; }
[[nodiscard]] inline constexpr std::string_view name(const Close&) noexcept          { return "Close"; }
[[nodiscard]] inline constexpr std::string_view name(const ProbeSuccess&) noexcept   { return "ProbeSuccess"; }
[[nodiscard]] inline constexpr std::string_view name(const ProbeFailure&) noexcept   { return "ProbeFailure"; }
[[nodiscard]] inline constexpr std::string_view name(const Failure&) noexcept        { return "Failure"; }
[[nodiscard]] inline constexpr std::string_view name(const ProtocolError&) noexcept  { return "ProtocolError"; }

} // namespace event

// Every alternative needs an event::name() overload, or this stops compiling
[[nodiscard]]
inline std::string_view to_string(const Event& ev) {
    return std::visit([](const auto& e) { return event::name(e); }, ev);
}

} // namespace tether::core::supervisor
