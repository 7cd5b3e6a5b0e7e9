#pragma once

#include <chrono>
#include <concepts>
#include <functional>
#include <string>
#include <string_view>

#include "tether/core/transport/events.hpp"

namespace tether::core::protocol {

// ===============================================================
// Engine -> supervisor hooks
// ===============================================================
struct Hooks {
    // Exactly one opaque frame to transmit (only emitted while resumed)
    std::function<void(std::string_view frame, transport::Encoding encoding)> on_frame;

    // Unexpected engine failure: the session is no longer trustworthy
    std::function<void(const std::string& message)> on_internal_error;

    // Malformed inbound frame: reported, session stays open
    std::function<void(const std::string& message)> on_protocol_error;
};

// ===============================================================
// Probe resolution
// ===============================================================
struct ProbeOutcome {
    bool ok{false};
    std::chrono::milliseconds delay{0};   // round-trip time (meaningful when ok)
    std::string error;                    // failure description (when !ok)
};

using ProbeCallback = std::function<void(ProbeOutcome)>;

// -----------------------------------------------------------------------------
// EngineConcept
// -----------------------------------------------------------------------------
//
// Contract of the remote-call protocol engine driven by the supervisor.
//
// The engine:
//
//   • Is owned by the supervisor for its whole lifetime (across sessions)
//   • Queues outbound frames while paused and flushes them, in order,
//     through Hooks::on_frame when resumed
//   • Resolves every probe exactly once (success, remote error or timeout);
//     the supervisor always passes a positive probe timeout
//   • Never invokes hooks or probe callbacks from its destructor
//
// -----------------------------------------------------------------------------

template<class E, class Timer>
concept EngineConcept =
    std::constructible_from<E, Timer&> &&
    requires(
        E e,
        const E& ce,
        Hooks hooks,
        std::string_view frame,
        transport::Encoding encoding,
        std::chrono::milliseconds timeout,
        ProbeCallback cb
    )
{
    { e.bind(std::move(hooks)) } -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Outbound gating
    // ---------------------------------------------------------------------

    { e.pause() } -> std::same_as<void>;
    { e.resume() } -> std::same_as<void>;
    { ce.is_paused() } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Inbound frames & liveness
    // ---------------------------------------------------------------------

    { e.consume(frame, encoding) } -> std::same_as<void>;
    { e.probe(timeout, std::move(cb)) } -> std::same_as<void>;
};

} // namespace tether::core::protocol
