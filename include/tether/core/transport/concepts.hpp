#pragma once

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "tether/core/transport/events.hpp"

namespace tether::core::transport {

// -----------------------------------------------------------------------------
// TransportConcept
// -----------------------------------------------------------------------------
//
// Minimal contract the supervisor needs from a session-oriented transport
// (typically a WebSocket client).
//
// The transport:
//
//   • Starts connecting as soon as it is created by the factory
//   • Reports open/error/close/message through the installed handler
//   • Delivers Closed exactly once, after which it emits nothing else
//   • May invoke the handler synchronously from close()
//
// Handshake, framing and encryption are entirely the transport's business.
//
// -----------------------------------------------------------------------------

template<class T>
concept TransportConcept =
    requires(
        T t,
        const T& ct,
        Handler handler,
        std::string_view frame,
        Encoding encoding,
        int code,
        std::string_view reason
    )
{
    // ---------------------------------------------------------------------
    // Event subscription
    // ---------------------------------------------------------------------

    { t.set_handler(std::move(handler)) } -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { t.send(frame, encoding) } -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { t.close(code, reason) } -> std::same_as<void>;
    { ct.ready_state() } noexcept -> std::same_as<ReadyState>;
};

// Creates a transport already connecting to `url`; may return null or throw
template<class T>
using Factory = std::function<std::unique_ptr<T>(const std::string& url)>;

} // namespace tether::core::transport
