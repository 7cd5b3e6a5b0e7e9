#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "tether/core/error.hpp"
#include "tether/core/supervisor.hpp"
#include "tether/core/telemetry/supervisor.hpp"
#include "tether/core/timer/scheduler.hpp"
#include "tether/core/transport/concepts.hpp"
#include "tether/rpc/engine.hpp"


namespace tether {

/*
===============================================================================
 tether::Client
===============================================================================

Public facade: a resilient JSON-RPC 2.0 client over any transport conforming
to core::transport::TransportConcept.

The Client owns everything the supervisor needs (timer, telemetry, protocol
engine through the supervisor) and forwards:
  • configuration      → core::Supervisor (validated setters / configure)
  • lifecycle          → start(), stop(), close_connection()
  • remote calls       → rpc::Engine (queued while no session is open)
  • local handlers     → rpc::Engine
  • lifecycle events   → on_event()

-------------------------------------------------------------------------------
 Usage Model
-------------------------------------------------------------------------------
    tether::Client<MyWebSocket> client;
    (void)client.set_factory([](const std::string& url) { ... });
    client.set_url("ws://localhost:8080");
    client.on_event([](const tether::Event& ev) { ... });
    (void)client.start();
    client.call("add", "[1,2]", [](const tether::rpc::Response& r) { ... });
    while (running) {
        client.poll();     // fires timers, releases retired transports
        transport_io();    // whatever drives the transport's own events
    }

All callbacks run inside poll() or inside the transport's event delivery, on
the caller's thread.
===============================================================================
*/

using Event = core::supervisor::Event;
using Error = core::Error;

template <
    core::transport::TransportConcept Transport,
    typename Timer = core::timer::Scheduler<>
>
class Client {
public:
    using Engine     = rpc::Engine<Timer>;
    using Supervisor = core::Supervisor<Transport, Engine, Timer>;
    using Options    = typename Supervisor::Options;
    using Factory    = typename Supervisor::Factory;

    Client()
        : supervisor_(timer_, telemetry_)
    {}

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    // Fires due timers and releases retired transports. Returns the number of
    // timers fired.
    inline std::size_t poll() {
        const std::size_t fired = timer_.poll();
        supervisor_.poll();
        return fired;
    }

    inline void on_event(core::supervisor::Handler handler) {
        supervisor_.on_event(std::move(handler));
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error start() { return supervisor_.start(); }

    [[nodiscard]]
    inline Error stop(int code = core::close_code::NORMAL,
                      std::string_view reason = core::close_code::NORMAL_REASON) {
        return supervisor_.stop(code, reason);
    }

    [[nodiscard]]
    inline Error close_connection(int code, std::string_view reason) {
        return supervisor_.close_connection(code, reason);
    }

    // -------------------------------------------------------------------------
    // Remote calls (queued while no session is open)
    // -------------------------------------------------------------------------

    inline std::uint64_t call(std::string_view method,
                              std::string_view params,
                              typename Engine::ResponseHandler handler,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        return supervisor_.engine().call(method, params, std::move(handler), timeout);
    }

    inline void notify(std::string_view method, std::string_view params = {}) {
        supervisor_.engine().notify(method, params);
    }

    // -------------------------------------------------------------------------
    // Local handlers
    // -------------------------------------------------------------------------

    inline void method(std::string name, typename Engine::MethodHandler handler) {
        supervisor_.engine().method(std::move(name), std::move(handler));
    }

    inline void notification(std::string name, typename Engine::NotificationHandler handler) {
        supervisor_.engine().notification(std::move(name), std::move(handler));
    }

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error configure(const Options& options) { return supervisor_.configure(options); }

    inline void set_url(std::string url) { supervisor_.set_url(std::move(url)); }

    [[nodiscard]]
    inline Error set_factory(Factory factory) { return supervisor_.set_factory(std::move(factory)); }

    [[nodiscard]]
    inline Error set_connect_timeout(std::chrono::milliseconds timeout) { return supervisor_.set_connect_timeout(timeout); }

    inline void set_reconnect(bool enabled) { supervisor_.set_reconnect(enabled); }

    [[nodiscard]]
    inline Error set_backoff(core::backoff::DelayFn fn) { return supervisor_.set_backoff(std::move(fn)); }

    inline void set_reconnect_counter_max(std::uint32_t max) { supervisor_.set_reconnect_counter_max(max); }

    [[nodiscard]]
    inline Error set_consecutive_probe_fail_close(std::uint32_t threshold) { return supervisor_.set_consecutive_probe_fail_close(threshold); }

    [[nodiscard]]
    inline Error set_timeout_close_code(int code) { return supervisor_.set_timeout_close_code(code); }

    [[nodiscard]]
    inline Error set_internal_error_close_code(int code) { return supervisor_.set_internal_error_close_code(code); }

    [[nodiscard]]
    inline Error set_probe_interval(std::chrono::milliseconds interval) { return supervisor_.set_probe_interval(interval); }

    [[nodiscard]]
    inline Error set_probe_timeout(std::chrono::milliseconds timeout) { return supervisor_.set_probe_timeout(timeout); }

    inline void set_ping_method(std::string name) { supervisor_.engine().set_ping_method(std::move(name)); }
    inline void set_ping_receive(bool enabled) { supervisor_.engine().set_ping_receive(enabled); }
    inline void set_default_timeout(std::chrono::milliseconds timeout) { supervisor_.engine().set_default_timeout(timeout); }
    inline void set_first_request_id(std::uint64_t id) { supervisor_.engine().set_first_request_id(id); }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool started() const noexcept { return supervisor_.started(); }

    [[nodiscard]]
    inline bool has_active_connection() const noexcept { return supervisor_.has_active_connection(); }

    [[nodiscard]]
    inline std::uint32_t reconnect_counter() const noexcept { return supervisor_.reconnect_counter(); }

    [[nodiscard]]
    inline core::supervisor::State state() const noexcept { return supervisor_.state(); }

    [[nodiscard]]
    inline const Options& options() const noexcept { return supervisor_.options(); }

    [[nodiscard]]
    inline Timer& timer() noexcept { return timer_; }

    [[nodiscard]]
    inline Supervisor& supervisor() noexcept { return supervisor_; }

    [[nodiscard]]
    inline const core::telemetry::Supervisor& telemetry() const noexcept { return telemetry_; }

private:
    // Declaration order is construction order: the supervisor borrows both
    Timer timer_;
    core::telemetry::Supervisor telemetry_;
    Supervisor supervisor_;
};

} // namespace tether
