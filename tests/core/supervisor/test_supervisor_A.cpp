/*
===============================================================================
 core::Supervisor - Group A Unit Tests
===============================================================================

Scope:
------
Construction and start/stop lifecycle guarantees of
tether::core::Supervisor<Transport, Engine, Timer>.

This group avoids timing and liveness logic. It focuses on:

- Correct initial state
- start()/stop() contract errors and idempotence
- RAII correctness and quiet destruction

Covered Requirements:
---------------------
A1. Default construction
    - Idle, not started, counter 0, no session, no active connection
    - No transport created implicitly, engine starts paused

A2. start() contract
    - start() creates exactly one transport and emits Connecting
    - start() while started returns InvalidState and changes nothing
    - start() without a factory returns InvalidArgument

A3. stop() contract
    - Invalid close codes are rejected without side effects
    - stop() closes the active transport and emits exactly one Close
    - Repeated stop() is a no-op (no second Close)
    - stop() while waiting to reconnect cancels the reconnect
    - start() after stop() opens a fresh session

A4. Destructor
    - Destruction closes the active transport with GOING_AWAY
    - No events are emitted from the destructor

A5. Event naming
    - to_string() names every lifecycle event after its alternative

===============================================================================
*/

#include <iostream>
#include <memory>
#include <string>

#include "common/supervisor_harness.hpp"

using test::SupervisorHarness;


// -----------------------------------------------------------------------------
// Group A1: Default construction
// -----------------------------------------------------------------------------
void test_default_construction() {
    std::cout << "[TEST] Group A1: default construction\n";
    SupervisorHarness h;

    TEST_CHECK(h.supervisor->state() == supervisor::State::Idle);
    TEST_CHECK(!h.supervisor->started());
    TEST_CHECK(h.supervisor->reconnect_counter() == 0);
    TEST_CHECK(h.supervisor->session_id() == 0);
    TEST_CHECK(!h.supervisor->has_active_connection());
    TEST_CHECK(h.supervisor->transport() == nullptr);

    TEST_CHECK(h.engine().is_paused());
    TEST_CHECK(MockTransport::created() == 0);
    TEST_CHECK(h.events.empty());

    // Defaults
    TEST_CHECK(h.supervisor->connect_timeout() == DEFAULT_CONNECT_TIMEOUT);
    TEST_CHECK(h.supervisor->reconnect());
    TEST_CHECK(h.supervisor->reconnect_counter_max() == DEFAULT_RECONNECT_COUNTER_MAX);
    TEST_CHECK(h.supervisor->consecutive_probe_fail_close() == DEFAULT_CONSECUTIVE_PROBE_FAIL_CLOSE);
    TEST_CHECK(h.supervisor->timeout_close_code() == 4100);
    TEST_CHECK(h.supervisor->internal_error_close_code() == 4101);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A2: start() contract
// -----------------------------------------------------------------------------
void test_start_creates_transport() {
    std::cout << "[TEST] Group A2: start() creates one transport and emits Connecting\n";
    SupervisorHarness h;

    TEST_CHECK(h.supervisor->start() == Error::None);
    TEST_CHECK(h.supervisor->started());
    TEST_CHECK(h.supervisor->state() == supervisor::State::Connecting);
    TEST_CHECK(MockTransport::created() == 1);
    TEST_CHECK(h.transport().url() == "ws://peer.test/rpc");

    TEST_CHECK(h.events.size() == 1);
    const auto* connecting = std::get_if<supervisor::event::Connecting>(&h.events[0]);
    TEST_CHECK(connecting != nullptr);
    TEST_CHECK(connecting->session == h.supervisor->session_id());
    TEST_CHECK(connecting->url == "ws://peer.test/rpc");

    std::cout << "[TEST] OK\n";
}

void test_start_twice_is_rejected() {
    std::cout << "[TEST] Group A2: start() while started returns InvalidState\n";
    SupervisorHarness h;

    TEST_CHECK(h.supervisor->start() == Error::None);
    const auto session = h.supervisor->session_id();

    TEST_CHECK(h.supervisor->start() == Error::InvalidState);
    TEST_CHECK(h.supervisor->session_id() == session);
    TEST_CHECK(MockTransport::created() == 1);
    TEST_CHECK(h.events.size() == 1);

    // Still rejected once open
    h.transport().emit_open();
    TEST_CHECK(h.supervisor->start() == Error::InvalidState);
    TEST_CHECK(h.supervisor->state() == supervisor::State::Open);

    std::cout << "[TEST] OK\n";
}

void test_start_without_factory() {
    std::cout << "[TEST] Group A2: start() without a factory returns InvalidArgument\n";
    ManualClock::reset();
    MockTransport::reset();

    TimerUnderTest timer;
    telemetry::Supervisor metrics;
    SupervisorUnderTest sup{timer, metrics};
    int events = 0;
    sup.on_event([&](const supervisor::Event&) { ++events; });

    TEST_CHECK(sup.start() == Error::InvalidArgument);
    TEST_CHECK(!sup.started());
    TEST_CHECK(sup.state() == supervisor::State::Idle);
    TEST_CHECK(events == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A3: stop() contract
// -----------------------------------------------------------------------------
void test_stop_rejects_invalid_code() {
    std::cout << "[TEST] Group A3: stop() rejects invalid close codes\n";
    SupervisorHarness h;
    h.start_and_open();

    TEST_CHECK(h.supervisor->stop(1001) == Error::InvalidCloseCode);
    TEST_CHECK(h.supervisor->stop(2500, "nope") == Error::InvalidCloseCode);
    TEST_CHECK(h.supervisor->stop(5000) == Error::InvalidCloseCode);

    TEST_CHECK(h.supervisor->started());
    TEST_CHECK(h.supervisor->state() == supervisor::State::Open);
    TEST_CHECK(h.transport().close_calls() == 0);
    TEST_CHECK(h.closes.empty());

    std::cout << "[TEST] OK\n";
}

void test_stop_emits_single_close() {
    std::cout << "[TEST] Group A3: stop() closes the transport and emits one Close\n";
    SupervisorHarness h;
    h.start_and_open();
    MockTransport& t = h.transport();

    TEST_CHECK(h.supervisor->stop() == Error::None);
    TEST_CHECK(!h.supervisor->started());
    TEST_CHECK(h.supervisor->state() == supervisor::State::Idle);
    TEST_CHECK(h.engine().is_paused());

    TEST_CHECK(t.close_calls() == 1);
    TEST_CHECK(t.last_close_code() == 1000);
    TEST_CHECK(t.last_close_reason() == "Normal Closure");

    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(h.closes[0].code == 1000);
    TEST_CHECK(h.closes[0].reason == "Normal Closure");
    TEST_CHECK(!h.closes[0].closed_by_remote);
    TEST_CHECK(!h.closes[0].reconnect);
    TEST_CHECK(!h.closes[0].reconnect_delay.has_value());

    // Idempotent
    TEST_CHECK(h.supervisor->stop() == Error::None);
    TEST_CHECK(h.supervisor->stop(4000, "again") == Error::None);
    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(t.close_calls() == 1);

    // Nothing ever reconnects
    h.advance(60000ms);
    TEST_CHECK(MockTransport::created() == 1);
    TEST_CHECK(h.count<supervisor::event::Connecting>() == 1);

    std::cout << "[TEST] OK\n";
}

void test_stop_with_application_code() {
    std::cout << "[TEST] Group A3: stop() forwards an application close code\n";
    SupervisorHarness h;
    h.start_and_open();
    MockTransport& t = h.transport();

    TEST_CHECK(h.supervisor->stop(4321, "maintenance") == Error::None);
    TEST_CHECK(t.last_close_code() == 4321);
    TEST_CHECK(t.last_close_reason() == "maintenance");
    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(h.closes[0].code == 4321);
    TEST_CHECK(h.closes[0].reason == "maintenance");

    std::cout << "[TEST] OK\n";
}

void test_stop_when_idle() {
    std::cout << "[TEST] Group A3: stop() on an idle supervisor is a no-op\n";
    SupervisorHarness h;

    TEST_CHECK(h.supervisor->stop() == Error::None);
    TEST_CHECK(h.supervisor->state() == supervisor::State::Idle);
    TEST_CHECK(h.events.empty());

    std::cout << "[TEST] OK\n";
}

void test_stop_while_connecting() {
    std::cout << "[TEST] Group A3: stop() while connecting\n";
    SupervisorHarness h;
    TEST_CHECK(h.supervisor->start() == Error::None);
    MockTransport& t = h.transport();

    TEST_CHECK(h.supervisor->stop() == Error::None);
    TEST_CHECK(t.close_calls() == 1);
    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(!h.closes[0].reconnect);
    TEST_CHECK(h.count<supervisor::event::Open>() == 0);

    // The connect timeout was cancelled along with the session
    h.advance(DEFAULT_CONNECT_TIMEOUT + 10ms);
    TEST_CHECK(h.closes.size() == 1);

    std::cout << "[TEST] OK\n";
}

void test_stop_while_waiting_reconnect() {
    std::cout << "[TEST] Group A3: stop() cancels a pending reconnect\n";
    SupervisorHarness h;
    TEST_CHECK(h.supervisor->set_backoff([](std::uint32_t) { return 500ms; }) == Error::None);
    h.start_and_open();

    h.transport().emit_close(1006, "");
    TEST_CHECK(h.supervisor->state() == supervisor::State::WaitingReconnect);
    TEST_CHECK(h.closes.size() == 1);

    TEST_CHECK(h.supervisor->stop() == Error::None);
    TEST_CHECK(h.supervisor->state() == supervisor::State::Idle);
    TEST_CHECK(h.closes.size() == 1);   // no session, no second Close

    h.advance(1000ms);
    TEST_CHECK(MockTransport::created() == 1);

    std::cout << "[TEST] OK\n";
}

void test_start_after_stop() {
    std::cout << "[TEST] Group A3: start() after stop() opens a fresh session\n";
    SupervisorHarness h;
    h.start_and_open();
    const auto first = h.supervisor->session_id();

    TEST_CHECK(h.supervisor->stop() == Error::None);
    h.poll();
    TEST_CHECK(MockTransport::live() == 0);

    TEST_CHECK(h.supervisor->start() == Error::None);
    TEST_CHECK(h.supervisor->started());
    TEST_CHECK(MockTransport::created() == 2);
    TEST_CHECK(h.supervisor->session_id() > first);
    TEST_CHECK(h.supervisor->reconnect_counter() == 0);

    h.transport().emit_open();
    TEST_CHECK(h.supervisor->has_active_connection());
    TEST_CHECK(h.count<supervisor::event::Open>() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A4: Destructor
// -----------------------------------------------------------------------------
void test_destructor_closes_quietly() {
    std::cout << "[TEST] Group A4: destructor closes the transport without events\n";
    SupervisorHarness h;
    h.start_and_open();
    const auto events_before = h.events.size();

    h.destroy_supervisor();

    TEST_CHECK(MockTransport::live() == 0);
    TEST_CHECK(MockTransport::destroyed() == 1);
    TEST_CHECK(MockTransport::last_destroyed_close_code() == close_code::GOING_AWAY);
    TEST_CHECK(h.events.size() == events_before);
    TEST_CHECK(h.closes.empty());

    // No timer left behind that could reach the destroyed supervisor
    TEST_CHECK(h.timer.pending() == 0);

    std::cout << "[TEST] OK\n";
}

void test_destructor_releases_retired_transports() {
    std::cout << "[TEST] Group A4: destructor releases retired transports\n";
    SupervisorHarness h;
    h.start_and_open();
    h.transport().emit_close(1006, "");
    TEST_CHECK(h.supervisor->retired_transports() == 1);

    h.destroy_supervisor();
    TEST_CHECK(MockTransport::live() == 0);
    TEST_CHECK(h.timer.pending() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group A5: Event naming
// -----------------------------------------------------------------------------
void test_event_names() {
    std::cout << "[TEST] Group A5: lifecycle events are named after their type\n";
    SupervisorHarness h;
    h.start_and_open();
    h.transport().emit_error("reset");
    TEST_CHECK(h.supervisor->stop() == Error::None);

    TEST_CHECK(h.events.size() == 4);
    TEST_CHECK(supervisor::to_string(h.events[0]) == "Connecting");
    TEST_CHECK(supervisor::to_string(h.events[1]) == "Open");
    TEST_CHECK(supervisor::to_string(h.events[2]) == "TransportError");
    TEST_CHECK(supervisor::to_string(h.events[3]) == "Close");

    namespace event = supervisor::event;
    TEST_CHECK(supervisor::to_string(supervisor::Event{event::ProbeSuccess{1ms}}) == "ProbeSuccess");
    TEST_CHECK(supervisor::to_string(supervisor::Event{event::ProbeFailure{1, "timeout"}}) == "ProbeFailure");
    TEST_CHECK(supervisor::to_string(supervisor::Event{
        event::Failure{supervisor::Fault::EventHandler, Error::None, "x"}}) == "Failure");
    TEST_CHECK(supervisor::to_string(supervisor::Event{event::ProtocolError{"bad frame"}}) == "ProtocolError");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_default_construction();
    test_start_creates_transport();
    test_start_twice_is_rejected();
    test_start_without_factory();
    test_stop_rejects_invalid_code();
    test_stop_emits_single_close();
    test_stop_with_application_code();
    test_stop_when_idle();
    test_stop_while_connecting();
    test_stop_while_waiting_reconnect();
    test_start_after_stop();
    test_destructor_closes_quietly();
    test_destructor_releases_retired_transports();
    test_event_names();

    std::cout << "\n[GROUP A SUPERVISOR TESTS PASSED]\n";
    return 0;
}
