/*
===============================================================================
 core::Supervisor - Group E Unit Tests
===============================================================================

Scope:
------
Fault containment and exactly-once session resolution.

Covered Requirements:
---------------------
E1. Caller callbacks that throw
    - Event handler: reported as Failure(EventHandler), state intact
    - A handler that also throws on the Failure report does not recurse
    - Backoff callback: default delay used, Close then Failure(BackoffCallback)
    - Transport factory throwing or returning nothing:
      Failure(TransportFactory, TransportUnavailable), reconnect per policy

E2. Protocol engine faults
    - Internal error: session closed with the internal-error close code,
      then Failure(EngineInternal)
    - Protocol error: ProtocolError event, session stays open
    - Outbound frame without an open transport: dropped, Failure(OutboundDropped)

E3. Exactly one Close per session
    - Competing close signals (remote close, timeout, local close, probe
      exhaustion) resolve the session once

===============================================================================
*/

#include <iostream>
#include <stdexcept>
#include <string>

#include "common/supervisor_harness.hpp"

using test::SupervisorHarness;


// -----------------------------------------------------------------------------
// Group E1: Caller callbacks that throw
// -----------------------------------------------------------------------------
void test_event_handler_throw() {
    std::cout << "[TEST] Group E1: event handler throw is reported as Failure\n";
    SupervisorHarness h;
    h.supervisor->on_event([&h](const supervisor::Event& ev) {
        h.record(ev);
        if (std::holds_alternative<supervisor::event::Connecting>(ev)) {
            throw std::runtime_error("handler exploded");
        }
    });

    TEST_CHECK(h.supervisor->start() == Error::None);
    TEST_CHECK(h.supervisor->state() == supervisor::State::Connecting);
    TEST_CHECK(h.failures.size() == 1);
    TEST_CHECK(h.failures[0].fault == supervisor::Fault::EventHandler);
    TEST_CHECK(h.failures[0].message.find("handler exploded") != std::string::npos);
    TEST_CHECK(h.telemetry.callback_faults_total.load() == 1);

    // The supervisor keeps working
    h.transport().emit_open();
    TEST_CHECK(h.supervisor->has_active_connection());
    TEST_CHECK(h.count<supervisor::event::Open>() == 1);

    std::cout << "[TEST] OK\n";
}

void test_event_handler_always_throwing() {
    std::cout << "[TEST] Group E1: handler throwing on every event does not recurse\n";
    SupervisorHarness h;
    h.supervisor->on_event([&h](const supervisor::Event& ev) {
        h.record(ev);
        throw std::logic_error("always");
    });

    TEST_CHECK(h.supervisor->start() == Error::None);
    // Connecting + one Failure report, no more
    TEST_CHECK(h.events.size() == 2);
    TEST_CHECK(h.failures.size() == 1);

    h.transport().emit_open();
    TEST_CHECK(h.events.size() == 4);
    TEST_CHECK(h.supervisor->state() == supervisor::State::Open);

    std::cout << "[TEST] OK\n";
}

void test_backoff_throw() {
    std::cout << "[TEST] Group E1: backoff throw falls back to the default delay\n";
    SupervisorHarness h;
    TEST_CHECK(h.supervisor->set_backoff([](std::uint32_t) -> std::chrono::milliseconds {
        throw std::runtime_error("bad backoff");
    }) == Error::None);
    h.start_and_open();

    h.transport().emit_close(1006, "");

    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(h.closes[0].reconnect);
    TEST_CHECK(h.closes[0].reconnect_delay.has_value());
    const auto delay = h.closes[0].reconnect_delay->count();
    TEST_CHECK(delay >= 50);
    TEST_CHECK(delay <= 100);
    TEST_CHECK(h.supervisor->reconnect_counter() == 1);

    // Close first, then the fault report
    TEST_CHECK(h.failures.size() == 1);
    TEST_CHECK(h.failures[0].fault == supervisor::Fault::BackoffCallback);
    TEST_CHECK(h.failures[0].message.find("bad backoff") != std::string::npos);
    TEST_CHECK(std::holds_alternative<supervisor::event::Failure>(h.events.back()));
    TEST_CHECK(std::holds_alternative<supervisor::event::Close>(h.events[h.events.size() - 2]));

    h.advance(std::chrono::milliseconds(delay));
    TEST_CHECK(MockTransport::created() == 2);

    std::cout << "[TEST] OK\n";
}

void test_factory_throw_reconnects() {
    std::cout << "[TEST] Group E1: factory throw reported, reconnect scheduled\n";
    SupervisorHarness h;
    int attempts = 0;
    TEST_CHECK(h.supervisor->set_factory([&attempts](const std::string&) -> std::unique_ptr<MockTransport> {
        ++attempts;
        throw std::runtime_error("no route to host");
    }) == Error::None);
    TEST_CHECK(h.supervisor->set_backoff([](std::uint32_t) { return 30ms; }) == Error::None);

    TEST_CHECK(h.supervisor->start() == Error::None);
    TEST_CHECK(attempts == 1);
    TEST_CHECK(h.supervisor->started());
    TEST_CHECK(h.supervisor->state() == supervisor::State::WaitingReconnect);
    TEST_CHECK(h.supervisor->reconnect_counter() == 1);
    TEST_CHECK(h.supervisor->session_id() == 0);

    TEST_CHECK(h.closes.empty());
    TEST_CHECK(h.count<supervisor::event::Connecting>() == 0);
    TEST_CHECK(h.failures.size() == 1);
    TEST_CHECK(h.failures[0].fault == supervisor::Fault::TransportFactory);
    TEST_CHECK(h.failures[0].error == Error::TransportUnavailable);
    TEST_CHECK(h.failures[0].message.find("no route to host") != std::string::npos);

    // Retries follow the backoff
    h.advance(30ms);
    TEST_CHECK(attempts == 2);
    TEST_CHECK(h.failures.size() == 2);

    // Factory recovers
    TEST_CHECK(h.supervisor->set_factory(MockTransport::factory()) == Error::None);
    h.advance(30ms);
    TEST_CHECK(MockTransport::created() == 1);
    TEST_CHECK(h.count<supervisor::event::Connecting>() == 1);
    h.transport().emit_open();
    TEST_CHECK(h.supervisor->has_active_connection());

    std::cout << "[TEST] OK\n";
}

void test_factory_null_without_reconnect() {
    std::cout << "[TEST] Group E1: factory returning nothing stops when reconnect is off\n";
    SupervisorHarness h;
    h.supervisor->set_reconnect(false);
    TEST_CHECK(h.supervisor->set_factory([](const std::string&) {
        return std::unique_ptr<MockTransport>{};
    }) == Error::None);

    TEST_CHECK(h.supervisor->start() == Error::None);
    TEST_CHECK(!h.supervisor->started());
    TEST_CHECK(h.supervisor->state() == supervisor::State::Idle);
    TEST_CHECK(h.failures.size() == 1);
    TEST_CHECK(h.failures[0].fault == supervisor::Fault::TransportFactory);
    TEST_CHECK(h.failures[0].error == Error::TransportUnavailable);
    TEST_CHECK(h.closes.empty());

    h.advance(10000ms);
    TEST_CHECK(h.failures.size() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E2: Protocol engine faults
// -----------------------------------------------------------------------------
void test_engine_internal_error() {
    std::cout << "[TEST] Group E2: engine internal error closes the session\n";
    SupervisorHarness h;
    TEST_CHECK(h.supervisor->set_backoff([](std::uint32_t) { return 10ms; }) == Error::None);
    h.start_and_open();
    MockTransport& t = h.transport();

    h.engine().raise_internal_error("handler threw: boom");

    TEST_CHECK(t.close_calls() == 1);
    TEST_CHECK(t.last_close_code() == 4101);
    TEST_CHECK(t.last_close_reason() == "Internal protocol error");

    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(h.closes[0].code == 4101);
    TEST_CHECK(h.closes[0].reason == "Internal protocol error");
    TEST_CHECK(h.closes[0].reconnect);

    TEST_CHECK(h.failures.size() == 1);
    TEST_CHECK(h.failures[0].fault == supervisor::Fault::EngineInternal);
    TEST_CHECK(h.failures[0].message == "handler threw: boom");
    TEST_CHECK(std::holds_alternative<supervisor::event::Failure>(h.events.back()));

    std::cout << "[TEST] OK\n";
}

void test_engine_internal_error_custom_code() {
    std::cout << "[TEST] Group E2: internal error uses the configured close code\n";
    SupervisorHarness h;
    TEST_CHECK(h.supervisor->set_internal_error_close_code(4999) == Error::None);
    h.start_and_open();

    h.engine().raise_internal_error("x");
    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(h.closes[0].code == 4999);

    std::cout << "[TEST] OK\n";
}

void test_engine_protocol_error() {
    std::cout << "[TEST] Group E2: protocol error keeps the session open\n";
    SupervisorHarness h;
    h.start_and_open();

    h.engine().raise_protocol_error("Parse error");
    TEST_CHECK(h.count<supervisor::event::ProtocolError>() == 1);
    const auto* err = std::get_if<supervisor::event::ProtocolError>(&h.events.back());
    TEST_CHECK(err != nullptr);
    TEST_CHECK(err->message == "Parse error");
    TEST_CHECK(h.closes.empty());
    TEST_CHECK(h.failures.empty());
    TEST_CHECK(h.supervisor->state() == supervisor::State::Open);

    std::cout << "[TEST] OK\n";
}

void test_outbound_dropped() {
    std::cout << "[TEST] Group E2: outbound frame without an open transport is dropped\n";
    SupervisorHarness h;

    // No session at all
    h.engine().send_ungated("orphan");
    TEST_CHECK(h.failures.size() == 1);
    TEST_CHECK(h.failures[0].fault == supervisor::Fault::OutboundDropped);
    TEST_CHECK(h.failures[0].error == Error::NotConnected);

    // Session still connecting
    TEST_CHECK(h.supervisor->start() == Error::None);
    h.engine().send_ungated("early");
    TEST_CHECK(h.failures.size() == 2);
    TEST_CHECK(h.transport().sent().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E3: Exactly one Close per session
// -----------------------------------------------------------------------------
void test_close_signals_race() {
    std::cout << "[TEST] Group E3: competing close signals resolve once\n";
    SupervisorHarness h;
    TEST_CHECK(h.supervisor->set_connect_timeout(100ms) == Error::None);
    TEST_CHECK(h.supervisor->set_backoff([](std::uint32_t) { return 1000ms; }) == Error::None);
    TEST_CHECK(h.supervisor->start() == Error::None);
    MockTransport& t = h.transport();

    // Remote close, then the timeout deadline passes, then a second remote close
    t.emit_close(1006, "");
    ManualClock::advance(100ms);
    h.timer.poll();
    t.emit_close(1006, "again");
    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(t.close_calls() == 0);

    std::cout << "[TEST] OK\n";
}

void test_handler_stop_inside_close() {
    std::cout << "[TEST] Group E3: stop() from the Close handler\n";
    SupervisorHarness h;
    h.supervisor->on_event([&h](const supervisor::Event& ev) {
        h.record(ev);
        if (std::holds_alternative<supervisor::event::Close>(ev)) {
            (void)h.supervisor->stop();
        }
    });
    h.start_and_open();

    h.transport().emit_close(1006, "");
    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(h.closes[0].reconnect);   // decided before the handler ran
    TEST_CHECK(!h.supervisor->started());
    TEST_CHECK(h.supervisor->state() == supervisor::State::Idle);

    h.advance(60000ms);
    TEST_CHECK(MockTransport::created() == 1);

    std::cout << "[TEST] OK\n";
}

void test_handler_close_inside_probe_failure() {
    std::cout << "[TEST] Group E3: close_connection() from a ProbeFailure handler\n";
    SupervisorHarness h;
    TEST_CHECK(h.supervisor->set_consecutive_probe_fail_close(1) == Error::None);
    h.supervisor->on_event([&h](const supervisor::Event& ev) {
        h.record(ev);
        if (std::holds_alternative<supervisor::event::ProbeFailure>(ev)) {
            (void)h.supervisor->close_connection(4002, "caller gave up");
        }
    });
    h.start_and_open();

    h.advance(1ms);
    h.engine().resolve_probe(false);

    // The caller's close won; no exhaustion close followed
    TEST_CHECK(h.closes.size() == 1);
    TEST_CHECK(h.closes[0].code == 4002);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Info);

    test_event_handler_throw();
    test_event_handler_always_throwing();
    test_backoff_throw();
    test_factory_throw_reconnects();
    test_factory_null_without_reconnect();
    test_engine_internal_error();
    test_engine_internal_error_custom_code();
    test_engine_protocol_error();
    test_outbound_dropped();
    test_close_signals_race();
    test_handler_stop_inside_close();
    test_handler_close_inside_probe_failure();

    std::cout << "\n[GROUP E SUPERVISOR TESTS PASSED]\n";
    return 0;
}
