#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace tether::core::telemetry {

// ============================================================================
// Supervisor Telemetry
//
// Observes supervisor-level decisions: sessions, closes, reconnects, probes.
// Does NOT observe transport internals or protocol payloads.
// Mechanical facts only.
// ============================================================================

struct alignas(64) Supervisor final {
    // ---------------------------------------------------------------------
    // Caller intent
    // ---------------------------------------------------------------------

    // start() invoked (accepted or rejected)
    lcr::metrics::atomic::counter32 start_calls_total;

    // stop() invoked (accepted or rejected)
    lcr::metrics::atomic::counter32 stop_calls_total;

    // ---------------------------------------------------------------------
    // Session lifecycle
    // ---------------------------------------------------------------------

    // Transport requested from the factory
    lcr::metrics::atomic::counter32 connect_attempts_total;

    // Transport reported open
    lcr::metrics::atomic::counter32 opens_total;

    // Session close handled (any cause, exactly once per session)
    lcr::metrics::atomic::counter32 closes_total;

    // Session close initiated by the remote side / the transport
    lcr::metrics::atomic::counter32 remote_closes_total;

    // Connect timeout fired on a still-connecting session
    lcr::metrics::atomic::counter32 connect_timeouts_total;

    // ---------------------------------------------------------------------
    // Reconnect decisions
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter32 reconnects_scheduled_total;

    // ---------------------------------------------------------------------
    // Liveness
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter32 probe_successes_total;
    lcr::metrics::atomic::counter32 probe_failures_total;

    // Session closed because the failure threshold was reached
    lcr::metrics::atomic::counter32 probe_exhaustions_total;

    // ---------------------------------------------------------------------
    // Faults
    // ---------------------------------------------------------------------

    // Caller callbacks that threw (event handler, backoff, factory)
    lcr::metrics::atomic::counter32 callback_faults_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Supervisor& other) const noexcept {
        start_calls_total.copy_to(other.start_calls_total);
        stop_calls_total.copy_to(other.stop_calls_total);

        connect_attempts_total.copy_to(other.connect_attempts_total);
        opens_total.copy_to(other.opens_total);
        closes_total.copy_to(other.closes_total);
        remote_closes_total.copy_to(other.remote_closes_total);
        connect_timeouts_total.copy_to(other.connect_timeouts_total);

        reconnects_scheduled_total.copy_to(other.reconnects_scheduled_total);

        probe_successes_total.copy_to(other.probe_successes_total);
        probe_failures_total.copy_to(other.probe_failures_total);
        probe_exhaustions_total.copy_to(other.probe_exhaustions_total);

        callback_faults_total.copy_to(other.callback_faults_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Supervisor Telemetry ===\n";

        os << "Caller intent\n";
        os << "  Start calls           : " << lcr::format_number_exact(start_calls_total.load()) << '\n';
        os << "  Stop calls            : " << lcr::format_number_exact(stop_calls_total.load()) << '\n';

        os << "\nSessions\n";
        os << "  Connect attempts      : " << lcr::format_number_exact(connect_attempts_total.load()) << '\n';
        os << "  Opens                 : " << lcr::format_number_exact(opens_total.load()) << '\n';
        os << "  Closes                : " << lcr::format_number_exact(closes_total.load()) << '\n';
        os << "  Remote closes         : " << lcr::format_number_exact(remote_closes_total.load()) << '\n';
        os << "  Connect timeouts      : " << lcr::format_number_exact(connect_timeouts_total.load()) << '\n';

        os << "\nReconnect\n";
        os << "  Reconnects scheduled  : " << lcr::format_number_exact(reconnects_scheduled_total.load()) << '\n';

        os << "\nLiveness\n";
        os << "  Probe successes       : " << lcr::format_number_exact(probe_successes_total.load()) << '\n';
        os << "  Probe failures        : " << lcr::format_number_exact(probe_failures_total.load()) << '\n';
        os << "  Probe exhaustions     : " << lcr::format_number_exact(probe_exhaustions_total.load()) << '\n';

        os << "\nFaults\n";
        os << "  Callback faults       : " << lcr::format_number_exact(callback_faults_total.load()) << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Supervisor>, "telemetry::Supervisor must be standard layout");
static_assert(std::is_trivially_destructible_v<Supervisor>, "telemetry::Supervisor must be trivially destructible");
static_assert(!std::is_polymorphic_v<Supervisor>, "telemetry::Supervisor must not be polymorphic");
static_assert(alignof(Supervisor) == 64, "telemetry::Supervisor must be cache-line aligned");

} // namespace tether::core::telemetry
