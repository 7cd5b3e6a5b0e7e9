#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "tether/core/config.hpp"
#include "tether/core/protocol/concepts.hpp"
#include "tether/core/timer/concepts.hpp"
#include "lcr/log/logger.hpp"


namespace tether::core::supervisor {

/*
===============================================================================
 tether::core::supervisor::LivenessMonitor
===============================================================================

Periodic application-level probing of one open session.

The monitor asks the protocol engine for a probe, waits for it to settle and
then waits `interval` before the next probe (the interval is measured from
settlement, so probes never overlap). Outcomes are reported to the owner
through Hooks:

  - success: consecutive failure count reset to 0, on_success(delay)
  - failure: count + 1, on_failure(count, error), and once count reaches the
             threshold, on_exhausted() (the count is left as is: the session
             is about to be closed and a new session restarts the monitor)

-------------------------------------------------------------------------------
 Staleness
-------------------------------------------------------------------------------
Every start()/stop() bumps a generation token. Pending timers and in-flight
probe callbacks capture the generation they were issued under and become
inert once it changes, so a late probe reply from a dead session is never
attributed to the next one.

The accelerated first delay passed to start() is a one-shot override: later
probes always use the interval current at scheduling time.
===============================================================================
*/

template <typename Timer, typename Engine>
class LivenessMonitor {
public:
    struct Hooks {
        std::function<void(std::chrono::milliseconds delay)> on_success;
        std::function<void(std::uint32_t consecutive, const std::string& error)> on_failure;
        std::function<void()> on_exhausted;
    };

    LivenessMonitor(Timer& timer, Engine& engine) noexcept
        : timer_(timer)
        , engine_(engine)
    {}

    LivenessMonitor(const LivenessMonitor&) = delete;
    LivenessMonitor& operator=(const LivenessMonitor&) = delete;

    ~LivenessMonitor() {
        stop();
    }

    inline void bind(Hooks hooks) {
        hooks_ = std::move(hooks);
    }

    // Lifecycle
    inline void start(std::chrono::milliseconds first_delay = FIRST_PROBE_DELAY) {
        stop();
        running_ = true;
        consecutive_failures_ = 0;
        TT_TRACE("[LIVE] Monitor started (generation " << generation_ << ", first probe in " << first_delay.count() << " ms)");
        schedule_(first_delay);
    }

    inline void stop() noexcept {
        if (probe_timer_ != timer::INVALID_TIMER) {
            (void)timer_.cancel(probe_timer_);
            probe_timer_ = timer::INVALID_TIMER;
        }
        running_ = false;
        in_flight_ = false;
        ++generation_;
    }

    // Configuration (read at scheduling time)
    inline void set_interval(std::chrono::milliseconds interval) noexcept { interval_ = interval; }
    inline void set_timeout(std::chrono::milliseconds timeout) noexcept { timeout_ = timeout; }
    inline void set_threshold(std::uint32_t threshold) noexcept { threshold_ = threshold; }

    // Accessors
    [[nodiscard]]
    inline bool running() const noexcept { return running_; }

    [[nodiscard]]
    inline bool in_flight() const noexcept { return in_flight_; }

    [[nodiscard]]
    inline std::uint32_t consecutive_failures() const noexcept { return consecutive_failures_; }

    [[nodiscard]]
    inline std::chrono::milliseconds interval() const noexcept { return interval_; }

    [[nodiscard]]
    inline std::chrono::milliseconds timeout() const noexcept { return timeout_; }

    [[nodiscard]]
    inline std::uint32_t threshold() const noexcept { return threshold_; }

private:
    Timer& timer_;
    Engine& engine_;
    Hooks hooks_;

    std::chrono::milliseconds interval_{DEFAULT_PROBE_INTERVAL};
    std::chrono::milliseconds timeout_{DEFAULT_PROBE_TIMEOUT};
    std::uint32_t threshold_{DEFAULT_CONSECUTIVE_PROBE_FAIL_CLOSE};

    timer::TimerId probe_timer_{timer::INVALID_TIMER};
    std::uint64_t generation_{0};
    std::uint32_t consecutive_failures_{0};
    bool running_{false};
    bool in_flight_{false};

private:
    inline void schedule_(std::chrono::milliseconds delay) {
        const std::uint64_t gen = generation_;
        probe_timer_ = timer_.schedule(delay, [this, gen]() {
            if (gen != generation_) {
                return;
            }
            probe_timer_ = timer::INVALID_TIMER;
            issue_probe_(gen);
        });
    }

    inline void issue_probe_(std::uint64_t gen) {
        in_flight_ = true;
        engine_.probe(timeout_, [this, gen](protocol::ProbeOutcome outcome) {
            on_outcome_(gen, std::move(outcome));
        });
    }

    inline void on_outcome_(std::uint64_t gen, protocol::ProbeOutcome outcome) {
        if (gen != generation_ || !running_) {
            TT_TRACE("[LIVE] Discarding probe outcome from generation " << gen);
            return;
        }
        in_flight_ = false;
        if (outcome.ok) {
            consecutive_failures_ = 0;
            TT_TRACE("[LIVE] Probe succeeded in " << outcome.delay.count() << " ms");
            if (hooks_.on_success) {
                hooks_.on_success(outcome.delay);
            }
        }
        else {
            ++consecutive_failures_;
            TT_DEBUG("[LIVE] Probe failed (" << consecutive_failures_ << "/" << threshold_ << "): " << outcome.error);
            if (hooks_.on_failure) {
                hooks_.on_failure(consecutive_failures_, outcome.error);
            }
            if (gen == generation_ && consecutive_failures_ >= threshold_) {
                TT_WARN("[LIVE] " << consecutive_failures_ << " consecutive probe failures, requesting close");
                if (hooks_.on_exhausted) {
                    hooks_.on_exhausted();
                }
            }
        }
        // Hooks may have stopped or restarted the monitor
        if (gen == generation_ && running_) {
            schedule_(interval_);
        }
    }
};

} // namespace tether::core::supervisor
