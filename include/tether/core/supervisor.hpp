#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "tether/core/backoff.hpp"
#include "tether/core/close_code.hpp"
#include "tether/core/config.hpp"
#include "tether/core/error.hpp"
#include "tether/core/protocol/concepts.hpp"
#include "tether/core/supervisor/event.hpp"
#include "tether/core/supervisor/liveness_monitor.hpp"
#include "tether/core/supervisor/options.hpp"
#include "tether/core/supervisor/session.hpp"
#include "tether/core/supervisor/state.hpp"
#include "tether/core/telemetry.hpp"
#include "tether/core/telemetry/supervisor.hpp"
#include "tether/core/timer/concepts.hpp"
#include "tether/core/transport/concepts.hpp"
#include "lcr/log/logger.hpp"


namespace tether::core {

/*
===============================================================================
 tether::core::Supervisor
===============================================================================

Connection supervisor: keeps one *logical* connection to a remote peer alive
over a session-oriented transport, parameterized by a transport conforming
to transport::TransportConcept, a protocol engine conforming to
protocol::EngineConcept and a timer conforming to timer::TimerConcept.

A logical connection is a sequence of sessions. Each session owns exactly
one transport instance, from the factory call until its close is handled.
At most one session is active at any time.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Create transports through the caller-supplied factory
- Guard connection setup with a connect timeout
- Gate the protocol engine: resumed while a session is open, paused otherwise
  (outbound work queues inside the engine during outages)
- Probe liveness of open sessions and close stalled ones
- Decide, exactly once per session, whether to reconnect (backoff) or stop
- Report every externally meaningful fact as a supervisor::Event

-------------------------------------------------------------------------------
 Session identity
-------------------------------------------------------------------------------
Every transport handler and timer closure captures the id of the session it
was created for and is ignored once that session is no longer the active
one. A session's close is resolved by the first of: remote close, local
close, connect timeout, probe exhaustion, engine internal error. Later
signals for the same session are no-ops.

-------------------------------------------------------------------------------
 Reconnect counter
-------------------------------------------------------------------------------
- delay = backoff(counter) with the pre-increment counter
- +1 (clamped to max) per session-ending failure while reconnect is enabled
- -1 (floored at 0) per successful liveness probe
- reset by start()

-------------------------------------------------------------------------------
 Design Guarantees
-------------------------------------------------------------------------------
- Single-threaded: every entry point (caller API, transport events, timers,
  probe outcomes) runs on the thread driving the timer
- Never throws on its own; caller callbacks that throw (event handler,
  backoff, factory) are contained and reported as Failure events
- Transports are never destroyed from inside their own callbacks: ended
  sessions are retired and released by the next poll()
- The destructor closes the active transport without emitting events

===============================================================================
*/

template <
    transport::TransportConcept Transport,
    typename Engine,
    timer::TimerConcept Timer
>
requires protocol::EngineConcept<Engine, Timer>
class Supervisor {
public:
    using Options = supervisor::Options<Transport>;
    using Factory = transport::Factory<Transport>;

    Supervisor(Timer& timer, telemetry::Supervisor& telemetry)
        : timer_(timer)
        , telemetry_(telemetry)
        , engine_(timer)
        , monitor_(timer, engine_)
        , counter_(options_.reconnect_counter_max)
    {
        engine_.pause();
        engine_.bind(protocol::Hooks{
            .on_frame = [this](std::string_view frame, transport::Encoding encoding) {
                send_frame_(frame, encoding);
            },
            .on_internal_error = [this](const std::string& message) {
                on_engine_internal_error_(message);
            },
            .on_protocol_error = [this](const std::string& message) {
                TT_WARN("[SUP] Protocol error: " << message);
                emit_(supervisor::event::ProtocolError{message});
            },
        });
        monitor_.bind(typename Monitor::Hooks{
            .on_success = [this](std::chrono::milliseconds delay) { on_probe_success_(delay); },
            .on_failure = [this](std::uint32_t consecutive, const std::string& error) { on_probe_failure_(consecutive, error); },
            .on_exhausted = [this]() { on_probe_exhausted_(); },
        });
        apply_monitor_options_();
    }

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Closes the active transport quietly: no events, no reconnect.
    ~Supervisor() {
        started_ = false;
        cancel_timer_(reconnect_timer_);
        monitor_.stop();
        if (session_) {
            Session s = std::move(*session_);
            session_.reset();
            cancel_timer_(s.connect_timer);
            s.transport->close(close_code::GOING_AWAY, "Client shutdown");
        }
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error start() {
        TT_TL1( telemetry_.start_calls_total.inc() );
        if (started_) {
            TT_WARN("[SUP] start() called while already started (state: " << to_string(state_) << "). Ignoring.");
            return Error::InvalidState;
        }
        if (!options_.factory) {
            TT_ERROR("[SUP] start() called without a transport factory");
            return Error::InvalidArgument;
        }
        TT_INFO("[SUP] Starting supervisor for " << options_.url);
        started_ = true;
        counter_.reset();
        connect_();
        return Error::None;
    }

    // Valid in any state. Idempotent: only the first call ends a session.
    [[nodiscard]]
    inline Error stop(int code = close_code::NORMAL, std::string_view reason = close_code::NORMAL_REASON) {
        TT_TL1( telemetry_.stop_calls_total.inc() );
        if (!close_code::is_valid_outgoing(code)) {
            TT_WARN("[SUP] stop() rejected close code " << code);
            return Error::InvalidCloseCode;
        }
        if (started_) {
            TT_INFO("[SUP] Stopping supervisor (" << code << " " << reason << ")");
        }
        started_ = false;
        cancel_timer_(reconnect_timer_);
        monitor_.stop();
        if (session_) {
            close_session_(session_->id, code, std::string(reason), false, true);
        }
        else {
            set_state_(supervisor::State::Idle);
        }
        return Error::None;
    }

    // Closes the active session; reconnects per policy when still started.
    [[nodiscard]]
    inline Error close_connection(int code, std::string_view reason) {
        if (!close_code::is_valid_outgoing(code)) {
            TT_WARN("[SUP] close_connection() rejected close code " << code);
            return Error::InvalidCloseCode;
        }
        if (!session_) {
            TT_DEBUG("[SUP] close_connection() without an active session");
            return Error::NotConnected;
        }
        close_session_(session_->id, code, std::string(reason), false, true);
        return Error::None;
    }

    // Releases transports retired by ended sessions
    inline void poll() noexcept {
        if (!retired_.empty()) {
            TT_TRACE("[SUP] Releasing " << retired_.size() << " retired transport(s)");
            retired_.clear();
        }
    }

    inline void on_event(supervisor::Handler handler) {
        handler_ = std::move(handler);
    }

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    // All-or-nothing
    [[nodiscard]]
    inline Error configure(const Options& options) {
        const Error err = options.validate();
        if (err != Error::None) {
            TT_WARN("[SUP] configure() rejected (" << to_string(err) << ")");
            return err;
        }
        options_ = options;
        counter_.set_max(options_.reconnect_counter_max);
        apply_monitor_options_();
        return Error::None;
    }

    inline void set_url(std::string url) { options_.url = std::move(url); }

    [[nodiscard]]
    inline Error set_factory(Factory factory) {
        if (!factory) return Error::InvalidArgument;
        options_.factory = std::move(factory);
        return Error::None;
    }

    [[nodiscard]]
    inline Error set_connect_timeout(std::chrono::milliseconds timeout) noexcept {
        if (timeout < std::chrono::milliseconds::zero()) return Error::InvalidArgument;
        options_.connect_timeout = timeout;
        return Error::None;
    }

    inline void set_reconnect(bool enabled) noexcept { options_.reconnect = enabled; }

    [[nodiscard]]
    inline Error set_backoff(backoff::DelayFn fn) {
        if (!fn) return Error::InvalidArgument;
        options_.backoff = std::move(fn);
        return Error::None;
    }

    inline void set_reconnect_counter_max(std::uint32_t max) noexcept {
        options_.reconnect_counter_max = max;
        counter_.set_max(max);
    }

    [[nodiscard]]
    inline Error set_consecutive_probe_fail_close(std::uint32_t threshold) noexcept {
        if (threshold == 0) return Error::InvalidArgument;
        options_.consecutive_probe_fail_close = threshold;
        monitor_.set_threshold(threshold);
        return Error::None;
    }

    [[nodiscard]]
    inline Error set_timeout_close_code(int code) noexcept {
        if (!close_code::is_valid_outgoing(code)) return Error::InvalidCloseCode;
        options_.timeout_close_code = code;
        return Error::None;
    }

    [[nodiscard]]
    inline Error set_internal_error_close_code(int code) noexcept {
        if (!close_code::is_valid_outgoing(code)) return Error::InvalidCloseCode;
        options_.internal_error_close_code = code;
        return Error::None;
    }

    [[nodiscard]]
    inline Error set_probe_interval(std::chrono::milliseconds interval) noexcept {
        if (interval < std::chrono::milliseconds::zero()) return Error::InvalidArgument;
        options_.probe_interval = interval;
        monitor_.set_interval(interval);
        return Error::None;
    }

    [[nodiscard]]
    inline Error set_probe_timeout(std::chrono::milliseconds timeout) noexcept {
        if (timeout <= std::chrono::milliseconds::zero()) return Error::InvalidArgument;
        options_.probe_timeout = timeout;
        monitor_.set_timeout(timeout);
        return Error::None;
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline const Options& options() const noexcept { return options_; }

    [[nodiscard]]
    inline const std::string& url() const noexcept { return options_.url; }

    [[nodiscard]]
    inline std::chrono::milliseconds connect_timeout() const noexcept { return options_.connect_timeout; }

    [[nodiscard]]
    inline bool reconnect() const noexcept { return options_.reconnect; }

    [[nodiscard]]
    inline std::uint32_t reconnect_counter_max() const noexcept { return counter_.max(); }

    [[nodiscard]]
    inline std::uint32_t consecutive_probe_fail_close() const noexcept { return options_.consecutive_probe_fail_close; }

    [[nodiscard]]
    inline int timeout_close_code() const noexcept { return options_.timeout_close_code; }

    [[nodiscard]]
    inline int internal_error_close_code() const noexcept { return options_.internal_error_close_code; }

    [[nodiscard]]
    inline std::chrono::milliseconds probe_interval() const noexcept { return options_.probe_interval; }

    [[nodiscard]]
    inline std::chrono::milliseconds probe_timeout() const noexcept { return options_.probe_timeout; }

    [[nodiscard]]
    inline bool started() const noexcept { return started_; }

    [[nodiscard]]
    inline supervisor::State state() const noexcept { return state_; }

    [[nodiscard]]
    inline std::uint32_t reconnect_counter() const noexcept { return counter_.value(); }

    // Id of the active session, 0 when there is none
    [[nodiscard]]
    inline std::uint64_t session_id() const noexcept { return session_ ? session_->id : 0; }

    // Started, open transport and engine flowing
    [[nodiscard]]
    inline bool has_active_connection() const noexcept {
        return started_
            && session_
            && session_->transport->ready_state() == transport::ReadyState::Open
            && !engine_.is_paused();
    }

    [[nodiscard]]
    inline Engine& engine() noexcept { return engine_; }

    [[nodiscard]]
    inline const Engine& engine() const noexcept { return engine_; }

    [[nodiscard]]
    inline std::uint32_t consecutive_probe_failures() const noexcept { return monitor_.consecutive_failures(); }

    [[nodiscard]]
    inline std::size_t retired_transports() const noexcept { return retired_.size(); }

#ifdef TT_UNIT_TEST
public:
    Transport* transport() noexcept {
        return session_ ? session_->transport.get() : nullptr;
    }
#endif // TT_UNIT_TEST

private:
    using Session = supervisor::Session<Transport>;
    using Monitor = supervisor::LivenessMonitor<Timer, Engine>;

    Timer& timer_;                                  // Not owned, outlives the supervisor
    telemetry::Supervisor& telemetry_;              // Telemetry reference (not owned)

    Options options_;

    // Owned across sessions (declared before the monitor, which refers to it)
    Engine engine_;
    Monitor monitor_;

    supervisor::Handler handler_;

    // Lifecycle
    bool started_{false};
    supervisor::State state_{supervisor::State::Idle};

    // Active session and session identity sequence
    std::optional<Session> session_;
    std::uint64_t session_seq_{0};

    // Reconnect state
    backoff::Counter counter_;
    timer::TimerId reconnect_timer_{timer::INVALID_TIMER};

    // Transports of ended sessions, released on the next poll()
    std::vector<std::unique_ptr<Transport>> retired_;

private:
    inline void set_state_(supervisor::State new_state) noexcept {
        if (state_ != new_state) {
            TT_TRACE("[SUP] State:  " << to_string(state_) << " -> " << to_string(new_state));
            state_ = new_state;
        }
    }

    [[nodiscard]]
    inline bool is_current_(std::uint64_t id) const noexcept {
        return session_ && session_->id == id && !session_->close_handled;
    }

    inline void cancel_timer_(timer::TimerId& id) noexcept {
        if (id != timer::INVALID_TIMER) {
            (void)timer_.cancel(id);
            id = timer::INVALID_TIMER;
        }
    }

    inline void apply_monitor_options_() noexcept {
        monitor_.set_interval(options_.probe_interval);
        monitor_.set_timeout(options_.probe_timeout);
        monitor_.set_threshold(options_.consecutive_probe_fail_close);
    }

    // -------------------------------------------------------------------------
    // Event emission (caller handler faults are contained here)
    // -------------------------------------------------------------------------
    inline void emit_(supervisor::Event ev) {
        TT_TRACE("[SUP] Emitting event: " << supervisor::to_string(ev));
        if (!handler_) {
            return;
        }
        // The handler may replace itself while running
        auto handler = handler_;
        std::string fault;
        try {
            handler(ev);
            return;
        }
        catch (const std::exception& e) {
            fault = e.what();
        }
        catch (...) {
            fault = "non-standard exception";
        }
        TT_TL1( telemetry_.callback_faults_total.inc() );
        if (const auto* failure = std::get_if<supervisor::event::Failure>(&ev);
            failure && failure->fault == supervisor::Fault::EventHandler) {
            TT_ERROR("[SUP] Event handler threw while reporting a handler fault: " << fault);
            return;
        }
        TT_ERROR("[SUP] Event handler threw on " << supervisor::to_string(ev) << ": " << fault);
        emit_(supervisor::event::Failure{
            supervisor::Fault::EventHandler,
            Error::None,
            "Event handler threw on " + std::string(supervisor::to_string(ev)) + ": " + fault
        });
    }

    // -------------------------------------------------------------------------
    // Connect
    // -------------------------------------------------------------------------
    inline void connect_() {
        cancel_timer_(reconnect_timer_);
        const std::uint64_t id = ++session_seq_;
        TT_TL1( telemetry_.connect_attempts_total.inc() );
        TT_DEBUG("[SUP] Connecting to " << options_.url << " (session #" << id << ")");

        std::unique_ptr<Transport> transport;
        std::string failure;
        try {
            transport = options_.factory(options_.url);
        }
        catch (const std::exception& e) {
            failure = e.what();
        }
        catch (...) {
            failure = "non-standard exception";
        }
        if (!transport) {
            if (failure.empty()) {
                failure = "factory returned no transport";
            }
            else {
                TT_TL1( telemetry_.callback_faults_total.inc() );
            }
            on_factory_failure_(failure);
            return;
        }

        session_.emplace();
        session_->id = id;
        session_->transport = std::move(transport);
        set_state_(supervisor::State::Connecting);

        session_->transport->set_handler([this, id](transport::Event&& ev) {
            on_transport_event_(id, std::move(ev));
        });

        // A zero connect timeout leaves the opening handshake unbounded
        const auto timeout = options_.connect_timeout;
        if (timeout > std::chrono::milliseconds::zero()) {
            session_->connect_timer = timer_.schedule(timeout, [this, id, timeout]() {
                on_connect_timeout_(id, timeout);
            });
        }

        emit_(supervisor::event::Connecting{id, options_.url});
    }

    // Failed attempt without a session: reconnect per policy or stop
    inline void on_factory_failure_(const std::string& failure) {
        TT_ERROR("[SUP] Transport factory failed: " << failure);
        set_state_(supervisor::State::Closing);
        std::string backoff_fault;
        std::string message = "Transport factory failed: " + failure;
        if (started_ && options_.reconnect) {
            const auto delay = schedule_reconnect_(backoff_fault);
            message += " (reconnecting in " + std::to_string(delay.count()) + "ms)";
        }
        else {
            finish_stop_();
        }
        emit_(supervisor::event::Failure{supervisor::Fault::TransportFactory, Error::TransportUnavailable, message});
        report_backoff_fault_(backoff_fault);
    }

    // -------------------------------------------------------------------------
    // Transport events (bound to the session they were subscribed for)
    // -------------------------------------------------------------------------
    inline void on_transport_event_(std::uint64_t id, transport::Event&& ev) {
        if (!is_current_(id)) {
            TT_TRACE("[SUP] Discarding transport event of stale session #" << id);
            return;
        }
        if (std::holds_alternative<transport::event::Opened>(ev)) {
            on_transport_open_();
        }
        else if (auto* failed = std::get_if<transport::event::Failed>(&ev)) {
            TT_WARN("[SUP] Transport error (session #" << id << "): " << failed->message);
            emit_(supervisor::event::TransportError{id, std::move(failed->message)});
        }
        else if (auto* closed = std::get_if<transport::event::Closed>(&ev)) {
            TT_INFO("[SUP] Transport closed by remote (session #" << id << "): " << closed->code << " " << closed->reason);
            TT_TL1( telemetry_.remote_closes_total.inc() );
            close_session_(id, closed->code, std::move(closed->reason), true, false);
        }
        else if (auto* message = std::get_if<transport::event::Message>(&ev)) {
            engine_.consume(message->data, message->encoding);
        }
    }

    inline void on_transport_open_() {
        Session& s = *session_;
        if (s.opened) {
            return;
        }
        s.opened = true;
        cancel_timer_(s.connect_timer);
        cancel_timer_(reconnect_timer_);
        set_state_(supervisor::State::Open);
        TT_TL1( telemetry_.opens_total.inc() );
        TT_INFO("[SUP] Connected to " << options_.url << " (session #" << s.id << ")");
        const std::uint64_t id = s.id;
        // Flushes frames queued during the outage
        engine_.resume();
        if (!is_current_(id)) {
            return;
        }
        monitor_.start(FIRST_PROBE_DELAY);
        emit_(supervisor::event::Open{id});
    }

    inline void on_connect_timeout_(std::uint64_t id, std::chrono::milliseconds timeout) {
        if (!is_current_(id) || session_->opened) {
            return;
        }
        session_->connect_timer = timer::INVALID_TIMER;
        TT_TL1( telemetry_.connect_timeouts_total.inc() );
        TT_WARN("[SUP] Connect timeout after " << timeout.count() << " ms (session #" << id << ")");
        close_session_(id, options_.timeout_close_code,
                       "Timeout: Opening connection took longer than " + std::to_string(timeout.count()) + "ms",
                       false, true);
    }

    // -------------------------------------------------------------------------
    // Close resolution: first caller per session wins
    // -------------------------------------------------------------------------
    inline void close_session_(std::uint64_t id, int code, std::string reason, bool closed_by_remote, bool initiate) {
        if (!is_current_(id)) {
            return;
        }
        session_->close_handled = true;
        set_state_(supervisor::State::Closing);

        Session s = std::move(*session_);
        session_.reset();

        // Teardown
        cancel_timer_(s.connect_timer);
        monitor_.stop();
        engine_.pause();

        if (initiate) {
            // Callbacks raised from here are already stale
            s.transport->close(code, reason);
        }
        retired_.push_back(std::move(s.transport));
        TT_TL1( telemetry_.closes_total.inc() );

        if (started_ && options_.reconnect) {
            std::string backoff_fault;
            const auto delay = schedule_reconnect_(backoff_fault);
            TT_INFO("[SUP] Session #" << id << " closed (" << code << " " << reason << "), reconnecting in " << delay.count() << " ms");
            emit_(supervisor::event::Close{code, std::move(reason), closed_by_remote, true, delay});
            report_backoff_fault_(backoff_fault);
        }
        else {
            finish_stop_();
            TT_INFO("[SUP] Session #" << id << " closed (" << code << " " << reason << "), not reconnecting");
            emit_(supervisor::event::Close{code, std::move(reason), closed_by_remote, false, std::nullopt});
        }
    }

    inline void finish_stop_() noexcept {
        started_ = false;
        cancel_timer_(reconnect_timer_);
        monitor_.stop();
        set_state_(supervisor::State::Idle);
    }

    // -------------------------------------------------------------------------
    // Reconnect
    // -------------------------------------------------------------------------
    [[nodiscard]]
    inline std::chrono::milliseconds schedule_reconnect_(std::string& backoff_fault) {
        const std::uint32_t counter = counter_.value();
        std::chrono::milliseconds delay{0};
        try {
            delay = options_.backoff(counter);
        }
        catch (const std::exception& e) {
            backoff_fault = e.what();
        }
        catch (...) {
            backoff_fault = "non-standard exception";
        }
        if (!backoff_fault.empty()) {
            TT_TL1( telemetry_.callback_faults_total.inc() );
            delay = backoff::exponential_jitter(counter);
            TT_ERROR("[SUP] Backoff callback threw: " << backoff_fault << " (using " << delay.count() << " ms)");
        }
        if (delay < std::chrono::milliseconds::zero()) {
            delay = std::chrono::milliseconds::zero();
        }
        counter_.increase();
        cancel_timer_(reconnect_timer_);
        reconnect_timer_ = timer_.schedule(delay, [this]() { on_reconnect_timer_(); });
        set_state_(supervisor::State::WaitingReconnect);
        TT_TL1( telemetry_.reconnects_scheduled_total.inc() );
        return delay;
    }

    inline void report_backoff_fault_(const std::string& backoff_fault) {
        if (!backoff_fault.empty()) {
            emit_(supervisor::event::Failure{
                supervisor::Fault::BackoffCallback,
                Error::None,
                "Backoff callback threw: " + backoff_fault
            });
        }
    }

    inline void on_reconnect_timer_() {
        reconnect_timer_ = timer::INVALID_TIMER;
        if (!started_ || session_) {
            return;
        }
        connect_();
    }

    // -------------------------------------------------------------------------
    // Liveness
    // -------------------------------------------------------------------------
    inline void on_probe_success_(std::chrono::milliseconds delay) {
        counter_.decrease();
        TT_TL1( telemetry_.probe_successes_total.inc() );
        emit_(supervisor::event::ProbeSuccess{delay});
    }

    inline void on_probe_failure_(std::uint32_t consecutive, const std::string& error) {
        TT_TL1( telemetry_.probe_failures_total.inc() );
        emit_(supervisor::event::ProbeFailure{consecutive, error});
    }

    inline void on_probe_exhausted_() {
        if (!session_) {
            return;
        }
        TT_TL1( telemetry_.probe_exhaustions_total.inc() );
        close_session_(session_->id, options_.timeout_close_code,
                       "Timeout: No responses received to probe calls", false, true);
    }

    // -------------------------------------------------------------------------
    // Protocol engine
    // -------------------------------------------------------------------------

    // Engine is resumed only while a session is open, so this never drops in
    // correct operation
    inline void send_frame_(std::string_view frame, transport::Encoding encoding) {
        if (!session_ || session_->close_handled
            || session_->transport->ready_state() != transport::ReadyState::Open) {
            TT_ERROR("[SUP] Dropping outbound frame: no open transport (state: " << to_string(state_) << ")");
            emit_(supervisor::event::Failure{
                supervisor::Fault::OutboundDropped,
                Error::NotConnected,
                "Outbound frame dropped: no open transport"
            });
            return;
        }
        if (!session_->transport->send(frame, encoding)) {
            TT_WARN("[SUP] Transport rejected outbound frame (session #" << session_->id << ")");
        }
    }

    inline void on_engine_internal_error_(const std::string& message) {
        TT_ERROR("[SUP] Protocol engine internal error: " << message);
        if (session_) {
            close_session_(session_->id, options_.internal_error_close_code, "Internal protocol error", false, true);
        }
        emit_(supervisor::event::Failure{supervisor::Fault::EngineInternal, Error::None, message});
    }
};

} // namespace tether::core
