#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tether/core/protocol/concepts.hpp"
#include "tether/core/timer/concepts.hpp"
#include "tether/core/transport/events.hpp"
#include "tether/rpc/error.hpp"
#include "tether/rpc/message.hpp"
#include "tether/rpc/parser.hpp"
#include "lcr/log/logger.hpp"


namespace tether::rpc {

/*
===============================================================================
 tether::rpc::Engine
===============================================================================

JSON-RPC 2.0 protocol engine conforming to core::protocol::EngineConcept.

The engine correlates outgoing calls with their responses, dispatches inbound
requests and notifications to registered handlers and answers liveness pings.
It knows nothing about transports: outbound frames leave through
Hooks::on_frame, inbound frames enter through consume().

-------------------------------------------------------------------------------
 Outbound flow
-------------------------------------------------------------------------------
- While paused every frame (calls, notifications, replies) is queued in order
- resume() flushes the queue, then frames go straight to on_frame
- Calls keep their timeout running while queued: a call made during an
  outage resolves with error_code::TIMEOUT if no session comes back in time

-------------------------------------------------------------------------------
 Inbound flow
-------------------------------------------------------------------------------
- Malformed JSON        → protocol error + -32700 reply (id null)
- Wrong "jsonrpc"       → protocol error + -32600 reply
- Unknown method        → -32601 reply
- Handler throws        → -32603 reply
- Unknown response id   → protocol error
- Response/notification handler throws → internal error (the supervisor
  closes the session with its internal-error close code)

-------------------------------------------------------------------------------
 Liveness
-------------------------------------------------------------------------------
probe() is a regular call of `ping_method` whose outcome is reported with the
measured round-trip delay. Inbound pings are answered with `true` while
`ping_receive` is enabled.

Pending calls are never resolved by the destructor.
===============================================================================
*/

inline constexpr std::string_view DEFAULT_PING_METHOD = "tether.ping";

template <typename Timer>
class Engine {
public:
    using ResponseHandler     = std::function<void(const Response&)>;
    using MethodHandler       = std::function<Reply(std::string_view params)>;
    using NotificationHandler = std::function<void(std::string_view params)>;

    explicit Engine(Timer& timer)
        : timer_(timer)
    {}

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    ~Engine() {
        for (auto& [id, pending] : pending_) {
            if (pending.timer != core::timer::INVALID_TIMER) {
                (void)timer_.cancel(pending.timer);
            }
        }
    }

    inline void bind(core::protocol::Hooks hooks) {
        hooks_ = std::move(hooks);
    }

    // -------------------------------------------------------------------------
    // Outbound gating
    // -------------------------------------------------------------------------

    inline void pause() noexcept {
        paused_ = true;
    }

    inline void resume() {
        paused_ = false;
        if (!outbox_.empty()) {
            TT_DEBUG("[RPC] Flushing " << outbox_.size() << " queued frame(s)");
        }
        // on_frame may pause us again
        while (!paused_ && !outbox_.empty()) {
            std::string frame = std::move(outbox_.front());
            outbox_.pop_front();
            emit_frame_(frame);
        }
    }

    [[nodiscard]]
    inline bool is_paused() const noexcept {
        return paused_;
    }

    // -------------------------------------------------------------------------
    // Outgoing calls
    // -------------------------------------------------------------------------

    // Returns the request id. `params` is raw JSON (array or object) or empty.
    // Without an explicit timeout, default_timeout() applies (0 = wait forever).
    inline std::uint64_t call(std::string_view method,
                              std::string_view params,
                              ResponseHandler handler,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        const std::uint64_t id = next_id_++;
        const auto effective = timeout.value_or(default_timeout_);

        Pending pending;
        pending.method.assign(method);
        pending.handler = std::move(handler);
        if (effective > std::chrono::milliseconds::zero()) {
            pending.timer = timer_.schedule(effective, [this, id, effective]() {
                on_call_timeout_(id, effective);
            });
        }
        pending_.emplace(id, std::move(pending));

        std::string frame;
        message::write_request(frame, id, method, params);
        TT_TRACE("[RPC] -> call #" << id << " " << method);
        send_(std::move(frame));
        return id;
    }

    inline void notify(std::string_view method, std::string_view params = {}) {
        std::string frame;
        message::write_notification(frame, method, params);
        TT_TRACE("[RPC] -> notify " << method);
        send_(std::move(frame));
    }

    // -------------------------------------------------------------------------
    // Local handlers
    // -------------------------------------------------------------------------

    // Registers (or replaces) the handler of an inbound request method
    inline void method(std::string name, MethodHandler handler) {
        methods_[std::move(name)] = std::move(handler);
    }

    // Adds a handler for an inbound notification (several may share a name)
    inline void notification(std::string name, NotificationHandler handler) {
        notifications_[std::move(name)].push_back(std::move(handler));
    }

    // -------------------------------------------------------------------------
    // Inbound frames
    // -------------------------------------------------------------------------

    inline void consume(std::string_view frame, core::transport::Encoding encoding) {
        if (encoding == core::transport::Encoding::Binary) {
            TT_TRACE("[RPC] <- binary frame (" << frame.size() << " bytes), decoding as UTF-8");
        }
        std::string diagnostic;
        const Result r = parser_.parse(frame, inbound_, diagnostic);
        switch (r) {
            case Result::Parsed:
                break;
            case Result::InvalidJson:
                protocol_error_(diagnostic);
                reply_error_(message::NULL_ID, RpcError{error_code::PARSE_ERROR, "Parse error", {}});
                return;
            case Result::InvalidSchema:
            case Result::InvalidValue:
            default:
                protocol_error_(diagnostic);
                // Never answer something that claimed to be a response
                if (inbound_.kind != Kind::Response) {
                    reply_error_(inbound_.id, RpcError{error_code::INVALID_REQUEST, diagnostic, {}});
                }
                return;
        }

        switch (inbound_.kind) {
            case Kind::Request:
                handle_request_();
                break;
            case Kind::Notification:
                handle_notification_();
                break;
            case Kind::Response:
                handle_response_();
                break;
        }
    }

    // -------------------------------------------------------------------------
    // Liveness
    // -------------------------------------------------------------------------

    inline void probe(std::chrono::milliseconds timeout, core::protocol::ProbeCallback cb) {
        const auto started = timer_.now();
        call(ping_method_, {}, [this, started, cb = std::move(cb)](const Response& response) {
            core::protocol::ProbeOutcome outcome;
            outcome.ok = response.ok;
            if (response.ok) {
                outcome.delay = std::chrono::duration_cast<std::chrono::milliseconds>(timer_.now() - started);
            }
            else {
                outcome.error = response.error.message;
            }
            cb(std::move(outcome));
        }, timeout);
    }

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    inline void set_ping_method(std::string name) { ping_method_ = std::move(name); }
    inline void set_ping_receive(bool enabled) noexcept { ping_receive_ = enabled; }
    inline void set_default_timeout(std::chrono::milliseconds timeout) noexcept { default_timeout_ = timeout; }

    // Only affects calls made afterwards
    inline void set_first_request_id(std::uint64_t id) noexcept { next_id_ = id; }

    [[nodiscard]]
    inline const std::string& ping_method() const noexcept { return ping_method_; }

    [[nodiscard]]
    inline bool ping_receive() const noexcept { return ping_receive_; }

    [[nodiscard]]
    inline std::chrono::milliseconds default_timeout() const noexcept { return default_timeout_; }

    // Accessors
    [[nodiscard]]
    inline std::size_t pending_calls() const noexcept { return pending_.size(); }

    [[nodiscard]]
    inline std::size_t queued_frames() const noexcept { return outbox_.size(); }

private:
    struct Pending {
        std::string method;
        ResponseHandler handler;
        core::timer::TimerId timer{core::timer::INVALID_TIMER};
    };

    Timer& timer_;
    core::protocol::Hooks hooks_;

    bool paused_{false};
    std::deque<std::string> outbox_;

    std::uint64_t next_id_{0};
    std::unordered_map<std::uint64_t, Pending> pending_;

    std::unordered_map<std::string, MethodHandler> methods_;
    std::unordered_map<std::string, std::vector<NotificationHandler>> notifications_;

    std::string ping_method_{DEFAULT_PING_METHOD};
    bool ping_receive_{true};
    std::chrono::milliseconds default_timeout_{0};

    Parser parser_;
    Inbound inbound_;

private:
    inline void send_(std::string frame) {
        if (paused_) {
            outbox_.push_back(std::move(frame));
            return;
        }
        emit_frame_(frame);
    }

    inline void emit_frame_(const std::string& frame) {
        if (hooks_.on_frame) {
            hooks_.on_frame(frame, core::transport::Encoding::Text);
        }
    }

    inline void protocol_error_(const std::string& message) {
        TT_WARN("[RPC] " << message);
        if (hooks_.on_protocol_error) {
            hooks_.on_protocol_error(message);
        }
    }

    inline void internal_error_(const std::string& message) {
        TT_ERROR("[RPC] " << message);
        if (hooks_.on_internal_error) {
            hooks_.on_internal_error(message);
        }
    }

    inline void reply_error_(std::string_view id, const RpcError& error) {
        std::string frame;
        message::write_error(frame, id, error);
        send_(std::move(frame));
    }

    inline void handle_request_() {
        // Handlers may re-enter consume(); work on copies
        const std::string id = inbound_.id;
        const std::string name = inbound_.method;
        const std::string params = inbound_.params;
        TT_TRACE("[RPC] <- request " << name << " (id " << id << ")");

        if (ping_receive_ && name == ping_method_) {
            std::string frame;
            message::write_result(frame, id, "true");
            send_(std::move(frame));
            return;
        }
        auto it = methods_.find(name);
        if (it == methods_.end()) {
            reply_error_(id, RpcError{error_code::METHOD_NOT_FOUND, "Method not found: " + name, {}});
            return;
        }
        auto handler = it->second;
        Reply reply;
        try {
            reply = handler(params);
        }
        catch (const std::exception& e) {
            TT_WARN("[RPC] Method '" << name << "' threw: " << e.what());
            reply = Reply::fail(error_code::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
        }
        catch (...) {
            TT_WARN("[RPC] Method '" << name << "' threw a non-standard exception");
            reply = Reply::fail(error_code::INTERNAL_ERROR, "Internal error");
        }
        std::string frame;
        if (reply.error) {
            message::write_error(frame, id, *reply.error);
        }
        else {
            message::write_result(frame, id, reply.result);
        }
        send_(std::move(frame));
    }

    inline void handle_notification_() {
        const std::string name = inbound_.method;
        const std::string params = inbound_.params;
        TT_TRACE("[RPC] <- notification " << name);
        auto it = notifications_.find(name);
        if (it == notifications_.end()) {
            TT_DEBUG("[RPC] No handler for notification '" << name << "'");
            return;
        }
        const auto handlers = it->second;
        for (const auto& handler : handlers) {
            std::string fault;
            try {
                handler(params);
                continue;
            }
            catch (const std::exception& e) {
                fault = e.what();
            }
            catch (...) {
                fault = "non-standard exception";
            }
            internal_error_("Notification handler for '" + name + "' threw: " + fault);
            return;
        }
    }

    inline void handle_response_() {
        if (!inbound_.has_numeric_id) {
            protocol_error_("Invalid Response: id " + inbound_.id + " does not match any pending call");
            return;
        }
        auto it = pending_.find(inbound_.numeric_id);
        if (it == pending_.end()) {
            protocol_error_("Invalid Response: id " + inbound_.id + " does not match any pending call");
            return;
        }
        Pending pending = std::move(it->second);
        pending_.erase(it);
        if (pending.timer != core::timer::INVALID_TIMER) {
            (void)timer_.cancel(pending.timer);
        }
        Response response;
        response.ok = !inbound_.is_error;
        if (response.ok) {
            response.result = inbound_.result;
        }
        else {
            response.error = inbound_.error;
        }
        TT_TRACE("[RPC] <- response #" << inbound_.numeric_id << (response.ok ? " ok" : " error"));
        deliver_(pending, response);
    }

    inline void on_call_timeout_(std::uint64_t id, std::chrono::milliseconds timeout) {
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;
        }
        Pending pending = std::move(it->second);
        pending_.erase(it);
        TT_DEBUG("[RPC] Call #" << id << " (" << pending.method << ") timed out after " << timeout.count() << " ms");
        Response response;
        response.ok = false;
        response.error = RpcError{
            error_code::TIMEOUT,
            "Timeout: '" + pending.method + "' call #" + std::to_string(id) + " got no response within " + std::to_string(timeout.count()) + "ms",
            {}
        };
        deliver_(pending, response);
    }

    inline void deliver_(Pending& pending, const Response& response) {
        if (!pending.handler) {
            return;
        }
        std::string fault;
        try {
            pending.handler(response);
            return;
        }
        catch (const std::exception& e) {
            fault = e.what();
        }
        catch (...) {
            fault = "non-standard exception";
        }
        internal_error_("Response handler of '" + pending.method + "' threw: " + fault);
    }
};

} // namespace tether::rpc
