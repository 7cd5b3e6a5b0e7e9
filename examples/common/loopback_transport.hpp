#pragma once

#include <algorithm>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tether/core/transport/concepts.hpp"
#include "tether/rpc/message.hpp"
#include "tether/rpc/parser.hpp"
#include "lcr/log/logger.hpp"


namespace tether::examples {

using core::transport::Encoding;
using core::transport::ReadyState;

// -----------------------------------------------------------------------------
// LoopbackTransport - in-process transport talking to a scripted JSON-RPC peer
// -----------------------------------------------------------------------------
//
// Nothing leaves the process. Frames sent by the client are parsed by the
// peer, which answers:
//
//   • pings (any method ending in "ping") with true
//   • "echo" with its params
//   • anything else with a method-not-found error
//
// The peer greets every new session with a "peer.hello" notification.
//
// Events are delivered from pump(), never from send(), so the client sees the
// same ordering a real socket would give it. While the peer is stalled it
// keeps the session open but answers nothing.
//
// -----------------------------------------------------------------------------
class LoopbackTransport {
public:
    explicit LoopbackTransport(std::string url)
        : url_(std::move(url))
    {
        TT_DEBUG("[LOOP] transport created for " << url_);
        live_().push_back(this);
    }

    ~LoopbackTransport() {
        TT_DEBUG("[LOOP] transport destroyed");
        auto& live = live_();
        live.erase(std::remove(live.begin(), live.end(), this), live.end());
    }

    LoopbackTransport(const LoopbackTransport&) = delete;
    LoopbackTransport& operator=(const LoopbackTransport&) = delete;

    // ---------------------------------------------------------------------
    // transport::TransportConcept API
    // ---------------------------------------------------------------------

    inline void set_handler(core::transport::Handler handler) {
        handler_ = std::move(handler);
    }

    inline bool send(std::string_view frame, Encoding) {
        if (state_ != ReadyState::Open) {
            return false;
        }
        TT_TRACE("[LOOP] -> " << frame);
        outbox_.emplace_back(frame);
        return true;
    }

    inline void close(int code, std::string_view reason) {
        if (state_ == ReadyState::Closed) {
            return;
        }
        state_ = ReadyState::Closed;
        deliver_(core::transport::event::Closed{code, std::string(reason)});
    }

    [[nodiscard]]
    inline ReadyState ready_state() const noexcept {
        return state_;
    }

    // ---------------------------------------------------------------------
    // Peer control
    // ---------------------------------------------------------------------

    static inline void set_stalled(bool stalled) noexcept {
        stalled_() = stalled;
    }

    [[nodiscard]]
    static inline bool stalled() noexcept {
        return stalled_();
    }

    [[nodiscard]]
    static inline core::transport::Factory<LoopbackTransport> factory() {
        return [](const std::string& url) { return std::make_unique<LoopbackTransport>(url); };
    }

    // Drives every live transport one step: completes pending handshakes,
    // lets the peer answer what it received and delivers its frames.
    // Returns true if any event was delivered.
    static inline bool pump() {
        const std::vector<LoopbackTransport*> snapshot = live_();
        bool did_work = false;
        for (LoopbackTransport* t : snapshot) {
            if (!is_live_(t)) {
                continue;
            }
            did_work |= t->step_();
        }
        return did_work;
    }

private:
    std::string url_;
    ReadyState state_{ReadyState::Connecting};
    core::transport::Handler handler_;

    std::deque<std::string> outbox_;   // client -> peer
    std::deque<std::string> inbox_;    // peer -> client

    rpc::Parser parser_;
    rpc::Inbound inbound_;
    std::string diagnostic_;

    static inline std::vector<LoopbackTransport*>& live_() {
        static std::vector<LoopbackTransport*> live;
        return live;
    }

    static inline bool& stalled_() {
        static bool stalled = false;
        return stalled;
    }

    static inline bool is_live_(const LoopbackTransport* t) {
        const auto& live = live_();
        return std::find(live.begin(), live.end(), t) != live.end();
    }

    inline bool step_() {
        if (state_ == ReadyState::Connecting) {
            state_ = ReadyState::Open;
            std::string hello;
            rpc::message::write_notification(hello, "peer.hello", R"({"peer":"loopback"})");
            inbox_.push_back(std::move(hello));
            deliver_(core::transport::event::Opened{});
            return true;
        }
        if (state_ != ReadyState::Open) {
            return false;
        }

        while (!outbox_.empty()) {
            std::string frame = std::move(outbox_.front());
            outbox_.pop_front();
            if (!stalled_()) {
                answer_(frame);
            }
        }

        bool did_work = false;
        // A handler may close this transport while frames are pending
        while (!inbox_.empty() && state_ == ReadyState::Open) {
            std::string frame = std::move(inbox_.front());
            inbox_.pop_front();
            TT_TRACE("[LOOP] <- " << frame);
            deliver_(core::transport::event::Message{std::move(frame), Encoding::Text});
            did_work = true;
        }
        return did_work;
    }

    inline void answer_(std::string_view frame) {
        const rpc::Result r = parser_.parse(frame, inbound_, diagnostic_);
        if (r != rpc::Result::Parsed) {
            TT_WARN("[LOOP] peer rejected frame (" << rpc::to_string(r) << "): " << diagnostic_);
            return;
        }
        if (inbound_.kind != rpc::Kind::Request) {
            return;
        }

        std::string reply;
        const std::string_view method = inbound_.method;
        if (method.size() >= 4 && method.substr(method.size() - 4) == "ping") {
            rpc::message::write_result(reply, inbound_.id, "true");
        }
        else if (method == "echo") {
            rpc::message::write_result(reply, inbound_.id, inbound_.params);
        }
        else {
            rpc::message::write_error(reply, inbound_.id, rpc::RpcError{
                .code = rpc::error_code::METHOD_NOT_FOUND,
                .message = "Method not found"
            });
        }
        inbox_.push_back(std::move(reply));
    }

    inline void deliver_(core::transport::Event&& ev) {
        if (handler_) {
            handler_(std::move(ev));
        }
    }
};

} // namespace tether::examples
