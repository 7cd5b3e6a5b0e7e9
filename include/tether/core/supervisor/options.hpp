#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "tether/core/backoff.hpp"
#include "tether/core/close_code.hpp"
#include "tether/core/config.hpp"
#include "tether/core/error.hpp"
#include "tether/core/transport/concepts.hpp"


namespace tether::core::supervisor {

// -----------------------------------------------------------------------------
// Options - full supervisor configuration
// -----------------------------------------------------------------------------
//
// Applied atomically by Supervisor::configure(): either every field is valid
// and all of them take effect, or nothing changes. Individual fields can also
// be changed through the matching setters.
//
// Changes apply to the next operation that reads them (next connect, next
// close decision, next probe scheduling), never to timers already armed.
//
// -----------------------------------------------------------------------------
template <typename Transport>
struct Options {
    std::string url;
    transport::Factory<Transport> factory;

    std::chrono::milliseconds connect_timeout{DEFAULT_CONNECT_TIMEOUT};

    bool reconnect{true};
    backoff::DelayFn backoff{backoff::exponential_jitter};
    std::uint32_t reconnect_counter_max{DEFAULT_RECONNECT_COUNTER_MAX};

    std::uint32_t consecutive_probe_fail_close{DEFAULT_CONSECUTIVE_PROBE_FAIL_CLOSE};
    std::chrono::milliseconds probe_interval{DEFAULT_PROBE_INTERVAL};
    std::chrono::milliseconds probe_timeout{DEFAULT_PROBE_TIMEOUT};

    int timeout_close_code{DEFAULT_TIMEOUT_CLOSE_CODE};
    int internal_error_close_code{DEFAULT_INTERNAL_ERROR_CLOSE_CODE};

    [[nodiscard]]
    inline Error validate() const noexcept {
        if (!factory || !backoff) {
            return Error::InvalidArgument;
        }
        if (connect_timeout < std::chrono::milliseconds::zero()
            || probe_interval < std::chrono::milliseconds::zero()) {
            return Error::InvalidArgument;
        }
        // Every probe must settle, so it needs a deadline
        if (probe_timeout <= std::chrono::milliseconds::zero()) {
            return Error::InvalidArgument;
        }
        if (consecutive_probe_fail_close == 0) {
            return Error::InvalidArgument;
        }
        if (!close_code::is_valid_outgoing(timeout_close_code)
            || !close_code::is_valid_outgoing(internal_error_close_code)) {
            return Error::InvalidCloseCode;
        }
        return Error::None;
    }
};

} // namespace tether::core::supervisor
