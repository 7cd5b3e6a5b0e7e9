#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>

namespace tether::core::timer {

// Opaque handle of a scheduled callback (0 is never issued)
using TimerId = std::uint64_t;
inline constexpr TimerId INVALID_TIMER = 0;

using Callback = std::function<void()>;

// -----------------------------------------------------------------------------
// TimerConcept
// -----------------------------------------------------------------------------
//
// Delayed, cancellable callbacks. The supervisor, the liveness monitor and the
// protocol engine express every wait (connect timeout, reconnect delay, probe
// interval, call timeout) through this facade so tests can inject a
// deterministic clock.
//
//   • schedule() never invokes the callback synchronously
//   • cancel() of an unknown, fired or already cancelled id returns false
//   • callbacks run on the thread driving the timer
//
// -----------------------------------------------------------------------------

template<class T>
concept TimerConcept =
    requires(
        T t,
        std::chrono::milliseconds delay,
        Callback cb,
        TimerId id
    )
{
    { t.schedule(delay, std::move(cb)) } -> std::same_as<TimerId>;
    { t.cancel(id) } noexcept -> std::same_as<bool>;
    { t.now() } -> std::same_as<std::chrono::steady_clock::time_point>;
};

} // namespace tether::core::timer
