#pragma once

#include <chrono>
#include <cstdint>
#include <cmath>
#include <functional>
#include <random>
#include <algorithm>

#include "tether/core/config.hpp"


namespace tether::core::backoff {

/*
===============================================================================
 Backoff policy
===============================================================================

A backoff policy maps the current reconnect counter (pre-increment, in
[0, max]) to the delay before the next connect attempt. Policies are plain
callables so callers can replace the default with anything, e.g.

    [](std::uint32_t n) { return std::chrono::milliseconds((n + 1) * 1111); }

The counter itself (backoff::Counter) is owned by the supervisor:
  - +1 (clamped to max) for every session-ending failure
  - -1 (floored at 0) for every successful liveness probe
===============================================================================
*/

using DelayFn = std::function<std::chrono::milliseconds(std::uint32_t counter)>;

constexpr auto BASE_DELAY = std::chrono::milliseconds(100);

// 2^counter * 100ms * uniform(0.5, 1.0)
[[nodiscard]]
inline std::chrono::milliseconds exponential_jitter(std::uint32_t counter) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> jitter(0.5, 1.0);
    const double ms = std::ldexp(static_cast<double>(BASE_DELAY.count()), static_cast<int>(std::min<std::uint32_t>(counter, 30)))
                    * jitter(rng);
    return std::chrono::milliseconds(static_cast<std::int64_t>(ms));
}

// ---------------------------------------------------------------------------
// Counter - bounded reconnect counter in [0, max]
// ---------------------------------------------------------------------------
class Counter {
public:
    explicit Counter(std::uint32_t max = DEFAULT_RECONNECT_COUNTER_MAX) noexcept
        : max_(max)
    {}

    [[nodiscard]]
    inline std::uint32_t value() const noexcept { return value_; }

    [[nodiscard]]
    inline std::uint32_t max() const noexcept { return max_; }

    // Lowering the maximum clamps the current value
    inline void set_max(std::uint32_t max) noexcept {
        max_ = max;
        value_ = std::min(value_, max_);
    }

    inline void increase() noexcept {
        value_ = std::min(value_ + 1, max_);
    }

    inline void decrease() noexcept {
        if (value_ > 0) {
            --value_;
        }
    }

    inline void reset() noexcept { value_ = 0; }

private:
    std::uint32_t value_{0};
    std::uint32_t max_;
};

} // namespace tether::core::backoff
