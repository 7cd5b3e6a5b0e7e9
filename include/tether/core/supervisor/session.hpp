#pragma once

#include <cstdint>
#include <memory>

#include "tether/core/timer/concepts.hpp"


namespace tether::core::supervisor {

// -----------------------------------------------------------------------------
// Session - one connect attempt, from transport request to close handled
// -----------------------------------------------------------------------------
template <typename Transport>
struct Session {
    // Identity token captured by every transport handler and timer closure
    std::uint64_t id{0};

    // Exclusively owned by the session (retired, not destroyed, on close)
    std::unique_ptr<Transport> transport;

    // Armed while connecting only
    timer::TimerId connect_timer{timer::INVALID_TIMER};

    bool opened{false};
    bool close_handled{false};
};

} // namespace tether::core::supervisor
