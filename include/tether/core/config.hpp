#pragma once

#include <chrono>
#include <cstdint>

namespace tether::core {

// -----------------------------------------------------------------------------
// Compile-time defaults (overridable at runtime through supervisor::Options)
// -----------------------------------------------------------------------------

constexpr auto DEFAULT_CONNECT_TIMEOUT = std::chrono::milliseconds(10000);   // transport must open within this window
constexpr std::uint32_t DEFAULT_RECONNECT_COUNTER_MAX = 8;                   // 2^8 * 100ms ~ 25s worst case
constexpr std::uint32_t DEFAULT_CONSECUTIVE_PROBE_FAIL_CLOSE = 4;            // failed probes in a row before closing
constexpr int DEFAULT_TIMEOUT_CLOSE_CODE = 4100;                             // connect timeout / probe exhaustion
constexpr int DEFAULT_INTERNAL_ERROR_CLOSE_CODE = 4101;                      // protocol engine internal error
constexpr auto DEFAULT_PROBE_INTERVAL = std::chrono::milliseconds(2000);     // measured from settlement of the previous probe
constexpr auto DEFAULT_PROBE_TIMEOUT = std::chrono::milliseconds(1000);
constexpr auto FIRST_PROBE_DELAY = std::chrono::milliseconds(1);             // validate a fresh session as soon as possible

} // namespace tether::core
