#pragma once

#include <string_view>

namespace tether::core::close_code {

// ===============================================================
// RFC 6455 close codes (section 7.4.1) plus IANA registered extras
// ===============================================================
inline constexpr int NORMAL               = 1000;
inline constexpr int GOING_AWAY           = 1001;
inline constexpr int PROTOCOL_ERROR       = 1002;
inline constexpr int UNSUPPORTED_DATA     = 1003;
inline constexpr int NO_STATUS_RECEIVED   = 1005; // never sent on the wire
inline constexpr int ABNORMAL_CLOSURE     = 1006; // never sent on the wire
inline constexpr int INVALID_PAYLOAD_DATA = 1007;
inline constexpr int POLICY_VIOLATION     = 1008;
inline constexpr int MESSAGE_TOO_BIG      = 1009;
inline constexpr int MANDATORY_EXTENSION  = 1010;
inline constexpr int INTERNAL_ERROR       = 1011;
inline constexpr int SERVICE_RESTART      = 1012;
inline constexpr int TRY_AGAIN_LATER      = 1013;

// Application-reserved range usable by endpoints
inline constexpr int APPLICATION_MIN = 3000;
inline constexpr int APPLICATION_MAX = 4999;

// Default reason attached to NORMAL
inline constexpr std::string_view NORMAL_REASON = "Normal Closure";

// ------------------------------------------------------------
// A locally initiated close may only use 1000 or [3000, 4999]
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr bool is_valid_outgoing(int code) noexcept {
    return code == NORMAL || (code >= APPLICATION_MIN && code <= APPLICATION_MAX);
}

[[nodiscard]]
inline constexpr std::string_view to_string(int code) noexcept {
    switch (code) {
        case NORMAL:               return "NORMAL";
        case GOING_AWAY:           return "GOING_AWAY";
        case PROTOCOL_ERROR:       return "PROTOCOL_ERROR";
        case UNSUPPORTED_DATA:     return "UNSUPPORTED_DATA";
        case NO_STATUS_RECEIVED:   return "NO_STATUS_RECEIVED";
        case ABNORMAL_CLOSURE:     return "ABNORMAL_CLOSURE";
        case INVALID_PAYLOAD_DATA: return "INVALID_PAYLOAD_DATA";
        case POLICY_VIOLATION:     return "POLICY_VIOLATION";
        case MESSAGE_TOO_BIG:      return "MESSAGE_TOO_BIG";
        case MANDATORY_EXTENSION:  return "MANDATORY_EXTENSION";
        case INTERNAL_ERROR:       return "INTERNAL_ERROR";
        case SERVICE_RESTART:      return "SERVICE_RESTART";
        case TRY_AGAIN_LATER:      return "TRY_AGAIN_LATER";
        default:
            if (code >= APPLICATION_MIN && code <= APPLICATION_MAX) return "APPLICATION";
            return "UNKNOWN";
    }
}

} // namespace tether::core::close_code
