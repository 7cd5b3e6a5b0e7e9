#pragma once

#include <string>
#include <format>
#include <chrono>
#include <cstdint>
#include <algorithm>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(std::uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}

// Format a millisecond delay for humans
// Examples:
//   0      -> "0 ms"
//   850    -> "850 ms"
//   2222   -> "2.22 s"
//   25600  -> "25.6 s"
inline std::string format_delay(std::chrono::milliseconds delay) {
    const auto ms = delay.count();
    if (ms < 1000) {
        return std::format("{} ms", ms);
    }
    const double s = static_cast<double>(ms) / 1000.0;
    const int precision = (s < 10.0) ? 2 : (s < 100.0) ? 1 : 0;
    return std::format("{:.{}f} s", s, precision);
}

} // namespace lcr
