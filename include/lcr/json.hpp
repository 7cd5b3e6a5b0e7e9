#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {

// Appends `s` to `out` with JSON string escaping (no surrounding quotes)
inline void escape_to(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

// Appends `s` as a quoted JSON string
inline void append_string(std::string& out, std::string_view s) {
    out += '\"';
    escape_to(out, s);
    out += '\"';
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = '0' + (value % 10);
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

// Signed variant (JSON-RPC error codes are negative)
inline void append(std::string& out, std::int64_t value)
{
    if (value < 0) {
        out += '-';
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

} // namespace json
} // namespace lcr
