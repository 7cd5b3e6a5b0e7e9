#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "tether/rpc/error.hpp"
#include "lcr/json.hpp"


/*
================================================================================
JSON-RPC 2.0 message writers
================================================================================

Serialize outgoing frames. `params`, `result` and `id` arguments are raw JSON
(already serialized by the caller or copied from an inbound frame) and are
written verbatim; only method names and error messages are escaped.

An empty `params` omits the member entirely, as allowed by JSON-RPC 2.0.
================================================================================
*/

namespace tether::rpc::message {

inline constexpr std::string_view VERSION = "2.0";
inline constexpr std::string_view NULL_ID = "null";

inline void write_request(std::string& out, std::uint64_t id, std::string_view method, std::string_view params) {
    out += "{\"jsonrpc\":\"2.0\",\"id\":";
    lcr::json::append(out, id);
    out += ",\"method\":";
    lcr::json::append_string(out, method);
    if (!params.empty()) {
        out += ",\"params\":";
        out += params;
    }
    out += '}';
}

inline void write_notification(std::string& out, std::string_view method, std::string_view params) {
    out += "{\"jsonrpc\":\"2.0\",\"method\":";
    lcr::json::append_string(out, method);
    if (!params.empty()) {
        out += ",\"params\":";
        out += params;
    }
    out += '}';
}

inline void write_result(std::string& out, std::string_view id, std::string_view result) {
    out += "{\"jsonrpc\":\"2.0\",\"id\":";
    out += id;
    out += ",\"result\":";
    out += result.empty() ? std::string_view{"null"} : result;
    out += '}';
}

inline void write_error(std::string& out, std::string_view id, const RpcError& error) {
    out += "{\"jsonrpc\":\"2.0\",\"id\":";
    out += id;
    out += ",\"error\":{\"code\":";
    lcr::json::append(out, static_cast<std::int64_t>(error.code));
    out += ",\"message\":";
    lcr::json::append_string(out, error.message);
    if (!error.data.empty()) {
        out += ",\"data\":";
        out += error.data;
    }
    out += "}}";
}

} // namespace tether::rpc::message
