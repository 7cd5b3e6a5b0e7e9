#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>


namespace tether::rpc {

// ===============================================================
// JSON-RPC 2.0 error codes (section 5.1)
// ===============================================================
namespace error_code {

inline constexpr int PARSE_ERROR      = -32700;
inline constexpr int INVALID_REQUEST  = -32600;
inline constexpr int METHOD_NOT_FOUND = -32601;
inline constexpr int INVALID_PARAMS   = -32602;
inline constexpr int INTERNAL_ERROR   = -32603;

// Implementation-defined server error range [-32099, -32000]
inline constexpr int TIMEOUT          = -32000;

} // namespace error_code

// ===============================================================
// Error object carried by failed responses
// ===============================================================
struct RpcError {
    int code{0};
    std::string message;
    std::string data;      // raw JSON, empty when absent
};

// ===============================================================
// Outcome of an outgoing call
// ===============================================================
struct Response {
    bool ok{false};
    std::string result;    // raw JSON (when ok)
    RpcError error;        // (when !ok)
};

// ===============================================================
// Outcome of a locally handled request
// ===============================================================
struct Reply {
    std::string result{"null"};          // raw JSON
    std::optional<RpcError> error;

    [[nodiscard]]
    static Reply ok(std::string result_json) {
        return Reply{std::move(result_json), std::nullopt};
    }

    [[nodiscard]]
    static Reply fail(int code, std::string message, std::string data_json = {}) {
        return Reply{"null", RpcError{code, std::move(message), std::move(data_json)}};
    }
};

} // namespace tether::rpc
