#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <simdjson.h>

#include "tether/rpc/error.hpp"
#include "tether/rpc/message.hpp"


namespace tether::rpc {

/*
================================================================================
JSON-RPC 2.0 inbound parser
================================================================================

Classifies one inbound frame as a request, a notification or a response and
extracts its members. Values the engine passes on (params, result, error
data, request id) are kept as minified raw JSON so the engine never needs to
understand application payloads.

Parsing is strict about the envelope and nothing else:
  • the frame must be a JSON object              → InvalidJson / InvalidSchema
  • "jsonrpc" must be exactly "2.0"             → InvalidValue
  • requests need a string "method"             → InvalidSchema
  • responses need "result" or an "error" object → InvalidSchema

On failure `diagnostic` describes the problem and `id` holds the request id
when one could be recovered (otherwise "null"), so the engine can still send
the error reply JSON-RPC 2.0 requires.

The parser never throws, never logs and reuses its simdjson buffers across
frames.
================================================================================
*/

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    InvalidJson,      // Not JSON at all
    InvalidSchema,    // JSON, but not a JSON-RPC envelope
    InvalidValue,     // Envelope present, unsupported "jsonrpc" version
    Parsed
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Parsed:         return "Parsed";
        default:                     return "unknown";
    }
}

enum class Kind : std::uint8_t {
    Request,
    Notification,
    Response
};

struct Inbound {
    Kind kind{Kind::Notification};

    // Raw JSON id ("null" when absent)
    std::string id{message::NULL_ID};

    // Numeric id (responses to our own calls)
    bool has_numeric_id{false};
    std::uint64_t numeric_id{0};

    // Requests / notifications
    std::string method;
    std::string params;

    // Responses
    bool is_error{false};
    std::string result;
    RpcError error;

    inline void clear() {
        kind = Kind::Notification;
        id.assign(message::NULL_ID);
        has_numeric_id = false;
        numeric_id = 0;
        method.clear();
        params.clear();
        is_error = false;
        result.clear();
        error = RpcError{};
    }
};

class Parser {
public:
    Parser() = default;

    [[nodiscard]]
    inline Result parse(std::string_view frame, Inbound& out, std::string& diagnostic) noexcept {
        using namespace simdjson;
        out.clear();
        diagnostic.clear();

        dom::element root;
        auto error = parser_.parse(frame).get(root);
        if (error) {
            diagnostic = "Parse error: ";
            diagnostic += error_message(error);
            return Result::InvalidJson;
        }
        if (root.type() != dom::element_type::OBJECT) {
            diagnostic = "Invalid Request: expected a JSON object";
            return Result::InvalidSchema;
        }

        // Recover the id first so error replies can reference it
        dom::element id;
        const bool has_id = !root["id"].get(id);
        if (has_id) {
            out.id = minify(id);
            std::uint64_t numeric;
            if (!id.get_uint64().get(numeric)) {
                out.has_numeric_id = true;
                out.numeric_id = numeric;
            }
        }

        std::string_view version;
        if (root["jsonrpc"].get(version) || version != message::VERSION) {
            diagnostic = "Invalid Request: given \"jsonrpc\" version is not supported";
            return Result::InvalidValue;
        }

        dom::element method;
        if (!root["method"].get(method)) {
            std::string_view name;
            if (method.get(name)) {
                diagnostic = "Invalid Request: \"method\" must be a string";
                return Result::InvalidSchema;
            }
            out.method.assign(name);
            out.kind = has_id ? Kind::Request : Kind::Notification;
            dom::element params;
            if (!root["params"].get(params)) {
                if (params.type() != dom::element_type::OBJECT && params.type() != dom::element_type::ARRAY) {
                    diagnostic = "Invalid Request: \"params\" must be an array or an object";
                    return Result::InvalidSchema;
                }
                out.params = minify(params);
            }
            return Result::Parsed;
        }

        out.kind = Kind::Response;
        dom::element result;
        if (!root["result"].get(result)) {
            out.result = minify(result);
            return Result::Parsed;
        }
        dom::element err;
        if (!root["error"].get(err) && err.type() == dom::element_type::OBJECT) {
            out.is_error = true;
            std::int64_t code = 0;
            if (err["code"].get(code)) {
                diagnostic = "Invalid Response: error \"code\" must be an integer";
                return Result::InvalidSchema;
            }
            out.error.code = static_cast<int>(code);
            std::string_view text;
            if (!err["message"].get(text)) {
                out.error.message.assign(text);
            }
            dom::element data;
            if (!err["data"].get(data)) {
                out.error.data = minify(data);
            }
            return Result::Parsed;
        }
        diagnostic = "Invalid Request: missing \"method\", \"result\" or \"error\"";
        return Result::InvalidSchema;
    }

private:
    // Underlying simdjson parser
    simdjson::dom::parser parser_;
};

} // namespace tether::rpc
