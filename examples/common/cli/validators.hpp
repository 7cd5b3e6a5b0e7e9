#pragma once

#include <exception>
#include <string>

#include <CLI/CLI.hpp>


namespace tether::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Close code validator (1000 or the application range)
// -------------------------------------------------------------
inline auto close_code_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            const int code = std::stoi(value);
            if (code == 1000 || (code >= 3000 && code <= 4999)) {
                return {};
            }
            return "Close code must be 1000 or within [3000, 4999]";
        } catch (const std::exception&) {
            return "Close code must be a valid integer";
        }
    },
    "Close code validator"
);

} // namespace tether::examples::cli
