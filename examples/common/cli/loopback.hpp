#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace tether::examples::cli::loopback {

struct Params {
    std::string url             = "ws://loopback.local/rpc";
    std::string log_level       = "info";
    std::int64_t connect_ms     = 500;
    std::int64_t probe_every_ms = 1000;
    std::int64_t probe_wait_ms  = 300;
    std::uint32_t probe_fails   = 3;
    int timeout_code            = 4100;
    std::int64_t stall_at_s     = 4;
    std::int64_t stall_for_s    = 3;
    std::int64_t duration_s     = 15;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL              : " << url << "\n"
           << "  Log Level        : " << log_level << "\n"
           << "  Connect timeout  : " << connect_ms << " ms\n"
           << "  Probe interval   : " << probe_every_ms << " ms\n"
           << "  Probe timeout    : " << probe_wait_ms << " ms\n"
           << "  Probe fail close : " << probe_fails << "\n"
           << "  Timeout code     : " << timeout_code << "\n"
           << "  Peer stalls at   : " << stall_at_s << " s (for " << stall_for_s << " s)\n"
           << "  Duration         : " << duration_s << " s\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "Endpoint handed to the transport factory")->check(ws_url_validator)->default_val(params.url);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);
    app.add_option("--connect-timeout", params.connect_ms, "Opening handshake budget in ms (0 disables)")->check(CLI::NonNegativeNumber)->default_val(params.connect_ms);
    app.add_option("--probe-interval", params.probe_every_ms, "Delay between liveness probes in ms")->check(CLI::NonNegativeNumber)->default_val(params.probe_every_ms);
    app.add_option("--probe-timeout", params.probe_wait_ms, "Time a probe may wait for its answer in ms")->check(CLI::PositiveNumber)->default_val(params.probe_wait_ms);
    app.add_option("--probe-fail-close", params.probe_fails, "Consecutive failed probes that close the session")->check(CLI::PositiveNumber)->default_val(params.probe_fails);
    app.add_option("--timeout-close-code", params.timeout_code, "Close code used for timeouts")->check(close_code_validator)->default_val(params.timeout_code);
    app.add_option("--stall-at", params.stall_at_s, "Seconds after start at which the peer stops answering")->check(CLI::NonNegativeNumber)->default_val(params.stall_at_s);
    app.add_option("--stall-for", params.stall_for_s, "Seconds the peer stays silent")->check(CLI::NonNegativeNumber)->default_val(params.stall_for_s);
    app.add_option("-d,--duration", params.duration_s, "Total run time in seconds")->check(CLI::PositiveNumber)->default_val(params.duration_s);

    app.footer(
        "The peer lives in-process and answers JSON-RPC over a loopback transport.\n"
        "While it stalls, probes fail and the session is closed and re-established.\n"
        "Behavior is observable via logs and lifecycle events."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace tether::examples::cli::loopback
