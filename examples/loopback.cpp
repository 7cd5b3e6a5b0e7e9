#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <variant>

#include "tether.hpp"

#include "common/cli/loopback.hpp"
#include "common/loopback_transport.hpp"

using namespace tether;
using namespace std::chrono;

using examples::LoopbackTransport;


int main(int argc, char** argv) {
    lcr::log::Logger::instance().enable_color(true);

    const auto params = examples::cli::loopback::configure(argc, argv,
        "Tether loopback demo: JSON-RPC calls and liveness probes against an in-process peer that stalls for a while."
    );
    params.dump("=== Tether Loopback Parameters ===", std::cout);

    Client<LoopbackTransport> client;

    auto options = client.options();
    options.url = params.url;
    options.factory = LoopbackTransport::factory();
    options.connect_timeout = milliseconds(params.connect_ms);
    options.probe_interval = milliseconds(params.probe_every_ms);
    options.probe_timeout = milliseconds(params.probe_wait_ms);
    options.consecutive_probe_fail_close = params.probe_fails;
    options.timeout_close_code = params.timeout_code;
    if (const Error err = client.configure(options); err != Error::None) {
        std::cerr << "Invalid configuration: " << core::to_string(err) << std::endl;
        return 1;
    }

    int opens = 0;
    int closes = 0;
    client.on_event([&](const Event& ev) {
        namespace event = core::supervisor::event;
        if (const auto* open = std::get_if<event::Open>(&ev)) {
            ++opens;
            std::cout << "[tether] session " << open->session << " OPEN" << std::endl;
        }
        else if (const auto* close = std::get_if<event::Close>(&ev)) {
            ++closes;
            std::cout << "[tether] CLOSE code=" << close->code << " reason='" << close->reason << "'";
            if (close->reconnect) {
                std::cout << " (reconnect in " << close->reconnect_delay->count() << " ms)";
            }
            std::cout << std::endl;
        }
        else if (const auto* ok = std::get_if<event::ProbeSuccess>(&ev)) {
            std::cout << "[tether] probe answered in " << ok->delay.count() << " ms" << std::endl;
        }
        else if (const auto* ko = std::get_if<event::ProbeFailure>(&ev)) {
            std::cout << "[tether] probe failed (" << ko->consecutive << " in a row): " << ko->error << std::endl;
        }
        else if (const auto* failure = std::get_if<event::Failure>(&ev)) {
            std::cout << "[tether] FAILURE " << core::supervisor::to_string(failure->fault)
                      << ": " << failure->message << std::endl;
        }
    });

    client.notification("peer.hello", [](std::string_view body) {
        std::cout << "[tether] peer says hello " << body << std::endl;
    });

    if (const Error err = client.start(); err != Error::None) {
        std::cerr << "Failed to start: " << core::to_string(err) << std::endl;
        return 1;
    }

    const auto duration = seconds(params.duration_s);
    const auto stall_at = seconds(params.stall_at_s);
    const auto stall_until = stall_at + seconds(params.stall_for_s);

    std::uint64_t calls = 0;
    std::uint64_t answered = 0;
    auto next_call = steady_clock::now();
    const auto start = steady_clock::now();
    auto elapsed = steady_clock::now() - start;
    while (elapsed < duration) {
        client.poll();
        (void)LoopbackTransport::pump();

        const bool stall = elapsed >= stall_at && elapsed < stall_until;
        if (stall != LoopbackTransport::stalled()) {
            std::cout << "\n[tether] PEER " << (stall ? "STALLED" : "RESUMED") << std::endl;
            LoopbackTransport::set_stalled(stall);
        }

        if (steady_clock::now() >= next_call) {
            const std::string payload = "[" + std::to_string(calls) + "]";
            (void)client.call("echo", payload, [&, payload](const rpc::Response& r) {
                if (r.ok) {
                    ++answered;
                    TT_INFO("[DEMO] echo " << r.result);
                } else {
                    TT_WARN("[DEMO] echo " << payload << " failed: " << r.error.message);
                }
            }, milliseconds(2000));
            ++calls;
            next_call += milliseconds(700);
        }

        std::this_thread::sleep_for(milliseconds(1));
        elapsed = steady_clock::now() - start;
    }

    (void)client.stop();
    client.telemetry().debug_dump(std::cout);

    std::cout << "\n========== DEMO SUMMARY ==========" << std::endl;
    std::cout << "Sessions opened   : " << opens << std::endl;
    std::cout << "Sessions closed   : " << closes << std::endl;
    std::cout << "Echo calls        : " << calls << std::endl;
    std::cout << "Echo answers      : " << answered << std::endl;

    if (params.stall_for_s > 0 && params.stall_at_s + params.stall_for_s < params.duration_s && opens < 2) {
        std::cout << "[tether] Recovery demo FAILED: no new session after the stall" << std::endl;
        return 1;
    }
    std::cout << "[tether] Loopback demo PASSED" << std::endl;
    return 0;
}
