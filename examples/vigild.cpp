#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "vigil.hpp"
#include "lcr/log/logger.hpp"

#include "common/cli/params.hpp"

using namespace std::chrono_literals;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Simulated component: whacks its check at least twice per window until shutdown,
// or until its stall delay (if any) has elapsed.
// -----------------------------------------------------------------------------
struct Component {
    std::string name;
    std::chrono::milliseconds window{0};
    std::chrono::milliseconds stall_after{0}; // 0 -> never stalls
};

void run_component(const Component& c, const vigil::Supervisor& supervisor, const std::atomic<bool>& shutdown) {
    const auto started = std::chrono::steady_clock::now();
    const auto interval = std::max<std::chrono::milliseconds>(c.window / 2, 1ms);
    bool stalled = false;

    while (!shutdown.load(std::memory_order_acquire)) {
        if (c.stall_after.count() > 0 && std::chrono::steady_clock::now() - started >= c.stall_after) {
            if (!stalled) {
                VG_WARN("[" << c.name << "] Component stalled, no more whacks.");
                stalled = true;
            }
        } else if (!supervisor.whack(c.name)) {
            VG_WARN("[" << c.name << "] Check is no longer registered.");
            return;
        }
        std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(interval, 50ms));
    }
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    using namespace vigil::examples;

    auto params = cli::configure(argc, argv,
        "vigild - in-process liveness supervisor\n"
        "Registers liveness checks, simulates the components that whack them\n"
        "and reports the first pass in which any of them went silent.\n");

    // -------------------------------------------------------------
    // Configuration: file first, then command-line overrides
    // -------------------------------------------------------------
    vigil::config::Config cfg;
    if (!params.config_path.empty()) {
        auto status = vigil::config::load(params.config_path, cfg);
        if (!status.ok()) {
            std::cerr << status.message() << std::endl;
            return 2;
        }
        if (params.log_level.empty()) {
            set_log_level(cfg.log_level);
        }
    }
    if (params.period_ms != 0) {
        cfg.period = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(params.period_ms));
    }
    for (const auto& text : params.checks) {
        cli::NamedDelay check;
        if (cli::parse_named_delay(text, check)) {
            cfg.checks.push_back({check.name, check.delay});
        }
    }
    if (cfg.checks.empty()) {
        std::cerr << "No liveness checks configured (use --config or --check NAME:MS)." << std::endl;
        return 2;
    }

    std::map<std::string, std::chrono::milliseconds> stalls;
    for (const auto& text : params.stalls) {
        cli::NamedDelay stall;
        if (cli::parse_named_delay(text, stall)) {
            stalls[stall.name] = stall.delay;
        }
    }

    params.dump("Parameters", std::cout);

    vigil::Supervisor supervisor;
    if (auto status = vigil::config::apply(cfg, supervisor); !status.ok()) {
        std::cerr << status.message() << std::endl;
        return 2;
    }

    // -------------------------------------------------------------
    // Components (last config entry wins for duplicate names)
    // -------------------------------------------------------------
    std::map<std::string, Component> components;
    for (const auto& check : cfg.checks) {
        Component c{check.name, check.timeout, 0ms};
        if (auto it = stalls.find(check.name); it != stalls.end()) {
            c.stall_after = it->second;
        }
        components[check.name] = c;
    }

    std::atomic<bool> shutdown{false};
    std::vector<std::thread> workers;
    workers.reserve(components.size());
    for (const auto& [name, component] : components) {
        workers.emplace_back(run_component, std::cref(component), std::cref(supervisor), std::cref(shutdown));
    }

    // -------------------------------------------------------------
    // Supervision loop on its own thread
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::atomic<bool> done{false};
    vigil::Status result;
    std::thread watcher([&] {
        result = supervisor.watch(cfg.period);
        done.store(true, std::memory_order_release);
    });

    // Signal handlers cannot take locks, so the main thread forwards the request
    while (running.load() && !done.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(20ms);
    }
    supervisor.terminate();
    watcher.join();

    shutdown.store(true, std::memory_order_release);
    for (auto& w : workers) {
        w.join();
    }

    if (!result.ok()) {
        VG_ERROR(result.message());
        return result.code == vigil::Error::AggregateFailure ? 1 : 2;
    }
    VG_INFO("Supervision stopped cleanly after " << supervisor.passes() << " pass(es).");
    return 0;
}
