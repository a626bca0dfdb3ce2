#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace vigil::examples::cli {

// -------------------------------------------------------------
// vigild parameters
// -------------------------------------------------------------
struct Params {
    std::string config_path;              // empty -> no config file
    std::uint64_t period_ms        = 0;   // 0 -> config value or default
    std::vector<std::string> checks;      // NAME:MS
    std::vector<std::string> stalls;      // NAME:MS
    std::string log_level;                // empty -> config value or "info"
    bool color                     = false;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Config    : " << (config_path.empty() ? "<none>" : config_path) << "\n"
           << "  Period    : " << (period_ms == 0 ? std::string("<config>") : std::to_string(period_ms) + " ms") << "\n"
           << "  Checks    : ";
        for (const auto& c : checks) { os << c << " "; }
        os << "\n  Stalls    : ";
        for (const auto& s : stalls) { os << s << " "; }
        os << "\n  Log Level : " << (log_level.empty() ? std::string("<config>") : log_level) << "\n";
    }
};

// -------------------------------------------------------------
// Build CLI
// -------------------------------------------------------------
[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-c,--config", params.config_path, "JSON supervision config")->check(CLI::ExistingFile);
    app.add_option("-p,--period", params.period_ms, "Supervision period in milliseconds (overrides config)")
        ->check(CLI::Range(std::uint64_t{0}, static_cast<std::uint64_t>(vigil::config::MAX_PERIOD.count())));
    app.add_option("--check", params.checks, "Liveness check NAME:MS, repeatable (e.g. --check db:500)")->check(named_delay_validator);
    app.add_option("--stall", params.stalls, "Stop whacking NAME after MS > 0, repeatable (e.g. --stall db:2000)")->check(stall_delay_validator);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")->check(log_level_validator);
    app.add_flag("--color", params.color, "Colored log output");
    app.footer(
        "Every check gets a simulated component that whacks it twice per window.\n"
        "Runs until Ctrl+C (exit 0) or until a check expires (exit 1).\n"
        "Configuration errors exit with 2."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr) == 0 ? EXIT_SUCCESS : 2);
    }

    lcr::log::Logger::instance().enable_color(params.color);
    if (!params.log_level.empty()) {
        set_log_level(params.log_level);
    }
    return params;
}

} // namespace vigil::examples::cli
