#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "vigil/error.hpp"


namespace vigil {

class Supervisor;

namespace config {

/*
================================================================================
Supervision Config (JSON)
================================================================================

    {
        "period_ms": 100,
        "log_level": "info",
        "checks": [
            { "name": "db",    "timeout_ms": 500 },
            { "name": "cache", "timeout_ms": 2000 }
        ]
    }

  • period_ms   optional, unsigned, at most one day, default 1000
  • log_level   optional, trace | debug | info | warn | error | fatal
  • checks      required array; every entry needs a non-empty "name" and an
                unsigned "timeout_ms" of at most one day

Duplicate names are accepted; when applied, the last entry wins, exactly as
Registry::add() behaves.
================================================================================
*/

inline constexpr std::chrono::milliseconds DEFAULT_PERIOD{1000};
inline constexpr std::string_view DEFAULT_LOG_LEVEL{"info"};

// Upper bounds for millisecond fields. Larger values would overflow once
// converted to steady_clock ticks.
inline constexpr std::chrono::milliseconds MAX_PERIOD{86'400'000};
inline constexpr std::chrono::milliseconds MAX_TIMEOUT{86'400'000};

struct Check {
    std::string name;
    std::chrono::milliseconds timeout{0};
};

struct Config {
    std::chrono::milliseconds period{DEFAULT_PERIOD};
    std::string log_level{DEFAULT_LOG_LEVEL};
    std::vector<Check> checks;
};

// Parses a JSON document. `out` is only written on success.
[[nodiscard]] Status parse(std::string_view json, Config& out);

// Reads and parses a JSON file.
[[nodiscard]] Status load(const std::string& path, Config& out);

// Registers one TimedCheck per entry on the supervisor.
[[nodiscard]] Status apply(const Config& cfg, Supervisor& supervisor);

} // namespace config
} // namespace vigil
