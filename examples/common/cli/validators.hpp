#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"
#include "vigil/config.hpp"


namespace vigil::examples::cli {

// -------------------------------------------------------------
// "name:milliseconds" pair used by --check and --stall
// -------------------------------------------------------------
struct NamedDelay {
    std::string name;
    std::chrono::milliseconds delay{0};
};

[[nodiscard]]
inline bool parse_named_delay(std::string_view text, NamedDelay& out) noexcept {
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
        return false;
    }
    std::uint64_t ms = 0;
    for (char c : text.substr(colon + 1)) {
        if (c < '0' || c > '9') {
            return false;
        }
        ms = ms * 10 + static_cast<std::uint64_t>(c - '0');
        if (ms > static_cast<std::uint64_t>(vigil::config::MAX_TIMEOUT.count())) {
            return false;
        }
    }
    out.name = std::string(text.substr(0, colon));
    out.delay = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
    return true;
}

inline auto named_delay_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        NamedDelay parsed;
        if (parse_named_delay(value, parsed)) {
            return {};
        }
        return "Expected NAME:MILLISECONDS (e.g. db:500)";
    },
    "NAME:MILLISECONDS validator"
);

// A stall needs a positive delay; 0 would read as "never stalls"
inline auto stall_delay_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        NamedDelay parsed;
        if (parse_named_delay(value, parsed) && parsed.delay.count() > 0) {
            return {};
        }
        return "Expected NAME:MILLISECONDS with MILLISECONDS > 0 (e.g. db:2000)";
    },
    "NAME:MILLISECONDS (> 0) validator"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl = lcr::log::Level::Info;
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);

} // namespace vigil::examples::cli
