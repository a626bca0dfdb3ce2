#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vigil {

/*
===============================================================================
 vigil::Error
===============================================================================

Error classification for every fallible vigil operation.

- InvalidConfiguration: malformed construction parameters, a bad supervision
  period, a malformed config document, or a watch loop that is already
  running. Reported immediately, never retried.

- AggregateFailure: one or more liveness checks were expired when the
  registry was scanned. Recovery belongs to the caller.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,
    InvalidConfiguration,
    AggregateFailure
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                 return "None";
    case Error::InvalidConfiguration: return "InvalidConfiguration";
    case Error::AggregateFailure:     return "AggregateFailure";
    default:                          return "Unknown";
    }
}


// -----------------------------------------------------------------------------
// Status
// -----------------------------------------------------------------------------
//
// Result value returned to the immediate caller. `expired` is only populated
// for AggregateFailure and is always sorted by name. `detail` is only
// populated for InvalidConfiguration.
//
struct Status {
    Error code{Error::None};
    std::vector<std::string> expired;
    std::string detail;

    [[nodiscard]] static Status success() { return Status{}; }

    [[nodiscard]] static Status invalid_configuration(std::string detail);

    // Sorts the names; callers may pass them in any order.
    [[nodiscard]] static Status aggregate_failure(std::vector<std::string> names);

    [[nodiscard]] bool ok() const noexcept { return code == Error::None; }

    explicit operator bool() const noexcept { return ok(); }

    // Human readable rendering. AggregateFailure reads:
    //   watchdog timed out on the following services: a, b
    [[nodiscard]] std::string message() const;
};

} // namespace vigil
