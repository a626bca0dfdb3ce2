#pragma once

#include <string>

namespace vigil {

/*
===============================================================================
 LivenessCheck
===============================================================================

A named unit of liveness. The monitored component proves it is alive by
calling reset() ("whacking" the check); a supervisor periodically asks
expired() and treats `true` as the failure condition.

Implementations must make reset() and expired() safe to call concurrently
from different threads without any external lock: the registry invokes
expired() while holding only its shared lock, and whacks may arrive at any
time.

expired() must not re-arm the check.
===============================================================================
*/
class LivenessCheck {
public:
    virtual ~LivenessCheck() = default;

    // Registry key. Stable for the lifetime of the check and never empty.
    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    // Re-arms the check from "now".
    virtual void reset() noexcept = 0;

    // True once the check's window has elapsed since the last reset.
    [[nodiscard]] virtual bool expired() const noexcept = 0;
};

} // namespace vigil
