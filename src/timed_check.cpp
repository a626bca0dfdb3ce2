#include "vigil/timed_check.hpp"

#include <memory>
#include <utility>

#include "lcr/log/logger.hpp"


namespace vigil {

Status TimedCheck::create(std::string name, duration window, std::unique_ptr<TimedCheck>& out) {
    if (name.empty()) {
        VG_ERROR("[CHECK] Rejected timed check with an empty name.");
        return Status::invalid_configuration("liveness check name must not be empty");
    }
    if (window < duration::zero()) {
        VG_ERROR("[CHECK] Rejected timed check '" << name << "': negative window.");
        return Status::invalid_configuration("liveness check '" + name + "' has a negative window");
    }
    out = std::make_unique<TimedCheck>(Token{}, std::move(name), window);
    return Status::success();
}

TimedCheck::TimedCheck(Token, std::string name, duration window) noexcept
    : name_(std::move(name))
    , window_(window)
{
    reset();
}

void TimedCheck::reset() noexcept {
    const auto now = clock::now();
    const auto deadline = window_ < clock::time_point::max() - now ? now + window_ : clock::time_point::max();
    deadline_ticks_.store(deadline.time_since_epoch().count(), std::memory_order_release);
}

bool TimedCheck::expired() const noexcept {
    return clock::now() > deadline_();
}

TimedCheck::duration TimedCheck::remaining() const noexcept {
    const auto left = deadline_() - clock::now();
    return left > duration::zero() ? left : duration::zero();
}

} // namespace vigil
