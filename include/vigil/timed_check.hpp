#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "vigil/error.hpp"
#include "vigil/liveness_check.hpp"


namespace vigil {

// -----------------------------------------------------------------------------
// TimedCheck
// -----------------------------------------------------------------------------
//
// Liveness check with a fixed window measured on the steady clock:
//
//   deadline = last reset() + window
//   expired() <=> now > deadline
//
// The deadline is kept as an atomic tick count, so a component may whack its
// own check while the supervisor reads it.
//
// A zero window is legal: the check is alive only at the reset instant. A
// window reaching past the clock's range saturates the deadline at
// time_point::max(), so such a check never expires.
//
class TimedCheck final : public LivenessCheck {
public:
    using clock    = std::chrono::steady_clock;
    using duration = clock::duration;

    // Fails with InvalidConfiguration on an empty name or a negative window.
    // `out` is only written on success.
    [[nodiscard]]
    static Status create(std::string name, duration window, std::unique_ptr<TimedCheck>& out);

private:
    // Restricts construction to create()
    struct Token { explicit Token() = default; };

public:
    TimedCheck(Token, std::string name, duration window) noexcept;

    TimedCheck(const TimedCheck&) = delete;
    TimedCheck& operator=(const TimedCheck&) = delete;

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    void reset() noexcept override;

    [[nodiscard]] bool expired() const noexcept override;

    [[nodiscard]] duration window() const noexcept { return window_; }

    // Time left before the check expires; zero once expired.
    [[nodiscard]] duration remaining() const noexcept;

private:
    [[nodiscard]] clock::time_point deadline_() const noexcept {
        return clock::time_point(duration(deadline_ticks_.load(std::memory_order_acquire)));
    }

private:
    const std::string name_;
    const duration window_;
    std::atomic<duration::rep> deadline_ticks_{0};
};

} // namespace vigil
