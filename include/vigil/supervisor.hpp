#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "vigil/error.hpp"
#include "vigil/liveness_check.hpp"
#include "vigil/registry.hpp"


namespace vigil {

/*
===============================================================================
 Supervisor
===============================================================================

Drives Registry::check_all() on a fixed period.

State machine:

    Idle --watch()--> Watching --terminate()--> Stopped
                          |
                          +--expired check--> Failed

watch() is fail-fast: the first failing pass is returned as-is, there is no
retry and no backoff. The caller may call watch() again after a failure to
resume supervision.

terminate() is sticky and idempotent. It may be called from any thread,
before or during watch(). A sleeping watch() is woken immediately; a watch()
started after terminate() returns success without scanning.

Only one watch() may run at a time on a given Supervisor.
===============================================================================
*/

enum class SupervisorState : std::uint8_t {
    Idle,
    Watching,
    Stopped,
    Failed
};

[[nodiscard]]
inline constexpr std::string_view to_string(SupervisorState s) noexcept {
    switch (s) {
    case SupervisorState::Idle:     return "Idle";
    case SupervisorState::Watching: return "Watching";
    case SupervisorState::Stopped:  return "Stopped";
    case SupervisorState::Failed:   return "Failed";
    default:                        return "Unknown";
    }
}


class Supervisor {
public:
    using duration = std::chrono::steady_clock::duration;

    Supervisor() = default;
    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;
    ~Supervisor() { terminate(); }

    // -------------------------------------------------------------------------
    // Registry forwarding
    // -------------------------------------------------------------------------
    void add(std::unique_ptr<LivenessCheck> check) { registry_.add(std::move(check)); }

    bool remove(std::string_view name) { return registry_.remove(name); }

    [[nodiscard]] bool whack(std::string_view name) const { return registry_.whack(name); }

    [[nodiscard]] bool contains(std::string_view name) const { return registry_.contains(name); }

    [[nodiscard]] std::size_t size() const { return registry_.size(); }

    [[nodiscard]] std::vector<std::string> names() const { return registry_.names(); }

    [[nodiscard]] Status check_all() const { return registry_.check_all(); }

    // -------------------------------------------------------------------------
    // Supervision loop
    // -------------------------------------------------------------------------

    /// Runs until terminate() is observed (success) or a pass finds an expired
    /// check (AggregateFailure). Blocks the calling thread.
    /// A negative period, or a second concurrent call, is InvalidConfiguration.
    [[nodiscard]] Status watch(duration period);

    /// Requests the watch loop to stop and wakes it if it is waiting.
    void terminate();

    [[nodiscard]] bool terminated() const noexcept {
        return stopped_.load(std::memory_order_acquire);
    }

    [[nodiscard]] SupervisorState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    /// Number of passes watch() completed without finding an expired check.
    [[nodiscard]] std::uint64_t passes() const noexcept {
        return passes_.load(std::memory_order_relaxed);
    }

private:
    Registry registry_;

    std::atomic<bool> stopped_{false};
    std::atomic<bool> watching_{false};
    std::atomic<SupervisorState> state_{SupervisorState::Idle};
    std::atomic<std::uint64_t> passes_{0};

    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace vigil
