#include "vigil/supervisor.hpp"

#include <chrono>

#include "lcr/log/logger.hpp"


namespace vigil {

namespace {

// Clears the "watch in progress" flag on every exit path
class WatchingGuard {
public:
    explicit WatchingGuard(std::atomic<bool>& flag) noexcept : flag_(flag) {}
    ~WatchingGuard() { flag_.store(false, std::memory_order_release); }

    WatchingGuard(const WatchingGuard&) = delete;
    WatchingGuard& operator=(const WatchingGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace


Status Supervisor::watch(duration period) {
    using namespace std::chrono;

    if (period < duration::zero()) {
        VG_ERROR("[SUPERVISOR] Refusing to watch with a negative period.");
        return Status::invalid_configuration("supervision period must not be negative");
    }

    bool expected = false;
    if (!watching_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        VG_ERROR("[SUPERVISOR] watch() called while another watch loop is running.");
        return Status::invalid_configuration("watch loop already running");
    }
    WatchingGuard guard(watching_);

    state_.store(SupervisorState::Watching, std::memory_order_release);
    VG_INFO("[SUPERVISOR] Watching " << registry_.size() << " liveness check(s) every "
            << duration_cast<milliseconds>(period).count() << " ms.");

    std::unique_lock<std::mutex> lk(mtx_);
    while (!stopped_.load(std::memory_order_acquire)) {
        // Scan without holding the wait mutex so terminate() never blocks on a pass
        lk.unlock();
        Status status = registry_.check_all();
        lk.lock();

        if (!status.ok()) {
            state_.store(SupervisorState::Failed, std::memory_order_release);
            VG_WARN("[SUPERVISOR] " << status.message());
            return status;
        }
        passes_.fetch_add(1, std::memory_order_relaxed);

        // Interruptible wait: terminate() flips stopped_ under mtx_ and notifies.
        // The deadline saturates so an oversized period cannot wrap into the past.
        const auto now = steady_clock::now();
        const auto until = period < steady_clock::time_point::max() - now ? now + period : steady_clock::time_point::max();
        if (cv_.wait_until(lk, until, [this] { return stopped_.load(std::memory_order_acquire); })) {
            break;
        }
    }

    state_.store(SupervisorState::Stopped, std::memory_order_release);
    VG_INFO("[SUPERVISOR] Watch loop stopped after " << passes_.load(std::memory_order_relaxed) << " pass(es).");
    return Status::success();
}

void Supervisor::terminate() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopped_.exchange(true, std::memory_order_acq_rel)) {
            return; // already requested
        }
    }
    cv_.notify_all();
    VG_DEBUG("[SUPERVISOR] Termination requested.");
}

} // namespace vigil
