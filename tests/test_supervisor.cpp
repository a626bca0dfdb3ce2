#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "vigil/supervisor.hpp"
#include "vigil/timed_check.hpp"
#include "common/test_check.hpp"

using namespace vigil;
using namespace std::chrono_literals;


/*
================================================================================
Supervisor - Unit Tests
================================================================================

Covers the watch loop state machine (Idle -> Watching -> Stopped | Failed),
sticky and idempotent termination, fail-fast reporting and concurrent
registry mutation while a watch loop is running.

Timing assertions use generous upper bounds so that a loaded machine does not
turn a correct implementation into a flaky test.
================================================================================
*/


std::unique_ptr<TimedCheck> timed(const std::string& name, TimedCheck::duration window) {
    std::unique_ptr<TimedCheck> check;
    TEST_CHECK(TimedCheck::create(name, window, check).ok());
    return check;
}

// -----------------------------------------------------------------------------
// Termination
// -----------------------------------------------------------------------------

void test_terminate_before_watch() {
    std::cout << "[TEST] Supervisor terminate() before watch()\n";

    Supervisor supervisor;
    // Would fail on the very first pass if watch() scanned at all
    supervisor.add(timed("dead", 0ms));
    std::this_thread::sleep_for(2ms);

    supervisor.terminate();
    supervisor.terminate();
    TEST_CHECK(supervisor.terminated());

    auto status = supervisor.watch(10ms);
    TEST_CHECK(status.ok());
    TEST_CHECK(supervisor.passes() == 0);
    TEST_CHECK(supervisor.state() == SupervisorState::Stopped);

    std::cout << "[TEST] OK\n";
}

void test_terminate_wakes_sleeping_watch() {
    std::cout << "[TEST] Supervisor terminate() interrupts the wait\n";

    Supervisor supervisor;
    supervisor.add(timed("svc", 60s));
    TEST_CHECK(supervisor.state() == SupervisorState::Idle);

    Status result = Status::invalid_configuration("not run");
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        result = supervisor.watch(30s);
        done.store(true);
    });

    TEST_CHECK(test::eventually([&] { return supervisor.passes() >= 1; }, 2s));
    TEST_CHECK(supervisor.state() == SupervisorState::Watching);

    const auto t0 = std::chrono::steady_clock::now();
    supervisor.terminate();
    TEST_CHECK(test::eventually([&] { return done.load(); }, 2s));
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    watcher.join();

    TEST_CHECK(result.ok());
    TEST_CHECK(elapsed < 1s); // far less than the 30s period
    TEST_CHECK(supervisor.state() == SupervisorState::Stopped);

    std::cout << "[TEST] OK\n";
}

void test_terminate_is_idempotent_from_many_threads() {
    std::cout << "[TEST] Supervisor concurrent terminate() calls\n";

    Supervisor supervisor;
    supervisor.add(timed("svc", 60s));

    Status result = Status::invalid_configuration("not run");
    std::thread watcher([&] { result = supervisor.watch(5ms); });

    std::vector<std::thread> stoppers;
    for (int i = 0; i < 8; ++i) {
        stoppers.emplace_back([&] {
            std::this_thread::sleep_for(10ms);
            supervisor.terminate();
        });
    }
    for (auto& t : stoppers) {
        t.join();
    }
    watcher.join();

    TEST_CHECK(result.ok());
    TEST_CHECK(supervisor.terminated());

    // Still sticky afterwards
    TEST_CHECK(supervisor.watch(5ms).ok());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Failure
// -----------------------------------------------------------------------------

void test_watch_fails_fast_on_expired_check() {
    std::cout << "[TEST] Supervisor watch() returns the first failing pass\n";

    Supervisor supervisor;
    supervisor.add(timed("short", 10ms));
    supervisor.add(timed("long", 10s));

    const auto t0 = std::chrono::steady_clock::now();
    auto status = supervisor.watch(5ms);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    TEST_CHECK(status.code == Error::AggregateFailure);
    TEST_CHECK((status.expired == std::vector<std::string>{"short"}));
    TEST_CHECK(status.message() == "watchdog timed out on the following services: short");
    TEST_CHECK(elapsed >= 10ms);
    TEST_CHECK(elapsed < 1s);
    TEST_CHECK(supervisor.state() == SupervisorState::Failed);
    TEST_CHECK(!supervisor.terminated());

    std::cout << "[TEST] OK\n";
}

void test_watch_reports_every_expired_check() {
    std::cout << "[TEST] Supervisor failure names all expired checks\n";

    Supervisor supervisor;
    supervisor.add(timed("b", 5ms));
    supervisor.add(timed("a", 5ms));
    supervisor.add(timed("c", 10s));
    std::this_thread::sleep_for(20ms);

    auto status = supervisor.watch(1ms);
    TEST_CHECK(status.code == Error::AggregateFailure);
    TEST_CHECK((status.expired == std::vector<std::string>{"a", "b"}));

    std::cout << "[TEST] OK\n";
}

void test_watch_can_resume_after_failure() {
    std::cout << "[TEST] Supervisor watch() may be re-invoked after a failure\n";

    Supervisor supervisor;
    supervisor.add(timed("db", 20ms));

    auto first = supervisor.watch(2ms);
    TEST_CHECK(first.code == Error::AggregateFailure);

    // Component re-registers with a wider window, supervision resumes and is
    // stopped by the caller
    supervisor.add(timed("db", 60s));
    TEST_CHECK(supervisor.size() == 1);
    std::thread stopper([&] {
        std::this_thread::sleep_for(5ms);
        supervisor.terminate();
    });
    auto second = supervisor.watch(1ms);
    stopper.join();

    TEST_CHECK(second.ok());
    TEST_CHECK(supervisor.state() == SupervisorState::Stopped);

    std::cout << "[TEST] OK\n";
}

void test_whacked_checks_keep_watch_running() {
    std::cout << "[TEST] Supervisor keeps watching while components whack\n";

    Supervisor supervisor;
    supervisor.add(timed("worker", 250ms));

    std::atomic<bool> stop_worker{false};
    std::thread worker([&] {
        while (!stop_worker.load()) {
            (void)supervisor.whack("worker");
            std::this_thread::sleep_for(5ms);
        }
    });

    Status result = Status::invalid_configuration("not run");
    std::thread watcher([&] { result = supervisor.watch(5ms); });

    std::this_thread::sleep_for(150ms);
    supervisor.terminate();
    watcher.join();
    stop_worker.store(true);
    worker.join();

    TEST_CHECK(result.ok());
    TEST_CHECK(supervisor.passes() > 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Configuration errors
// -----------------------------------------------------------------------------

void test_negative_period_is_rejected() {
    std::cout << "[TEST] Supervisor rejects a negative period\n";

    Supervisor supervisor;
    auto status = supervisor.watch(-1ms);
    TEST_CHECK(status.code == Error::InvalidConfiguration);
    TEST_CHECK(supervisor.state() == SupervisorState::Idle);

    std::cout << "[TEST] OK\n";
}

void test_oversized_period_waits_instead_of_spinning() {
    std::cout << "[TEST] Supervisor period past the clock range still sleeps\n";

    const Supervisor::duration periods[] = {
        std::chrono::milliseconds(9'223'372'036'854),
        Supervisor::duration::max(),
    };

    for (const auto period : periods) {
        Supervisor supervisor;
        supervisor.add(timed("svc", 60s));

        Status result = Status::invalid_configuration("not run");
        std::thread watcher([&] { result = supervisor.watch(period); });

        TEST_CHECK(test::eventually([&] { return supervisor.passes() >= 1; }, 2s));
        std::this_thread::sleep_for(100ms);
        TEST_CHECK(supervisor.passes() == 1);

        supervisor.terminate();
        watcher.join();
        TEST_CHECK(result.ok());
        TEST_CHECK(supervisor.state() == SupervisorState::Stopped);
    }

    std::cout << "[TEST] OK\n";
}

void test_concurrent_watch_is_rejected() {
    std::cout << "[TEST] Supervisor rejects a second concurrent watch()\n";

    Supervisor supervisor;
    supervisor.add(timed("svc", 60s));

    std::thread watcher([&] { TEST_CHECK(supervisor.watch(10s).ok()); });
    TEST_CHECK(test::eventually([&] { return supervisor.state() == SupervisorState::Watching; }, 2s));

    auto second = supervisor.watch(1ms);
    TEST_CHECK(second.code == Error::InvalidConfiguration);

    supervisor.terminate();
    watcher.join();

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Registry mutation during watch
// -----------------------------------------------------------------------------

void test_add_remove_while_watching() {
    std::cout << "[TEST] Supervisor add/remove while watch() runs\n";

    Supervisor supervisor;
    supervisor.add(timed("anchor", 60s));

    Status result = Status::invalid_configuration("not run");
    std::thread watcher([&] { result = supervisor.watch(1ms); });

    std::vector<std::thread> mutators;
    for (int m = 0; m < 4; ++m) {
        mutators.emplace_back([&, m] {
            for (int i = 0; i < 500; ++i) {
                const std::string name = "m" + std::to_string(m) + "-" + std::to_string(i % 8);
                supervisor.add(timed(name, 60s));
                (void)supervisor.remove(name);
            }
        });
    }
    for (auto& t : mutators) {
        t.join();
    }

    TEST_CHECK(supervisor.size() == 1);
    TEST_CHECK(supervisor.contains("anchor"));

    supervisor.terminate();
    watcher.join();
    TEST_CHECK(result.ok());

    std::cout << "[TEST] OK\n";
}

void test_removing_expired_check_clears_failure() {
    std::cout << "[TEST] Supervisor remove() drops an expired check from the pass\n";

    Supervisor supervisor;
    supervisor.add(timed("gone", 1ms));
    supervisor.add(timed("kept", 60s));
    std::this_thread::sleep_for(5ms);

    TEST_CHECK(!supervisor.check_all().ok());
    TEST_CHECK(supervisor.remove("gone"));
    TEST_CHECK(supervisor.check_all().ok());

    std::cout << "[TEST] OK\n";
}


int main() {
    test_terminate_before_watch();
    test_terminate_wakes_sleeping_watch();
    test_terminate_is_idempotent_from_many_threads();
    test_watch_fails_fast_on_expired_check();
    test_watch_reports_every_expired_check();
    test_watch_can_resume_after_failure();
    test_whacked_checks_keep_watch_running();
    test_negative_period_is_rejected();
    test_oversized_period_waits_instead_of_spinning();
    test_concurrent_watch_is_rejected();
    test_add_remove_while_watching();
    test_removing_expired_check_clears_failure();

    std::cout << "[TEST] Supervisor tests PASSED\n";
    return 0;
}
