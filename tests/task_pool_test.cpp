#include <catch2/catch_test_macros.hpp>

#include "mcpchat/async/periodic_timer.hpp"
#include "mcpchat/async/runtime.hpp"
#include "mcpchat/async/task_pool.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

using namespace mcpchat;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// run_bounded
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("run_bounded runs every index once", "[task_pool]") {
    TaskPool pool(3);
    std::mutex mutex;
    std::multiset<std::size_t> seen;

    pool.run_bounded(10, [&](std::size_t index) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(index);
    });

    REQUIRE(seen.size() == 10);
    for (std::size_t i = 0; i < 10; ++i) {
        REQUIRE(seen.count(i) == 1);
    }
}

TEST_CASE("run_bounded never exceeds max concurrency", "[task_pool]") {
    TaskPool pool(2);
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};

    pool.run_bounded(6, [&](std::size_t) {
        const int now = ++in_flight;
        int previous = peak.load();
        while (now > previous && peak.compare_exchange_weak(previous, now) == false) {
        }
        std::this_thread::sleep_for(20ms);
        --in_flight;
    });

    REQUIRE(peak.load() <= 2);
    REQUIRE(peak.load() >= 1);
}

TEST_CASE("run_bounded keeps going when a job throws", "[task_pool]") {
    TaskPool pool(2);
    std::atomic<int> finished{0};

    pool.run_bounded(5, [&](std::size_t index) {
        if (index == 1) {
            throw std::runtime_error("job 1 failed");
        }
        ++finished;
    });

    REQUIRE(finished.load() == 4);
}

TEST_CASE("run_bounded with no jobs returns immediately", "[task_pool]") {
    TaskPool pool(4);
    bool called = false;

    pool.run_bounded(0, [&](std::size_t) { called = true; });

    REQUIRE(called == false);
}

TEST_CASE("TaskPool clamps max concurrency to one", "[task_pool]") {
    TaskPool pool(0);
    REQUIRE(pool.max_concurrency() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// run_with_timeout
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("run_with_timeout returns the value of a fast job", "[task_pool]") {
    TaskPool pool(1);

    auto outcome = pool.run_with_timeout([] { return 42; }, 500ms);

    REQUIRE(outcome.ok());
    REQUIRE(outcome.status == TaskStatus::Completed);
    REQUIRE(outcome.value == 42);
    REQUIRE(outcome.error.empty());
}

TEST_CASE("run_with_timeout abandons a slow job", "[task_pool]") {
    TaskPool pool(1);
    const auto started = std::chrono::steady_clock::now();

    auto outcome = pool.run_with_timeout([] {
        std::this_thread::sleep_for(300ms);
        return std::string("late");
    }, 50ms);

    const auto elapsed = std::chrono::steady_clock::now() - started;
    REQUIRE(outcome.status == TaskStatus::TimedOut);
    REQUIRE(outcome.value.has_value() == false);
    REQUIRE(outcome.error == "timed out after 50ms");
    REQUIRE(elapsed < 250ms);
    REQUIRE(pool.abandoned_count() == 1);

    std::this_thread::sleep_for(400ms);
    REQUIRE(pool.abandoned_count() == 0);
}

TEST_CASE("Destroying a pool gives up on work that never finishes", "[task_pool]") {
    std::promise<void> release;
    auto gate = std::make_shared<std::shared_future<void>>(release.get_future().share());
    auto finished = std::make_shared<std::atomic<bool>>(false);

    const auto started = std::chrono::steady_clock::now();
    {
        TaskPool pool(1, 100ms);
        auto outcome = pool.run_with_timeout([gate, finished] {
            gate->wait();
            finished->store(true);
            return 0;
        }, 20ms);
        REQUIRE(outcome.status == TaskStatus::TimedOut);
        REQUIRE(pool.abandoned_count() == 1);
    }
    REQUIRE(std::chrono::steady_clock::now() - started < 1s);
    REQUIRE(finished->load() == false);

    // The job owns its state and still completes after the pool is gone.
    release.set_value();
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (finished->load() == false && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(finished->load());
}

TEST_CASE("run_with_timeout reports a throwing job as failed", "[task_pool]") {
    TaskPool pool(1);

    auto outcome = pool.run_with_timeout([]() -> int {
        throw std::runtime_error("boom");
    }, 500ms);

    REQUIRE(outcome.status == TaskStatus::Failed);
    REQUIRE(outcome.error == "boom");
    REQUIRE(to_string(outcome.status) == "failed");
}

// ═══════════════════════════════════════════════════════════════════════════
// Runtime and PeriodicTimer
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Runtime starts and stops idempotently", "[runtime]") {
    Runtime runtime(2);
    REQUIRE(runtime.is_running() == false);

    runtime.start();
    runtime.start();
    REQUIRE(runtime.is_running());

    runtime.stop();
    runtime.stop();
    REQUIRE(runtime.is_running() == false);
}

TEST_CASE("PeriodicTimer ticks until stopped", "[runtime][timer]") {
    Runtime runtime(1);
    runtime.start();

    std::atomic<int> ticks{0};
    PeriodicTimer timer(runtime.executor(), 10ms, [&ticks] { ++ticks; });
    REQUIRE(timer.interval() == 10ms);

    timer.start();
    REQUIRE(timer.is_running());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (ticks.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(ticks.load() >= 3);

    timer.stop();
    REQUIRE(timer.is_running() == false);
    const int after_stop = ticks.load();
    std::this_thread::sleep_for(50ms);
    REQUIRE(ticks.load() == after_stop);

    runtime.stop();
}

TEST_CASE("PeriodicTimer survives a throwing tick", "[runtime][timer]") {
    Runtime runtime(1);
    runtime.start();

    std::atomic<int> ticks{0};
    PeriodicTimer timer(runtime.executor(), 10ms, [&ticks] {
        ++ticks;
        throw std::runtime_error("tick failed");
    });
    timer.start();

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (ticks.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(ticks.load() >= 2);

    timer.stop();
    runtime.stop();
}
