#pragma once

#include "mcpchat/log/logger.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace mcpchat {

// ═══════════════════════════════════════════════════════════════════════════
// Task Outcomes
// ═══════════════════════════════════════════════════════════════════════════

enum class TaskStatus { Completed, TimedOut, Failed };

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Completed: return "completed";
        case TaskStatus::TimedOut:  return "timed_out";
        case TaskStatus::Failed:    return "failed";
    }
    return "unknown";
}

template <typename T>
struct TaskOutcome {
    TaskStatus status{TaskStatus::Failed};
    std::optional<T> value;
    std::string error;   // set for TimedOut and Failed
    std::chrono::duration<double, std::milli> duration{0};

    [[nodiscard]] bool ok() const noexcept { return status == TaskStatus::Completed; }
};

// ═══════════════════════════════════════════════════════════════════════════
// TaskPool
// ═══════════════════════════════════════════════════════════════════════════
// Bounded fan-out used by connection start-up, tool execution and health
// probing.
//
//   run_bounded()       runs N jobs on at most max_concurrency workers
//                       (an asio::thread_pool) and returns when all finished.
//   run_with_timeout()  runs one job on a detached thread; a job that overruns
//                       is abandoned and its result discarded. Abandoned work
//                       is never joined, so a job must own (or share) all the
//                       state it touches.
//
// The destructor gives abandoned work up to `abandon_grace` to finish and
// then leaves it running.

class TaskPool {
public:
    explicit TaskPool(std::size_t max_concurrency,
                      std::chrono::milliseconds abandon_grace = std::chrono::milliseconds{1'000});
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    [[nodiscard]] std::size_t max_concurrency() const noexcept { return max_concurrency_; }

    /// Calls job(0) .. job(count-1). Exceptions from a job are logged and do
    /// not stop the others.
    void run_bounded(std::size_t count, const std::function<void(std::size_t)>& job);

    template <typename F>
    [[nodiscard]] auto run_with_timeout(F&& fn, std::chrono::milliseconds timeout)
        -> TaskOutcome<std::invoke_result_t<F&>>;

    /// Work that timed out and has not finished yet.
    [[nodiscard]] std::size_t abandoned_count();

private:
    void abandon(std::future<void> future);
    void reap_finished_locked();

    std::size_t max_concurrency_;
    std::chrono::milliseconds abandon_grace_;
    std::mutex abandoned_mutex_;
    std::vector<std::future<void>> abandoned_;
};

template <typename F>
auto TaskPool::run_with_timeout(F&& fn, std::chrono::milliseconds timeout)
    -> TaskOutcome<std::invoke_result_t<F&>>
{
    using T = std::invoke_result_t<F&>;

    // Owned jointly with the worker, which may outlive this call and the pool.
    struct Slot {
        std::optional<T> value;
        std::string error;
        std::promise<void> finished;
    };

    auto slot = std::make_shared<Slot>();
    std::future<void> done = slot->finished.get_future();
    const auto started = std::chrono::steady_clock::now();

    std::thread([slot, job = std::forward<F>(fn)]() mutable {
        try {
            slot->value.emplace(job());
        } catch (const std::exception& e) {
            slot->error = e.what();
        }
        slot->finished.set_value();
    }).detach();

    TaskOutcome<T> outcome;
    if (done.wait_for(timeout) == std::future_status::timeout) {
        outcome.status = TaskStatus::TimedOut;
        outcome.error = "timed out after " + std::to_string(timeout.count()) + "ms";
        outcome.duration = std::chrono::steady_clock::now() - started;
        abandon(std::move(done));
        return outcome;
    }

    done.get();
    outcome.duration = std::chrono::steady_clock::now() - started;
    if (slot->value.has_value()) {
        outcome.status = TaskStatus::Completed;
        outcome.value = std::move(slot->value);
    } else {
        outcome.status = TaskStatus::Failed;
        outcome.error = slot->error;
    }
    return outcome;
}

}  // namespace mcpchat
