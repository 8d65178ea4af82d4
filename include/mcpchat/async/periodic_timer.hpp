#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace mcpchat {

// ─────────────────────────────────────────────────────────────────────────────
// PeriodicTimer - runs a callback every `interval` on an executor
// ─────────────────────────────────────────────────────────────────────────────
// The tick loop is a coroutine on its own strand, so ticks never overlap.
// stop() returns once the loop has exited; calling it from inside the tick
// only requests the stop.

class PeriodicTimer {
public:
    using Tick = std::function<void()>;

    PeriodicTimer(asio::any_io_executor executor, std::chrono::milliseconds interval, Tick tick);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept;

private:
    struct State;

    static asio::awaitable<void> tick_loop(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

}  // namespace mcpchat
