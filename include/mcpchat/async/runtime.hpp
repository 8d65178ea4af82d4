#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace mcpchat {

// ─────────────────────────────────────────────────────────────────────────────
// Runtime - io_context plus the threads that run it
// ─────────────────────────────────────────────────────────────────────────────
// Periodic work (health ticks, cache cleanup, notification batch flushes)
// runs here. Components that take an executor must be stopped before the
// runtime is.

class Runtime {
public:
    explicit Runtime(std::size_t thread_count = 2);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] asio::any_io_executor executor() noexcept { return io_.get_executor(); }
    [[nodiscard]] asio::io_context& context() noexcept { return io_; }

private:
    asio::io_context io_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> threads_;
    std::size_t thread_count_;
    std::atomic<bool> running_{false};
};

}  // namespace mcpchat
