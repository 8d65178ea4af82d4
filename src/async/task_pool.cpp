#include "mcpchat/async/task_pool.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>

namespace mcpchat {

TaskPool::TaskPool(std::size_t max_concurrency, std::chrono::milliseconds abandon_grace)
    : max_concurrency_(std::max<std::size_t>(1, max_concurrency))
    , abandon_grace_(abandon_grace)
{}

TaskPool::~TaskPool() {
    std::vector<std::future<void>> remaining;
    {
        std::lock_guard<std::mutex> lock(abandoned_mutex_);
        reap_finished_locked();
        remaining.swap(abandoned_);
    }
    if (remaining.empty()) {
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + abandon_grace_;
    std::size_t still_running = 0;
    for (auto& future : remaining) {
        if (future.wait_until(deadline) != std::future_status::ready) {
            ++still_running;
        }
    }
    if (still_running > 0) {
        get_logger().warn_fmt("Leaving {} abandoned tasks running", still_running);
    }
}

void TaskPool::run_bounded(std::size_t count, const std::function<void(std::size_t)>& job) {
    if (count == 0) {
        return;
    }

    const std::size_t workers = std::min(max_concurrency_, count);
    asio::thread_pool pool(workers);
    std::atomic<std::size_t> next{0};

    // Each worker pulls indices until the range is drained, so never more
    // than `workers` jobs run at once.
    for (std::size_t w = 0; w < workers; ++w) {
        asio::post(pool, [&next, &job, count] {
            for (;;) {
                const std::size_t index = next.fetch_add(1);
                if (index >= count) {
                    return;
                }
                try {
                    job(index);
                } catch (const std::exception& e) {
                    get_logger().error_fmt("Task {} threw: {}", index, e.what());
                }
            }
        });
    }
    pool.join();
}

void TaskPool::abandon(std::future<void> future) {
    std::lock_guard<std::mutex> lock(abandoned_mutex_);
    reap_finished_locked();
    abandoned_.push_back(std::move(future));
}

void TaskPool::reap_finished_locked() {
    std::erase_if(abandoned_, [](std::future<void>& future) {
        return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
}

std::size_t TaskPool::abandoned_count() {
    std::lock_guard<std::mutex> lock(abandoned_mutex_);
    reap_finished_locked();
    return abandoned_.size();
}

}  // namespace mcpchat
