#include "mcpchat/async/runtime.hpp"
#include "mcpchat/log/logger.hpp"

#include <algorithm>

namespace mcpchat {

Runtime::Runtime(std::size_t thread_count)
    : thread_count_(std::max<std::size_t>(1, thread_count))
{}

Runtime::~Runtime() {
    stop();
}

void Runtime::start() {
    if (running_.exchange(true) == true) {
        return;
    }

    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_.get_executor());
    io_.restart();

    threads_.reserve(thread_count_);
    for (std::size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this] { io_.run(); });
    }
    get_logger().debug_fmt("Runtime started with {} threads", thread_count_);
}

void Runtime::stop() {
    if (running_.exchange(false) == false) {
        return;
    }

    if (work_guard_) {
        work_guard_->reset();
        work_guard_.reset();
    }
    io_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    MCPCHAT_LOG_DEBUG("Runtime stopped");
}

}  // namespace mcpchat
