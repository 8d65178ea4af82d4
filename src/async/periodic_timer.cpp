#include "mcpchat/async/periodic_timer.hpp"
#include "mcpchat/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/use_awaitable.hpp>

#include <condition_variable>
#include <mutex>

namespace mcpchat {

struct PeriodicTimer::State {
    State(asio::any_io_executor executor, std::chrono::milliseconds every, Tick callback)
        : strand(asio::make_strand(executor))
        , timer(strand)
        , interval(every)
        , tick(std::move(callback))
    {}

    asio::strand<asio::any_io_executor> strand;
    asio::steady_timer timer;
    std::chrono::milliseconds interval;
    Tick tick;

    std::mutex mutex;
    std::condition_variable loop_exited;
    bool running{false};
    bool loop_active{false};

    [[nodiscard]] bool should_continue() {
        std::lock_guard<std::mutex> lock(mutex);
        return running;
    }

    void finish_loop() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            loop_active = false;
        }
        loop_exited.notify_all();
    }
};

PeriodicTimer::PeriodicTimer(asio::any_io_executor executor, std::chrono::milliseconds interval, Tick tick)
    : state_(std::make_shared<State>(std::move(executor), interval, std::move(tick)))
{}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

void PeriodicTimer::start() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->running == true || state_->loop_active == true) {
            return;
        }
        state_->running = true;
        state_->loop_active = true;
    }
    asio::co_spawn(state_->strand, tick_loop(state_), asio::detached);
}

void PeriodicTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->running == false && state_->loop_active == false) {
            return;
        }
        state_->running = false;
    }

    asio::post(state_->strand, [state = state_] { state->timer.cancel(); });

    if (state_->strand.running_in_this_thread()) {
        return;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->loop_exited.wait(lock, [this] { return state_->loop_active == false; });
}

bool PeriodicTimer::is_running() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
}

std::chrono::milliseconds PeriodicTimer::interval() const noexcept {
    return state_->interval;
}

asio::awaitable<void> PeriodicTimer::tick_loop(std::shared_ptr<State> state) {
    while (state->should_continue()) {
        state->timer.expires_after(state->interval);
        asio::error_code ec;
        co_await state->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || state->should_continue() == false) {
            break;
        }
        try {
            state->tick();
        } catch (const std::exception& e) {
            get_logger().error_fmt("Periodic task threw: {}", e.what());
        }
    }
    state->finish_loop();
}

}  // namespace mcpchat
