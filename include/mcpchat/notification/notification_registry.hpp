#pragma once

#include "mcpchat/async/periodic_timer.hpp"
#include "mcpchat/async/task_pool.hpp"
#include "mcpchat/notification/notification_handler.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/strand.hpp>
#include <asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcpchat {

using HandlerPtr = std::shared_ptr<INotificationHandler>;

struct NotificationRegistryConfig {
    std::chrono::milliseconds handler_timeout{5'000};       // 0 runs handlers inline
    std::chrono::milliseconds batch_flush_interval{100};    // how often due batches are checked
};

// ═══════════════════════════════════════════════════════════════════════════
// NotificationRegistry
// ═══════════════════════════════════════════════════════════════════════════
// Fans server notifications out to subscribed handlers. Each registration
// owns its state; a handler that fails, throws or hangs is logged and keeps
// its previous state while the remaining handlers still run. Dispatches are
// serialized.

class NotificationRegistry {
public:
    explicit NotificationRegistry(NotificationRegistryConfig config = {});
    ~NotificationRegistry();

    NotificationRegistry(const NotificationRegistry&) = delete;
    NotificationRegistry& operator=(const NotificationRegistry&) = delete;

    /// Calls handler->init(args). Registering a handler that is already
    /// registered replaces its registration and terminates the old state.
    [[nodiscard]] tl::expected<void, HandlerError> register_handler(
        HandlerPtr handler, std::vector<NotificationType> types, const Json& init_args = Json::object());

    /// Returns false if the handler was not registered.
    bool unregister_handler(const HandlerPtr& handler);

    /// Delivers one notification; returns the number of handlers invoked.
    /// Batched types are queued and return 0.
    std::size_t dispatch(const std::string& server_name, const std::string& method, const Json& params);

    /// Queues dispatch() and returns at once: on the registry's strand once
    /// start() was called, on an internal single-thread executor otherwise.
    /// Used from transport reader threads, which must stay free to deliver
    /// the replies a handler waits for.
    void post(const std::string& server_name, const std::string& method, const Json& params);

    [[nodiscard]] std::map<NotificationType, std::vector<std::string>> list_handlers() const;
    [[nodiscard]] std::optional<HandlerState> handler_state(const HandlerPtr& handler) const;

    void enable_batching(NotificationType type, std::chrono::milliseconds window);
    void disable_batching(NotificationType type);

    /// Delivers every queued batch now; returns the number of handlers invoked.
    std::size_t flush_batches();

    /// Starts the batch flush timer and async posting on `executor`.
    void start(asio::any_io_executor executor);

    /// Stops the flush timer and waits for queued posts.
    void stop();

    [[nodiscard]] const NotificationRegistryConfig& config() const noexcept { return config_; }

private:
    struct Registration {
        HandlerPtr handler;
        std::vector<NotificationType> types;
        HandlerState state;
        std::uint64_t generation{0};
    };

    struct Batch {
        std::chrono::steady_clock::time_point opened;
        std::string method;
        std::vector<Json> events;
    };

    using BatchKey = std::pair<NotificationType, std::string>;

    std::size_t deliver(const NotificationEvent& event);
    [[nodiscard]] std::optional<HandlerState> invoke(
        const HandlerPtr& handler, const NotificationEvent& event, const HandlerState& state);
    std::size_t flush(bool only_due);

    NotificationRegistryConfig config_;
    TaskPool pool_;

    std::mutex dispatch_mutex_;

    mutable std::mutex mutex_;
    std::vector<Registration> registrations_;
    std::uint64_t next_generation_{1};
    std::map<NotificationType, std::chrono::milliseconds> batch_windows_;
    std::map<BatchKey, Batch> batches_;

    std::mutex runtime_mutex_;
    std::condition_variable posts_drained_;
    std::optional<asio::strand<asio::any_io_executor>> strand_;
    std::unique_ptr<asio::thread_pool> fallback_;
    std::size_t pending_posts_{0};
    std::unique_ptr<PeriodicTimer> flush_timer_;
};

}  // namespace mcpchat
