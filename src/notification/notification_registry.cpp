#include "mcpchat/notification/notification_registry.hpp"
#include "mcpchat/log/logger.hpp"

#include <asio/post.hpp>

#include <algorithm>

namespace mcpchat {

NotificationRegistry::NotificationRegistry(NotificationRegistryConfig config)
    : config_(config)
    , pool_(1)
{}

NotificationRegistry::~NotificationRegistry() {
    stop();

    std::unique_ptr<asio::thread_pool> fallback;
    {
        std::lock_guard<std::mutex> lock(runtime_mutex_);
        fallback = std::move(fallback_);
    }
    if (fallback != nullptr) {
        fallback->join();
    }

    std::vector<Registration> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(registrations_);
    }
    for (const auto& registration : remaining) {
        registration.handler->terminate(registration.state);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<void, HandlerError> NotificationRegistry::register_handler(
    HandlerPtr handler, std::vector<NotificationType> types, const Json& init_args
) {
    if (handler == nullptr) {
        return tl::unexpected(HandlerError::failed("handler is null"));
    }

    auto initial = handler->init(init_args);
    if (initial.has_value() == false) {
        get_logger().error_fmt("Handler {} failed to initialize: {}", handler->name(), initial.error().message);
        return tl::unexpected(std::move(initial.error()));
    }

    std::optional<Registration> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Registration fresh{handler, std::move(types), std::move(*initial), next_generation_++};

        auto it = std::find_if(registrations_.begin(), registrations_.end(),
            [&](const Registration& r) { return r.handler == handler; });
        if (it != registrations_.end()) {
            replaced = std::move(*it);
            *it = std::move(fresh);
        } else {
            registrations_.push_back(std::move(fresh));
        }
    }

    if (replaced.has_value()) {
        handler->terminate(replaced->state);
    }
    get_logger().info_fmt("Registered notification handler {}", handler->name());
    return {};
}

bool NotificationRegistry::unregister_handler(const HandlerPtr& handler) {
    std::optional<Registration> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(registrations_.begin(), registrations_.end(),
            [&](const Registration& r) { return r.handler == handler; });
        if (it == registrations_.end()) {
            return false;
        }
        removed = std::move(*it);
        registrations_.erase(it);
    }

    removed->handler->terminate(removed->state);
    get_logger().info_fmt("Unregistered notification handler {}", removed->handler->name());
    return true;
}

std::map<NotificationType, std::vector<std::string>> NotificationRegistry::list_handlers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<NotificationType, std::vector<std::string>> out;
    for (const auto& registration : registrations_) {
        for (const auto type : registration.types) {
            out[type].push_back(registration.handler->name());
        }
    }
    return out;
}

std::optional<HandlerState> NotificationRegistry::handler_state(const HandlerPtr& handler) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& registration : registrations_) {
        if (registration.handler == handler) {
            return registration.state;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────────────────────────────────────

std::size_t NotificationRegistry::dispatch(
    const std::string& server_name, const std::string& method, const Json& params
) {
    const auto type = notification_type_from_method(method);
    if (type.has_value() == false) {
        get_logger().debug_fmt("Unknown notification method from {}: {}", server_name, method);
        return 0;
    }

    NotificationEvent event;
    event.server_name = server_name;
    event.type = *type;
    event.method = method;
    event.params = params.is_null() ? Json::object() : params;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (batch_windows_.count(*type) > 0) {
            auto& batch = batches_[BatchKey{*type, server_name}];
            if (batch.events.empty()) {
                batch.opened = std::chrono::steady_clock::now();
                batch.method = method;
            }
            batch.events.push_back(event.params);
            return 0;
        }
    }

    std::lock_guard<std::mutex> serial(dispatch_mutex_);
    return deliver(event);
}

void NotificationRegistry::post(const std::string& server_name, const std::string& method, const Json& params) {
    auto job = [this, server_name, method, params] {
        try {
            (void)dispatch(server_name, method, params);
        } catch (const std::exception& e) {
            get_logger().error_fmt("Notification dispatch failed: {}", e.what());
        }
        std::lock_guard<std::mutex> done(runtime_mutex_);
        pending_posts_ -= 1;
        posts_drained_.notify_all();
    };

    std::lock_guard<std::mutex> lock(runtime_mutex_);
    pending_posts_ += 1;
    if (strand_.has_value()) {
        asio::post(*strand_, std::move(job));
        return;
    }
    if (fallback_ == nullptr) {
        fallback_ = std::make_unique<asio::thread_pool>(1);
    }
    asio::post(*fallback_, std::move(job));
}

// dispatch_mutex_ held.
std::size_t NotificationRegistry::deliver(const NotificationEvent& event) {
    struct Target {
        HandlerPtr handler;
        HandlerState state;
        std::uint64_t generation;
    };

    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& registration : registrations_) {
            const auto& types = registration.types;
            if (std::find(types.begin(), types.end(), event.type) != types.end()) {
                targets.push_back({registration.handler, registration.state, registration.generation});
            }
        }
    }

    for (auto& target : targets) {
        auto next = invoke(target.handler, event, target.state);
        if (next.has_value() == false) {
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& registration : registrations_) {
            if (registration.generation == target.generation) {
                registration.state = std::move(*next);
                break;
            }
        }
    }
    return targets.size();
}

std::optional<HandlerState> NotificationRegistry::invoke(
    const HandlerPtr& handler, const NotificationEvent& event, const HandlerState& state
) {
    auto report = [&](const HandlerResult& result) -> std::optional<HandlerState> {
        if (result.has_value()) {
            return *result;
        }
        get_logger().error_fmt("Handler {} failed on {}: {}",
            handler->name(), to_string(event.type), result.error().message);
        return result.error().state;
    };

    if (config_.handler_timeout.count() == 0) {
        try {
            return report(handler->handle_notification(event, state));
        } catch (const std::exception& e) {
            get_logger().error_fmt("Handler {} threw on {}: {}", handler->name(), to_string(event.type), e.what());
            return std::nullopt;
        }
    }

    auto outcome = pool_.run_with_timeout(
        [target = handler, event, state] { return target->handle_notification(event, state); },
        config_.handler_timeout);

    if (outcome.ok() == false) {
        get_logger().error_fmt("Handler {} {} on {}: {}",
            handler->name(),
            outcome.status == TaskStatus::TimedOut ? "timed out" : "threw",
            to_string(event.type), outcome.error);
        return std::nullopt;
    }
    return report(*outcome.value);
}

// ─────────────────────────────────────────────────────────────────────────────
// Batching
// ─────────────────────────────────────────────────────────────────────────────

void NotificationRegistry::enable_batching(NotificationType type, std::chrono::milliseconds window) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch_windows_[type] = window;
}

void NotificationRegistry::disable_batching(NotificationType type) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch_windows_.erase(type);
    }
    (void)flush(false);
}

std::size_t NotificationRegistry::flush_batches() {
    return flush(false);
}

std::size_t NotificationRegistry::flush(bool only_due) {
    std::lock_guard<std::mutex> serial(dispatch_mutex_);

    std::vector<NotificationEvent> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        for (auto it = batches_.begin(); it != batches_.end();) {
            const auto& [key, batch] = *it;
            const auto window = batch_windows_.count(key.first) > 0
                ? batch_windows_.at(key.first)
                : std::chrono::milliseconds{0};
            if (batch.events.empty() || (only_due && now - batch.opened < window)) {
                ++it;
                continue;
            }

            NotificationEvent event;
            event.server_name = key.second;
            event.type = key.first;
            event.method = batch.method;
            event.count = batch.events.size();
            event.batched = true;
            event.params = {{"count", batch.events.size()}, {"events", batch.events}};
            ready.push_back(std::move(event));
            it = batches_.erase(it);
        }
    }

    std::size_t invoked = 0;
    for (const auto& event : ready) {
        get_logger().debug_fmt("Delivering batch of {} {} from {}", event.count, to_string(event.type), event.server_name);
        invoked += deliver(event);
    }
    return invoked;
}

// ─────────────────────────────────────────────────────────────────────────────
// Runtime
// ─────────────────────────────────────────────────────────────────────────────

void NotificationRegistry::start(asio::any_io_executor executor) {
    std::lock_guard<std::mutex> lock(runtime_mutex_);
    if (strand_.has_value()) {
        return;
    }
    strand_.emplace(asio::make_strand(executor));
    flush_timer_ = std::make_unique<PeriodicTimer>(executor, config_.batch_flush_interval, [this] {
        (void)flush(true);
    });
    flush_timer_->start();
}

void NotificationRegistry::stop() {
    std::unique_ptr<PeriodicTimer> timer;
    {
        std::unique_lock<std::mutex> lock(runtime_mutex_);
        strand_.reset();
        timer = std::move(flush_timer_);
        posts_drained_.wait(lock, [this] { return pending_posts_ == 0; });
    }
    if (timer != nullptr) {
        timer->stop();
    }
}

}  // namespace mcpchat
