#ifndef MCPCHAT_TESTS_RECORDING_HANDLER_HPP
#define MCPCHAT_TESTS_RECORDING_HANDLER_HPP

#include "mcpchat/notification/notification_handler.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mcpchat::testing {

// ─────────────────────────────────────────────────────────────────────────────
// RecordingHandler - counts events in its state and remembers what it saw
// ─────────────────────────────────────────────────────────────────────────────

class RecordingHandler : public INotificationHandler {
public:
    enum class Mode { Normal, Fail, Throw, Hang };

    explicit RecordingHandler(std::string name, Mode mode = Mode::Normal)
        : name_(std::move(name))
        , mode_(mode)
    {}

    [[nodiscard]] std::string name() const override { return name_; }

    [[nodiscard]] HandlerResult init(const Json& args) override {
        if (args.value("refuse", false)) {
            return tl::unexpected(HandlerError::failed("init refused"));
        }
        return Json{{"seen", 0}, {"label", args.value("label", "")}};
    }

    [[nodiscard]] HandlerResult handle_notification(const NotificationEvent& event, HandlerState state) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        switch (mode_) {
            case Mode::Fail:
                state["seen"] = state.value("seen", 0) + 1;
                return tl::unexpected(HandlerError::failed("refusing " + event.method, std::move(state)));
            case Mode::Throw:
                throw std::runtime_error("handler exploded");
            case Mode::Hang:
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
                break;
            case Mode::Normal:
                break;
        }
        state["seen"] = state.value("seen", 0) + 1;
        return state;
    }

    void terminate(const HandlerState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        terminated_.push_back(state);
    }

    [[nodiscard]] std::vector<NotificationEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    [[nodiscard]] std::vector<HandlerState> terminated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminated_;
    }

private:
    std::string name_;
    Mode mode_;
    mutable std::mutex mutex_;
    std::vector<NotificationEvent> events_;
    std::vector<HandlerState> terminated_;
};

}  // namespace mcpchat::testing

#endif  // MCPCHAT_TESTS_RECORDING_HANDLER_HPP
