#pragma once

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "StdioChannel is only available on POSIX-compatible systems"
#endif

#include "mcpchat/transport/message_channel.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include <sys/types.h>

namespace mcpchat {

// ═══════════════════════════════════════════════════════════════════════════
// StdioChannel
// ═══════════════════════════════════════════════════════════════════════════
// Spawns the server process and exchanges newline-delimited JSON over its
// stdin/stdout. stderr goes to /dev/null. A reader thread owns the stdout
// pipe and hands each parsed line to the message handler.

class StdioChannel final : public IMessageChannel {
public:
    explicit StdioChannel(StdioServerConfig config);
    ~StdioChannel() override;

    StdioChannel(const StdioChannel&) = delete;
    StdioChannel& operator=(const StdioChannel&) = delete;
    StdioChannel(StdioChannel&&) = delete;
    StdioChannel& operator=(StdioChannel&&) = delete;

    [[nodiscard]] TransportResult<void> open(MessageHandler on_message, CloseHandler on_close) override;
    [[nodiscard]] TransportResult<void> send(const Json& message) override;
    void close() override;
    [[nodiscard]] bool is_open() const noexcept override;

    [[nodiscard]] pid_t pid() const noexcept { return child_pid_.load(); }

    /// Rejects empty commands and shell metacharacters in the executable name.
    [[nodiscard]] static bool is_safe_command(const std::string& command) noexcept;

private:
    void reader_loop(int stdout_fd);
    void terminate_child(pid_t pid);

    StdioServerConfig config_;
    MessageHandler on_message_;
    CloseHandler on_close_;

    std::atomic<bool> running_{false};
    std::atomic<pid_t> child_pid_{-1};
    int stdin_fd_{-1};
    std::mutex write_mutex_;
    std::mutex lifecycle_mutex_;
    std::thread reader_thread_;
};

}  // namespace mcpchat
