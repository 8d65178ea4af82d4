#include "mcpchat/transport/stdio_channel.hpp"
#include "mcpchat/log/logger.hpp"
#include "mcpchat/protocol/wire_json.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <map>
#include <vector>

extern char** environ;

namespace mcpchat {

namespace {

constexpr useconds_t kTerminationGraceUs = 100'000;
constexpr int kReaderPollMs = 100;
constexpr std::size_t kReadChunk = 8192;

std::string errno_text(std::string_view what) {
    return std::string(what) + ": " + std::strerror(errno);
}

// A dead child must surface as a write error, not kill the client.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// Parent environment with the configured overrides applied.
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        const auto eq = kv.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        merged[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

std::vector<char*> as_pointer_array(std::vector<std::string>& storage) {
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& s : storage) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

}  // namespace

StdioChannel::StdioChannel(StdioServerConfig config)
    : config_(std::move(config))
{}

StdioChannel::~StdioChannel() {
    close();
}

bool StdioChannel::is_safe_command(const std::string& command) noexcept {
    if (command.empty()) {
        return false;
    }
    constexpr std::string_view kShellMeta = ";|&$`\\\"'<>(){}[]!#*?";
    for (const char c : command) {
        if (kShellMeta.find(c) != std::string_view::npos) {
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────────────────────────────────────────────
// Open
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> StdioChannel::open(MessageHandler on_message, CloseHandler on_close) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (running_.load() == true) {
        return tl::unexpected(TransportError::protocol("channel already open"));
    }
    if (is_safe_command(config_.command) == false) {
        return tl::unexpected(TransportError::protocol(
            "refusing to spawn unsafe command '" + config_.command + "'"));
    }

    ignore_sigpipe_once();

    // Everything the child touches is allocated before fork(): only async-
    // signal-safe calls are allowed between fork() and exec.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());
    std::vector<char*> argv = as_pointer_array(argv_storage);

    std::vector<std::string> env_storage = build_environment(config_.env);
    std::vector<char*> envp = as_pointer_array(env_storage);

    int stdin_pipe[2];
    int stdout_pipe[2];
    if (::pipe(stdin_pipe) == -1) {
        return tl::unexpected(TransportError::network(errno_text("failed to create stdin pipe")));
    }
    if (::pipe(stdout_pipe) == -1) {
        const auto error = TransportError::network(errno_text("failed to create stdout pipe"));
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        return tl::unexpected(error);
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const auto error = TransportError::network(errno_text("failed to fork"));
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        return tl::unexpected(error);
    }

    if (pid == 0) {
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);

        const int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull != -1) {
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }

        ::execvpe(argv[0], argv.data(), envp.data());
        ::_exit(127);
    }

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    // The read end must not leak into servers spawned later.
    ::fcntl(stdin_pipe[1], F_SETFD, FD_CLOEXEC);
    ::fcntl(stdout_pipe[0], F_SETFD, FD_CLOEXEC);

    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);
    stdin_fd_ = stdin_pipe[1];
    child_pid_.store(pid);
    running_.store(true);

    reader_thread_ = std::thread([this, fd = stdout_pipe[0]] { reader_loop(fd); });

    get_logger().info_fmt("Spawned '{}' (pid {})", config_.command, pid);
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Send
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> StdioChannel::send(const Json& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (running_.load() == false || stdin_fd_ == -1) {
        return tl::unexpected(TransportError::closed("server process is not running"));
    }

    std::string data = message.dump();
    data.push_back('\n');

    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t written = ::write(stdin_fd_, ptr, remaining);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(TransportError::network(errno_text("failed to write to server")));
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Reader
// ─────────────────────────────────────────────────────────────────────────────

void StdioChannel::reader_loop(int stdout_fd) {
    std::string buffer;
    char chunk[kReadChunk];
    std::string close_reason;

    while (running_.load() == true) {
        struct pollfd pfd{};
        pfd.fd = stdout_fd;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, kReaderPollMs);
        if (ready == 0) {
            continue;
        }
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            close_reason = errno_text("poll failed");
            break;
        }

        const ssize_t n = ::read(stdout_fd, chunk, sizeof(chunk));
        if (n == 0) {
            close_reason = "server process closed its output";
            break;
        }
        if (n == -1) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            close_reason = errno_text("read failed");
            break;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));

        std::size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (line.empty() == false && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() == true) {
                continue;
            }

            auto parsed = parse_wire_json(line);
            if (parsed.has_value() == false) {
                // Some servers print banners on stdout.
                get_logger().debug_fmt("Ignoring non-JSON line from '{}': {}",
                                       config_.command, parsed.error().message);
                continue;
            }
            if (on_message_) {
                try {
                    on_message_(*parsed);
                } catch (const std::exception& e) {
                    get_logger().error_fmt("Message handler for '{}' threw: {}", config_.command, e.what());
                }
            }
        }

        if (buffer.size() > config_.max_message_size) {
            get_logger().warn_fmt("Dropping {} bytes from '{}': message exceeds limit",
                                  buffer.size(), config_.command);
            buffer.clear();
        }
    }

    ::close(stdout_fd);

    // Only an unexpected end is reported; close() clears running_ first.
    // The handler may release the last reference to this channel, so nothing
    // after it touches members.
    if (running_.exchange(false) == true) {
        get_logger().warn_fmt("Server '{}' went away: {}", config_.command, close_reason);
        CloseHandler handler = on_close_;
        if (handler) {
            handler(close_reason);
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Close
// ─────────────────────────────────────────────────────────────────────────────

void StdioChannel::terminate_child(pid_t pid) {
    if (pid <= 0) {
        return;
    }
    ::kill(pid, SIGTERM);

    int status = 0;
    pid_t reaped = ::waitpid(pid, &status, WNOHANG);
    if (reaped == 0) {
        ::usleep(kTerminationGraceUs);
        reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == 0) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
        }
    }
}

void StdioChannel::close() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    running_.store(false);

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (stdin_fd_ != -1) {
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }
    }

    terminate_child(child_pid_.exchange(-1));

    if (reader_thread_.joinable()) {
        // close() may run on the reader itself, from inside a close handler.
        if (reader_thread_.get_id() == std::this_thread::get_id()) {
            reader_thread_.detach();
        } else {
            reader_thread_.join();
        }
    }
}

bool StdioChannel::is_open() const noexcept {
    return running_.load();
}

}  // namespace mcpchat
