#include "execution/process_executor.hpp"

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>

#include <sys/wait.h>
#include <unistd.h>

#include "core/environment.hpp"
#include "core/path_resolver.hpp"
#include "execution/file_descriptor.hpp"
#include "execution/stream_pump.hpp"
#include "execution/stream_sink.hpp"

namespace hardened {

namespace {

using Clock = std::chrono::steady_clock;

[[nodiscard]] std::vector<char *> build_c_array(std::vector<std::string> &strings) {
    std::vector<char *> array;
    array.reserve(strings.size() + 1);

    for (auto &value : strings) {
        array.push_back(value.data());
    }
    array.push_back(nullptr);

    return array;
}

[[nodiscard]] std::unexpected<ExecError> spawn_error(int error_number, std::string message) {
    return std::unexpected(
        ExecError{.kind = ExecErrorKind::SpawnFailed, .message = std::move(message), .error_number = error_number});
}

// A timeout too long to be represented as a steady_clock deadline means no deadline.
[[nodiscard]] std::optional<Clock::time_point> deadline_after(const std::optional<std::chrono::milliseconds> &timeout) {
    if (!timeout.has_value()) {
        return std::nullopt;
    }

    const auto now = Clock::now();
    if (*timeout <= std::chrono::milliseconds::zero()) {
        return now;
    }

    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (*timeout >= headroom) {
        return std::nullopt;
    }

    return now + std::chrono::duration_cast<Clock::duration>(*timeout);
}

[[nodiscard]] bool needs_pipe(const StreamPolicy &policy, bool capture) {
    return capture || !std::holds_alternative<stream::Discard>(policy);
}

// Owns a spawned child from the moment fork succeeded until it is reaped. The exit
// waiter and the stream pumps report into one channel (mutex + condition variable)
// that the calling thread waits on, optionally with a deadline.
class Supervisor {
  public:
    Supervisor(pid_t pid, UniqueFd cancel_read, UniqueFd cancel_write)
        : pid_(pid), cancel_read_(std::move(cancel_read)), cancel_write_(std::move(cancel_write)) {}

    ~Supervisor() {
        if (reaped_) {
            return;
        }

        kill_group();
        cancel_pumps();
        join_all();

        int status = 0;
        // abandoning the run after an internal failure; reaping is best effort here
        while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
    }

    Supervisor(const Supervisor &) = delete;
    Supervisor &operator=(const Supervisor &) = delete;

    void attach(UniqueFd source, StreamSink &sink) {
        {
            std::lock_guard lock(mutex_);
            ++open_streams_;
        }

        auto &pump = sink.kind() == StreamKind::Stdout ? stdout_pump_ : stderr_pump_;
        pump = std::make_unique<StreamPump>(std::move(source), sink, cancel_read_.get(), [this] { stream_finished(); });
        pump->start();
    }

    void start_waiter() { waiter_ = std::thread([this] { wait_for_exit(); }); }

    // Returns true when the deadline elapsed before the child exited.
    [[nodiscard]] bool wait(std::optional<Clock::time_point> deadline) {
        std::unique_lock lock(mutex_);
        const auto settled = [this] { return exited_ && (open_streams_ == 0 || waiter_error_ != nullptr); };

        bool settled_in_time = true;
        if (deadline.has_value()) {
            settled_in_time = cv_.wait_until(lock, *deadline, settled);
        } else {
            cv_.wait(lock, settled);
        }

        if (settled_in_time && !waiter_error_) {
            return false;
        }

        const bool timed_out = !exited_;
        lock.unlock();

        // also reaches descendants that still hold the pipes after the child exited
        kill_group();

        lock.lock();
        cv_.wait(lock, [this] { return exited_; });
        lock.unlock();

        shut_down_streams();
        return timed_out;
    }

    // Joins every thread, reaps the child and rethrows the first failure observed by
    // a helper thread. Returns the raw wait status.
    [[nodiscard]] int finish(const std::function<int(pid_t)> &reap) {
        join_all();

        const int status = reap(pid_);
        reaped_ = true;

        if (waiter_error_) {
            std::rethrow_exception(waiter_error_);
        }

        for (const auto *pump : {stdout_pump_.get(), stderr_pump_.get()}) {
            if (pump != nullptr && pump->error()) {
                std::rethrow_exception(pump->error());
            }
        }

        return status;
    }

  private:
    pid_t pid_;
    UniqueFd cancel_read_;
    UniqueFd cancel_write_;
    std::unique_ptr<StreamPump> stdout_pump_;
    std::unique_ptr<StreamPump> stderr_pump_;
    std::thread waiter_;

    std::mutex mutex_;
    std::condition_variable cv_;
    int open_streams_{0};
    bool exited_{false};
    std::exception_ptr waiter_error_;
    bool reaped_{false};

    void wait_for_exit() noexcept {
        std::exception_ptr error;

        // WNOWAIT leaves the child as a zombie so its pid and process group stay
        // reserved until the calling thread reaps it
        siginfo_t info{};
        while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == -1) {
            if (errno == EINTR) {
                continue;
            }

            error = std::make_exception_ptr(std::runtime_error(std::format("waitid failed: {}", std::strerror(errno))));
            break;
        }

        {
            std::lock_guard lock(mutex_);
            exited_ = true;
            waiter_error_ = error;
        }
        cv_.notify_all();
    }

    void stream_finished() {
        {
            std::lock_guard lock(mutex_);
            --open_streams_;
        }
        cv_.notify_all();
    }

    void shut_down_streams() {
        cancel_pumps();

        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return open_streams_ == 0; });
    }

    void kill_group() noexcept {
        if (::kill(-pid_, SIGKILL) == -1 && errno == ESRCH) {
            (void)::kill(pid_, SIGKILL);
        }
    }

    void cancel_pumps() noexcept {
        if (!cancel_write_.valid()) {
            return;
        }

        const char signal_byte = 'x';
        while (::write(cancel_write_.get(), &signal_byte, 1) == -1 && errno == EINTR) {
        }
        cancel_write_.reset();
    }

    void join_all() {
        if (waiter_.joinable()) {
            waiter_.join();
        }

        for (auto *pump : {stdout_pump_.get(), stderr_pump_.get()}) {
            if (pump != nullptr) {
                pump->join();
            }
        }
    }
};

} // namespace

ProcessExecutor::ProcessExecutor(const PathResolver &path_resolver, const SpawnSyscalls *syscalls)
    : path_resolver_(path_resolver), syscalls_(syscalls != nullptr ? syscalls : &default_spawn_syscalls()) {}

std::expected<ExecutionResult, ExecError> ProcessExecutor::execute(const CommandSpec &spec, Capture capture) const {
    if (auto valid = validate(spec); !valid.has_value()) {
        return std::unexpected(valid.error());
    }

    const std::string program_path = path_resolver_.find_command_path(spec.executable);
    if (program_path.empty()) {
        return spawn_error(ENOENT, std::format("{}: command not found", spec.executable));
    }

    std::vector<std::string> argv_strings;
    argv_strings.reserve(spec.arguments.size() + 1);
    argv_strings.push_back(spec.executable);
    argv_strings.insert(argv_strings.end(), spec.arguments.begin(), spec.arguments.end());

    std::vector<std::string> envp_strings =
        to_envp_entries(resolve_environment(spec.environment, snapshot_environment(environ)));

    const auto argv = build_c_array(argv_strings);
    const auto envp = build_c_array(envp_strings);

    const bool capture_stdout = captures(capture, StreamKind::Stdout);
    const bool capture_stderr = captures(capture, StreamKind::Stderr);

    ChildStdio stdio(
        needs_pipe(spec.stdout_policy, capture_stdout), needs_pipe(spec.stderr_policy, capture_stderr), *syscalls_);
    if (!stdio.is_valid()) {
        return spawn_error(stdio.error_number(), stdio.error());
    }

    int exec_error_fds[2] = {-1, -1};
    if (syscalls_->pipe_fn(exec_error_fds) == -1) {
        return spawn_error(errno, std::format("pipe failed: {}", std::strerror(errno)));
    }
    UniqueFd exec_error_read(exec_error_fds[0]);
    UniqueFd exec_error_write(exec_error_fds[1]);

    int cancel_fds[2] = {-1, -1};
    if (syscalls_->pipe_fn(cancel_fds) == -1) {
        return spawn_error(errno, std::format("pipe failed: {}", std::strerror(errno)));
    }
    UniqueFd cancel_read(cancel_fds[0]);
    UniqueFd cancel_write(cancel_fds[1]);

    const pid_t pid = syscalls_->fork_fn();
    if (pid == -1) {
        return spawn_error(errno, std::format("fork failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        execute_in_child(program_path.c_str(), argv, envp, stdio, exec_error_write.get());
    }

    // the child makes the same call; whichever side runs first wins
    (void)::setpgid(pid, pid);

    stdio.close_child_ends();
    exec_error_write.reset();

    if (const int exec_errno = read_exec_error(exec_error_read.get()); exec_errno != 0) {
        (void)::kill(pid, SIGKILL);
        (void)wait_for_process(pid);
        return spawn_error(
            exec_errno, std::format("failed to execute '{}': {}", spec.executable, std::strerror(exec_errno)));
    }

    const std::optional<Clock::time_point> deadline = deadline_after(spec.timeout);

    StreamSink stdout_sink(StreamKind::Stdout, spec.stdout_policy, capture_stdout, default_passthrough_fd(StreamKind::Stdout));
    StreamSink stderr_sink(StreamKind::Stderr, spec.stderr_policy, capture_stderr, default_passthrough_fd(StreamKind::Stderr));

    Supervisor supervisor(pid, std::move(cancel_read), std::move(cancel_write));
    if (stdio.is_piped(StreamKind::Stdout)) {
        supervisor.attach(stdio.take_parent_end(StreamKind::Stdout), stdout_sink);
    }
    if (stdio.is_piped(StreamKind::Stderr)) {
        supervisor.attach(stdio.take_parent_end(StreamKind::Stderr), stderr_sink);
    }
    supervisor.start_waiter();

    const bool timed_out = supervisor.wait(deadline);
    const int status = supervisor.finish(&ProcessExecutor::wait_for_process);

    ExecutionResult result;
    if (timed_out) {
        result.exit_code = kSentinelExitCode;
        result.termination = Termination::TimedOut;
        result.signal = SIGKILL;
    } else {
        result.exit_code = wait_status_to_exit_code(status);
        if (WIFSIGNALED(status)) {
            result.termination = Termination::Signaled;
            result.signal = WTERMSIG(status);
        }
    }

    result.captured_stdout = stdout_sink.take_captured();
    result.captured_stderr = stderr_sink.take_captured();

    return result;
}

std::expected<void, ExecError> ProcessExecutor::validate(const CommandSpec &spec) {
    if (spec.executable.empty()) {
        return std::unexpected(to_exec_error(ParseError{"executable is empty"}));
    }

    if (spec.executable.find('\0') != std::string::npos) {
        return std::unexpected(to_exec_error(ParseError{"executable contains a NUL byte"}));
    }

    for (std::size_t i = 0; i < spec.arguments.size(); ++i) {
        if (spec.arguments[i].find('\0') != std::string::npos) {
            return std::unexpected(to_exec_error(ParseError{std::format("argument {} contains a NUL byte", i)}));
        }
    }

    if (auto valid = validate_environment(spec.environment); !valid.has_value()) {
        return std::unexpected(to_exec_error(valid.error()));
    }

    return {};
}

void ProcessExecutor::execute_in_child(
    const char *program_path,
    const std::vector<char *> &argv,
    const std::vector<char *> &envp,
    const ChildStdio &stdio,
    int exec_error_fd) noexcept {
    (void)::setpgid(0, 0);

    int error_number = 0;
    if (!stdio.apply_in_child()) {
        error_number = errno;
    } else {
        ::execve(program_path, argv.data(), envp.data());
        error_number = errno;
    }

    while (::write(exec_error_fd, &error_number, sizeof(error_number)) == -1 && errno == EINTR) {
    }
    _exit(127);
}

int ProcessExecutor::read_exec_error(int fd) noexcept {
    int error_number = 0;

    while (true) {
        const ssize_t bytes = ::read(fd, &error_number, sizeof(error_number));
        if (bytes == -1 && errno == EINTR) {
            continue;
        }

        if (bytes == -1) {
            return errno;
        }

        // EOF: the descriptor was closed by a successful exec
        return bytes == 0 ? 0 : error_number;
    }
}

int ProcessExecutor::wait_for_process(pid_t pid) {
    int status = 0;

    while (::waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw std::runtime_error("waitpid failed");
    }

    return status;
}

int ProcessExecutor::wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    return kSentinelExitCode;
}

} // namespace hardened
