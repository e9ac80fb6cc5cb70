#include "execution/child_stdio.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace hardened {

namespace {

int posix_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC); }

int posix_open(const char *path, int flags, unsigned int mode) { return ::open(path, flags | O_CLOEXEC, mode); }

pid_t posix_fork() { return ::fork(); }

const SpawnSyscalls default_syscalls{
    .pipe_fn = &posix_pipe,
    .open_fn = &posix_open,
    .fork_fn = &posix_fork,
};

[[nodiscard]] bool install_fd(int source, int target) noexcept {
    if (source == target) {
        // dup2 onto itself keeps FD_CLOEXEC, which would close it across exec
        const int flags = ::fcntl(target, F_GETFD);
        return flags != -1 && ::fcntl(target, F_SETFD, flags & ~FD_CLOEXEC) != -1;
    }

    while (::dup2(source, target) == -1) {
        if (errno != EINTR) {
            return false;
        }
    }

    return true;
}

} // namespace

const SpawnSyscalls &default_spawn_syscalls() noexcept { return default_syscalls; }

ChildStdio::ChildStdio(bool pipe_stdout, bool pipe_stderr, const SpawnSyscalls &syscalls) : syscalls_(syscalls) {
    const int null_fd = syscalls_.open_fn("/dev/null", O_RDWR, 0);
    if (null_fd == -1) {
        valid_ = false;
        error_number_ = errno;
        error_ = std::format("failed to open /dev/null: {}", std::strerror(error_number_));
        return;
    }
    null_fd_.reset(null_fd);

    if (pipe_stdout && !open_pipe(stdout_, "stdout")) {
        return;
    }

    if (pipe_stderr && !open_pipe(stderr_, "stderr")) {
        return;
    }
}

bool ChildStdio::is_valid() const noexcept { return valid_; }

const std::string &ChildStdio::error() const noexcept { return error_; }

int ChildStdio::error_number() const noexcept { return error_number_; }

bool ChildStdio::apply_in_child() const noexcept {
    const int stdout_target = stdout_.child_write.valid() ? stdout_.child_write.get() : null_fd_.get();
    const int stderr_target = stderr_.child_write.valid() ? stderr_.child_write.get() : null_fd_.get();

    return install_fd(null_fd_.get(), STDIN_FILENO) && install_fd(stdout_target, STDOUT_FILENO) &&
           install_fd(stderr_target, STDERR_FILENO);
}

void ChildStdio::close_child_ends() noexcept {
    stdout_.child_write.reset();
    stderr_.child_write.reset();
    null_fd_.reset();
}

bool ChildStdio::is_piped(StreamKind kind) const noexcept { return ends_for(kind).parent_read.valid(); }

UniqueFd ChildStdio::take_parent_end(StreamKind kind) noexcept { return std::move(ends_for(kind).parent_read); }

bool ChildStdio::open_pipe(StreamEnds &ends, const char *stream_name) {
    int fds[2] = {-1, -1};
    if (syscalls_.pipe_fn(fds) == -1) {
        valid_ = false;
        error_number_ = errno;
        error_ = std::format("pipe failed for {}: {}", stream_name, std::strerror(error_number_));
        return false;
    }

    ends.parent_read.reset(fds[0]);
    ends.child_write.reset(fds[1]);
    return true;
}

ChildStdio::StreamEnds &ChildStdio::ends_for(StreamKind kind) noexcept {
    return kind == StreamKind::Stdout ? stdout_ : stderr_;
}

const ChildStdio::StreamEnds &ChildStdio::ends_for(StreamKind kind) const noexcept {
    return kind == StreamKind::Stdout ? stdout_ : stderr_;
}

} // namespace hardened
