#pragma once

#include <string>
#include <sys/types.h>

#include "core/command_spec.hpp"
#include "execution/file_descriptor.hpp"

namespace hardened {

// Seams over the calls that create a child and its plumbing, so OS refusal can be
// simulated. Every descriptor the defaults create is close-on-exec.
struct SpawnSyscalls {
    int (*pipe_fn)(int fds[2]);
    int (*open_fn)(const char *path, int flags, unsigned int mode);
    pid_t (*fork_fn)();
};

[[nodiscard]] const SpawnSyscalls &default_spawn_syscalls() noexcept;

// Descriptors the child receives as stdin/stdout/stderr. stdin is always /dev/null;
// an output stream is either a pipe whose read end stays with the parent, or
// /dev/null when nothing will ever read it.
class ChildStdio {
  public:
    ChildStdio(bool pipe_stdout, bool pipe_stderr, const SpawnSyscalls &syscalls);

    ChildStdio(const ChildStdio &) = delete;
    ChildStdio &operator=(const ChildStdio &) = delete;

    [[nodiscard]] bool is_valid() const noexcept;
    [[nodiscard]] const std::string &error() const noexcept;
    [[nodiscard]] int error_number() const noexcept;

    // Runs in the forked child; only async-signal-safe calls.
    [[nodiscard]] bool apply_in_child() const noexcept;

    void close_child_ends() noexcept;
    [[nodiscard]] bool is_piped(StreamKind kind) const noexcept;
    [[nodiscard]] UniqueFd take_parent_end(StreamKind kind) noexcept;

  private:
    struct StreamEnds {
        UniqueFd parent_read;
        UniqueFd child_write;
    };

    const SpawnSyscalls &syscalls_;
    UniqueFd null_fd_;
    StreamEnds stdout_;
    StreamEnds stderr_;
    bool valid_{true};
    std::string error_;
    int error_number_{0};

    [[nodiscard]] bool open_pipe(StreamEnds &ends, const char *stream_name);
    [[nodiscard]] StreamEnds &ends_for(StreamKind kind) noexcept;
    [[nodiscard]] const StreamEnds &ends_for(StreamKind kind) const noexcept;
};

} // namespace hardened
