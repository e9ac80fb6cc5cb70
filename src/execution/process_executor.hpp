#pragma once

#include <expected>
#include <string>
#include <vector>

#include <sys/types.h>

#include "core/command_spec.hpp"
#include "core/errors.hpp"
#include "execution/child_stdio.hpp"

namespace hardened {

class PathResolver;

// Runs one CommandSpec to completion: spawns the child in its own process group,
// drains stdout and stderr on dedicated threads, waits for exit on a third, and
// enforces the timeout from the calling thread. Blocks until the child is reaped
// and both streams are drained.
class ProcessExecutor {
  public:
    explicit ProcessExecutor(const PathResolver &path_resolver, const SpawnSyscalls *syscalls = nullptr);

    [[nodiscard]] std::expected<ExecutionResult, ExecError> execute(const CommandSpec &spec, Capture capture) const;

  private:
    const PathResolver &path_resolver_;
    const SpawnSyscalls *syscalls_;

    [[nodiscard]] static std::expected<void, ExecError> validate(const CommandSpec &spec);

    [[noreturn]] static void execute_in_child(
        const char *program_path,
        const std::vector<char *> &argv,
        const std::vector<char *> &envp,
        const ChildStdio &stdio,
        int exec_error_fd) noexcept;

    [[nodiscard]] static int read_exec_error(int fd) noexcept;
    [[nodiscard]] static int wait_for_process(pid_t pid);
    [[nodiscard]] static int wait_status_to_exit_code(int status);
};

} // namespace hardened
