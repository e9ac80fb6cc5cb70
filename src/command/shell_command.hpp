#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/allowlist.hpp"
#include "core/command_spec.hpp"
#include "core/errors.hpp"

namespace hardened {

// Builder for one subprocess invocation. The executable and argument vector are
// derived from one of three origins:
//   - executable(): the caller's strings are used literally;
//   - safe_from_string(): a command line split in-process, no shell involved;
//   - shell_from_string(): the line is handed to `<login shell> -c`, after its
//     top-level command names were recorded for auditing.
// A builder can be run any number of times; each run is independent.
class ShellCommand {
  public:
    [[nodiscard]] static std::expected<ShellCommand, ParseError> executable(std::string executable);
    [[nodiscard]] static std::expected<ShellCommand, ParseError>
    executable(std::string executable, std::vector<std::string> arguments);
    [[nodiscard]] static std::expected<ShellCommand, ParseError> safe_from_string(std::string_view command_line);
    [[nodiscard]] static std::expected<ShellCommand, ParseError> shell_from_string(std::string_view command_line);
    [[nodiscard]] static ShellCommand shell();

    ShellCommand &pass_arg(std::string argument);
    ShellCommand &pass_args(std::span<const std::string> arguments);
    // Appends `--key value`.
    ShellCommand &pass_flag(std::string_view key, std::string value);

    ShellCommand &pass_env(std::string key, std::string value);
    ShellCommand &pass_envs(const env::Map &values);
    ShellCommand &pass_env_only(env::Map values);
    ShellCommand &inherit_all_envs();
    ShellCommand &inherit_envs(std::span<const std::string> names);

    ShellCommand &passthrough_stdout();
    ShellCommand &passthrough_stderr();
    ShellCommand &passthrough_both();
    ShellCommand &ignore_stdout();
    ShellCommand &ignore_stderr();
    ShellCommand &ignore_both();
    ShellCommand &pipe_callback_stdout(ChunkCallback callback);
    ShellCommand &pipe_callback_stderr(ChunkCallback callback);
    ShellCommand &pipe_callback_both(const ChunkCallback &callback);
    ShellCommand &capture_stdout();
    ShellCommand &capture_stderr();
    ShellCommand &capture_both();

    ShellCommand &set_timeout(std::uint64_t seconds);
    ShellCommand &set_timeout_ms(std::uint64_t milliseconds);

    // Only consulted for shell-delegated commands.
    ShellCommand &allow_commands(std::vector<std::string> allowed);

    [[nodiscard]] const std::optional<std::vector<std::string>> &top_level_commands() const noexcept;
    [[nodiscard]] const CommandSpec &spec() const noexcept;

    [[nodiscard]] std::expected<ExecutionResult, ExecError> run(Capture capture = Capture::None) const;
    [[nodiscard]] std::expected<ExecutionResult, ExecError> run_capture() const;

  private:
    CommandSpec spec_;
    CommandAllowlistGuard guard_;

    explicit ShellCommand(CommandSpec spec);
};

// `$SHELL`, or /bin/sh when it is unset or empty.
[[nodiscard]] std::string login_shell();

// Runs `executable arguments...` without a shell and captures its output. Yields
// stdout when the exit code is 0, otherwise the exit code as a decimal string.
[[nodiscard]] std::expected<std::string, ExecError>
safe_exec(std::string executable, std::vector<std::string> arguments = {});

// Runs a command line through the login shell after checking every top-level
// command against `expected_commands` (when given). Same result convention as safe_exec.
[[nodiscard]] std::expected<std::string, ExecError>
shell_exec(std::string_view command_line, std::optional<std::vector<std::string>> expected_commands = std::nullopt);

} // namespace hardened
