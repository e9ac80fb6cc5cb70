#include "command/shell_command.hpp"

#include <chrono>
#include <cstdlib>
#include <format>
#include <iterator>
#include <string>
#include <utility>

#include "core/environment.hpp"
#include "core/path_resolver.hpp"
#include "core/shell_scanner.hpp"
#include "core/tokenizer.hpp"
#include "execution/process_executor.hpp"

namespace hardened {

namespace {

[[nodiscard]] std::expected<void, ParseError> reject_nul(std::string_view text, std::string_view what) {
    if (text.find('\0') != std::string_view::npos) {
        return std::unexpected(ParseError{std::format("{} contains a NUL byte", what)});
    }

    return {};
}

[[nodiscard]] std::expected<std::string, ExecError> output_or_exit_code(std::expected<ExecutionResult, ExecError> run) {
    if (!run.has_value()) {
        return std::unexpected(std::move(run.error()));
    }

    if (run->exit_code != 0) {
        return std::to_string(run->exit_code);
    }

    return run->captured_stdout.value_or(std::string{});
}

} // namespace

ShellCommand::ShellCommand(CommandSpec spec) : spec_(std::move(spec)) {}

std::expected<ShellCommand, ParseError> ShellCommand::executable(std::string executable) {
    return ShellCommand::executable(std::move(executable), {});
}

std::expected<ShellCommand, ParseError>
ShellCommand::executable(std::string executable, std::vector<std::string> arguments) {
    if (executable.empty()) {
        return std::unexpected(ParseError{"executable is empty"});
    }

    if (auto valid = reject_nul(executable, "executable"); !valid.has_value()) {
        return std::unexpected(valid.error());
    }

    for (const auto &argument : arguments) {
        if (auto valid = reject_nul(argument, "argument"); !valid.has_value()) {
            return std::unexpected(valid.error());
        }
    }

    CommandSpec spec;
    spec.executable = std::move(executable);
    spec.arguments = std::move(arguments);
    spec.origin = CommandOrigin::Explicit;

    return ShellCommand(std::move(spec));
}

std::expected<ShellCommand, ParseError> ShellCommand::safe_from_string(std::string_view command_line) {
    auto tokens = Tokenizer{}.tokenize(command_line);
    if (!tokens.has_value()) {
        return std::unexpected(tokens.error());
    }

    CommandSpec spec;
    spec.executable = std::move(tokens->front());
    spec.arguments.assign(std::make_move_iterator(tokens->begin() + 1), std::make_move_iterator(tokens->end()));
    spec.origin = CommandOrigin::SafeSplit;

    return ShellCommand(std::move(spec));
}

std::expected<ShellCommand, ParseError> ShellCommand::shell_from_string(std::string_view command_line) {
    auto commands = ShellScanner{}.top_level_commands(command_line);
    if (!commands.has_value()) {
        return std::unexpected(commands.error());
    }

    CommandSpec spec;
    spec.executable = login_shell();
    spec.arguments = {"-c", std::string(command_line)};
    spec.origin = CommandOrigin::ShellDelegated;
    spec.top_level_commands = std::move(*commands);

    return ShellCommand(std::move(spec));
}

ShellCommand ShellCommand::shell() {
    CommandSpec spec;
    spec.executable = login_shell();
    spec.origin = CommandOrigin::Explicit;

    return ShellCommand(std::move(spec));
}

ShellCommand &ShellCommand::pass_arg(std::string argument) {
    spec_.arguments.push_back(std::move(argument));
    return *this;
}

ShellCommand &ShellCommand::pass_args(std::span<const std::string> arguments) {
    spec_.arguments.insert(spec_.arguments.end(), arguments.begin(), arguments.end());
    return *this;
}

ShellCommand &ShellCommand::pass_flag(std::string_view key, std::string value) {
    spec_.arguments.push_back(std::format("--{}", key));
    spec_.arguments.push_back(std::move(value));
    return *this;
}

ShellCommand &ShellCommand::pass_env(std::string key, std::string value) {
    add_environment_override(spec_.environment, std::move(key), std::move(value));
    return *this;
}

ShellCommand &ShellCommand::pass_envs(const env::Map &values) {
    for (const auto &[key, value] : values) {
        add_environment_override(spec_.environment, key, value);
    }
    return *this;
}

ShellCommand &ShellCommand::pass_env_only(env::Map values) {
    spec_.environment = env::ReplaceOnly{.values = std::move(values)};
    return *this;
}

ShellCommand &ShellCommand::inherit_all_envs() {
    spec_.environment = env::InheritAll{};
    return *this;
}

ShellCommand &ShellCommand::inherit_envs(std::span<const std::string> names) {
    spec_.environment = env::InheritNamed{.names = {names.begin(), names.end()}, .overrides = {}};
    return *this;
}

ShellCommand &ShellCommand::passthrough_stdout() {
    spec_.stdout_policy = stream::Passthrough{};
    return *this;
}

ShellCommand &ShellCommand::passthrough_stderr() {
    spec_.stderr_policy = stream::Passthrough{};
    return *this;
}

ShellCommand &ShellCommand::passthrough_both() { return passthrough_stdout().passthrough_stderr(); }

ShellCommand &ShellCommand::ignore_stdout() {
    spec_.stdout_policy = stream::Discard{};
    return *this;
}

ShellCommand &ShellCommand::ignore_stderr() {
    spec_.stderr_policy = stream::Discard{};
    return *this;
}

ShellCommand &ShellCommand::ignore_both() { return ignore_stdout().ignore_stderr(); }

ShellCommand &ShellCommand::pipe_callback_stdout(ChunkCallback callback) {
    spec_.stdout_policy = stream::Callback{.callback = std::move(callback)};
    return *this;
}

ShellCommand &ShellCommand::pipe_callback_stderr(ChunkCallback callback) {
    spec_.stderr_policy = stream::Callback{.callback = std::move(callback)};
    return *this;
}

ShellCommand &ShellCommand::pipe_callback_both(const ChunkCallback &callback) {
    return pipe_callback_stdout(callback).pipe_callback_stderr(callback);
}

ShellCommand &ShellCommand::capture_stdout() {
    spec_.stdout_policy = stream::Capture{};
    return *this;
}

ShellCommand &ShellCommand::capture_stderr() {
    spec_.stderr_policy = stream::Capture{};
    return *this;
}

ShellCommand &ShellCommand::capture_both() { return capture_stdout().capture_stderr(); }

ShellCommand &ShellCommand::set_timeout(std::uint64_t seconds) {
    spec_.timeout = timeout_from_seconds(seconds);
    return *this;
}

ShellCommand &ShellCommand::set_timeout_ms(std::uint64_t milliseconds) {
    spec_.timeout = timeout_from_ms(milliseconds);
    return *this;
}

ShellCommand &ShellCommand::allow_commands(std::vector<std::string> allowed) {
    guard_ = CommandAllowlistGuard(std::move(allowed));
    return *this;
}

const std::optional<std::vector<std::string>> &ShellCommand::top_level_commands() const noexcept {
    return spec_.top_level_commands;
}

const CommandSpec &ShellCommand::spec() const noexcept { return spec_; }

std::expected<ExecutionResult, ExecError> ShellCommand::run(Capture capture) const {
    if (auto allowed = guard_.check(spec_.top_level_commands); !allowed.has_value()) {
        return std::unexpected(allowed.error());
    }

    const PathResolver path_resolver{};
    const ProcessExecutor executor(path_resolver);

    return executor.execute(spec_, capture);
}

std::expected<ExecutionResult, ExecError> ShellCommand::run_capture() const { return run(Capture::Both); }

std::string login_shell() {
    const char *shell = std::getenv("SHELL");
    if (shell == nullptr || *shell == '\0') {
        return "/bin/sh";
    }

    return shell;
}

std::expected<std::string, ExecError> safe_exec(std::string executable, std::vector<std::string> arguments) {
    auto command = ShellCommand::executable(std::move(executable), std::move(arguments));
    if (!command.has_value()) {
        return std::unexpected(to_exec_error(command.error()));
    }

    return output_or_exit_code(command->run_capture());
}

std::expected<std::string, ExecError>
shell_exec(std::string_view command_line, std::optional<std::vector<std::string>> expected_commands) {
    auto command = ShellCommand::shell_from_string(command_line);
    if (!command.has_value()) {
        return std::unexpected(to_exec_error(command.error()));
    }

    if (expected_commands.has_value()) {
        command->allow_commands(std::move(*expected_commands));
    }

    return output_or_exit_code(command->run_capture());
}

} // namespace hardened
