#include "app/line_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <format>
#include <ostream>
#include <string>
#include <vector>

#include "app/session_state.hpp"
#include "core/tokenizer.hpp"

namespace hardened {

LineRunner::LineRunner(const SessionState &session) : session_(session) {}

std::expected<ShellCommand, ExecError> LineRunner::prepare(std::string_view line) const {
    auto command = session_.mode == LineMode::Shell ? ShellCommand::shell_from_string(line)
                                                    : ShellCommand::safe_from_string(line);
    if (!command.has_value()) {
        return std::unexpected(to_exec_error(command.error()));
    }

    if (session_.allowlist.has_value()) {
        if (session_.mode == LineMode::Shell) {
            command->allow_commands(*session_.allowlist);
        } else {
            // no shell involved, so the executable itself is the only top-level command
            const CommandAllowlistGuard guard(*session_.allowlist);
            const std::vector<std::string> executable{command->spec().executable};
            if (auto allowed = guard.check(executable); !allowed.has_value()) {
                return std::unexpected(allowed.error());
            }
        }
    }

    if (!session_.environment.empty()) {
        command->pass_envs(session_.environment);
    }

    if (session_.timeout.has_value()) {
        command->set_timeout_ms(static_cast<std::uint64_t>(session_.timeout->count()));
    }

    command->passthrough_both();
    return std::move(*command);
}

int LineRunner::run(std::string_view line, std::ostream &err) const {
    auto command = prepare(line);
    if (!command.has_value()) {
        err << std::format("hardened-exec: {}\n", command.error().message);
        return status_for(command.error());
    }

    audit(*command, err);

    auto result = command->run();
    if (!result.has_value()) {
        err << std::format("hardened-exec: {}\n", result.error().message);
        return status_for(result.error());
    }

    switch (result->termination) {
    case Termination::TimedOut:
        err << std::format("[timed out after {} ms]\n", session_.timeout.value_or(std::chrono::milliseconds{0}).count());
        break;
    case Termination::Signaled:
        err << std::format("[killed by signal {}]\n", result->signal);
        break;
    case Termination::Exited:
        if (result->exit_code != 0) {
            err << std::format("[exit {}]\n", result->exit_code);
        }
        break;
    }

    return status_for(*result);
}

void LineRunner::audit(const ShellCommand &command, std::ostream &err) const {
    const auto &spec = command.spec();

    if (spec.top_level_commands.has_value()) {
        std::string names;
        for (const auto &name : *spec.top_level_commands) {
            if (!names.empty()) {
                names += ", ";
            }
            names += name;
        }
        err << std::format("[audit] shell: {}\n", names);
        return;
    }

    std::vector<std::string> argv{spec.executable};
    argv.insert(argv.end(), spec.arguments.begin(), spec.arguments.end());
    err << std::format("[audit] exec: {}\n", join(argv));
}

int status_for(const ExecError &error) noexcept {
    switch (error.kind) {
    case ExecErrorKind::DisallowedCommand:
        return kStatusDisallowed;
    case ExecErrorKind::SpawnFailed:
        return error.error_number == ENOENT ? kStatusNotFound : kStatusEngineError;
    case ExecErrorKind::Parse:
        return kStatusEngineError;
    }

    return kStatusEngineError;
}

int status_for(const ExecutionResult &result) noexcept {
    switch (result.termination) {
    case Termination::TimedOut:
        return kStatusTimedOut;
    case Termination::Signaled:
        return kStatusSignalBase + result.signal;
    case Termination::Exited:
        return result.exit_code;
    }

    return kStatusEngineError;
}

} // namespace hardened
