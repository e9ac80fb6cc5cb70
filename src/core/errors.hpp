#pragma once

#include <string>

namespace hardened {

struct ParseError {
    std::string message;
};

enum class ExecErrorKind {
    Parse,
    DisallowedCommand,
    SpawnFailed,
};

// Reported before a process exists (Parse, DisallowedCommand) or when the OS refused
// to create it (SpawnFailed). A child that runs and fails is never an ExecError.
struct ExecError {
    ExecErrorKind kind;
    std::string message;
    int error_number{0};
};

[[nodiscard]] inline ExecError to_exec_error(const ParseError &error) {
    return ExecError{.kind = ExecErrorKind::Parse, .message = error.message, .error_number = 0};
}

} // namespace hardened
