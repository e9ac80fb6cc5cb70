#pragma once

#include <expected>
#include <iosfwd>
#include <string_view>

#include "command/shell_command.hpp"

namespace hardened {

struct SessionState;

// Exit statuses used when a line never produced a child exit code.
inline constexpr int kStatusTimedOut = 124;
inline constexpr int kStatusEngineError = 125;
inline constexpr int kStatusDisallowed = 126;
inline constexpr int kStatusNotFound = 127;
inline constexpr int kStatusSignalBase = 128;

// Turns one input line into a ShellCommand according to the session settings, echoes
// what is about to run, executes it with both streams passed through and reports the
// outcome on `err`.
class LineRunner {
  public:
    explicit LineRunner(const SessionState &session);

    [[nodiscard]] std::expected<ShellCommand, ExecError> prepare(std::string_view line) const;
    int run(std::string_view line, std::ostream &err) const;

  private:
    const SessionState &session_;

    void audit(const ShellCommand &command, std::ostream &err) const;
};

[[nodiscard]] int status_for(const ExecError &error) noexcept;
[[nodiscard]] int status_for(const ExecutionResult &result) noexcept;

} // namespace hardened
