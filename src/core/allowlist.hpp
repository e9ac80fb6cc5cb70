#pragma once

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "core/errors.hpp"

namespace hardened {

// Pre-flight check for shell-delegated command lines. Compares recorded top-level
// command names against the allowlist as plain text; no PATH, alias or function
// resolution happens. A missing allowlist or a missing command list accepts everything.
class CommandAllowlistGuard {
  public:
    CommandAllowlistGuard() = default;
    explicit CommandAllowlistGuard(std::vector<std::string> allowed);

    [[nodiscard]] bool enabled() const noexcept;
    [[nodiscard]] const std::optional<std::vector<std::string>> &allowed() const noexcept;

    [[nodiscard]] std::expected<void, ExecError>
    check(const std::optional<std::vector<std::string>> &top_level_commands) const;

  private:
    std::optional<std::vector<std::string>> allowed_;

    [[nodiscard]] bool permits(const std::string &command) const;
};

} // namespace hardened
