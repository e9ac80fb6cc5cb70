#include "core/allowlist.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace hardened {

CommandAllowlistGuard::CommandAllowlistGuard(std::vector<std::string> allowed) : allowed_(std::move(allowed)) {}

bool CommandAllowlistGuard::enabled() const noexcept { return allowed_.has_value(); }

const std::optional<std::vector<std::string>> &CommandAllowlistGuard::allowed() const noexcept { return allowed_; }

std::expected<void, ExecError>
CommandAllowlistGuard::check(const std::optional<std::vector<std::string>> &top_level_commands) const {
    if (!allowed_.has_value() || !top_level_commands.has_value()) {
        return {};
    }

    for (const auto &command : *top_level_commands) {
        if (!permits(command)) {
            return std::unexpected(ExecError{
                .kind = ExecErrorKind::DisallowedCommand,
                .message = std::format("unexpected top-level command '{}'", command),
                .error_number = 0,
            });
        }
    }

    return {};
}

bool CommandAllowlistGuard::permits(const std::string &command) const {
    return std::find(allowed_->begin(), allowed_->end(), command) != allowed_->end();
}

} // namespace hardened
