#pragma once

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "app/session_state.hpp"
#include "core/errors.hpp"

namespace hardened {

struct AppConfig {
    SessionState session;
    std::optional<std::string> one_shot_line;
    std::string history_file;
    bool show_help{false};
};

// Reads HARDENED_EXEC_MODE, HARDENED_EXEC_ALLOW, HARDENED_EXEC_TIMEOUT_MS, HISTFILE and
// HOME, then applies the command-line flags on top.
[[nodiscard]] std::expected<AppConfig, ParseError> load_config(std::span<const std::string> args);

[[nodiscard]] std::vector<std::string> split_list(std::string_view text);
[[nodiscard]] std::expected<std::chrono::milliseconds, ParseError> parse_timeout_ms(std::string_view text);

[[nodiscard]] std::string usage();

} // namespace hardened
