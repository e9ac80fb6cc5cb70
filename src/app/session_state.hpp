#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/command_spec.hpp"

namespace hardened {

enum class LineMode {
    Safe,
    Shell,
};

[[nodiscard]] std::optional<LineMode> parse_line_mode(std::string_view text);
[[nodiscard]] std::string_view line_mode_name(LineMode mode) noexcept;

// Settings the audit shell applies to every line it runs.
struct SessionState {
    LineMode mode{LineMode::Safe};
    std::optional<std::vector<std::string>> allowlist;
    std::optional<std::chrono::milliseconds> timeout;
    env::Map environment;
};

} // namespace hardened
