#include "app/session_state.hpp"

namespace hardened {

std::optional<LineMode> parse_line_mode(std::string_view text) {
    if (text == "safe") {
        return LineMode::Safe;
    }

    if (text == "shell") {
        return LineMode::Shell;
    }

    return std::nullopt;
}

std::string_view line_mode_name(LineMode mode) noexcept {
    switch (mode) {
    case LineMode::Safe:
        return "safe";
    case LineMode::Shell:
        return "shell";
    }

    return "safe";
}

} // namespace hardened
