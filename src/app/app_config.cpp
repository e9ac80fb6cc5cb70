#include "app/app_config.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <system_error>

namespace hardened {

namespace {

[[nodiscard]] std::string default_history_file() {
    if (const char *histfile = std::getenv("HISTFILE"); histfile != nullptr && *histfile != '\0') {
        return histfile;
    }

    const char *home = std::getenv("HOME");
    return std::string(home != nullptr ? home : "") + "/.hardened_exec_history";
}

[[nodiscard]] std::expected<void, ParseError> apply_mode(SessionState &session, std::string_view text) {
    const auto mode = parse_line_mode(text);
    if (!mode.has_value()) {
        return std::unexpected(ParseError{std::format("invalid mode '{}' (expected safe or shell)", text)});
    }

    session.mode = *mode;
    return {};
}

} // namespace

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> items;

    while (!text.empty()) {
        const auto comma = text.find(',');
        const auto item = text.substr(0, comma);
        if (!item.empty()) {
            items.emplace_back(item);
        }

        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }

    return items;
}

std::expected<std::chrono::milliseconds, ParseError> parse_timeout_ms(std::string_view text) {
    std::uint64_t value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);

    if (text.empty() || ec != std::errc{} || ptr != last) {
        return std::unexpected(ParseError{std::format("invalid timeout '{}' (expected milliseconds)", text)});
    }

    return timeout_from_ms(value);
}

std::expected<AppConfig, ParseError> load_config(std::span<const std::string> args) {
    AppConfig config;
    config.history_file = default_history_file();

    if (const char *mode = std::getenv("HARDENED_EXEC_MODE"); mode != nullptr && *mode != '\0') {
        if (auto applied = apply_mode(config.session, mode); !applied.has_value()) {
            return std::unexpected(applied.error());
        }
    }

    if (const char *allow = std::getenv("HARDENED_EXEC_ALLOW"); allow != nullptr && *allow != '\0') {
        config.session.allowlist = split_list(allow);
    }

    if (const char *timeout = std::getenv("HARDENED_EXEC_TIMEOUT_MS"); timeout != nullptr && *timeout != '\0') {
        auto parsed = parse_timeout_ms(timeout);
        if (!parsed.has_value()) {
            return std::unexpected(parsed.error());
        }
        config.session.timeout = *parsed;
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto &arg = args[i];

        const auto require_value = [&]() -> std::expected<std::string_view, ParseError> {
            if (i + 1 >= args.size()) {
                return std::unexpected(ParseError{std::format("{} requires a value", arg)});
            }
            return std::string_view(args[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "--shell") {
            config.session.mode = LineMode::Shell;
        } else if (arg == "--safe") {
            config.session.mode = LineMode::Safe;
        } else if (arg == "--allow") {
            auto value = require_value();
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            config.session.allowlist = split_list(*value);
        } else if (arg == "--timeout-ms") {
            auto value = require_value();
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            auto parsed = parse_timeout_ms(*value);
            if (!parsed.has_value()) {
                return std::unexpected(parsed.error());
            }
            config.session.timeout = *parsed;
        } else if (arg == "-c") {
            auto value = require_value();
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            config.one_shot_line = std::string(*value);
        } else {
            return std::unexpected(ParseError{std::format("unknown option '{}'", arg)});
        }
    }

    return config;
}

std::string usage() {
    return "usage: hardened-exec [--safe | --shell] [--allow name,...] [--timeout-ms N] [-c command-line]\n"
           "\n"
           "Without -c, reads command lines interactively. Directives:\n"
           "  :mode safe|shell     split lines in-process, or hand them to the login shell\n"
           "  :allow [name...]     restrict top-level commands (no names clears the list)\n"
           "  :timeout <ms>|off    kill commands that run longer than this\n"
           "  :env KEY=VALUE       pass an extra environment variable\n"
           "  :which <name>        show where a command resolves on PATH\n"
           "  :history [n]         show the last n history entries\n"
           "  :exit                leave\n";
}

} // namespace hardened
