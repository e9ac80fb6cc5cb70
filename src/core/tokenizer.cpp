#include "core/tokenizer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace hardened {

namespace {

[[nodiscard]] bool escapable_in_double_quotes(char c) {
    return c == '\\' || c == '"' || c == '$' || c == '`' || c == '\n';
}

[[nodiscard]] bool needs_quoting(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return false;
    }

    switch (c) {
    case '_':
    case '-':
    case '.':
    case '/':
    case ',':
    case ':':
    case '=':
    case '+':
    case '@':
    case '%':
        return false;
    default:
        return true;
    }
}

} // namespace

std::expected<std::vector<std::string>, ParseError> Tokenizer::tokenize(std::string_view input) const {
    if (input.find('\0') != std::string_view::npos) {
        return std::unexpected(ParseError{"command line contains a NUL byte"});
    }

    std::vector<std::string> tokens;
    std::string token;
    bool in_token = false;

    bool single_quoted = false;
    bool double_quoted = false;
    bool escaped = false;

    auto flush_token = [&]() {
        if (in_token) {
            tokens.push_back(std::move(token));
            token.clear();
            in_token = false;
        }
    };

    for (std::size_t i = 0; i < input.size(); ++i) {
        const char current = input[i];

        if (escaped) {
            escaped = false;

            // backslash-newline is a line continuation in both contexts
            if (current == '\n') {
                continue;
            }

            if (double_quoted && !escapable_in_double_quotes(current)) {
                token.push_back('\\');
            }
            token.push_back(current);
            continue;
        }

        if (single_quoted) {
            if (current == '\'') {
                single_quoted = false;
            } else {
                token.push_back(current);
            }
            continue;
        }

        if (current == '\\') {
            escaped = true;
            in_token = true;
            continue;
        }

        if (double_quoted) {
            if (current == '"') {
                double_quoted = false;
            } else {
                token.push_back(current);
            }
            continue;
        }

        if (current == '\'') {
            single_quoted = true;
            in_token = true;
            continue;
        }

        if (current == '"') {
            double_quoted = true;
            in_token = true;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(current))) {
            flush_token();
            continue;
        }

        if (current == '#' && !in_token) {
            while (i + 1 < input.size() && input[i + 1] != '\n') {
                ++i;
            }
            continue;
        }

        token.push_back(current);
        in_token = true;
    }

    if (escaped) {
        return std::unexpected(ParseError{"command line ends with a dangling escape"});
    }

    if (single_quoted || double_quoted) {
        return std::unexpected(ParseError{"command line has an unterminated quote"});
    }

    flush_token();

    if (tokens.empty()) {
        return std::unexpected(ParseError{"command line is empty"});
    }

    return tokens;
}

std::string quote(std::string_view argument) {
    if (argument.empty()) {
        return "''";
    }

    bool plain = true;
    for (const char c : argument) {
        if (needs_quoting(c)) {
            plain = false;
            break;
        }
    }

    if (plain) {
        return std::string(argument);
    }

    std::string quoted;
    quoted.reserve(argument.size() + 2);
    quoted.push_back('\'');
    for (const char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');

    return quoted;
}

std::string join(std::span<const std::string> arguments) {
    std::string line;

    for (std::size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) {
            line.push_back(' ');
        }

        line += quote(arguments[i]);
    }

    return line;
}

} // namespace hardened
