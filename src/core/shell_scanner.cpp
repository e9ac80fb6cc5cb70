#include "core/shell_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace hardened {

namespace {

class SegmentCollector {
  public:
    void append(char c) {
        word_.push_back(c);
        in_word_ = true;
    }

    [[nodiscard]] bool in_word() const noexcept { return in_word_; }

    [[nodiscard]] bool word_is_fd_number() const {
        return in_word_ && !word_quoted_ && !word_.empty() &&
               std::all_of(word_.begin(), word_.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    }

    void mark_quoted() noexcept {
        word_quoted_ = true;
        in_word_ = true;
    }

    void expect_redirection_target() noexcept { skip_next_word_ = true; }

    void discard_word() {
        word_.clear();
        in_word_ = false;
        word_quoted_ = false;
    }

    void finish_word() {
        if (!in_word_) {
            return;
        }

        if (skip_next_word_) {
            skip_next_word_ = false;
        } else if (!segment_has_command_) {
            commands_.push_back(word_);
            segment_has_command_ = true;
        }

        discard_word();
    }

    void finish_segment() {
        finish_word();
        segment_has_command_ = false;
        skip_next_word_ = false;
    }

    [[nodiscard]] std::vector<std::string> take() { return std::move(commands_); }

  private:
    std::vector<std::string> commands_;
    std::string word_;
    bool in_word_{false};
    bool word_quoted_{false};
    bool segment_has_command_{false};
    bool skip_next_word_{false};
};

[[nodiscard]] bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r'; }

} // namespace

std::expected<std::vector<std::string>, ParseError>
ShellScanner::top_level_commands(std::string_view command_line) const {
    if (command_line.find('\0') != std::string_view::npos) {
        return std::unexpected(ParseError{"command line contains a NUL byte"});
    }

    if (std::all_of(command_line.begin(), command_line.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c));
        })) {
        return std::unexpected(ParseError{"command line is empty"});
    }

    SegmentCollector collector;
    // closing characters of the groups currently open: ')' '}' '`' '"'
    std::vector<char> closers;

    const std::size_t size = command_line.size();
    char previous = '\0';

    for (std::size_t i = 0; i < size; ++i) {
        const char current = command_line[i];
        const char next = i + 1 < size ? command_line[i + 1] : '\0';
        const bool top_level = closers.empty();
        const bool in_double_quotes = !closers.empty() && closers.back() == '"';

        if (current == '\\') {
            if (i + 1 >= size) {
                return std::unexpected(ParseError{"command line ends with a dangling escape"});
            }

            if (top_level) {
                if (next != '\n') {
                    collector.append(next);
                    collector.mark_quoted();
                }
            } else if (closers.size() == 1 && in_double_quotes &&
                       (next == '\\' || next == '"' || next == '$' || next == '`')) {
                collector.append(next);
            } else {
                collector.append(current);
                collector.append(next);
            }

            previous = next;
            ++i;
            continue;
        }

        if (in_double_quotes) {
            if (current == '"') {
                closers.pop_back();
                if (!closers.empty()) {
                    collector.append(current);
                }
            } else if (current == '$' && (next == '(' || next == '{')) {
                collector.append(current);
                collector.append(next);
                closers.push_back(next == '(' ? ')' : '}');
                ++i;
            } else if (current == '`') {
                collector.append(current);
                closers.push_back('`');
            } else {
                collector.append(current);
            }

            previous = current;
            continue;
        }

        if (current == '\'') {
            const std::size_t end = command_line.find('\'', i + 1);
            if (end == std::string_view::npos) {
                return std::unexpected(ParseError{"command line has an unterminated quote"});
            }

            if (top_level) {
                for (std::size_t j = i + 1; j < end; ++j) {
                    collector.append(command_line[j]);
                }
                collector.mark_quoted();
            } else {
                for (std::size_t j = i; j <= end; ++j) {
                    collector.append(command_line[j]);
                }
            }

            previous = '\'';
            i = end;
            continue;
        }

        if (current == '"') {
            if (top_level) {
                collector.mark_quoted();
            } else {
                collector.append(current);
            }
            closers.push_back('"');
            previous = current;
            continue;
        }

        if (current == '$' && (next == '(' || next == '{')) {
            collector.append(current);
            collector.append(next);
            closers.push_back(next == '(' ? ')' : '}');
            previous = next;
            ++i;
            continue;
        }

        if (current == '`') {
            collector.append(current);
            if (!closers.empty() && closers.back() == '`') {
                closers.pop_back();
            } else {
                closers.push_back('`');
            }
            previous = current;
            continue;
        }

        if (current == '(') {
            collector.append(current);
            closers.push_back(')');
            previous = current;
            continue;
        }

        // a `)` with no opener is ordinary text, as in `case` patterns
        if (current == ')' || current == '}') {
            if (!closers.empty() && closers.back() == current) {
                closers.pop_back();
            }
            collector.append(current);
            previous = current;
            continue;
        }

        if (!top_level) {
            collector.append(current);
            previous = current;
            continue;
        }

        if (current == '#' && !collector.in_word()) {
            while (i + 1 < size && command_line[i + 1] != '\n') {
                ++i;
            }
            previous = '\0';
            continue;
        }

        if (is_blank(current)) {
            collector.finish_word();
            previous = current;
            continue;
        }

        if (current == '\n' || current == ';') {
            collector.finish_segment();
            previous = current;
            continue;
        }

        const bool redirect_ampersand = current == '&' && (next == '>' || previous == '>' || previous == '<');
        const bool redirect_pipe = current == '|' && previous == '>';

        if (current == '>' || current == '<' || redirect_ampersand || redirect_pipe) {
            if (collector.word_is_fd_number()) {
                collector.discard_word();
            } else if (current != '&' && current != '|') {
                collector.finish_word();
            }

            // `>&2` style duplications carry their target inline
            if (!(redirect_ampersand && (previous == '>' || previous == '<'))) {
                collector.expect_redirection_target();
            }

            previous = current;
            continue;
        }

        if (current == '&' || current == '|') {
            if (next == current || (current == '|' && next == '&')) {
                ++i;
            }
            collector.finish_segment();
            previous = '\0';
            continue;
        }

        collector.append(current);
        previous = current;
    }

    if (!closers.empty()) {
        return std::unexpected(ParseError{closers.back() == '"' ? "command line has an unterminated quote"
                                                                 : "command line has an unterminated group"});
    }

    collector.finish_segment();

    auto commands = collector.take();
    if (commands.empty()) {
        return std::unexpected(ParseError{"command line has no commands"});
    }

    return commands;
}

} // namespace hardened
