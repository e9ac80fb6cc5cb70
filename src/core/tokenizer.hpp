#pragma once

#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/errors.hpp"

namespace hardened {

// Splits a command line into an argument vector with POSIX shell quoting rules,
// without ever invoking a shell. Operators such as `|` or `>` are ordinary characters.
class Tokenizer {
  public:
    [[nodiscard]] std::expected<std::vector<std::string>, ParseError> tokenize(std::string_view input) const;
};

// Quotes a single argument so that Tokenizer yields it back unchanged.
[[nodiscard]] std::string quote(std::string_view argument);

[[nodiscard]] std::string join(std::span<const std::string> arguments);

} // namespace hardened
