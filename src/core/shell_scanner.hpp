#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "core/errors.hpp"

namespace hardened {

// Extracts the first word of every top-level pipeline or list segment of a shell
// command line. Segments are split on `;`, `&&`, `||`, `|`, `&` and newlines that
// appear outside quotes, subshells and substitutions.
//
// The scan is lexical only: aliases, functions, `$PATH` lookups and expansions are
// not resolved, and a group such as `(a; b)` is reported as one literal word.
class ShellScanner {
  public:
    [[nodiscard]] std::expected<std::vector<std::string>, ParseError>
    top_level_commands(std::string_view command_line) const;
};

} // namespace hardened
