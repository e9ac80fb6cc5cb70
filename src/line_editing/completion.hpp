#pragma once

#include <set>
#include <string>

namespace hardened {

class DirectiveRegistry;
class PathResolver;
struct SessionState;

// Completes the first word of a line: directive names when it starts with `:`,
// otherwise executables found on PATH (narrowed to the allowlist when one is active).
// readline holds a single completion hook, so only the last installed engine answers.
class CompletionEngine {
  public:
    CompletionEngine(const DirectiveRegistry &directive_registry,
                     const PathResolver &path_resolver,
                     const SessionState &session);
    ~CompletionEngine();

    CompletionEngine(const CompletionEngine &) = delete;
    CompletionEngine &operator=(const CompletionEngine &) = delete;

    void install() const;

    [[nodiscard]] std::set<std::string> collect_matches(const std::string &prefix) const;

  private:
    const DirectiveRegistry &directive_registry_;
    const PathResolver &path_resolver_;
    const SessionState &session_;
};

} // namespace hardened
