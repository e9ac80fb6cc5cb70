#pragma once

#include <functional>
#include <iosfwd>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hardened {

class HistoryManager;
class PathResolver;
struct SessionState;

// Colon-prefixed commands that change the audit shell itself instead of spawning
// anything (`:mode shell`, `:timeout 500`, ...).
class DirectiveRegistry {
  public:
    using DirectiveFunc = std::function<int(const std::vector<std::string> &, std::ostream &, std::ostream &)>;

    DirectiveRegistry(SessionState &session, const PathResolver &path_resolver, HistoryManager &history_manager);

    [[nodiscard]] static bool is_directive_line(std::string_view line);

    [[nodiscard]] bool is_directive(std::string_view name) const;
    int execute(std::string_view name, const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    // Tokenizes a `:name args...` line and runs it.
    int dispatch(std::string_view line, std::ostream &out, std::ostream &err);

    [[nodiscard]] std::set<std::string> names() const;
    [[nodiscard]] bool exit_requested() const noexcept;

  private:
    SessionState &session_;
    const PathResolver &path_resolver_;
    HistoryManager &history_manager_;
    bool exit_requested_{false};
    std::unordered_map<std::string, DirectiveFunc> registry_;

    void register_directives();

    int directive_mode(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int directive_allow(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int directive_timeout(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int directive_env(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int directive_which(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int directive_history(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int directive_exit(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
};

} // namespace hardened
