#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace hardened {

class PathResolver {
  public:
    // Resolves a command the way execvp does: names containing a slash are returned
    // unchanged, bare names are looked up in the parent's PATH. Empty when not found.
    [[nodiscard]] std::string find_command_path(std::string_view command) const;
    [[nodiscard]] std::set<std::string> executable_candidates(std::string_view prefix) const;

  private:
    void scan_path_directories(const std::function<bool(const std::string &dir)> &callback) const;
};

} // namespace hardened
