#pragma once

#include <iosfwd>
#include <string>

namespace hardened {

// Thin wrapper over the readline history list. Every line typed at the audit
// prompt is recorded, directives included, so a session can be replayed later.
class HistoryManager {
  public:
    static constexpr int kMaxEntries = 1000;

    void initialize(std::string history_file);
    // Returns the errno reported by readline, 0 on success.
    [[nodiscard]] int save() const;
    void record_input(const std::string &input) const;

    void print(std::ostream &out, int limit) const;

    [[nodiscard]] int size() const noexcept;
    [[nodiscard]] const std::string &file() const noexcept;

  private:
    std::string history_file_;
};

} // namespace hardened
