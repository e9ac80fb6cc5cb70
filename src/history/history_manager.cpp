#include "history/history_manager.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <ostream>
#include <utility>

#include <readline/history.h>

namespace hardened {

void HistoryManager::initialize(std::string history_file) {
    using_history();
    stifle_history(kMaxEntries);

    history_file_ = std::move(history_file);
    if (!history_file_.empty()) {
        // a missing file just means an empty history
        read_history(history_file_.c_str());
    }
}

int HistoryManager::save() const {
    if (history_file_.empty()) {
        return 0;
    }

    return write_history(history_file_.c_str());
}

void HistoryManager::record_input(const std::string &input) const {
    if (input.find_first_not_of(" \t") == std::string::npos) {
        return;
    }

    if (history_length > 0) {
        const HIST_ENTRY *last_entry = history_get(history_base + history_length - 1);
        if (last_entry != nullptr && std::strcmp(input.c_str(), last_entry->line) == 0) {
            return;
        }
    }

    add_history(input.c_str());
}

void HistoryManager::print(std::ostream &out, int limit) const {
    const int count = std::clamp(limit, 0, history_length);

    for (int offset = history_length - count; offset < history_length; ++offset) {
        const HIST_ENTRY *entry = history_get(history_base + offset);
        if (entry != nullptr) {
            out << std::format("{:>5}  {}\n", offset + 1, entry->line);
        }
    }
}

int HistoryManager::size() const noexcept { return history_length; }

const std::string &HistoryManager::file() const noexcept { return history_file_; }

} // namespace hardened
