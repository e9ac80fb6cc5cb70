#include "line_editing/completion.hpp"

#include <algorithm>
#include <cstring>
#include <set>
#include <string>
#include <vector>

#include <readline/readline.h>

#include "app/session_state.hpp"
#include "core/path_resolver.hpp"
#include "directives/directive_registry.hpp"

namespace hardened {

namespace {

const CompletionEngine *active_engine = nullptr;

// snapshot taken when readline asks for the first candidate (state 0)
std::vector<std::string> pending_matches;

char *next_match(const char * /*text*/, int state) {
    static std::size_t next_index = 0;
    if (state == 0) {
        next_index = 0;
    }

    if (next_index >= pending_matches.size()) {
        return nullptr;
    }

    // readline frees every string it is handed
    return ::strdup(pending_matches[next_index++].c_str());
}

char **complete_first_word(const char *text, int start, int /*end*/) {
    // never fall back to readline's filename completion
    rl_attempted_completion_over = 1;

    if (active_engine == nullptr || start != 0) {
        return nullptr;
    }

    const auto matches = active_engine->collect_matches(text);
    pending_matches.assign(matches.begin(), matches.end());
    return rl_completion_matches(text, next_match);
}

} // namespace

CompletionEngine::CompletionEngine(const DirectiveRegistry &directive_registry,
                                   const PathResolver &path_resolver,
                                   const SessionState &session)
    : directive_registry_(directive_registry), path_resolver_(path_resolver), session_(session) {}

CompletionEngine::~CompletionEngine() {
    if (active_engine == this) {
        active_engine = nullptr;
        rl_attempted_completion_function = nullptr;
        pending_matches.clear();
    }
}

void CompletionEngine::install() const {
    active_engine = this;
    rl_attempted_completion_function = complete_first_word;
}

std::set<std::string> CompletionEngine::collect_matches(const std::string &prefix) const {
    std::set<std::string> matches;

    if (prefix.starts_with(':')) {
        for (const auto &name : directive_registry_.names()) {
            if (name.starts_with(prefix)) {
                matches.insert(name);
            }
        }
        return matches;
    }

    matches = path_resolver_.executable_candidates(prefix);

    if (session_.allowlist.has_value()) {
        const auto &allowed = *session_.allowlist;
        std::erase_if(matches, [&allowed](const std::string &candidate) {
            return std::find(allowed.begin(), allowed.end(), candidate) == allowed.end();
        });
    }

    return matches;
}

} // namespace hardened
