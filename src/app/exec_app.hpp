#pragma once

#include <string>
#include <string_view>

#include "app/app_config.hpp"
#include "app/line_runner.hpp"
#include "app/session_state.hpp"
#include "core/path_resolver.hpp"
#include "directives/directive_registry.hpp"
#include "history/history_manager.hpp"
#include "line_editing/completion.hpp"

namespace hardened {

class ExecApp {
  public:
    explicit ExecApp(AppConfig config);

    int run();
    int run_once(std::string_view line);

  private:
    AppConfig config_;
    PathResolver path_resolver_;
    HistoryManager history_manager_;
    DirectiveRegistry directive_registry_;
    CompletionEngine completion_engine_;
    LineRunner line_runner_;

    [[nodiscard]] std::string prompt() const;
};

} // namespace hardened
