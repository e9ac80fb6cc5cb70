#include "app/exec_app.hpp"

#include <cstdlib>
#include <cstring>
#include <format>
#include <iostream>
#include <string>
#include <utility>

#include <readline/readline.h>

namespace hardened {

ExecApp::ExecApp(AppConfig config)
    : config_(std::move(config)),
      path_resolver_(),
      history_manager_(),
      directive_registry_(config_.session, path_resolver_, history_manager_),
      completion_engine_(directive_registry_, path_resolver_, config_.session),
      line_runner_(config_.session) {}

int ExecApp::run_once(std::string_view line) {
    if (DirectiveRegistry::is_directive_line(line)) {
        return directive_registry_.dispatch(line, std::cout, std::cerr);
    }

    return line_runner_.run(line, std::cerr);
}

int ExecApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    completion_engine_.install();
    history_manager_.initialize(config_.history_file);

    int last_status = 0;

    while (!directive_registry_.exit_requested()) {
        const std::string current_prompt = prompt();
        char *line = readline(current_prompt.c_str());
        if (line == nullptr) {
            std::cout << std::endl;
            break;
        }

        std::string input(line);
        std::free(line);

        if (input.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        history_manager_.record_input(input);
        last_status = run_once(input);
    }

    if (const int error = history_manager_.save(); error != 0) {
        std::cerr << std::format("hardened-exec: could not save history to {}: {}\n",
                                 history_manager_.file(),
                                 std::strerror(error));
    }

    return last_status;
}

std::string ExecApp::prompt() const { return std::format("[{}] $ ", line_mode_name(config_.session.mode)); }

} // namespace hardened
