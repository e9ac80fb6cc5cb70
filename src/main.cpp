#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "app/exec_app.hpp"
#include "app/line_runner.hpp"

int main(int argc, char **argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    auto config = hardened::load_config(args);
    if (!config.has_value()) {
        std::cerr << "hardened-exec: " << config.error().message << '\n' << hardened::usage();
        return hardened::kStatusEngineError;
    }

    if (config->show_help) {
        std::cout << hardened::usage();
        return 0;
    }

    auto one_shot = config->one_shot_line;
    hardened::ExecApp app(std::move(*config));

    if (one_shot.has_value()) {
        return app.run_once(*one_shot);
    }

    return app.run();
}
