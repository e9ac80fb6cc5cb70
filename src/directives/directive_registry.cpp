#include "directives/directive_registry.hpp"

#include <charconv>
#include <format>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

#include "app/app_config.hpp"
#include "app/session_state.hpp"
#include "core/environment.hpp"
#include "core/path_resolver.hpp"
#include "core/tokenizer.hpp"
#include "history/history_manager.hpp"

namespace hardened {

DirectiveRegistry::DirectiveRegistry(SessionState &session,
                                     const PathResolver &path_resolver,
                                     HistoryManager &history_manager)
    : session_(session), path_resolver_(path_resolver), history_manager_(history_manager) {
    register_directives();
}

bool DirectiveRegistry::is_directive_line(std::string_view line) {
    const auto first = line.find_first_not_of(" \t");
    return first != std::string_view::npos && line[first] == ':';
}

bool DirectiveRegistry::is_directive(std::string_view name) const { return registry_.contains(std::string(name)); }

int DirectiveRegistry::execute(std::string_view name,
                               const std::vector<std::string> &args,
                               std::ostream &out,
                               std::ostream &err) {
    auto it = registry_.find(std::string(name));
    if (it == registry_.end()) {
        err << std::format("{}: unknown directive\n", name);
        return 1;
    }

    return it->second(args, out, err);
}

int DirectiveRegistry::dispatch(std::string_view line, std::ostream &out, std::ostream &err) {
    const Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize(line);
    if (!tokens.has_value()) {
        err << std::format("parse error: {}\n", tokens.error().message);
        return 2;
    }

    auto &words = tokens.value();
    const std::string name = words.front();
    words.erase(words.begin());

    return execute(name, words, out, err);
}

std::set<std::string> DirectiveRegistry::names() const {
    std::set<std::string> result;

    for (const auto &[name, _] : registry_) {
        result.insert(name);
    }

    return result;
}

bool DirectiveRegistry::exit_requested() const noexcept { return exit_requested_; }

void DirectiveRegistry::register_directives() {
    registry_[":mode"] = [this](const auto &args, auto &out, auto &err) { return directive_mode(args, out, err); };
    registry_[":allow"] = [this](const auto &args, auto &out, auto &err) { return directive_allow(args, out, err); };
    registry_[":timeout"] = [this](const auto &args, auto &out, auto &err) {
        return directive_timeout(args, out, err);
    };
    registry_[":env"] = [this](const auto &args, auto &out, auto &err) { return directive_env(args, out, err); };
    registry_[":which"] = [this](const auto &args, auto &out, auto &err) { return directive_which(args, out, err); };
    registry_[":history"] = [this](const auto &args, auto &out, auto &err) {
        return directive_history(args, out, err);
    };
    registry_[":exit"] = [this](const auto &args, auto &out, auto &err) { return directive_exit(args, out, err); };
}

int DirectiveRegistry::directive_mode(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (args.empty()) {
        out << line_mode_name(session_.mode) << '\n';
        return 0;
    }

    const auto mode = parse_line_mode(args.front());
    if (!mode.has_value() || args.size() > 1) {
        err << ":mode: expected safe or shell\n";
        return 1;
    }

    session_.mode = *mode;
    return 0;
}

int DirectiveRegistry::directive_allow(const std::vector<std::string> &args,
                                       std::ostream & /*out*/,
                                       std::ostream & /*err*/) {
    if (args.empty()) {
        session_.allowlist.reset();
        return 0;
    }

    std::vector<std::string> allowed;
    for (const auto &arg : args) {
        auto names = split_list(arg);
        allowed.insert(allowed.end(), names.begin(), names.end());
    }

    session_.allowlist = std::move(allowed);
    return 0;
}

int DirectiveRegistry::directive_timeout(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (args.empty()) {
        if (session_.timeout.has_value()) {
            out << std::format("{} ms\n", session_.timeout->count());
        } else {
            out << "off\n";
        }
        return 0;
    }

    if (args.front() == "off") {
        session_.timeout.reset();
        return 0;
    }

    auto parsed = parse_timeout_ms(args.front());
    if (!parsed.has_value()) {
        err << std::format(":timeout: {}\n", parsed.error().message);
        return 1;
    }

    session_.timeout = *parsed;
    return 0;
}

int DirectiveRegistry::directive_env(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (args.empty()) {
        for (const auto &[key, value] : session_.environment) {
            out << std::format("{}={}\n", key, value);
        }
        return 0;
    }

    env::Map additions;
    for (const auto &arg : args) {
        const auto separator = arg.find('=');
        if (separator == std::string::npos) {
            err << std::format(":env: expected KEY=VALUE, got '{}'\n", arg);
            return 1;
        }
        additions[arg.substr(0, separator)] = arg.substr(separator + 1);
    }

    if (auto valid = validate_environment(env::Merge{additions}); !valid.has_value()) {
        err << std::format(":env: {}\n", valid.error().message);
        return 1;
    }

    for (auto &[key, value] : additions) {
        session_.environment[key] = std::move(value);
    }
    return 0;
}

int DirectiveRegistry::directive_which(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (args.empty()) {
        err << ":which: missing argument\n";
        return 1;
    }

    int status = 0;
    for (const auto &name : args) {
        const auto file_path = path_resolver_.find_command_path(name);
        if (file_path.empty()) {
            out << std::format("{}: not found\n", name);
            status = 1;
        } else {
            out << std::format("{} is {}\n", name, file_path);
        }
    }

    return status;
}

int DirectiveRegistry::directive_history(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    int limit = history_manager_.size();
    if (!args.empty()) {
        const auto &token = args.front();
        const char *first = token.data();
        const char *last = token.data() + token.size();
        auto [ptr, ec] = std::from_chars(first, last, limit);

        if (ec != std::errc{} || ptr != last || limit < 0) {
            err << ":history: invalid numeric argument\n";
            return 1;
        }
    }

    history_manager_.print(out, limit);
    return 0;
}

int DirectiveRegistry::directive_exit(const std::vector<std::string> & /*args*/,
                                      std::ostream & /*out*/,
                                      std::ostream & /*err*/) {
    exit_requested_ = true;
    return 0;
}

} // namespace hardened
