#include <cassert>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "app/app_config.hpp"

using hardened::AppConfig;
using hardened::LineMode;
using hardened::load_config;
using hardened::parse_timeout_ms;
using hardened::split_list;

namespace {

class EnvVarGuard {
  public:
    explicit EnvVarGuard(const char *name) : name_(name) {
        const char *value = std::getenv(name_.c_str());
        if (value != nullptr) {
            had_value_ = true;
            value_ = value;
        }
    }

    ~EnvVarGuard() {
        if (had_value_) {
            setenv(name_.c_str(), value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    bool had_value_{false};
    std::string value_;
};

struct ConfigEnvironment {
    EnvVarGuard mode{"HARDENED_EXEC_MODE"};
    EnvVarGuard allow{"HARDENED_EXEC_ALLOW"};
    EnvVarGuard timeout{"HARDENED_EXEC_TIMEOUT_MS"};
    EnvVarGuard histfile{"HISTFILE"};
    EnvVarGuard home{"HOME"};

    ConfigEnvironment() {
        unsetenv("HARDENED_EXEC_MODE");
        unsetenv("HARDENED_EXEC_ALLOW");
        unsetenv("HARDENED_EXEC_TIMEOUT_MS");
        unsetenv("HISTFILE");
        setenv("HOME", "/home/tester", 1);
    }
};

AppConfig load(std::vector<std::string> args) {
    auto config = load_config(args);
    assert(config.has_value());
    return config.value();
}

void test_defaults() {
    ConfigEnvironment environment;

    const auto config = load({});
    assert(config.session.mode == LineMode::Safe);
    assert(!config.session.allowlist.has_value());
    assert(!config.session.timeout.has_value());
    assert(config.session.environment.empty());
    assert(!config.one_shot_line.has_value());
    assert(!config.show_help);
    assert(config.history_file == "/home/tester/.hardened_exec_history");
}

void test_environment_variables() {
    ConfigEnvironment environment;
    setenv("HARDENED_EXEC_MODE", "shell", 1);
    setenv("HARDENED_EXEC_ALLOW", "ls,,echo", 1);
    setenv("HARDENED_EXEC_TIMEOUT_MS", "1500", 1);
    setenv("HISTFILE", "/tmp/custom_history", 1);

    const auto config = load({});
    assert(config.session.mode == LineMode::Shell);
    assert((config.session.allowlist == std::vector<std::string>{"ls", "echo"}));
    assert(config.session.timeout == std::chrono::milliseconds(1500));
    assert(config.history_file == "/tmp/custom_history");
}

void test_flags_override_environment() {
    ConfigEnvironment environment;
    setenv("HARDENED_EXEC_MODE", "shell", 1);
    setenv("HARDENED_EXEC_TIMEOUT_MS", "1500", 1);

    const auto config = load({"--safe", "--timeout-ms", "20", "--allow", "cat", "-c", "cat /etc/hostname"});
    assert(config.session.mode == LineMode::Safe);
    assert(config.session.timeout == std::chrono::milliseconds(20));
    assert((config.session.allowlist == std::vector<std::string>{"cat"}));
    assert(config.one_shot_line == std::optional<std::string>("cat /etc/hostname"));

    assert(load({"--shell"}).session.mode == LineMode::Shell);
    assert(load({"--help"}).show_help);
    assert(load({"-h"}).show_help);
}

void test_invalid_values_are_errors() {
    ConfigEnvironment environment;

    assert(!load_config(std::vector<std::string>{"--timeout-ms"}).has_value());
    assert(!load_config(std::vector<std::string>{"--timeout-ms", "soon"}).has_value());
    assert(!load_config(std::vector<std::string>{"-c"}).has_value());
    assert(!load_config(std::vector<std::string>{"--bogus"}).has_value());

    setenv("HARDENED_EXEC_MODE", "paranoid", 1);
    auto bad_mode = load_config(std::vector<std::string>{});
    assert(!bad_mode.has_value());
    assert(bad_mode.error().message.find("paranoid") != std::string::npos);
    unsetenv("HARDENED_EXEC_MODE");

    setenv("HARDENED_EXEC_TIMEOUT_MS", "-5", 1);
    assert(!load_config(std::vector<std::string>{}).has_value());
}

void test_helpers() {
    assert((split_list("a,b,,c,") == std::vector<std::string>{"a", "b", "c"}));
    assert(split_list("").empty());
    assert(parse_timeout_ms("0").value() == std::chrono::milliseconds(0));
    assert(!parse_timeout_ms("").has_value());
    assert(!parse_timeout_ms("10ms").has_value());

    assert(parse_timeout_ms("18446744073709551615").value() == hardened::kMaxTimeout);
    assert(parse_timeout_ms("9223372036854775807").value() == hardened::kMaxTimeout);
    assert(!parse_timeout_ms("18446744073709551616").has_value());
}

void test_huge_timeout_from_environment_is_clamped() {
    ConfigEnvironment environment;
    setenv("HARDENED_EXEC_TIMEOUT_MS", "18446744073709551615", 1);

    const auto config = load({});
    assert(config.session.timeout == hardened::kMaxTimeout);
    assert(config.session.timeout > std::chrono::milliseconds::zero());

    assert(load({"--timeout-ms", "18446744073709551615"}).session.timeout == hardened::kMaxTimeout);
    assert(!load_config(std::vector<std::string>{"--timeout-ms", "99999999999999999999"}).has_value());
}

} // namespace

int main() {
    test_defaults();
    test_environment_variables();
    test_flags_override_environment();
    test_invalid_values_are_errors();
    test_helpers();
    test_huge_timeout_from_environment_is_clamped();
    return 0;
}
