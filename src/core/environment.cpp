#include "core/environment.hpp"

#include <format>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace hardened {

namespace {

[[nodiscard]] std::expected<void, ParseError> validate_entries(const env::Map &entries) {
    for (const auto &[key, value] : entries) {
        if (key.empty() || key.find('=') != std::string::npos || key.find('\0') != std::string::npos) {
            return std::unexpected(ParseError{std::format("invalid environment variable name '{}'", key)});
        }

        if (value.find('\0') != std::string::npos) {
            return std::unexpected(ParseError{std::format("environment variable '{}' contains a NUL byte", key)});
        }
    }

    return {};
}

void overlay(env::Map &target, const env::Map &overrides) {
    for (const auto &[key, value] : overrides) {
        target.insert_or_assign(key, value);
    }
}

} // namespace

env::Map snapshot_environment(const char *const *block) {
    env::Map snapshot;
    if (block == nullptr) {
        return snapshot;
    }

    for (const char *const *entry = block; *entry != nullptr; ++entry) {
        const std::string_view text(*entry);
        const auto separator = text.find('=');
        if (separator == std::string_view::npos || separator == 0) {
            continue;
        }

        snapshot.emplace(std::string(text.substr(0, separator)), std::string(text.substr(separator + 1)));
    }

    return snapshot;
}

env::Map resolve_environment(const EnvironmentPolicy &policy, const env::Map &parent) {
    return std::visit(
        [&](const auto &active) -> env::Map {
            using Policy = std::decay_t<decltype(active)>;

            if constexpr (std::is_same_v<Policy, env::InheritAll>) {
                return parent;
            } else if constexpr (std::is_same_v<Policy, env::InheritNamed>) {
                env::Map resolved;
                for (const auto &name : active.names) {
                    if (const auto it = parent.find(name); it != parent.end()) {
                        resolved.emplace(it->first, it->second);
                    }
                }
                overlay(resolved, active.overrides);
                return resolved;
            } else if constexpr (std::is_same_v<Policy, env::Merge>) {
                env::Map resolved = parent;
                overlay(resolved, active.overrides);
                return resolved;
            } else {
                return active.values;
            }
        },
        policy);
}

std::vector<std::string> to_envp_entries(const env::Map &environment) {
    std::vector<std::string> entries;
    entries.reserve(environment.size());

    for (const auto &[key, value] : environment) {
        entries.push_back(std::format("{}={}", key, value));
    }

    return entries;
}

void add_environment_override(EnvironmentPolicy &policy, std::string key, std::string value) {
    if (std::holds_alternative<env::InheritAll>(policy)) {
        policy = env::Merge{};
    }

    std::visit(
        [&](auto &active) {
            using Policy = std::decay_t<decltype(active)>;

            if constexpr (std::is_same_v<Policy, env::InheritNamed> || std::is_same_v<Policy, env::Merge>) {
                active.overrides.insert_or_assign(std::move(key), std::move(value));
            } else if constexpr (std::is_same_v<Policy, env::ReplaceOnly>) {
                active.values.insert_or_assign(std::move(key), std::move(value));
            }
        },
        policy);
}

std::expected<void, ParseError> validate_environment(const EnvironmentPolicy &policy) {
    return std::visit(
        [](const auto &active) -> std::expected<void, ParseError> {
            using Policy = std::decay_t<decltype(active)>;

            if constexpr (std::is_same_v<Policy, env::InheritAll>) {
                return {};
            } else if constexpr (std::is_same_v<Policy, env::ReplaceOnly>) {
                return validate_entries(active.values);
            } else {
                return validate_entries(active.overrides);
            }
        },
        policy);
}

} // namespace hardened
