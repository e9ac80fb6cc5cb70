#pragma once

#include <expected>
#include <string>
#include <vector>

#include "core/command_spec.hpp"
#include "core/errors.hpp"

namespace hardened {

// Copies a `KEY=VALUE` block such as `environ`. Entries without '=' are skipped and
// the first occurrence of a key wins, as with getenv.
[[nodiscard]] env::Map snapshot_environment(const char *const *block);

[[nodiscard]] env::Map resolve_environment(const EnvironmentPolicy &policy, const env::Map &parent);

[[nodiscard]] std::vector<std::string> to_envp_entries(const env::Map &environment);

// Adds one key on top of the active policy. InheritAll turns into Merge; every other
// policy keeps its variant and records the key in its own map.
void add_environment_override(EnvironmentPolicy &policy, std::string key, std::string value);

[[nodiscard]] std::expected<void, ParseError> validate_environment(const EnvironmentPolicy &policy);

} // namespace hardened
