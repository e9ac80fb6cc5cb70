#include "core/path_resolver.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>

namespace hardened {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] bool is_executable_file(const fs::path &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }

    const auto perms = fs::status(path, ec).permissions();
    if (ec) {
        return false;
    }

    constexpr auto executable_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (perms & executable_bits) != fs::perms::none;
}

} // namespace

void PathResolver::scan_path_directories(const std::function<bool(const std::string &dir)> &callback) const {
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return;
    }

    std::stringstream path_stream(path_env);
    std::string dir;

    while (std::getline(path_stream, dir, ':')) {
        // an empty entry stands for the current directory
        if (callback(dir.empty() ? std::string(".") : dir)) {
            return;
        }
    }
}

std::string PathResolver::find_command_path(std::string_view command) const {
    if (command.empty()) {
        return {};
    }

    if (command.find('/') != std::string_view::npos) {
        return std::string(command);
    }

    std::string resolved_path;

    scan_path_directories([&](const std::string &dir) {
        const fs::path candidate = fs::path(dir) / command;
        if (is_executable_file(candidate)) {
            resolved_path = candidate.string();
            return true;
        }

        return false;
    });

    return resolved_path;
}

std::set<std::string> PathResolver::executable_candidates(std::string_view prefix) const {
    std::set<std::string> candidates;

    scan_path_directories([&](const std::string &dir) {
        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(dir, ec)) {
            if (ec) {
                break;
            }

            const std::string filename = entry.path().filename().string();
            if (filename.starts_with(prefix) && is_executable_file(entry.path())) {
                candidates.insert(filename);
            }
        }

        return false;
    });

    return candidates;
}

} // namespace hardened
