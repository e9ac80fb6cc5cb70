#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <readline/history.h>
#include <unistd.h>

#include "history/history_manager.hpp"

using hardened::HistoryManager;

namespace {

namespace fs = std::filesystem;

std::string make_temp_file(std::string_view initial = "") {
    std::string pattern = "/tmp/hardened_history_manager_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    const int fd = mkstemp(buffer.data());
    assert(fd != -1);
    close(fd);

    if (!initial.empty()) {
        std::ofstream file(buffer.data());
        assert(file.is_open());
        file << initial;
    }

    return buffer.data();
}

std::string slurp(const std::string &path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void reset_history() {
    using_history();
    clear_history();
}

void test_initialize_loads_and_save_persists() {
    reset_history();

    const std::string histfile = make_temp_file(":mode shell\nls -1; id\n");

    HistoryManager manager;
    manager.initialize(histfile);
    assert(manager.file() == histfile);
    assert(manager.size() == 2);

    manager.record_input("echo new");
    assert(manager.save() == 0);

    const auto content = slurp(histfile);
    assert(content.find(":mode shell") != std::string::npos);
    assert(content.find("ls -1; id") != std::string::npos);
    assert(content.find("echo new") != std::string::npos);

    fs::remove(histfile);
}

void test_missing_history_file_starts_empty() {
    reset_history();

    HistoryManager manager;
    manager.initialize("/no/such/directory/history");
    assert(manager.size() == 0);
    assert(manager.save() != 0);

    HistoryManager unnamed;
    unnamed.initialize("");
    assert(unnamed.save() == 0);
}

void test_record_input_skips_blank_and_repeated_lines() {
    reset_history();
    HistoryManager manager;

    manager.record_input("");
    manager.record_input("   \t");
    assert(manager.size() == 0);

    manager.record_input("echo first");
    manager.record_input("echo first");
    assert(manager.size() == 1);

    manager.record_input("echo second");
    manager.record_input("echo first");
    assert(manager.size() == 3);
}

void test_print_limits() {
    reset_history();
    HistoryManager manager;

    manager.record_input("echo a");
    manager.record_input("echo b");

    std::stringstream last;
    manager.print(last, 1);
    assert(last.str() == "    2  echo b\n");

    std::stringstream none;
    manager.print(none, 0);
    assert(none.str().empty());

    std::stringstream all;
    manager.print(all, 100);
    assert(all.str() == "    1  echo a\n    2  echo b\n");
}

} // namespace

int main() {
    test_initialize_loads_and_save_persists();
    test_missing_history_file_starts_empty();
    test_record_input_skips_blank_and_repeated_lines();
    test_print_limits();
    return 0;
}
