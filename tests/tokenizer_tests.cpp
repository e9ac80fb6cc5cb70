#include <cassert>
#include <string>
#include <vector>

#include "core/tokenizer.hpp"

using hardened::join;
using hardened::quote;
using hardened::Tokenizer;

namespace {

std::vector<std::string> tokens_of(std::string_view input) {
    const Tokenizer tokenizer;
    auto result = tokenizer.tokenize(input);
    assert(result.has_value());
    return result.value();
}

void test_basic_splitting() {
    assert((tokens_of("ls -1") == std::vector<std::string>{"ls", "-1"}));
    assert((tokens_of("  echo \t a   b \n") == std::vector<std::string>{"echo", "a", "b"}));
}

void test_shell_operators_are_plain_words() {
    assert((tokens_of("echo a | rev > out; id") ==
            std::vector<std::string>{"echo", "a", "|", "rev", ">", "out;", "id"}));
    assert((tokens_of("echo $HOME") == std::vector<std::string>{"echo", "$HOME"}));
}

void test_quoting_rules() {
    assert((tokens_of("echo 'a b' \"c d\"") == std::vector<std::string>{"echo", "a b", "c d"}));
    assert((tokens_of("echo 'it'\\''s'") == std::vector<std::string>{"echo", "it's"}));
    assert((tokens_of("echo \"say \\\"hi\\\"\"") == std::vector<std::string>{"echo", "say \"hi\""}));
    assert((tokens_of("echo \"a\\nb\"") == std::vector<std::string>{"echo", "a\\nb"}));
    assert((tokens_of("echo '\\n'") == std::vector<std::string>{"echo", "\\n"}));
    assert((tokens_of("echo a\\ b") == std::vector<std::string>{"echo", "a b"}));
    assert((tokens_of("echo ab\"cd\"'ef'") == std::vector<std::string>{"echo", "abcdef"}));
}

void test_empty_quoted_strings_are_arguments() {
    assert((tokens_of("printf '' \"\"") == std::vector<std::string>{"printf", "", ""}));
}

void test_line_continuation_and_comments() {
    assert((tokens_of("echo a\\\nb") == std::vector<std::string>{"echo", "ab"}));
    assert((tokens_of("echo a # trailing words") == std::vector<std::string>{"echo", "a"}));
    assert((tokens_of("echo a#b") == std::vector<std::string>{"echo", "a#b"}));
    assert((tokens_of("echo '#x'") == std::vector<std::string>{"echo", "#x"}));
}

void test_rejected_input() {
    const Tokenizer tokenizer;

    assert(!tokenizer.tokenize("").has_value());
    assert(!tokenizer.tokenize("   \t").has_value());
    assert(!tokenizer.tokenize("# only a comment").has_value());
    assert(!tokenizer.tokenize("echo 'open").has_value());
    assert(!tokenizer.tokenize("echo \"open").has_value());
    assert(!tokenizer.tokenize("echo \\").has_value());

    const std::string with_nul("echo a\0b", 8);
    auto nul = tokenizer.tokenize(with_nul);
    assert(!nul.has_value());
    assert(nul.error().message.find("NUL") != std::string::npos);
}

void test_quote_leaves_safe_words_alone() {
    assert(quote("ls") == "ls");
    assert(quote("/usr/bin/env") == "/usr/bin/env");
    assert(quote("--key=value") == "--key=value");
    assert(quote("") == "''");
    assert(quote("a b") == "'a b'");
    assert(quote("it's") == "'it'\\''s'");
}

void test_join_output_tokenizes_back() {
    const std::vector<std::vector<std::string>> samples{
        {"echo", "plain"},
        {"printf", "%s\\n", "two words", ""},
        {"sh", "-c", "echo \"$HOME\"; exit 3"},
        {"grep", "it's", "a|b", "*.txt", "#hash", "~tilde"},
        {"env", "X=tab\there", "new\nline"},
    };

    for (const auto &argv : samples) {
        const auto line = join(argv);
        assert(tokens_of(line) == argv);
        // joining the re-split vector gives the same line again
        assert(join(tokens_of(line)) == line);
    }
}

} // namespace

int main() {
    test_basic_splitting();
    test_shell_operators_are_plain_words();
    test_quoting_rules();
    test_empty_quoted_strings_are_arguments();
    test_line_continuation_and_comments();
    test_rejected_input();
    test_quote_leaves_safe_words_alone();
    test_join_output_tokenizes_back();
    return 0;
}
