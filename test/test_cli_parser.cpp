#include "test_util.hpp"
#include "util/cli_parser.hpp"

#include <string>
#include <vector>

using namespace fastaclass;

// Build a mutable argv from string literals.
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    Argv(std::initializer_list<const char*> args) {
        for (const char* a : args) storage.emplace_back(a);
        for (auto& s : storage) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }
};

static void test_key_values() {
    std::fprintf(stderr, "-- test_key_values\n");

    Argv a{"fastaclass", "-in", "seqs.fa", "-o", "-", "--level=3", "-n", "7"};
    CliParser cli(a.argc(), a.argv());

    CHECK_STR(cli.program(), "fastaclass");
    CHECK_STR(cli.get_string("-in"), "seqs.fa");
    CHECK_STR(cli.get_string("-o"), "-");
    CHECK_STR(cli.get_string("--level"), "3");
    CHECK_STR(cli.get_string("-n"), "7");
    CHECK(cli.positional().empty());
}

static void test_defaults() {
    std::fprintf(stderr, "-- test_defaults\n");

    Argv a{"prog", "-n", "abc"};
    CliParser cli(a.argc(), a.argv());

    CHECK(!cli.has("-missing"));
    CHECK_STR(cli.get_string("-missing", "dflt"), "dflt");
    CHECK_STR(cli.get_string("-n", "dflt"), "abc");
}

static void test_flags_and_positional() {
    std::fprintf(stderr, "-- test_flags_and_positional\n");

    Argv a{"prog", "-summary", "in.fa", "-v", "extra", "--", "-literal"};
    CliParser cli(a.argc(), a.argv(), {"-summary", "-v"});

    CHECK(cli.has("-summary"));
    CHECK(cli.has("-v"));
    CHECK_EQ(cli.positional().size(), 3u);
    if (cli.positional().size() == 3) {
        CHECK_STR(cli.positional()[0], "in.fa");
        CHECK_STR(cli.positional()[1], "extra");
        CHECK_STR(cli.positional()[2], "-literal");
    }

    // Without the flag list the next word is taken as a value
    Argv b{"prog", "-summary", "in.fa"};
    CliParser greedy(b.argc(), b.argv());
    CHECK_STR(greedy.get_string("-summary"), "in.fa");
    CHECK(greedy.positional().empty());

    // Trailing option with no value
    Argv c{"prog", "in.fa", "--verbose"};
    CliParser trailing(c.argc(), c.argv());
    CHECK(trailing.has("--verbose"));
    CHECK_EQ(trailing.positional().size(), 1u);
}

static void test_repeated_keys() {
    std::fprintf(stderr, "-- test_repeated_keys\n");

    Argv a{"prog", "-in", "a.fa", "-in", "b.fa", "--in=c.fa"};
    CliParser cli(a.argc(), a.argv());

    auto vals = cli.get_strings("-in");
    CHECK_EQ(vals.size(), 2u);
    CHECK_STR(cli.get_string("-in"), "b.fa");
    CHECK_STR(cli.get_string("--in"), "c.fa");
    CHECK(cli.get_strings("-none").empty());
}

int main() {
    test_key_values();
    test_defaults();
    test_flags_and_positional();
    test_repeated_keys();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
