#include "test_common.hpp"
#include <climits>
#include <cstdint>

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--file=config/.gitignore"};
    ArgParser parser(2, const_cast<char**>(argv), {"--file"});
    REQUIRE(parser.has_flag("--file"));
    REQUIRE(parser.get_option("--file") == "config/.gitignore");
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-o/tmp/ws"};
    ArgParser parser(3, const_cast<char**>(argv), {"--help", "--root"},
                     {{'h', "--help"}, {'o', "--root"}});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--root") == std::string("/tmp/ws"));
}

TEST_CASE("ArgParser stacked short flags") {
    const char* argv[] = {"prog", "-sn"};
    ArgParser parser(2, const_cast<char**>(argv), {"--silent", "--dry-run"},
                     {{'s', "--silent"}, {'n', "--dry-run"}}, {"--silent", "--dry-run"});
    REQUIRE(parser.has_flag("--silent"));
    REQUIRE(parser.has_flag("--dry-run"));
}

TEST_CASE("ArgParser switches keep the next argument positional") {
    const char* argv[] = {"prog", "add", "--dry-run", "build", "--sort", "dist"};
    ArgParser parser(6, const_cast<char**>(argv), {"--dry-run", "--sort"}, {},
                     {"--dry-run", "--sort"});
    REQUIRE(parser.has_flag("--dry-run"));
    REQUIRE(parser.has_flag("--sort"));
    REQUIRE(parser.get_option("--dry-run").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"add", "build", "dist"});
}

TEST_CASE("ArgParser switches still accept an explicit value") {
    const char* argv[] = {"prog", "--sort=false"};
    ArgParser parser(2, const_cast<char**>(argv), {"--sort"}, {}, {"--sort"});
    REQUIRE(parser.get_option("--sort") == "false");
}

TEST_CASE("ArgParser short switch does not swallow a path") {
    const char* argv[] = {"prog", "remove", "-n", "dist"};
    ArgParser parser(4, const_cast<char**>(argv), {"--dry-run"}, {{'n', "--dry-run"}},
                     {"--dry-run"});
    REQUIRE(parser.has_flag("--dry-run"));
    REQUIRE(parser.positional() == std::vector<std::string>{"remove", "dist"});
}

TEST_CASE("ArgParser repeated options") {
    const char* argv[] = {"prog", "--base-entry", ".DS_Store", "--base-entry=Thumbs.db"};
    ArgParser parser(4, const_cast<char**>(argv), {"--base-entry"});
    REQUIRE(parser.get_all_options("--base-entry") ==
            std::vector<std::string>{".DS_Store", "Thumbs.db"});
    REQUIRE(parser.get_option("--base-entry") == "Thumbs.db");
    REQUIRE(parser.get_all_options("--missing").empty());
}

TEST_CASE("ArgParser log options") {
    const char* argv[] = {"prog", "--log-level", "DEBUG", "--verbose", "--log-file", "my.log",
                          "clean"};
    ArgParser parser(7, const_cast<char**>(argv), {"--log-level", "--verbose", "--log-file"}, {},
                     {"--verbose"});
    REQUIRE(parser.get_option("--log-level") == "DEBUG");
    REQUIRE(parser.has_flag("--verbose"));
    REQUIRE(parser.get_option("--log-file") == "my.log");
    REQUIRE(parser.positional() == std::vector<std::string>{"clean"});
}

TEST_CASE("ArgParser unknown options with values") {
    const char* argv[] = {"prog", "--bogus=1", "-z"};
    ArgParser parser(3, const_cast<char**>(argv), {"--help"}, {{'h', "--help"}});
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"--bogus"});
    REQUIRE(parser.positional() == std::vector<std::string>{"-z"});
}

TEST_CASE("parse_size_t helper range") {
    const char* argv[] = {"prog", "--num", "100"};
    ArgParser parser(3, const_cast<char**>(argv), {"--num"});
    bool ok = false;
    parse_size_t(parser, "--num", 0, 50, ok);
    REQUIRE_FALSE(ok);
    REQUIRE(parse_size_t(parser, "--num", 0, 100, ok) == 100);
    REQUIRE(ok);
}

TEST_CASE("parse_size_t helper missing flag") {
    const char* argv[] = {"prog"};
    ArgParser parser(1, const_cast<char**>(argv), {"--num"});
    bool ok = true;
    REQUIRE(parse_size_t(parser, "--num", 0, 10, ok) == 0);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes helper from parser") {
    const char* argv[] = {"prog", "--max-log-size", "2MB"};
    ArgParser parser(3, const_cast<char**>(argv), {"--max-log-size"});
    bool ok = false;
    REQUIRE(parse_bytes(parser, "--max-log-size", 1, SIZE_MAX, ok) == 2 * 1024 * 1024);
    REQUIRE(ok);
}
