#include "test_common.hpp"

using namespace ignore;

TEST_CASE("classify recognises each line kind") {
    REQUIRE(classify("") == LineKind::Blank);
    REQUIRE(classify("# build output") == LineKind::Comment);
    REQUIRE(classify("*.log") == LineKind::Pattern);
    REQUIRE(classify("!important.log") == LineKind::Pattern);
    REQUIRE(classify("**/cache/*") == LineKind::Pattern);
    REQUIRE(classify("file?.txt") == LineKind::Pattern);
    REQUIRE(classify("[Bb]in") == LineKind::Pattern);
    REQUIRE(classify("node_modules/") == LineKind::Literal);
    REQUIRE(classify("/.env") == LineKind::Literal);
}

TEST_CASE("comment takes priority over pattern characters") {
    REQUIRE(classify("#*.log") == LineKind::Comment);
}

TEST_CASE("parse_line trims before classifying") {
    ParsedLine p = parse_line("   dist/  ");
    REQUIRE(p.kind == LineKind::Literal);
    REQUIRE(p.text == "dist/");
    REQUIRE(parse_line("   ").kind == LineKind::Blank);
}

TEST_CASE("normalization_key ignores anchoring and trailing slashes") {
    for (const char* spelling : {"node_modules", "/node_modules", "node_modules/", "/node_modules/",
                                 "//node_modules//"})
        REQUIRE(normalization_key(spelling) == "node_modules");
    REQUIRE(normalization_key("src/gen/") == "src/gen");
    REQUIRE(normalization_key("Build") != normalization_key("build"));
}

TEST_CASE("variant_of reports anchoring and trailing slash") {
    EntryVariant v = variant_of("/dist/");
    REQUIRE(v.anchored);
    REQUIRE(v.trailing_slash);
    v = variant_of("dist");
    REQUIRE_FALSE(v.anchored);
    REQUIRE_FALSE(v.trailing_slash);
}

TEST_CASE("escape_path and unescape_path handle space, hash and bang") {
    REQUIRE(escape_path("my file #1!.txt") == "my\\ file\\ \\#1\\!.txt");
    REQUIRE(unescape_path("my\\ file\\ \\#1\\!.txt") == "my file #1!.txt");
    REQUIRE(unescape_path("a\\b") == "a\\b");
    REQUIRE(unescape_path("trailing\\") == "trailing\\");
}

TEST_CASE("render_canonical applies folder and file rules") {
    EntryVariant anchored{false, true};
    EntryVariant plain{false, false};
    EntryVariant slashed{true, false};

    REQUIRE(render_canonical("node_modules", true, anchored, true) == "/node_modules/");
    REQUIRE(render_canonical("node_modules", true, anchored, false) == "/node_modules");
    REQUIRE(render_canonical("node_modules", true, slashed, false) == "node_modules/");
    REQUIRE(render_canonical("README.md", false, anchored, true) == "/README.md");
    REQUIRE(render_canonical("link", false, slashed, true) == "link");
    REQUIRE(render_canonical(".env", false, anchored, true) == ".env");
    REQUIRE(render_canonical(".vscode", true, anchored, true) == "/.vscode/");
    REQUIRE(render_canonical("config/.env", false, anchored, true) == "/config/.env");
    REQUIRE(render_canonical("dist", false, plain, true) == "dist");
}

TEST_CASE("format_entry renders new entries") {
    REQUIRE(format_entry("node_modules", true, true, true) == "/node_modules/");
    REQUIRE(format_entry("node_modules", true, false, true) == "node_modules/");
    REQUIRE(format_entry("node_modules", true, true, false) == "/node_modules");
    REQUIRE(format_entry("src/main.cpp", false, true, true) == "/src/main.cpp");
    REQUIRE(format_entry(".env", false, true, true) == ".env");
    REQUIRE(format_entry(".vscode", true, true, true) == "/.vscode/");
    REQUIRE(format_entry("my notes.txt", false, true, true) == "/my\\ notes.txt");
}

TEST_CASE("normalize_base_entries trims and drops empties and duplicates") {
    REQUIRE(normalize_base_entries({" .DS_Store ", "", "Thumbs.db", ".DS_Store", "  "}) ==
            std::vector<std::string>{".DS_Store", "Thumbs.db"});
    REQUIRE(normalize_base_entries({}).empty());
}

TEST_CASE("has_entry compares literal keys and pattern text") {
    std::vector<std::string> lines{"/node_modules/", "*.log", "# .DS_Store"};
    REQUIRE(has_entry(lines, "node_modules"));
    REQUIRE(has_entry(lines, "node_modules/"));
    REQUIRE(has_entry(lines, "*.log"));
    REQUIRE_FALSE(has_entry(lines, "*.tmp"));
    REQUIRE_FALSE(has_entry(lines, ".DS_Store"));
}

TEST_CASE("enforce_base_entries prepends missing entries in configured order") {
    std::vector<std::string> lines{"dist/"};
    REQUIRE(enforce_base_entries(lines, {".DS_Store", "Thumbs.db"}));
    REQUIRE(lines == std::vector<std::string>{".DS_Store", "Thumbs.db", "dist/"});
    REQUIRE_FALSE(enforce_base_entries(lines, {".DS_Store", "Thumbs.db"}));
    REQUIRE(lines.size() == 3);
}

TEST_CASE("enforce_base_entries accepts other spellings of a baseline") {
    std::vector<std::string> lines{"/.DS_Store"};
    REQUIRE_FALSE(enforce_base_entries(lines, {".DS_Store"}));
    REQUIRE(lines == std::vector<std::string>{"/.DS_Store"});
}

TEST_CASE("enforce_base_entries with empty baseline does nothing") {
    std::vector<std::string> lines;
    REQUIRE_FALSE(enforce_base_entries(lines, {}));
    REQUIRE(lines.empty());
}

TEST_CASE("add_entry skips existing keys") {
    std::vector<std::string> lines{"node_modules/"};
    REQUIRE_FALSE(add_entry(lines, "/node_modules/"));
    REQUIRE(add_entry(lines, "/dist/"));
    REQUIRE(lines == std::vector<std::string>{"node_modules/", "/dist/"});
}

TEST_CASE("find_matching_entry returns the first candidate present") {
    std::vector<std::string> lines{"  dist/ ", "/build"};
    REQUIRE(find_matching_entry(lines, {"/dist/", "dist/", "/build"}) == std::string("dist/"));
    REQUIRE_FALSE(find_matching_entry(lines, {"/dist/"}).has_value());
}

TEST_CASE("remove_entry removes every trimmed match") {
    std::vector<std::string> lines{"/dist/", "build", " /dist/ "};
    REQUIRE(remove_entry(lines, "/dist/"));
    REQUIRE(lines == std::vector<std::string>{"build"});
    REQUIRE_FALSE(remove_entry(lines, "/dist/"));
}
