#include "test_common.hpp"

using tidyignore::test_support::TempDir;
using tidyignore::test_support::read_file;
using tidyignore::test_support::write_file;

TEST_CASE("FileRuleStore reads missing files as nullopt") {
    TempDir tmp("store_missing");
    store::FileRuleStore store;
    REQUIRE_FALSE(store.read(tmp.path / ".gitignore").has_value());
}

TEST_CASE("FileRuleStore round trips content verbatim") {
    TempDir tmp("store_rw");
    store::FileRuleStore store;
    const fs::path file = tmp.path / ".gitignore";
    store.write(file, "dist/\r\nbuild/\n");
    REQUIRE(read_file(file) == "dist/\r\nbuild/\n");
    auto content = store.read(file);
    REQUIRE(content.has_value());
    REQUIRE(*content == "dist/\r\nbuild/\n");

    store.write(file, "a\n");
    REQUIRE(*store.read(file) == "a\n");
}

TEST_CASE("FileRuleStore reports directories as errors") {
    TempDir tmp("store_dir");
    fs::create_directories(tmp.path / ".gitignore");
    store::FileRuleStore store;
    REQUIRE_THROWS_AS(store.read(tmp.path / ".gitignore"), std::system_error);
}

TEST_CASE("FileRuleStore write fails in a missing directory") {
    TempDir tmp("store_fail");
    store::FileRuleStore store;
    REQUIRE_THROWS_AS(store.write(tmp.path / "no" / "such" / ".gitignore", "x\n"),
                      std::system_error);
}

TEST_CASE("FileRuleStore reads empty files as empty content") {
    TempDir tmp("store_empty");
    write_file(tmp.path / ".gitignore", "");
    store::FileRuleStore store;
    auto content = store.read(tmp.path / ".gitignore");
    REQUIRE(content.has_value());
    REQUIRE(content->empty());
}
