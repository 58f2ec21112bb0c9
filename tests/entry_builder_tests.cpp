#include "test_common.hpp"

using namespace ignore;
using tidyignore::test_support::ScriptedProbe;
using tidyignore::test_support::ThrowingProbe;
using tidyignore::test_support::TempDir;
using tidyignore::test_support::write_file;
using probe::PathType;

TEST_CASE("workspace_relative_path converts to slash separated paths") {
    const fs::path ws = fs::temp_directory_path() / "tidyignore_ws";
    REQUIRE(workspace_relative_path(ws, ws / "src" / "main.cpp") == "src/main.cpp");
    REQUIRE(workspace_relative_path(ws, "build/") == "build");
    REQUIRE(workspace_relative_path(ws, ws / "a" / ".." / "b") == "b");
}

TEST_CASE("workspace_relative_path rejects the root, outside paths and the rule file") {
    const fs::path ws = fs::temp_directory_path() / "tidyignore_ws";
    REQUIRE_THROWS_AS(workspace_relative_path(ws, ws), std::invalid_argument);
    REQUIRE_THROWS_AS(workspace_relative_path(ws, ws / "."), std::invalid_argument);
    REQUIRE_THROWS_AS(workspace_relative_path(ws, ws.parent_path() / "other"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(workspace_relative_path(ws, "../x"), std::invalid_argument);
    REQUIRE_THROWS_AS(workspace_relative_path(ws, ws / ".gitignore"), std::invalid_argument);
    REQUIRE_NOTHROW(workspace_relative_path(ws, ws / "sub" / ".gitignore"));
}

TEST_CASE("workspace_relative_path reports readable messages") {
    const fs::path ws = fs::temp_directory_path() / "tidyignore_ws";
    try {
        workspace_relative_path(ws, ws / ".gitignore");
        FAIL("expected rejection");
    } catch (const std::invalid_argument& e) {
        REQUIRE(std::string(e.what()) == "Managing the .gitignore file itself is not supported.");
    }
    try {
        workspace_relative_path(ws, ws.parent_path());
        FAIL("expected rejection");
    } catch (const std::invalid_argument& e) {
        REQUIRE(std::string(e.what()) == "Selected item is not inside the workspace.");
    }
}

TEST_CASE("add renders directories as folders and everything else as files") {
    ScriptedProbe prober{{"node_modules", PathType::Directory},
                         {"src", PathType::Directory},
                         {"src/main.cpp", PathType::FileOrSymlink}};
    EntryPolicy policy;
    REQUIRE(build_entry_for_add(prober, "node_modules", policy).entry == "/node_modules/");
    REQUIRE(build_entry_for_add(prober, "src/main.cpp", policy).entry == "/src/main.cpp");
    AddEntryInfo missing = build_entry_for_add(prober, "not/there", policy);
    REQUIRE(missing.entry == "/not/there");
    REQUIRE_FALSE(missing.is_directory);
}

TEST_CASE("add respects the formatting policy") {
    ScriptedProbe prober{{"dist", PathType::Directory}};
    EntryPolicy policy;
    policy.add_with_leading_slash = false;
    policy.trailing_slash_for_folders = false;
    REQUIRE(build_entry_for_add(prober, "dist", policy).entry == "dist");
}

TEST_CASE("add never anchors root dotfiles") {
    ScriptedProbe prober{{".env", PathType::FileOrSymlink}, {".vscode", PathType::Directory}};
    REQUIRE(build_entry_for_add(prober, ".env", EntryPolicy{}).entry == ".env");
    REQUIRE(build_entry_for_add(prober, ".vscode", EntryPolicy{}).entry == "/.vscode/");
}

TEST_CASE("add substitutes the shallowest symlinked ancestor") {
    ScriptedProbe prober{{"public", PathType::Directory},
                         {"public/docs", PathType::FileOrSymlink},
                         {"public/docs/images", PathType::Directory}};
    AddEntryInfo info = build_entry_for_add(prober, "public/docs/images", EntryPolicy{});
    REQUIRE(info.entry == "/public/docs");
    REQUIRE(info.via_symlink);
    REQUIRE(info.relative_path == "public/docs");
    REQUIRE_FALSE(info.is_directory);
}

TEST_CASE("ancestor walk stops at the first link") {
    ScriptedProbe prober{{"a", PathType::FileOrSymlink}, {"a/b", PathType::FileOrSymlink}};
    REQUIRE(find_symlinked_ancestor(prober, "a/b/c") == std::string("a"));
    REQUIRE(prober.calls == std::vector<std::string>{"a"});
}

TEST_CASE("ancestor walk ignores the target itself") {
    ScriptedProbe prober{{"link", PathType::FileOrSymlink}};
    REQUIRE_FALSE(find_symlinked_ancestor(prober, "link").has_value());
    REQUIRE(prober.calls.empty());
}

TEST_CASE("remove builds the primary entry and alternates") {
    ScriptedProbe prober{{"dist", PathType::Directory}};
    RemoveEntryInfo info = build_entry_for_remove(prober, "dist", EntryPolicy{});
    REQUIRE(info.primary == "/dist/");
    REQUIRE(info.alternates ==
            std::vector<std::string>{"/dist", "dist/", "/dist/", "dist", "/dist"});
}

TEST_CASE("remove alternates for a file") {
    ScriptedProbe prober;
    RemoveEntryInfo info = build_entry_for_remove(prober, "notes.txt", EntryPolicy{});
    REQUIRE(info.primary == "/notes.txt");
    REQUIRE(info.alternates.front() == "/notes.txt/");
}

TEST_CASE("entries for real paths on disk") {
    TempDir tmp("builder");
    fs::create_directories(tmp.path / "public" / "real");
    fs::create_directories(tmp.path / "node_modules");
    write_file(tmp.path / "README.md", "hi\n");
    write_file(tmp.path / ".env", "KEY=1\n");
    probe::FilesystemProbe prober(tmp.path);

    REQUIRE(build_entry_for_add(prober, "node_modules", EntryPolicy{}).entry == "/node_modules/");
    REQUIRE(build_entry_for_add(prober, "README.md", EntryPolicy{}).entry == "/README.md");
    REQUIRE(build_entry_for_add(prober, ".env", EntryPolicy{}).entry == ".env");

#ifndef _WIN32
    fs::create_directory_symlink(tmp.path / "public" / "real", tmp.path / "public" / "docs");
    fs::create_directories(tmp.path / "public" / "real" / "images");
    REQUIRE(build_entry_for_add(prober, "public/docs/images", EntryPolicy{}).entry ==
            "/public/docs");
    REQUIRE(build_entry_for_add(prober, "public/docs", EntryPolicy{}).entry == "/public/docs");
#endif
}

TEST_CASE("entries are still built when path lookups fail") {
    ThrowingProbe prober;
    AddEntryInfo info = build_entry_for_add(prober, "public/docs/images", EntryPolicy{});
    REQUIRE(info.entry == "/public/docs/images");
    REQUIRE_FALSE(info.via_symlink);
    REQUIRE_FALSE(find_symlinked_ancestor(prober, "a/b").has_value());
    REQUIRE(build_entry_for_remove(prober, "dist", EntryPolicy{}).primary == "/dist");
}
