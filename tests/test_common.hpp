#pragma once
#include <catch2/catch.hpp>
#include "arg_parser.hpp"
#include "cleaner.hpp"
#include "config_utils.hpp"
#include "entry_builder.hpp"
#include "ignore_utils.hpp"
#include "line_utils.hpp"
#include "logger.hpp"
#include "operations.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "path_probe.hpp"
#include "rule_store.hpp"
#include "time_utils.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace tidyignore::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive)
        fs::remove_all(target, ec);
    else
        fs::remove(target, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
#if defined(_WIN32)
    constexpr int kMaxAttempts = 10;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        if (remove_once(target, recursive, ec))
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
#else
    if (remove_once(target, recursive, ec))
        return;
#endif
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
} // namespace detail

inline void remove_path(const fs::path& target) { detail::remove_with_retry(target, false); }

inline void remove_all(const fs::path& target) { detail::remove_with_retry(target, true); }

/// Fresh directory under the system temp dir, removed again on destruction.
struct TempDir {
    fs::path path;
    explicit TempDir(const std::string& name) {
        static std::atomic<int> counter{0};
        path = fs::temp_directory_path() /
               ("tidyignore_" + name + "_" + std::to_string(++counter));
        std::error_code ec;
        fs::remove_all(path, ec);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

inline void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << content;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

/// RuleStore keeping files in memory and counting writes.
class MemoryRuleStore : public store::RuleStore {
  public:
    std::map<std::string, std::string> files;
    int writes = 0;

    std::optional<std::string> read(const fs::path& location) const override {
        auto it = files.find(location.generic_string());
        if (it == files.end())
            return std::nullopt;
        return it->second;
    }
    void write(const fs::path& location, const std::string& content) override {
        files[location.generic_string()] = content;
        ++writes;
    }
};

/// RuleStore whose writes always fail.
class FailingRuleStore : public MemoryRuleStore {
  public:
    void write(const fs::path& location, const std::string&) override {
        throw std::system_error(std::make_error_code(std::errc::permission_denied),
                                "Failed to write " + location.string());
    }
};

/// PathProbe answering from a fixed table; unlisted paths are not found.
class ScriptedProbe : public probe::PathProbe {
  public:
    std::map<std::string, probe::PathType> types;
    mutable std::vector<std::string> calls;
    mutable std::mutex calls_mtx;

    ScriptedProbe() = default;
    ScriptedProbe(std::initializer_list<std::pair<const std::string, probe::PathType>> init)
        : types(init) {}

    probe::PathType probe(const fs::path& relative) const override {
        {
            std::lock_guard<std::mutex> lk(calls_mtx);
            calls.push_back(relative.generic_string());
        }
        auto it = types.find(relative.generic_string());
        return it == types.end() ? probe::PathType::NotFound : it->second;
    }
};

/// PathProbe that throws for every query.
class ThrowingProbe : public probe::PathProbe {
  public:
    probe::PathType probe(const fs::path&) const override {
        throw std::runtime_error("probe unavailable");
    }
};

} // namespace tidyignore::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::tidyignore::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::tidyignore::test_support::remove_all((path))
#endif
