// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

static void load_file(const fs::path& path, bool yaml, ConfigOptions& cfg_opts,
                      ConfigLists& cfg_lists) {
    std::string err;
    bool ok = yaml ? load_yaml_config(path.string(), cfg_opts, cfg_lists, err)
                   : load_json_config(path.string(), cfg_opts, cfg_lists, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + path.string() + ": " + err);
}

void load_config_and_auto(int argc, char* argv[], ConfigOptions& cfg_opts, ConfigLists& cfg_lists,
                          fs::path& config_file) {
    const std::set<std::string> pre_known{"--config-yaml", "--config-json", "--root",
                                          "--auto-config"};
    const std::map<char, std::string> pre_short{
        {'y', "--config-yaml"}, {'j', "--config-json"}, {'o', "--root"}};
    ArgParser pre_parser(argc, argv, pre_known, pre_short, switch_flags());
    if (pre_parser.has_flag("--config-yaml")) {
        std::string cfg = pre_parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        load_file(cfg, true, cfg_opts, cfg_lists);
        config_file = cfg;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string cfg = pre_parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        load_file(cfg, false, cfg_opts, cfg_lists);
        config_file = cfg;
    }

    bool want_auto = pre_parser.has_flag("--auto-config");
    if (!want_auto && cfg_opts.count("--auto-config")) {
        bool ok = false;
        want_auto = parse_bool(cfg_opts["--auto-config"], ok) && ok;
    }
    if (!want_auto)
        return;

    fs::path root_hint;
    if (pre_parser.has_flag("--root"))
        root_hint = pre_parser.get_option("--root");
    else if (cfg_opts.count("--root"))
        root_hint = cfg_opts["--root"];

    auto find_cfg = [](const fs::path& dir) -> fs::path {
        if (dir.empty())
            return {};
        std::error_code ec;
        fs::path y = dir / ".tidyignore.yaml";
        if (fs::is_regular_file(y, ec))
            return y;
        fs::path j = dir / ".tidyignore.json";
        if (fs::is_regular_file(j, ec))
            return j;
        return {};
    };
    fs::path exe_dir;
    if (argv && argv[0])
        exe_dir = fs::absolute(argv[0]).parent_path();
    fs::path cfg_path = find_cfg(root_hint);
    if (cfg_path.empty())
        cfg_path = find_cfg(fs::current_path());
    if (cfg_path.empty())
        cfg_path = find_cfg(exe_dir);
    if (!cfg_path.empty()) {
        load_file(cfg_path, cfg_path.extension() == ".yaml", cfg_opts, cfg_lists);
        config_file = cfg_path;
    }
}
