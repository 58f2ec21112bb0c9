#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "ignore_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

const std::set<std::string>& switch_flags() {
    static const std::set<std::string> switches{"--no-base-entries",
                                                "--leading-slash",
                                                "--no-leading-slash",
                                                "--trailing-slash",
                                                "--no-trailing-slash",
                                                "--remove-empty-lines",
                                                "--remove-comments",
                                                "--sort",
                                                "--dry-run",
                                                "--silent",
                                                "--help",
                                                "--version",
                                                "--verbose",
                                                "--json-log",
                                                "--compress-logs",
                                                "--syslog",
                                                "--auto-config"};
    return switches;
}

Options parse_options(int argc, char* argv[]) {
    fs::path config_file;
    ConfigOptions cfg_opts;
    ConfigLists cfg_lists;
    load_config_and_auto(argc, argv, cfg_opts, cfg_lists, config_file);

    std::set<std::string> known{"--root",       "--file",          "--base-entry",
                                "--config-yaml", "--config-json",  "--log-file",
                                "--log-level",   "--max-log-size", "--max-log-files"};
    known.insert(switch_flags().begin(), switch_flags().end());
    const std::map<char, std::string> short_opts{{'o', "--root"},      {'y', "--config-yaml"},
                                                 {'j', "--config-json"}, {'s', "--silent"},
                                                 {'h', "--help"},      {'V', "--version"},
                                                 {'l', "--log-file"},  {'L', "--log-level"},
                                                 {'n', "--dry-run"}};
    ArgParser parser(argc, argv, known, short_opts, switch_flags());
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());

    // Settings that only have a long-form name in config files.
    std::set<std::string> cfg_known = known;
    cfg_known.insert({"--base-entries", "--add-with-leading-slash", "--trailing-slash-for-folders",
                      "--sort-when-cleaning", "--show-notifications"});
    cfg_known.erase("--config-yaml");
    cfg_known.erase("--config-json");
    for (const auto& kv : cfg_opts) {
        if (!cfg_known.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }
    for (const auto& kv : cfg_lists) {
        if (kv.first != "--base-entries" && kv.first != "--base-entry")
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    auto checked_bool = [](const std::string& flag, const std::string& val) {
        bool ok = false;
        bool b = parse_bool(val, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + flag);
        return b;
    };
    auto cfg_bool = [&](const std::string& k) -> std::optional<bool> {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return std::nullopt;
        return checked_bool(k, it->second);
    };
    auto cli_bool = [&](const std::string& k) -> std::optional<bool> {
        if (!parser.has_flag(k))
            return std::nullopt;
        return checked_bool(k, parser.get_option(k));
    };
    auto cfg_opt = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::string();
    };
    auto flag_value = [&](const std::string& k, bool fallback) {
        if (auto v = cli_bool(k))
            return *v;
        if (auto v = cfg_bool(k))
            return *v;
        return fallback;
    };
    // An on/off flag pair plus the config-only long name for the same setting.
    auto policy_value = [&](const std::string& on, const std::string& off,
                            const std::string& alias, bool fallback) {
        bool value = fallback;
        if (auto v = cfg_bool(alias))
            value = *v;
        if (auto v = cfg_bool(on))
            value = *v;
        if (auto v = cfg_bool(off))
            value = !*v;
        if (auto v = cli_bool(on))
            value = *v;
        if (auto v = cli_bool(off))
            value = !*v;
        return value;
    };
    auto string_value = [&](const std::string& k) {
        std::string val = parser.get_option(k);
        if (val.empty())
            val = cfg_opt(k);
        return val;
    };

    Options opts;
    opts.config_file = config_file;
    opts.show_help = flag_value("--help", false);
    opts.print_version = flag_value("--version", false);
    opts.auto_config = flag_value("--auto-config", false);
    opts.dry_run = flag_value("--dry-run", false);
    opts.silent = flag_value("--silent", false);
    if (auto v = cfg_bool("--show-notifications"); v && !parser.has_flag("--silent"))
        opts.silent = !*v;

    const auto& positional = parser.positional();
    if (!positional.empty()) {
        const std::string& cmd = positional.front();
        if (cmd == "add")
            opts.command = Command::Add;
        else if (cmd == "remove")
            opts.command = Command::Remove;
        else if (cmd == "clean")
            opts.command = Command::Clean;
        else
            throw std::runtime_error("Unknown command: " + cmd);
        for (size_t i = 1; i < positional.size(); ++i)
            opts.targets.emplace_back(positional[i]);
    }
    if (!opts.show_help && !opts.print_version) {
        if (opts.command == Command::None)
            throw std::runtime_error("Missing command (add, remove or clean)");
        if (opts.command == Command::Clean && !opts.targets.empty())
            throw std::runtime_error("clean does not take paths");
        if (opts.command != Command::Clean && opts.targets.empty())
            throw std::runtime_error(positional.front() + " requires at least one path");
    }

    if (parser.has_flag("--root") || cfg_opts.count("--root")) {
        std::string val = string_value("--root");
        if (val.empty())
            throw std::runtime_error("--root requires a directory");
        opts.root = val;
    }
    if (parser.has_flag("--file") || cfg_opts.count("--file")) {
        std::string val = string_value("--file");
        if (val.empty())
            throw std::runtime_error("--file requires a file name");
        opts.rule_file = fs::path(val).lexically_normal().generic_string();
    }

    ignore::RuleSettings& settings = opts.settings;
    std::vector<std::string> base{".DS_Store"};
    if (cfg_lists.count("--base-entries"))
        base = cfg_lists["--base-entries"];
    else if (cfg_opts.count("--base-entries"))
        base = {cfg_opt("--base-entries")};
    if (cfg_lists.count("--base-entry"))
        base = cfg_lists["--base-entry"];
    else if (cfg_opts.count("--base-entry"))
        base = {cfg_opt("--base-entry")};
    if (parser.has_flag("--base-entry"))
        base = parser.get_all_options("--base-entry");
    if (flag_value("--no-base-entries", false))
        base.clear();
    settings.base_entries = ignore::normalize_base_entries(base);

    settings.policy.add_with_leading_slash =
        policy_value("--leading-slash", "--no-leading-slash", "--add-with-leading-slash", true);
    settings.policy.trailing_slash_for_folders = policy_value(
        "--trailing-slash", "--no-trailing-slash", "--trailing-slash-for-folders", true);
    settings.cleaning.trailing_slash_for_folders = settings.policy.trailing_slash_for_folders;
    settings.cleaning.remove_empty_lines = flag_value("--remove-empty-lines", false);
    settings.cleaning.remove_comments = flag_value("--remove-comments", false);
    bool sort = false;
    if (auto v = cfg_bool("--sort-when-cleaning"))
        sort = *v;
    settings.cleaning.sort = flag_value("--sort", sort);

    LoggingOptions& logging = opts.logging;
    logging.log_file = string_value("--log-file");
    if (flag_value("--verbose", false))
        logging.log_level = LogLevel::DEBUG;
    if (parser.has_flag("--log-level") || cfg_opts.count("--log-level")) {
        std::string val = string_value("--log-level");
        if (val.empty())
            throw std::runtime_error("--log-level requires a value");
        logging.log_level = parse_log_level(val);
    }
    bool ok = false;
    if (parser.has_flag("--max-log-size") || cfg_opts.count("--max-log-size")) {
        logging.max_log_size = parse_bytes(string_value("--max-log-size"), 1, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (parser.has_flag("--max-log-files") || cfg_opts.count("--max-log-files")) {
        logging.max_log_files = parse_size_t(string_value("--max-log-files"), 1, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    logging.json_log = flag_value("--json-log", false);
    logging.compress_logs = flag_value("--compress-logs", false);
    logging.use_syslog = flag_value("--syslog", false);
    return opts;
}
