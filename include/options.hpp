#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <filesystem>
#include <set>
#include <vector>
#include <string>
#include "config_utils.hpp"
#include "logger.hpp"
#include "operations.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
};

enum class Command { None, Add, Remove, Clean };

struct Options {
    Command command = Command::None;
    std::vector<std::filesystem::path> targets;
    std::filesystem::path root; ///< Empty means discover the workspace
    std::string rule_file = ".gitignore";
    ignore::RuleSettings settings;
    bool dry_run = false;
    bool silent = false;
    bool show_help = false;
    bool print_version = false;
    bool auto_config = false;
    std::filesystem::path config_file;
    LoggingOptions logging;
};

/**
 * Parse command-line arguments and configuration files to populate an Options
 * instance.
 *
 * Command-line flags override configuration values, which override the
 * built-in defaults.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error on unknown options, invalid values or config
 *         files that cannot be loaded.
 */
Options parse_options(int argc, char* argv[]);

/// Flags that never take a value (`--sort`, `--dry-run`, ...).
const std::set<std::string>& switch_flags();

/**
 * Load the configuration selected by `--config-yaml`, `--config-json` or
 * `--auto-config`.
 *
 * Auto detection looks for `.tidyignore.yaml` and then `.tidyignore.json`
 * in the `--root` directory, the current directory and the executable's
 * directory, stopping at the first match.
 *
 * @param config_file Receives the path of the last file loaded.
 * @throws std::runtime_error if a named file cannot be loaded.
 */
void load_config_and_auto(int argc, char* argv[], ConfigOptions& cfg_opts, ConfigLists& cfg_lists,
                          std::filesystem::path& config_file);

#endif // OPTIONS_HPP
