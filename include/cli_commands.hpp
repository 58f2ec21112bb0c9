#pragma once

#include <filesystem>
#include <iosfwd>

#include "options.hpp"
#include "path_probe.hpp"
#include "rule_store.hpp"

namespace cli {

/**
 * @brief Decide which directory holds the rule file.
 *
 * Uses `--root` when given, otherwise the working tree of the git repository
 * containing the current directory, otherwise the current directory.
 * libgit2 must already be initialized.
 */
std::filesystem::path resolve_workspace(const Options& opts);

/// Apply the logging options (file, level, rotation, format, syslog).
void configure_logging(const Options& opts);

/**
 * @brief Run `add` or `remove` for every target in @a opts.
 *
 * Relative targets are resolved against the current directory. The summary
 * and each failure are written to @a out unless `--silent` is set; with
 * `--dry-run` the resulting file content is written instead of the file.
 *
 * @return `0` when every target was added, removed or skipped, `1` when any
 *         target failed.
 */
int handle_update(const Options& opts, const std::filesystem::path& workspace,
                  store::RuleStore& store, const probe::PathProbe& prober, std::ostream& out);

/**
 * @brief Run `clean` on the rule file.
 *
 * A missing rule file is reported and left missing.
 */
int handle_clean(const Options& opts, const std::filesystem::path& workspace,
                 store::RuleStore& store, const probe::PathProbe& prober, std::ostream& out);

/// Execute the command selected in @a opts against the real filesystem.
int run_command(const Options& opts);

} // namespace cli
