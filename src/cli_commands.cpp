#include <filesystem>
#include <iostream>
#include <system_error>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "line_utils.hpp"
#include "logger.hpp"
#include "operations.hpp"

namespace fs = std::filesystem;

namespace cli {

namespace {

// Rule file location split into its directory and file name.
ignore::RuleFile rule_file_for(const Options& opts, const fs::path& workspace) {
    fs::path rel(opts.rule_file);
    ignore::RuleFile file;
    file.workspace = (workspace / rel.parent_path()).lexically_normal();
    file.name = rel.filename().string();
    return file;
}

void notify(const Options& opts, std::ostream& out, const std::string& message) {
    if (!opts.silent)
        out << message << "\n";
}

} // namespace

fs::path resolve_workspace(const Options& opts) {
    if (!opts.root.empty()) {
        fs::path root = fs::absolute(opts.root).lexically_normal();
        while (!root.has_filename() && root.has_relative_path())
            root = root.parent_path();
        return root;
    }
    const fs::path cwd = fs::current_path();
    std::string err;
    if (auto root = git::discover_workspace(cwd, &err))
        return *root;
    if (!err.empty())
        log_warning("Could not inspect git repository", {{"path", cwd.string()}, {"error", err}});
    return cwd;
}

void configure_logging(const Options& opts) {
    const LoggingOptions& logging = opts.logging;
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    if (!logging.log_file.empty())
        init_logger(logging.log_file, logging.log_level, logging.max_log_size,
                    logging.max_log_files);
    else
        set_log_level(logging.log_level);
    if (logging.use_syslog)
        init_syslog();
}

int handle_update(const Options& opts, const fs::path& workspace, store::RuleStore& store,
                  const probe::PathProbe& prober, std::ostream& out) {
    const ignore::UpdateMode mode =
        opts.command == Command::Remove ? ignore::UpdateMode::Remove : ignore::UpdateMode::Add;
    std::vector<fs::path> targets;
    targets.reserve(opts.targets.size());
    for (const auto& t : opts.targets)
        targets.push_back(fs::absolute(t));

    const ignore::RuleFile file = rule_file_for(opts, workspace);
    ignore::UpdateOutcome outcome = ignore::perform_update(store, prober, file, mode, targets,
                                                           opts.settings, opts.dry_run);
    if (opts.dry_run)
        out << text::serialize_lines(outcome.lines);

    const std::string summary = ignore::update_summary(outcome.results, mode);
    bool failed = false;
    for (const auto& r : outcome.results) {
        if (r.status == ignore::EntryStatus::Error) {
            failed = true;
            const std::string line = std::string("Failed to ") + ignore::mode_name(mode) + " \"" +
                                     r.entry + "\": " +
                                     (r.detail.empty() ? "Unknown error" : r.detail);
            log_error(line);
            notify(opts, out, line);
        } else if (r.status == ignore::EntryStatus::Skipped) {
            log_info("Skipped entry", {{"entry", r.entry}, {"reason", r.detail}});
        }
    }
    if (failed)
        log_error(summary);
    else
        log_info(summary);
    notify(opts, out, summary);
    return failed ? 1 : 0;
}

int handle_clean(const Options& opts, const fs::path& workspace, store::RuleStore& store,
                 const probe::PathProbe& prober, std::ostream& out) {
    const ignore::RuleFile file = rule_file_for(opts, workspace);
    ignore::CleanOutcome outcome =
        ignore::clean_rule_file(store, prober, file, opts.settings, opts.dry_run);
    if (!outcome.found) {
        const std::string message =
            file.name + " not found in workspace \"" + workspace.string() + "\".";
        log_warning(message);
        notify(opts, out, message);
        return 0;
    }
    if (opts.dry_run)
        out << text::serialize_lines(outcome.result.lines);
    const std::string message = outcome.changed
                                    ? ignore::cleaning_summary(outcome.result, file.name)
                                    : file.name + " is already clean.";
    log_info(message);
    notify(opts, out, message);
    return 0;
}

int run_command(const Options& opts) {
    const fs::path workspace = resolve_workspace(opts);
    const fs::path probe_root = rule_file_for(opts, workspace).workspace;
    store::FileRuleStore store;
    probe::FilesystemProbe prober(probe_root);
    log_debug("Running command", {{"workspace", workspace.string()}, {"file", opts.rule_file}});
    try {
        if (opts.command == Command::Clean)
            return handle_clean(opts, workspace, store, prober, std::cout);
        return handle_update(opts, workspace, store, prober, std::cout);
    } catch (const std::system_error& e) {
        log_error(e.what());
        std::cerr << e.what() << "\n";
        return 1;
    }
}

} // namespace cli
