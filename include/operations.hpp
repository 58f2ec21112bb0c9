#ifndef OPERATIONS_HPP
#define OPERATIONS_HPP
#include <filesystem>
#include <string>
#include <vector>
#include "cleaner.hpp"
#include "entry_builder.hpp"
#include "path_probe.hpp"
#include "rule_store.hpp"

namespace ignore {

enum class UpdateMode { Add, Remove };

enum class EntryStatus { Added, Removed, Skipped, Error };

/// Outcome for a single target of an add or remove run.
struct OperationResult {
    std::string entry;
    EntryStatus status = EntryStatus::Skipped;
    std::string detail;
};

/// Everything a run needs to know about the user's preferences.
struct RuleSettings {
    std::vector<std::string> base_entries{".DS_Store"};
    EntryPolicy policy;
    CleaningOptions cleaning;
};

/// Location of the rule file inside a workspace.
struct RuleFile {
    std::filesystem::path workspace;
    std::string name = ".gitignore";

    std::filesystem::path location() const { return workspace / name; }
};

struct UpdateOutcome {
    std::vector<OperationResult> results;
    std::vector<std::string> lines; ///< Final line list
    bool created = false;           ///< The rule file did not exist before
    bool written = false;           ///< Content differs from what was read
};

struct CleanOutcome {
    bool found = false;   ///< False when there was no rule file to clean
    bool changed = false; ///< Cleaned lines differ from the original lines
    CleaningResult result;
};

const char* mode_name(UpdateMode mode);
const char* status_name(EntryStatus status);

/**
 * @brief Add or remove the entries representing @p targets.
 *
 * The rule file is read once. A missing file starts out as the baseline
 * entries. Each distinct target is processed in order; validation and probe
 * errors become `Error` results and never abort the run. Afterwards the
 * baseline is enforced, consecutive blank lines are collapsed and trailing
 * blank lines trimmed.
 *
 * The file is written at most once and only when the result differs from
 * what was read (or the file did not exist). With @p dry_run nothing is
 * written and @ref UpdateOutcome::written reports what would have happened.
 *
 * @throws std::system_error when the store fails to read or write.
 */
UpdateOutcome perform_update(store::RuleStore& store, const probe::PathProbe& prober,
                             const RuleFile& file, UpdateMode mode,
                             const std::vector<std::filesystem::path>& targets,
                             const RuleSettings& settings, bool dry_run = false);

/**
 * @brief Clean the rule file in place.
 *
 * Nothing is created when the file does not exist. The file is written only
 * when cleaning changed its lines and @p dry_run is false.
 *
 * @throws std::system_error when the store fails to read or write.
 */
CleanOutcome clean_rule_file(store::RuleStore& store, const probe::PathProbe& prober,
                             const RuleFile& file, const RuleSettings& settings,
                             bool dry_run = false);

/// "Added 2 entries. 1 skipped. 1 failed." style one-line summary.
std::string update_summary(const std::vector<OperationResult>& results, UpdateMode mode);

} // namespace ignore

#endif // OPERATIONS_HPP
