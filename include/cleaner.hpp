#ifndef CLEANER_HPP
#define CLEANER_HPP
#include <string>
#include <vector>
#include "path_probe.hpp"

namespace ignore {

struct CleaningOptions {
    bool sort = false;
    bool remove_empty_lines = false;
    bool remove_comments = false;
    bool trailing_slash_for_folders = true;
};

/**
 * @brief Outcome of a cleaning pass.
 *
 * Only @a lines matters for correctness; the counters feed the summary shown
 * to the user.
 */
struct CleaningResult {
    std::vector<std::string> lines;
    int duplicates_removed = 0;
    int empty_lines_removed = 0;
    int comments_removed = 0;
    bool sorted_applied = false;
    bool base_entries_added = false;
};

/**
 * @brief Deduplicate and canonicalise already filtered, trimmed lines.
 *
 * Literal lines keep the first occurrence per normalization key and are
 * re-rendered with render_canonical(). Pattern lines are deduplicated by exact
 * text. Blank and comment lines pass through untouched.
 *
 * When @p prober is null every key has DirectoryStatus::Unknown and folder
 * detection relies on the trailing slashes seen in the file.
 *
 * @param duplicates_removed Incremented for every dropped duplicate. A later
 *        occurrence that differs from the first only by its trailing slash is
 *        still dropped but not counted when the trailing-slash policy is off.
 */
std::vector<std::string> canonicalize_lines(const std::vector<std::string>& lines,
                                            const probe::PathProbe* prober,
                                            bool trailing_slash_for_folders,
                                            int& duplicates_removed);

/// Sort a copy of @p lines with text::locale_compare. Stable.
std::vector<std::string> sort_lines(const std::vector<std::string>& lines);

/**
 * @brief Run the full cleaning pipeline over raw rule file lines.
 *
 * Steps: trim, drop blank lines and comments if requested, canonicalise,
 * enforce baseline entries, optionally sort, and when blank lines are being
 * removed collapse any remaining blank runs and trailing blanks.
 *
 * @param lines        Lines as parsed from the rule file.
 * @param options      Formatting policy.
 * @param base_entries Baseline entries that must be present; empty disables.
 * @param prober       Optional probe rooted at the rule file's directory.
 */
CleaningResult clean_entries(const std::vector<std::string>& lines,
                             const CleaningOptions& options,
                             const std::vector<std::string>& base_entries,
                             const probe::PathProbe* prober = nullptr);

/**
 * @brief Render the summary line for a cleaning result.
 *
 * Produces e.g. `Cleaned .gitignore: 2 duplicates, 1 empty line, and sorted
 * alphabetically.`; @p file_label replaces `.gitignore`.
 */
std::string cleaning_summary(const CleaningResult& result,
                             const std::string& file_label = ".gitignore");

/// Join items as `a`, `a and b` or `a, b, and c`.
std::string format_summary_list(const std::vector<std::string>& items);

} // namespace ignore

#endif // CLEANER_HPP
