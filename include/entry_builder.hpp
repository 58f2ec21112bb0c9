#ifndef ENTRY_BUILDER_HPP
#define ENTRY_BUILDER_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "path_probe.hpp"

namespace ignore {

/// Formatting policy applied to newly built entries.
struct EntryPolicy {
    bool add_with_leading_slash = true;
    bool trailing_slash_for_folders = true;
};

struct AddEntryInfo {
    std::string entry;         ///< Rule line to add
    std::string relative_path; ///< Path the line represents, after symlink substitution
    bool is_directory = false;
    bool via_symlink = false;  ///< True when an ancestor symlink replaced the target
};

struct RemoveEntryInfo {
    std::string primary;                ///< Line the path would be added as
    std::vector<std::string> alternates; ///< Other spellings that also represent it
    std::string relative_path;
};

/**
 * @brief Convert @p target into a workspace-relative path with `/` separators.
 *
 * Relative targets are interpreted against @p workspace. The result is
 * lexically normalised.
 *
 * @throws std::invalid_argument if the target is the workspace root, lies
 *         outside the workspace, or is the rule file @p rule_file itself.
 */
std::string workspace_relative_path(const std::filesystem::path& workspace,
                                    const std::filesystem::path& target,
                                    const std::string& rule_file = ".gitignore");

/**
 * @brief Find the shallowest symbolic link among the ancestors of a path.
 *
 * Ancestors are probed one at a time from the workspace root toward the
 * immediate parent and the walk stops at the first link. The target itself is
 * not considered.
 *
 * @return Relative path of that ancestor, or `std::nullopt` if none is a link.
 */
std::optional<std::string> find_symlinked_ancestor(const probe::PathProbe& prober,
                                                   const std::string& relative_path);

/**
 * @brief Build the rule line that adds @p relative_path.
 *
 * A real directory is rendered as a folder; files, symbolic links and paths
 * that cannot be found are rendered as files. When an ancestor is a symbolic
 * link the ancestor replaces the target and is rendered as a file.
 */
AddEntryInfo build_entry_for_add(const probe::PathProbe& prober, const std::string& relative_path,
                                 const EntryPolicy& policy);

/**
 * @brief Build the candidate lines that may represent @p relative_path.
 *
 * The primary line is rendered like an add (without ancestor substitution).
 * Alternates cover the opposite folder/file rendering and the anchored and
 * unanchored spellings with and without a trailing slash.
 */
RemoveEntryInfo build_entry_for_remove(const probe::PathProbe& prober,
                                       const std::string& relative_path,
                                       const EntryPolicy& policy);

} // namespace ignore

#endif // ENTRY_BUILDER_HPP
