#ifndef IGNORE_UTILS_HPP
#define IGNORE_UTILS_HPP
#include <optional>
#include <string>
#include <vector>

namespace ignore {

enum class LineKind { Blank, Comment, Pattern, Literal };

struct ParsedLine {
    LineKind kind = LineKind::Blank;
    std::string text;
};

/// Anchoring and trailing-slash style of a literal entry as the user wrote it.
struct EntryVariant {
    bool trailing_slash = false;
    bool anchored = false;
};

/**
 * @brief Check whether a line carries glob or negation syntax.
 *
 * A line is a pattern when it contains any of `*`, `?`, `[` or `]`, or when it
 * begins with `!`. Patterns are kept verbatim and only deduplicated by exact
 * text.
 */
bool is_pattern_line(const std::string& line);

/**
 * @brief Classify an already trimmed line.
 *
 * Checks run in priority order: blank, comment (`#` prefix), pattern, and
 * finally literal for anything else.
 */
LineKind classify(const std::string& trimmed);

/// Trim @p raw and classify it.
ParsedLine parse_line(const std::string& raw);

/**
 * @brief Canonical identity of a literal entry.
 *
 * All leading and trailing `/` characters are removed, so `dist`, `/dist`,
 * `dist/` and `/dist/` share the key `dist`. Comparison is case-sensitive.
 */
std::string normalization_key(const std::string& literal);

/// Read the anchoring and trailing-slash flags of a trimmed literal.
EntryVariant variant_of(const std::string& literal);

/// Escape the characters git treats specially in a path (space, `#`, `!`).
std::string escape_path(const std::string& path);

/// Reverse escape_path().
std::string unescape_path(const std::string& entry);

/**
 * @brief True for a root-level dotfile such as `.env`.
 *
 * The key must not contain a `/`, must start with `.` and must not denote a
 * folder. Such entries are always written without a leading slash.
 */
bool is_root_dotfile(const std::string& key, bool is_folder);

/**
 * @brief Render the single surviving line for a key.
 *
 * @param key    Canonical key of the entry.
 * @param is_folder Whether the entry denotes a real directory.
 * @param first  Variant of the first occurrence of the key.
 * @param trailing_slash_for_folders Policy forcing `/` after folders.
 */
std::string render_canonical(const std::string& key, bool is_folder, const EntryVariant& first,
                             bool trailing_slash_for_folders);

/**
 * @brief Format a workspace-relative path as a new rule line.
 *
 * The path is escaped, anchored with `/` when @p add_leading_slash is set
 * (except for root dotfiles) and suffixed with `/` for directories when
 * @p trailing_slash_for_folders is set. Non-directories never keep a trailing
 * slash.
 */
std::string format_entry(const std::string& relative_path, bool is_directory,
                         bool add_leading_slash, bool trailing_slash_for_folders);

/**
 * @brief Normalise a configured list of baseline entries.
 *
 * Values are trimmed; empty values and repeats are dropped, first wins.
 */
std::vector<std::string> normalize_base_entries(const std::vector<std::string>& raw);

/**
 * @brief Check whether @p entry is already represented in @p lines.
 *
 * Literal entries match any literal line with the same key. Pattern entries
 * need an exact (trimmed) text match.
 */
bool has_entry(const std::vector<std::string>& lines, const std::string& entry);

/**
 * @brief Prepend missing baseline entries.
 *
 * Entries are processed in reverse configured order so that they end up in
 * configured order at the top of the file.
 *
 * @return `true` if at least one entry was inserted.
 */
bool enforce_base_entries(std::vector<std::string>& lines,
                          const std::vector<std::string>& base_entries);

/**
 * @brief Return the first candidate that appears verbatim (after trimming).
 */
std::optional<std::string> find_matching_entry(const std::vector<std::string>& lines,
                                               const std::vector<std::string>& candidates);

/// Append @p entry unless has_entry() already finds it. Returns `true` if added.
bool add_entry(std::vector<std::string>& lines, const std::string& entry);

/// Remove every line whose trimmed text equals @p entry. Returns `true` if any were removed.
bool remove_entry(std::vector<std::string>& lines, const std::string& entry);

} // namespace ignore

#endif // IGNORE_UTILS_HPP
