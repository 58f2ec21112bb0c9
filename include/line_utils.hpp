#ifndef LINE_UTILS_HPP
#define LINE_UTILS_HPP
#include <string>
#include <vector>

namespace text {

/**
 * @brief Split raw rule file content into lines.
 *
 * Windows line endings (`\r\n`) are normalised to `\n` before splitting. A
 * single trailing empty segment produced by a final terminator is dropped so a
 * file ending in a newline does not yield a phantom blank line. Empty content
 * yields no lines.
 */
std::vector<std::string> parse_lines(const std::string& content);

/**
 * @brief Join lines back into file content.
 *
 * Lines are joined with `\n` and a single trailing `\n` is appended. An empty
 * sequence serialises to the empty string.
 */
std::string serialize_lines(const std::vector<std::string>& lines);

/// Strip leading and trailing whitespace.
std::string trim(const std::string& s);

/**
 * @brief Collapse blank-line runs and drop trailing blank lines.
 *
 * A line counts as blank when it is empty after trimming.
 *
 * @param collapse_empty Keep only the first blank line of every run.
 * @param trim_trailing  Remove blank lines at the end of the sequence.
 */
std::vector<std::string> cleanup_lines(const std::vector<std::string>& lines,
                                       bool collapse_empty = true, bool trim_trailing = true);

/**
 * @brief Compare two UTF-8 strings the way a human-facing sort expects.
 *
 * Uses the ICU root collation: punctuation before digits, digits before
 * letters, accented letters next to their base letter, lowercase before
 * uppercase on a tie. Blank strings order first. Strings that collate equal
 * fall back to byte order, so the result is a strict weak ordering that does
 * not depend on the process locale.
 *
 * @throws std::runtime_error if ICU cannot provide the collator.
 * @return Negative, zero or positive like `strcmp`.
 */
int locale_compare(const std::string& a, const std::string& b);

} // namespace text

#endif // LINE_UTILS_HPP
