#include "cleaner.hpp"
#include "ignore_utils.hpp"
#include "line_utils.hpp"
#include "logger.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace {

struct EntryMeta {
    bool saw_folder_syntax = false;
    probe::DirectoryStatus status = probe::DirectoryStatus::Unknown;
};

std::string plural(int count, const std::string& noun) {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

} // namespace

namespace ignore {

std::vector<std::string> canonicalize_lines(const std::vector<std::string>& lines,
                                            const probe::PathProbe* prober,
                                            bool trailing_slash_for_folders,
                                            int& duplicates_removed) {
    std::map<std::string, EntryMeta> meta;
    for (const auto& line : lines) {
        if (classify(line) != LineKind::Literal)
            continue;
        EntryMeta& m = meta[normalization_key(line)];
        if (line.back() == '/')
            m.saw_folder_syntax = true;
    }

    if (prober && !meta.empty()) {
        std::set<std::string> keys;
        for (const auto& [key, m] : meta)
            keys.insert(key);
        for (const auto& [key, status] : probe::resolve_directory_status(*prober, keys))
            meta[key].status = status;
    }

    std::vector<std::string> normalized;
    normalized.reserve(lines.size());
    std::set<std::string> seen_patterns;
    std::map<std::string, EntryVariant> first_variant;

    for (const auto& line : lines) {
        switch (classify(line)) {
        case LineKind::Blank:
            normalized.emplace_back();
            continue;
        case LineKind::Comment:
            normalized.push_back(line);
            continue;
        case LineKind::Pattern:
            if (!seen_patterns.insert(line).second) {
                ++duplicates_removed;
                continue;
            }
            normalized.push_back(line);
            continue;
        case LineKind::Literal:
            break;
        }

        const std::string key = normalization_key(line);
        const EntryVariant variant = variant_of(line);
        auto seen = first_variant.find(key);
        if (seen != first_variant.end()) {
            // Trailing-slash-only variants are not counted while the policy is off.
            bool slash_only = seen->second.trailing_slash != variant.trailing_slash &&
                              !trailing_slash_for_folders;
            if (!slash_only)
                ++duplicates_removed;
            continue;
        }

        const EntryMeta& m = meta[key];
        bool is_folder = m.status == probe::DirectoryStatus::IsDirectory;
        if (m.status == probe::DirectoryStatus::Unknown ||
            m.status == probe::DirectoryStatus::NotFound)
            is_folder = m.saw_folder_syntax;
        first_variant.emplace(key, variant);
        normalized.push_back(render_canonical(key, is_folder, variant, trailing_slash_for_folders));
    }
    return normalized;
}

std::vector<std::string> sort_lines(const std::vector<std::string>& lines) {
    std::vector<std::string> sorted = lines;
    std::stable_sort(sorted.begin(), sorted.end(), [](const std::string& a, const std::string& b) {
        return text::locale_compare(a, b) < 0;
    });
    return sorted;
}

CleaningResult clean_entries(const std::vector<std::string>& lines,
                             const CleaningOptions& options,
                             const std::vector<std::string>& base_entries,
                             const probe::PathProbe* prober) {
    CleaningResult result;
    std::vector<std::string> kept;
    kept.reserve(lines.size());
    for (const auto& raw : lines) {
        std::string line = text::trim(raw);
        LineKind kind = classify(line);
        if (kind == LineKind::Blank && options.remove_empty_lines) {
            ++result.empty_lines_removed;
            continue;
        }
        if (kind == LineKind::Comment && options.remove_comments) {
            ++result.comments_removed;
            continue;
        }
        kept.push_back(std::move(line));
    }

    std::vector<std::string> normalized = canonicalize_lines(
        kept, prober, options.trailing_slash_for_folders, result.duplicates_removed);
    result.base_entries_added = enforce_base_entries(normalized, base_entries);

    if (options.sort) {
        std::vector<std::string> sorted = sort_lines(normalized);
        result.sorted_applied = sorted != normalized;
        normalized = std::move(sorted);
    }

    if (options.remove_empty_lines)
        result.lines = text::cleanup_lines(normalized, true, true);
    else
        result.lines = std::move(normalized);

    log_debug("Cleaned rule lines", {{"input", std::to_string(lines.size())},
                                     {"output", std::to_string(result.lines.size())},
                                     {"duplicates", std::to_string(result.duplicates_removed)}});
    return result;
}

std::string format_summary_list(const std::vector<std::string>& items) {
    if (items.empty())
        return "";
    if (items.size() == 1)
        return items[0];
    if (items.size() == 2)
        return items[0] + " and " + items[1];
    std::string out;
    for (size_t i = 0; i + 1 < items.size(); ++i)
        out += items[i] + ", ";
    return out + "and " + items.back();
}

std::string cleaning_summary(const CleaningResult& result, const std::string& file_label) {
    std::vector<std::string> updates;
    if (result.duplicates_removed)
        updates.push_back(plural(result.duplicates_removed, "duplicate"));
    if (result.empty_lines_removed)
        updates.push_back(plural(result.empty_lines_removed, "empty line"));
    if (result.comments_removed)
        updates.push_back(plural(result.comments_removed, "comment"));
    if (result.sorted_applied)
        updates.push_back("sorted alphabetically");
    if (result.base_entries_added)
        updates.push_back("added base entries");
    std::string detail = updates.empty() ? "" : ": " + format_summary_list(updates);
    return "Cleaned " + file_label + detail + ".";
}

} // namespace ignore
