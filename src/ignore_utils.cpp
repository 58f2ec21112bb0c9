#include "ignore_utils.hpp"
#include "line_utils.hpp"
#include <algorithm>
#include <set>

namespace {

std::string strip_leading_slashes(const std::string& s) {
    size_t pos = s.find_first_not_of('/');
    return pos == std::string::npos ? std::string() : s.substr(pos);
}

std::string strip_trailing_slashes(const std::string& s) {
    size_t pos = s.find_last_not_of('/');
    return pos == std::string::npos ? std::string() : s.substr(0, pos + 1);
}

bool ends_with_slash(const std::string& s) { return !s.empty() && s.back() == '/'; }

} // namespace

namespace ignore {

bool is_pattern_line(const std::string& line) {
    if (!line.empty() && line[0] == '!')
        return true;
    return line.find_first_of("*?[]") != std::string::npos;
}

LineKind classify(const std::string& trimmed) {
    if (trimmed.empty())
        return LineKind::Blank;
    if (trimmed[0] == '#')
        return LineKind::Comment;
    if (is_pattern_line(trimmed))
        return LineKind::Pattern;
    return LineKind::Literal;
}

ParsedLine parse_line(const std::string& raw) {
    ParsedLine out;
    out.text = text::trim(raw);
    out.kind = classify(out.text);
    return out;
}

std::string normalization_key(const std::string& literal) {
    return strip_leading_slashes(strip_trailing_slashes(literal));
}

EntryVariant variant_of(const std::string& literal) {
    EntryVariant v;
    v.trailing_slash = ends_with_slash(literal);
    v.anchored = !literal.empty() && literal.front() == '/';
    return v;
}

std::string escape_path(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == ' ' || c == '#' || c == '!')
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string unescape_path(const std::string& entry) {
    std::string out;
    out.reserve(entry.size());
    for (size_t i = 0; i < entry.size(); ++i) {
        char c = entry[i];
        if (c == '\\' && i + 1 < entry.size()) {
            char next = entry[i + 1];
            if (next == ' ' || next == '#' || next == '!') {
                out.push_back(next);
                ++i;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

bool is_root_dotfile(const std::string& key, bool is_folder) {
    return !is_folder && key.find('/') == std::string::npos && !key.empty() && key[0] == '.';
}

std::string render_canonical(const std::string& key, bool is_folder, const EntryVariant& first,
                             bool trailing_slash_for_folders) {
    if (is_pattern_line(key))
        return key;
    const std::string base = strip_trailing_slashes(key);
    if (is_folder) {
        std::string anchored = first.anchored ? "/" + base : base;
        if (trailing_slash_for_folders || first.trailing_slash)
            return ends_with_slash(anchored) ? anchored : anchored + "/";
        return strip_trailing_slashes(anchored);
    }
    if (is_root_dotfile(key, is_folder))
        return base;
    return strip_trailing_slashes(first.anchored ? "/" + base : base);
}

std::string format_entry(const std::string& relative_path, bool is_directory,
                         bool add_leading_slash, bool trailing_slash_for_folders) {
    const std::string core = strip_leading_slashes(escape_path(relative_path));
    const bool root_level = relative_path.find('/') == std::string::npos;
    const bool root_dotfile = !is_directory && root_level && !core.empty() && core[0] == '.';

    std::string entry = strip_trailing_slashes(core);
    if (is_directory && trailing_slash_for_folders)
        entry += '/';
    if (add_leading_slash && !root_dotfile)
        entry = "/" + entry;
    return entry;
}

std::vector<std::string> normalize_base_entries(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& value : raw) {
        std::string t = text::trim(value);
        if (t.empty() || !seen.insert(t).second)
            continue;
        out.push_back(t);
    }
    return out;
}

bool has_entry(const std::vector<std::string>& lines, const std::string& entry) {
    const ParsedLine wanted = parse_line(entry);
    if (wanted.kind != LineKind::Literal) {
        return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
            return text::trim(line) == wanted.text;
        });
    }
    const std::string key = normalization_key(wanted.text);
    return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
        ParsedLine parsed = parse_line(line);
        return parsed.kind == LineKind::Literal && normalization_key(parsed.text) == key;
    });
}

bool enforce_base_entries(std::vector<std::string>& lines,
                          const std::vector<std::string>& base_entries) {
    bool updated = false;
    for (auto it = base_entries.rbegin(); it != base_entries.rend(); ++it) {
        if (has_entry(lines, *it))
            continue;
        lines.insert(lines.begin(), *it);
        updated = true;
    }
    return updated;
}

std::optional<std::string> find_matching_entry(const std::vector<std::string>& lines,
                                               const std::vector<std::string>& candidates) {
    for (const auto& candidate : candidates) {
        for (const auto& line : lines) {
            if (text::trim(line) == candidate)
                return candidate;
        }
    }
    return std::nullopt;
}

bool add_entry(std::vector<std::string>& lines, const std::string& entry) {
    if (has_entry(lines, entry))
        return false;
    lines.push_back(entry);
    return true;
}

bool remove_entry(std::vector<std::string>& lines, const std::string& entry) {
    const size_t before = lines.size();
    lines.erase(std::remove_if(lines.begin(), lines.end(),
                               [&](const std::string& line) { return text::trim(line) == entry; }),
                lines.end());
    return lines.size() != before;
}

} // namespace ignore
