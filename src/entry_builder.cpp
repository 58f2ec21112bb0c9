#include "entry_builder.hpp"
#include "ignore_utils.hpp"
#include "logger.hpp"
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

fs::path without_trailing_separator(fs::path p) {
    while (!p.has_filename() && p.has_relative_path())
        p = p.parent_path();
    return p;
}

// Probe failures count as "not found" so one bad path never aborts a batch.
probe::PathType safe_probe(const probe::PathProbe& prober, const std::string& relative_path) {
    try {
        return prober.probe(relative_path);
    } catch (const std::exception& e) {
        log_debug("Path probe failed", {{"path", relative_path}, {"error", e.what()}});
        return probe::PathType::NotFound;
    }
}

} // namespace

namespace ignore {

std::string workspace_relative_path(const fs::path& workspace, const fs::path& target,
                                    const std::string& rule_file) {
    fs::path root = without_trailing_separator(fs::absolute(workspace).lexically_normal());
    fs::path full = target.is_absolute() ? target : root / target;
    full = without_trailing_separator(full.lexically_normal());

    fs::path rel = full.lexically_relative(root);
    std::string normalized = rel.generic_string();
    if (normalized.empty() || normalized == ".")
        throw std::invalid_argument(
            "Select a file or folder inside the workspace, not the workspace root.");
    if (normalized == ".." || normalized.rfind("../", 0) == 0 || rel.is_absolute())
        throw std::invalid_argument("Selected item is not inside the workspace.");
    if (normalized == fs::path(rule_file).lexically_normal().generic_string())
        throw std::invalid_argument("Managing the " + rule_file +
                                    " file itself is not supported.");
    return normalized;
}

std::optional<std::string> find_symlinked_ancestor(const probe::PathProbe& prober,
                                                   const std::string& relative_path) {
    std::string prefix;
    size_t start = 0;
    while (true) {
        size_t slash = relative_path.find('/', start);
        // The last segment is the target itself.
        if (slash == std::string::npos)
            break;
        prefix = relative_path.substr(0, slash);
        start = slash + 1;
        // An existing ancestor that is not a real directory can only be a link:
        // regular files have no children.
        if (safe_probe(prober, prefix) == probe::PathType::FileOrSymlink)
            return prefix;
    }
    return std::nullopt;
}

AddEntryInfo build_entry_for_add(const probe::PathProbe& prober, const std::string& relative_path,
                                 const EntryPolicy& policy) {
    AddEntryInfo info;
    info.relative_path = relative_path;
    info.is_directory = safe_probe(prober, relative_path) == probe::PathType::Directory;

    if (auto ancestor = find_symlinked_ancestor(prober, relative_path)) {
        log_debug("Target lies below a symbolic link",
                  {{"target", relative_path}, {"link", *ancestor}});
        info.relative_path = *ancestor;
        info.is_directory = false;
        info.via_symlink = true;
    }

    info.entry = format_entry(info.relative_path, info.is_directory, policy.add_with_leading_slash,
                              policy.trailing_slash_for_folders);
    return info;
}

RemoveEntryInfo build_entry_for_remove(const probe::PathProbe& prober,
                                       const std::string& relative_path,
                                       const EntryPolicy& policy) {
    RemoveEntryInfo info;
    info.relative_path = relative_path;
    const bool is_directory = safe_probe(prober, relative_path) == probe::PathType::Directory;

    info.primary = format_entry(relative_path, is_directory, policy.add_with_leading_slash,
                                policy.trailing_slash_for_folders);
    const std::string escaped = escape_path(relative_path);
    const std::string with_trailing = escaped.back() == '/' ? escaped : escaped + "/";
    info.alternates = {
        format_entry(relative_path, !is_directory, policy.add_with_leading_slash,
                     policy.trailing_slash_for_folders),
        with_trailing,
        "/" + with_trailing,
        escaped,
        "/" + escaped,
    };
    return info;
}

} // namespace ignore
