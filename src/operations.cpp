#include "operations.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include "ignore_utils.hpp"
#include "line_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace ignore {

namespace {

bool is_base_entry(const std::vector<std::string>& base_entries, const std::string& entry) {
    return std::find(base_entries.begin(), base_entries.end(), entry) != base_entries.end();
}

OperationResult add_one(std::vector<std::string>& lines, const probe::PathProbe& prober,
                        const std::string& relative, const RuleFile& file,
                        const RuleSettings& settings) {
    AddEntryInfo info = build_entry_for_add(prober, relative, settings.policy);
    if (is_base_entry(settings.base_entries, info.entry))
        return {info.entry, EntryStatus::Skipped, "Entry is managed automatically."};
    if (add_entry(lines, info.entry))
        return {info.entry, EntryStatus::Added, ""};
    return {info.entry, EntryStatus::Skipped, "Entry already exists in " + file.name + "."};
}

OperationResult remove_one(std::vector<std::string>& lines, const probe::PathProbe& prober,
                           const std::string& relative, const RuleFile& file,
                           const RuleSettings& settings) {
    RemoveEntryInfo info = build_entry_for_remove(prober, relative, settings.policy);
    std::vector<std::string> candidates{info.primary};
    candidates.insert(candidates.end(), info.alternates.begin(), info.alternates.end());

    auto existing = find_matching_entry(lines, candidates);
    if (existing && is_base_entry(settings.base_entries, *existing))
        return {*existing, EntryStatus::Skipped,
                "This entry is managed automatically and cannot be removed."};
    if (existing && remove_entry(lines, *existing))
        return {*existing, EntryStatus::Removed, ""};
    for (const auto& candidate : candidates) {
        if (remove_entry(lines, candidate))
            return {candidate, EntryStatus::Removed, ""};
    }
    return {info.primary, EntryStatus::Skipped, "Entry not found in " + file.name + "."};
}

} // namespace

const char* mode_name(UpdateMode mode) { return mode == UpdateMode::Add ? "add" : "remove"; }

const char* status_name(EntryStatus status) {
    switch (status) {
    case EntryStatus::Added:
        return "added";
    case EntryStatus::Removed:
        return "removed";
    case EntryStatus::Skipped:
        return "skipped";
    case EntryStatus::Error:
        return "error";
    }
    return "error";
}

UpdateOutcome perform_update(store::RuleStore& store, const probe::PathProbe& prober,
                             const RuleFile& file, UpdateMode mode,
                             const std::vector<fs::path>& targets, const RuleSettings& settings,
                             bool dry_run) {
    UpdateOutcome outcome;
    const fs::path location = file.location();
    std::vector<std::string> original;
    if (auto content = store.read(location)) {
        original = text::parse_lines(*content);
        outcome.lines = original;
    } else {
        outcome.created = true;
        outcome.lines = settings.base_entries;
        log_debug("Rule file not found, starting from baseline entries",
                  {{"file", location.string()}});
    }

    std::set<std::string> seen;
    for (const auto& target : targets) {
        fs::path full = target.is_absolute() ? target : file.workspace / target;
        if (!seen.insert(full.lexically_normal().generic_string()).second)
            continue;

        OperationResult result;
        try {
            std::string relative = workspace_relative_path(file.workspace, target, file.name);
            result = mode == UpdateMode::Add
                         ? add_one(outcome.lines, prober, relative, file, settings)
                         : remove_one(outcome.lines, prober, relative, file, settings);
        } catch (const std::invalid_argument& e) {
            result = {target.generic_string(), EntryStatus::Error, e.what()};
        } catch (const fs::filesystem_error& e) {
            result = {target.generic_string(), EntryStatus::Error, e.what()};
        }
        log_debug("Processed target", {{"target", target.generic_string()},
                                       {"entry", result.entry},
                                       {"status", status_name(result.status)}});
        outcome.results.push_back(std::move(result));
    }

    enforce_base_entries(outcome.lines, settings.base_entries);
    outcome.lines = text::cleanup_lines(outcome.lines);

    outcome.written = outcome.created || outcome.lines != original;
    if (outcome.written && !dry_run) {
        store.write(location, text::serialize_lines(outcome.lines));
        log_info("Updated rule file", {{"file", location.string()}, {"mode", mode_name(mode)}});
    }
    return outcome;
}

CleanOutcome clean_rule_file(store::RuleStore& store, const probe::PathProbe& prober,
                             const RuleFile& file, const RuleSettings& settings, bool dry_run) {
    CleanOutcome outcome;
    const fs::path location = file.location();
    auto content = store.read(location);
    if (!content) {
        log_warning("Nothing to clean", {{"file", location.string()}});
        return outcome;
    }
    outcome.found = true;

    const std::vector<std::string> original = text::parse_lines(*content);
    outcome.result = clean_entries(original, settings.cleaning, settings.base_entries, &prober);
    outcome.changed = outcome.result.lines != original;
    if (outcome.changed && !dry_run)
        store.write(location, text::serialize_lines(outcome.result.lines));
    log_info("Cleaned rule file", {{"file", location.string()},
                                   {"changed", outcome.changed ? "true" : "false"},
                                   {"duplicates", std::to_string(outcome.result.duplicates_removed)}});
    return outcome;
}

std::string update_summary(const std::vector<OperationResult>& results, UpdateMode mode) {
    const EntryStatus success = mode == UpdateMode::Add ? EntryStatus::Added : EntryStatus::Removed;
    auto count = [&](EntryStatus status) {
        return std::count_if(results.begin(), results.end(),
                             [&](const OperationResult& r) { return r.status == status; });
    };
    const auto done = count(success);
    const auto skipped = count(EntryStatus::Skipped);
    const auto failed = count(EntryStatus::Error);

    std::string message = std::string(mode == UpdateMode::Add ? "Added " : "Removed ") +
                          std::to_string(done) + (done == 1 ? " entry." : " entries.");
    if (skipped)
        message += " " + std::to_string(skipped) + " skipped.";
    if (failed)
        message += " " + std::to_string(failed) + " failed.";
    return message;
}

} // namespace ignore
