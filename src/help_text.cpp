#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--root", "-o", "<path>", "Workspace root (default: git working tree or cwd)", "Basics"},
        {"--file", "", "<name>", "Rule file inside the root (default .gitignore)", "Basics"},
        {"--dry-run", "-n", "", "Print the resulting file instead of writing it", "Basics"},
        {"--silent", "-s", "", "Disable console notifications", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--base-entry", "", "<text>", "Entry that must always be present (repeatable)",
         "Entries"},
        {"--no-base-entries", "", "", "Do not enforce any base entries", "Entries"},
        {"--leading-slash", "", "", "Anchor new entries with '/' (default)", "Entries"},
        {"--no-leading-slash", "", "", "Add new entries unanchored", "Entries"},
        {"--trailing-slash", "", "", "Write folders with a trailing '/' (default)", "Entries"},
        {"--no-trailing-slash", "", "", "Keep folder entries as written", "Entries"},
        {"--remove-empty-lines", "", "", "Drop blank lines when cleaning", "Cleaning"},
        {"--remove-comments", "", "", "Drop comment lines when cleaning", "Cleaning"},
        {"--sort", "", "", "Sort entries alphabetically when cleaning", "Cleaning"},
        {"--auto-config", "", "", "Auto detect .tidyignore.yaml or .tidyignore.json", "Config"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "File for general logs", "Logging"},
        {"--log-level", "-L", "<level>", "Set log verbosity", "Logging"},
        {"--verbose", "", "", "Shorthand for --log-level DEBUG", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    auto flag_text = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_text(o).size());
    }

    std::cout << "tidyignore - .gitignore maintenance tool\n";
    std::cout << "Adds, removes and normalizes entries of a workspace's .gitignore.\n";
    std::cout << "Configuration can be read from YAML or JSON files.\n\n";
    std::cout << "Usage: " << prog << " add <path>... [options]\n";
    std::cout << "       " << prog << " remove <path>... [options]\n";
    std::cout << "       " << prog << " clean [options]\n\n";
    const std::vector<std::string> order{"Basics", "Entries", "Cleaning", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag_text(*o)
                      << o->desc << "\n";
        }
        std::cout << "\n";
    }
}
