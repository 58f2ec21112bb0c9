/**
 * @file tidyignore.cpp
 * @brief CLI entry point for adding, removing and cleaning .gitignore entries.
 *
 * The workspace is located with libgit2; the helper modules handle option
 * parsing, logging and the rule file operations themselves.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @param argc Number of command-line arguments.
 * @param argv Array of command-line argument strings.
 * @return int Zero on success or when printing help/version; 1 when a target
 *             failed or on option and I/O errors.
 */
#ifndef TIDYIGNORE_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv); // Parse CLI options.
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << TIDYIGNORE_VERSION << "\n";
            return 0;
        }
        cli::configure_logging(opts);
        if (!opts.config_file.empty())
            log_debug("Loaded configuration", {{"file", opts.config_file.string()}});
        int rc = cli::run_command(opts);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // TIDYIGNORE_NO_MAIN
