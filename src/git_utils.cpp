#include "git_utils.hpp"
#include "logger.hpp"

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

std::string last_error_message() {
    const git_error* e = git_error_last();
    return (e && e->message) ? e->message : "";
}

std::optional<fs::path> discover_workspace(const fs::path& start, std::string* error) {
    repo_ptr repo;
    const std::string start_str = start.string();
    int rc = git_repository_open_ext(repo.out(), start_str.c_str(), 0, nullptr);
    if (rc != 0) {
        if (rc != GIT_ENOTFOUND) {
            std::string msg = last_error_message();
            if (error)
                *error = msg;
            log_debug("Repository discovery failed", {{"path", start_str}, {"error", msg}});
        }
        return std::nullopt;
    }
    const char* workdir = git_repository_workdir(repo.get());
    if (!workdir)
        return std::nullopt;
    fs::path root = fs::path(workdir).lexically_normal();
    while (!root.has_filename() && root.has_relative_path())
        root = root.parent_path();
    log_debug("Discovered workspace", {{"path", root.string()}});
    return root;
}

} // namespace git
