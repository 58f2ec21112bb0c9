#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

// RAII wrapper for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
    T** out() { return &h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Find the working tree of the repository containing @a start.
 *
 * Searches @a start and its parents. Bare repositories have no working tree
 * and are ignored.
 *
 * @param start Directory to start from.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Working tree root or `std::nullopt` when @a start is not inside a
 *         repository.
 */
std::optional<fs::path> discover_workspace(const fs::path& start, std::string* error = nullptr);

/// Last libgit2 error message, or an empty string.
std::string last_error_message();

} // namespace git

#endif // GIT_UTILS_HPP
