#ifndef PATH_PROBE_HPP
#define PATH_PROBE_HPP
#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace probe {

/// What a relative path currently is on disk.
enum class PathType { Directory, FileOrSymlink, NotFound };

/// Directory knowledge accumulated for a rule key during cleaning.
enum class DirectoryStatus { Unknown, IsDirectory, IsFileOrSymlink, NotFound };

/**
 * @brief Reports the on-disk type of workspace-relative paths.
 *
 * Implementations must be callable concurrently from several threads and must
 * never throw for a missing path. A symbolic link is always reported as
 * PathType::FileOrSymlink whatever it points to, because git tracks the link
 * itself rather than its target.
 */
class PathProbe {
  public:
    virtual ~PathProbe() = default;
    virtual PathType probe(const std::filesystem::path& relative) const = 0;
};

/**
 * @brief PathProbe backed by std::filesystem.
 *
 * Paths are resolved against @a root with `symlink_status`, so links are not
 * followed. Errors other than "not found" are logged at debug level and also
 * reported as PathType::NotFound.
 */
class FilesystemProbe : public PathProbe {
    std::filesystem::path root_;

  public:
    explicit FilesystemProbe(std::filesystem::path root);
    PathType probe(const std::filesystem::path& relative) const override;
    const std::filesystem::path& root() const { return root_; }
};

/// Map a probe answer onto the cleaning status enumeration.
DirectoryStatus to_directory_status(PathType type);

/**
 * @brief Resolve the directory status of every key in one batch.
 *
 * Keys are un-escaped (`\ `, `\#`, `\!`) before probing. All probes are
 * started together and the call returns only once every one has finished.
 * A probe that throws is recorded as DirectoryStatus::NotFound.
 */
std::map<std::string, DirectoryStatus> resolve_directory_status(const PathProbe& prober,
                                                                const std::set<std::string>& keys);

} // namespace probe

#endif // PATH_PROBE_HPP
