#include "path_probe.hpp"
#include "ignore_utils.hpp"
#include "logger.hpp"
#include <future>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace probe {

FilesystemProbe::FilesystemProbe(fs::path root) : root_(std::move(root)) {}

PathType FilesystemProbe::probe(const fs::path& relative) const {
    std::error_code ec;
    fs::file_status st = fs::symlink_status(root_ / relative, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
            log_debug("Path probe failed", {{"path", relative.generic_string()},
                                            {"error", ec.message()}});
        return PathType::NotFound;
    }
    switch (st.type()) {
    case fs::file_type::not_found:
    case fs::file_type::none:
        return PathType::NotFound;
    case fs::file_type::directory:
        return PathType::Directory;
    default:
        return PathType::FileOrSymlink;
    }
}

DirectoryStatus to_directory_status(PathType type) {
    switch (type) {
    case PathType::Directory:
        return DirectoryStatus::IsDirectory;
    case PathType::FileOrSymlink:
        return DirectoryStatus::IsFileOrSymlink;
    case PathType::NotFound:
        return DirectoryStatus::NotFound;
    }
    return DirectoryStatus::Unknown;
}

std::map<std::string, DirectoryStatus> resolve_directory_status(const PathProbe& prober,
                                                                const std::set<std::string>& keys) {
    std::vector<std::pair<std::string, std::future<PathType>>> pending;
    pending.reserve(keys.size());
    for (const auto& key : keys) {
        fs::path rel = ignore::unescape_path(key);
        pending.emplace_back(key, std::async(std::launch::async | std::launch::deferred,
                                             [&prober, rel] { return prober.probe(rel); }));
    }

    std::map<std::string, DirectoryStatus> statuses;
    for (auto& [key, fut] : pending) {
        try {
            statuses[key] = to_directory_status(fut.get());
        } catch (const std::exception& e) {
            log_debug("Path probe threw", {{"path", key}, {"error", e.what()}});
            statuses[key] = DirectoryStatus::NotFound;
        }
    }
    return statuses;
}

} // namespace probe
