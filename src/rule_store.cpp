#include "rule_store.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace store {

std::optional<std::string> FileRuleStore::read(const fs::path& location) const {
    std::error_code ec;
    fs::file_status st = fs::status(location, ec);
    if (ec == std::errc::no_such_file_or_directory || st.type() == fs::file_type::not_found)
        return std::nullopt;
    if (ec)
        throw std::system_error(ec, "Failed to stat " + location.string());
    if (fs::is_directory(st))
        throw std::system_error(std::make_error_code(std::errc::is_a_directory),
                                "Failed to read " + location.string());

    std::ifstream ifs(location, std::ios::binary);
    if (!ifs)
        throw std::system_error(errno, std::generic_category(),
                                "Failed to open " + location.string());
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "Failed to read " + location.string());
    return content;
}

void FileRuleStore::write(const fs::path& location, const std::string& content) {
    std::ofstream ofs(location, std::ios::binary | std::ios::trunc);
    if (!ofs)
        throw std::system_error(errno, std::generic_category(),
                                "Failed to open " + location.string() + " for writing");
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (!ofs)
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "Failed to write " + location.string());
}

} // namespace store
