#ifndef RULE_STORE_HPP
#define RULE_STORE_HPP
#include <filesystem>
#include <optional>
#include <string>

namespace store {

/**
 * @brief Reads and writes the raw text of a rule file.
 *
 * read() returns `std::nullopt` when nothing exists at @a location and throws
 * std::system_error for any other failure. write() replaces the whole content
 * or throws std::system_error.
 */
class RuleStore {
  public:
    virtual ~RuleStore() = default;
    virtual std::optional<std::string> read(const std::filesystem::path& location) const = 0;
    virtual void write(const std::filesystem::path& location, const std::string& content) = 0;
};

/// RuleStore on the local filesystem. Content is read and written verbatim.
class FileRuleStore : public RuleStore {
  public:
    std::optional<std::string> read(const std::filesystem::path& location) const override;
    void write(const std::filesystem::path& location, const std::string& content) override;
};

} // namespace store

#endif // RULE_STORE_HPP
