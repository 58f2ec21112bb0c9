#include "line_utils.hpp"
#include <unicode/coll.h>
#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

// One collator per thread; ICU collators must not be shared across threads.
const icu::Collator& root_collator() {
    thread_local std::unique_ptr<icu::Collator> collator = [] {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::Collator> c(
            icu::Collator::createInstance(icu::Locale::getRoot(), status));
        if (U_FAILURE(status) || !c)
            throw std::runtime_error(std::string("Failed to create collator: ") +
                                     u_errorName(status));
        return c;
    }();
    return *collator;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char ch) { return std::isspace(ch); });
}

} // namespace

namespace text {

std::vector<std::string> parse_lines(const std::string& content) {
    std::vector<std::string> out;
    if (content.empty())
        return out;
    std::string normalized;
    normalized.reserve(content.size());
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n')
            continue;
        normalized.push_back(content[i]);
    }
    size_t start = 0;
    while (true) {
        size_t pos = normalized.find('\n', start);
        if (pos == std::string::npos) {
            out.push_back(normalized.substr(start));
            break;
        }
        out.push_back(normalized.substr(start, pos - start));
        start = pos + 1;
    }
    if (!out.empty() && out.back().empty())
        out.pop_back();
    return out;
}

std::string serialize_lines(const std::vector<std::string>& lines) {
    if (lines.empty())
        return "";
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

std::string trim(const std::string& s) {
    auto first =
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
    auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }).base();
    if (first >= last)
        return "";
    return std::string(first, last);
}

std::vector<std::string> cleanup_lines(const std::vector<std::string>& lines,
                                       bool collapse_empty, bool trim_trailing) {
    std::vector<std::string> cleaned;
    cleaned.reserve(lines.size());
    for (const auto& line : lines) {
        if (collapse_empty && is_blank(line) && !cleaned.empty() && is_blank(cleaned.back()))
            continue;
        cleaned.push_back(line);
    }
    if (trim_trailing) {
        while (!cleaned.empty() && is_blank(cleaned.back()))
            cleaned.pop_back();
    }
    return cleaned;
}

int locale_compare(const std::string& a, const std::string& b) {
    const bool blank_a = is_blank(a);
    const bool blank_b = is_blank(b);
    if (blank_a != blank_b)
        return blank_a ? -1 : 1;
    if (!blank_a) {
        UErrorCode status = U_ZERO_ERROR;
        UCollationResult r = root_collator().compareUTF8(icu::StringPiece(a.data(), a.size()),
                                                         icu::StringPiece(b.data(), b.size()),
                                                         status);
        if (U_FAILURE(status))
            throw std::runtime_error(std::string("Failed to compare entries: ") +
                                     u_errorName(status));
        if (r != UCOL_EQUAL)
            return r == UCOL_LESS ? -1 : 1;
    }
    // Collation-equal but different bytes: keep a strict order.
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace text
