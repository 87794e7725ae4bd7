#include "tools/text_match.hpp"

#include <cctype>
#include <vector>

namespace toolsrv::tools {

namespace {

struct LineSpan {
    std::size_t begin = 0;
    std::size_t end = 0;  // exclusive, before '\n'
};

std::vector<LineSpan> split_lines(const std::string& text) {
    std::vector<LineSpan> lines;
    std::size_t begin = 0;
    while (true) {
        const auto newline = text.find('\n', begin);
        if (newline == std::string::npos) {
            lines.push_back({begin, text.size()});
            break;
        }
        lines.push_back({begin, newline});
        begin = newline + 1;
    }
    return lines;
}

std::string trimmed(const std::string& text, const LineSpan& span) {
    std::size_t begin = span.begin;
    std::size_t end = span.end;
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

PatchFindResult fuzzy_line_match(const std::string& content, const std::string& needle) {
    PatchFindResult result;
    result.error = FindError::NotFound;

    auto needle_lines = split_lines(needle);
    // A trailing newline in the needle does not add a line to match.
    if (needle_lines.size() > 1 && needle_lines.back().begin == needle_lines.back().end) {
        needle_lines.pop_back();
    }
    std::vector<std::string> wanted;
    bool has_text = false;
    for (const auto& span : needle_lines) {
        wanted.push_back(trimmed(needle, span));
        has_text = has_text || !wanted.back().empty();
    }
    if (!has_text) {
        return result;
    }

    const auto lines = split_lines(content);
    if (lines.size() < wanted.size()) {
        return result;
    }

    std::vector<std::string> normalized;
    normalized.reserve(lines.size());
    for (const auto& span : lines) {
        normalized.push_back(trimmed(content, span));
    }

    for (std::size_t start = 0; start + wanted.size() <= lines.size(); ++start) {
        bool equal = true;
        for (std::size_t i = 0; i < wanted.size(); ++i) {
            if (normalized[start + i] != wanted[i]) {
                equal = false;
                break;
            }
        }
        if (!equal) {
            continue;
        }
        ++result.count;
        if (result.count == 1) {
            result.index = lines[start].begin;
            result.length = lines[start + wanted.size() - 1].end - lines[start].begin;
        }
    }

    if (result.count == 1) {
        result.ok = true;
    } else if (result.count > 1) {
        result.error = FindError::Ambiguous;
    }
    return result;
}

// Wildcard matcher memoised on (path offset, pattern offset) so repeated stars
// revisit each state once.
class GlobMatcher {
public:
    GlobMatcher(const std::string& path, const std::string& pattern)
        : path_(path), pattern_(pattern), memo_((path.size() + 1) * (pattern.size() + 1), kUnknown) {}

    bool matches() { return match_from(0, 0); }

private:
    static constexpr char kUnknown = 0;
    static constexpr char kNo = 1;
    static constexpr char kYes = 2;

    bool match_from(std::size_t p, std::size_t q) {
        char& state = memo_[p * (pattern_.size() + 1) + q];
        if (state == kUnknown) {
            state = compute(p, q) ? kYes : kNo;
        }
        return state == kYes;
    }

    bool compute(std::size_t p, std::size_t q) {
        while (q < pattern_.size()) {
            const char c = pattern_[q];
            if (c == '*') {
                const bool double_star = q + 1 < pattern_.size() && pattern_[q + 1] == '*';
                if (double_star) {
                    const std::size_t next = q + 2;
                    // "**/" may also match zero directories.
                    if (next < pattern_.size() && pattern_[next] == '/' && match_from(p, next + 1)) {
                        return true;
                    }
                    for (std::size_t k = p; k <= path_.size(); ++k) {
                        if (match_from(k, next)) {
                            return true;
                        }
                    }
                    return false;
                }
                for (std::size_t k = p; k <= path_.size(); ++k) {
                    if (match_from(k, q + 1)) {
                        return true;
                    }
                    if (k < path_.size() && path_[k] == '/') {
                        break;
                    }
                }
                return false;
            }
            if (p >= path_.size()) {
                return false;
            }
            if (c == '?') {
                if (path_[p] == '/') {
                    return false;
                }
            } else if (c != path_[p]) {
                return false;
            }
            ++p;
            ++q;
        }
        return p == path_.size();
    }

    const std::string& path_;
    const std::string& pattern_;
    std::vector<char> memo_;
};

}  // namespace

PatchFindResult fuzzy_find_unique(const std::string& content, const std::string& needle) {
    PatchFindResult result;
    if (needle.empty()) {
        result.error = FindError::InvalidArgs;
        return result;
    }

    std::size_t search_from = 0;
    while (true) {
        const auto found = content.find(needle, search_from);
        if (found == std::string::npos) {
            break;
        }
        ++result.count;
        if (result.count == 1) {
            result.index = found;
            result.length = needle.size();
        }
        search_from = found + 1;
    }

    if (result.count == 1) {
        result.ok = true;
        return result;
    }
    if (result.count > 1) {
        result.error = FindError::Ambiguous;
        return result;
    }
    return fuzzy_line_match(content, needle);
}

bool matches_glob_pattern(const std::string& relative_path, const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }
    if (pattern.find('/') == std::string::npos) {
        const auto slash = relative_path.find_last_of('/');
        const std::string name =
            slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);
        return GlobMatcher(name, pattern).matches();
    }
    std::string normalized = pattern;
    while (normalized.rfind("./", 0) == 0) {
        normalized = normalized.substr(2);
    }
    return GlobMatcher(relative_path, normalized).matches();
}

std::size_t count_lines(const std::string& text) {
    std::size_t lines = 1;
    for (const char c : text) {
        if (c == '\n') {
            ++lines;
        }
    }
    return lines;
}

}  // namespace toolsrv::tools
