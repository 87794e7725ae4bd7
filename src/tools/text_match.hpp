#pragma once

#include <cstddef>
#include <string>

namespace toolsrv::tools {

enum class FindError {
    NotFound,
    Ambiguous,
    InvalidArgs
};

struct PatchFindResult {
    bool ok = false;
    std::size_t index = 0;
    std::size_t length = 0;   // span to replace; differs from the needle on a fuzzy hit
    std::size_t count = 0;    // occurrences seen
    FindError error = FindError::NotFound;
};

// Exact unique substring search, falling back to a whitespace-tolerant line match.
PatchFindResult fuzzy_find_unique(const std::string& content, const std::string& needle);

// Simplified wildcard matching: "*" stays within one path segment, "**" crosses
// segments, "?" is one character. A pattern without '/' is matched on the file name.
bool matches_glob_pattern(const std::string& relative_path, const std::string& pattern);

// Number of lines in a text block as a caller would count them ("a\nb" is 2).
std::size_t count_lines(const std::string& text);

}  // namespace toolsrv::tools
