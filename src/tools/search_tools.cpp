#include <algorithm>
#include <regex>
#include <system_error>
#include <vector>
#include "tools/text_match.hpp"
#include "tools/tool_host.hpp"
#include "tools/tool_support.hpp"

namespace toolsrv::tools {

using policy::PathAccess;
using protocol::ErrorCode;
using protocol::ToolResult;
using support::Clock;

namespace {

// Longest line prefix handed to std::regex. libstdc++ recurses once per character,
// so longer inputs can exhaust a worker thread's stack on grouped patterns.
constexpr std::size_t kMaxScannedLineBytes = 2 * 1024;

bool escapes_search_root(const std::string& pattern) {
    return pattern.rfind("..", 0) == 0 || pattern.find("../") != std::string::npos;
}

struct TimedPath {
    std::string path;
    std::filesystem::file_time_type mtime;
};

}  // namespace

ToolResult ToolHost::glob_files_impl(const GlobArgs& args) const {
    const auto started = Clock::now();
    if (escapes_search_root(args.pattern)) {
        return support::failure(ErrorCode::PermissionDenied,
                                "Pattern must not escape the search directory.", started);
    }

    auto resolved = resolver_.resolve(args.path, PathAccess::Read);
    if (core::errors::is_error(resolved)) {
        return support::from_error(core::errors::get_error(resolved), started);
    }
    const auto& root = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return support::failure(ErrorCode::NotFound, "Directory not found: " + args.path,
                                started);
    }

    support::WalkOptions options;
    options.max_entries = config_.limits.max_glob_scan;
    const auto files = support::walk_files(root, options);

    const std::size_t cap = config_.limits.max_glob_results;
    std::vector<TimedPath> matched;
    for (const auto& file : files) {
        if (matched.size() >= cap) {
            break;
        }
        if (!matches_glob_pattern(file, args.pattern)) {
            continue;
        }
        std::error_code time_ec;
        auto mtime = std::filesystem::last_write_time(root / file, time_ec);
        if (time_ec) {
            mtime = std::filesystem::file_time_type::min();
        }
        matched.push_back({file, mtime});
    }

    std::stable_sort(matched.begin(), matched.end(),
                     [](const TimedPath& a, const TimedPath& b) { return a.mtime > b.mtime; });

    std::string output;
    for (const auto& entry : matched) {
        if (!output.empty()) {
            output.push_back('\n');
        }
        output += entry.path;
    }
    if (output.empty()) {
        output = "No files matched";
    }
    if (matched.size() >= cap) {
        output += "\n[... capped at " + std::to_string(cap) + " files]";
    }
    return support::success(std::move(output), started);
}

ToolResult ToolHost::grep_files_impl(const GrepArgs& args) const {
    const auto started = Clock::now();

    std::regex matcher;
    try {
        matcher = std::regex(args.pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& error) {
        return support::failure(ErrorCode::InvalidArgs,
                                "Invalid regex \"" + args.pattern + "\": " + error.what(),
                                started);
    }

    auto resolved = resolver_.resolve(args.path, PathAccess::Read);
    if (core::errors::is_error(resolved)) {
        return support::from_error(core::errors::get_error(resolved), started);
    }
    const auto& target = core::errors::get_value(resolved);

    std::error_code ec;
    std::filesystem::path base;
    std::vector<std::string> files;
    if (std::filesystem::is_regular_file(target, ec)) {
        base = target.parent_path();
        files.push_back(target.filename().string());
    } else if (std::filesystem::is_directory(target, ec)) {
        base = target;
        files = support::walk_files(target, support::WalkOptions{});
    } else {
        return support::failure(ErrorCode::NotFound, "Path not found: " + args.path,
                                started);
    }

    const std::size_t cap = config_.limits.max_grep_matches;
    const std::size_t max_line = config_.limits.max_grep_line_length;
    std::vector<std::string> matches;

    for (const auto& file : files) {
        if (matches.size() >= cap) {
            break;
        }
        if (args.glob.has_value() && !args.glob->empty() &&
            !matches_glob_pattern(file, args.glob.value())) {
            continue;
        }

        auto content_result = support::read_file_bytes(base / file);
        if (core::errors::is_error(content_result)) {
            continue;
        }
        const std::string& content = core::errors::get_value(content_result);
        if (support::looks_binary(content)) {
            continue;
        }

        std::size_t line_no = 0;
        std::size_t begin = 0;
        while (begin <= content.size() && matches.size() < cap) {
            auto end = content.find('\n', begin);
            if (end == std::string::npos) {
                end = content.size();
            }
            ++line_no;
            const std::string line = content.substr(begin, end - begin);
            const std::string scanned = line.substr(0, kMaxScannedLineBytes);
            if (std::regex_search(scanned, matcher)) {
                std::string shown = line;
                if (shown.size() > max_line) {
                    shown = shown.substr(0, max_line) + "[line truncated]";
                }
                matches.push_back(file + ":" + std::to_string(line_no) + ": " + shown);
            }
            if (end == content.size()) {
                break;
            }
            begin = end + 1;
        }
    }

    if (matches.empty()) {
        return support::success("No matches found", started);
    }
    std::string output;
    for (const auto& match : matches) {
        if (!output.empty()) {
            output.push_back('\n');
        }
        output += match;
    }
    if (matches.size() >= cap) {
        output += "\n\n[... capped at " + std::to_string(cap) + " matches]";
    }
    return support::success(std::move(output), started);
}

}  // namespace toolsrv::tools
