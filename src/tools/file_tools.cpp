#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "core/logging/logger.hpp"
#include "tools/text_match.hpp"
#include "tools/tool_host.hpp"
#include "tools/tool_support.hpp"

namespace toolsrv::tools {

using policy::PathAccess;
using protocol::ErrorCode;
using protocol::ToolResult;
using support::Clock;

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    if (text.empty()) {
        return lines;
    }
    std::size_t begin = 0;
    while (begin <= text.size()) {
        const auto newline = text.find('\n', begin);
        if (newline == std::string::npos) {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, newline - begin));
        begin = newline + 1;
        if (begin == text.size()) {
            break;  // a final newline terminates the last line
        }
    }
    return lines;
}

std::string pad_left(const std::string& text, const std::size_t width) {
    if (text.size() >= width) {
        return text;
    }
    return std::string(width - text.size(), ' ') + text;
}

std::int64_t clamp_i64(const std::int64_t value, const std::int64_t low,
                       const std::int64_t high) {
    return std::max(low, std::min(high, value));
}

struct ListEntry {
    std::string name;
    bool is_directory = false;
};

}  // namespace

ToolResult ToolHost::read_file_impl(const ReadArgs& args) const {
    const auto started = Clock::now();
    auto resolved = resolver_.resolve(args.path, PathAccess::Read);
    if (core::errors::is_error(resolved)) {
        return support::from_error(core::errors::get_error(resolved), started);
    }
    const auto& file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return support::failure(ErrorCode::InvalidArgs,
                                "Path is a directory: " + args.path + ". Use list instead.",
                                started);
    }

    auto bytes_result = support::read_file_bytes(file_path);
    if (core::errors::is_error(bytes_result)) {
        auto error = core::errors::get_error(bytes_result);
        if (error.category == core::errors::ErrorCategory::NotFound) {
            error.message = "File not found: " + args.path;
        }
        return support::from_error(error, started);
    }
    const std::string& bytes = core::errors::get_value(bytes_result);

    if (support::looks_binary(bytes)) {
        return support::success("Binary file (" + std::to_string(bytes.size()) +
                                    " bytes). Use shell to inspect.",
                                started);
    }

    const auto lines = split_lines(bytes);
    if (lines.empty()) {
        return support::success("(empty file)", started);
    }

    const auto total = static_cast<std::int64_t>(lines.size());
    const auto max_lines = static_cast<std::int64_t>(config_.limits.max_read_lines);
    const std::int64_t offset = clamp_i64(args.offset.value_or(1), 1, total);
    const std::int64_t limit = clamp_i64(args.limit.value_or(max_lines), 1, max_lines);
    const std::int64_t last = std::min(total, offset - 1 + limit);
    const std::size_t width = std::to_string(last).size();

    std::string output;
    std::int64_t emitted = 0;
    for (std::int64_t line_no = offset; line_no <= last; ++line_no) {
        const std::string rendered =
            pad_left(std::to_string(line_no), width) + "| " +
            lines[static_cast<std::size_t>(line_no - 1)];
        const std::size_t needed = rendered.size() + (emitted > 0 ? 1 : 0);
        if (output.size() + needed > config_.limits.max_read_chars) {
            if (emitted == 0) {
                // A single oversized line is cut rather than dropped.
                output = rendered.substr(0, config_.limits.max_read_chars);
                emitted = 1;
            }
            break;
        }
        if (emitted > 0) {
            output.push_back('\n');
        }
        output += rendered;
        ++emitted;
    }

    const std::int64_t next_offset = offset + emitted;
    if (next_offset <= total) {
        output += "\n[... truncated: " + std::to_string(total) +
                  " total lines. Use offset=" + std::to_string(next_offset) +
                  " to continue.]";
    }
    return support::success(std::move(output), started);
}

ToolResult ToolHost::write_file_impl(const WriteArgs& args) const {
    const auto started = Clock::now();

    // Content is persisted verbatim: <credential:X> placeholders stay placeholders.
    auto resolved = resolver_.resolve(args.path, PathAccess::Write);
    if (core::errors::is_error(resolved)) {
        return support::failure(ErrorCode::PermissionDenied,
                                "Write denied: \"" + args.path +
                                    "\" is outside the workspace." +
                                    read_only_hint(args.path),
                                started);
    }
    const auto& file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return support::failure(ErrorCode::InvalidArgs,
                                "Path is a directory: " + args.path, started);
    }

    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return support::failure(ErrorCode::ExecutionError,
                                "Failed to create parent directories for " + args.path +
                                    ": " + ec.message(),
                                started);
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return support::failure(ErrorCode::ExecutionError,
                                "Failed to open file for writing: " + args.path, started);
    }
    out << args.content;
    out.flush();
    if (!out.good()) {
        return support::failure(ErrorCode::ExecutionError,
                                "Failed to write file: " + args.path, started);
    }

    LOG_DEBUG("write: " + std::to_string(args.content.size()) + " bytes to " + args.path);
    return support::success("Wrote " + std::to_string(args.content.size()) +
                                " bytes to " + args.path,
                            started);
}

ToolResult ToolHost::list_directory_impl(const ListArgs& args) const {
    const auto started = Clock::now();
    auto resolved = resolver_.resolve(args.path, PathAccess::Read);
    if (core::errors::is_error(resolved)) {
        return support::from_error(core::errors::get_error(resolved), started);
    }
    const auto& dir_path = core::errors::get_value(resolved);
    const std::size_t cap = config_.limits.max_list_entries;
    const std::string capped_marker =
        "\n[... capped at " + std::to_string(cap) + " entries]";

    std::error_code ec;
    if (!std::filesystem::exists(dir_path, ec)) {
        return support::success("(directory does not exist)", started);
    }
    if (!std::filesystem::is_directory(dir_path, ec)) {
        return support::failure(ErrorCode::InvalidArgs,
                                "Not a directory: " + args.path + ". Use read instead.",
                                started);
    }

    if (args.recursive) {
        support::WalkOptions options;
        options.max_entries = cap;
        const auto files = support::walk_files(dir_path, options);
        std::string output;
        for (const auto& file : files) {
            if (!output.empty()) {
                output.push_back('\n');
            }
            output += file;
        }
        if (output.empty()) {
            output = "(empty directory)";
        }
        if (files.size() >= cap) {
            output += capped_marker;
        }
        return support::success(std::move(output), started);
    }

    std::vector<ListEntry> entries;
    std::filesystem::directory_iterator it(dir_path, ec);
    if (ec) {
        return support::failure(ErrorCode::ExecutionError,
                                "Failed to list " + args.path + ": " + ec.message(),
                                started);
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code status_ec;
        const bool is_dir =
            std::filesystem::is_directory(it->symlink_status(status_ec)) && !status_ec;
        entries.push_back({it->path().filename().string(), is_dir});
    }

    std::sort(entries.begin(), entries.end(), [](const ListEntry& a, const ListEntry& b) {
        if (a.is_directory != b.is_directory) {
            return a.is_directory;
        }
        return a.name < b.name;
    });

    std::string output;
    const std::size_t shown = std::min(entries.size(), cap);
    for (std::size_t i = 0; i < shown; ++i) {
        if (!output.empty()) {
            output.push_back('\n');
        }
        output += (entries[i].is_directory ? "[DIR]  " : "[FILE] ") + entries[i].name;
    }
    if (output.empty()) {
        output = "(empty directory)";
    }
    if (entries.size() > cap) {
        output += capped_marker;
    }
    return support::success(std::move(output), started);
}

ToolResult ToolHost::patch_file_impl(const PatchArgs& args) const {
    const auto started = Clock::now();

    // Patch mutates files, so only the writable root applies.
    auto resolved = resolver_.resolve(args.path, PathAccess::Write);
    if (core::errors::is_error(resolved)) {
        return support::failure(ErrorCode::PermissionDenied,
                                "Cannot patch: path is outside the writable workspace." +
                                    read_only_hint(args.path),
                                started);
    }
    const auto& file_path = core::errors::get_value(resolved);

    auto content_result = support::read_file_bytes(file_path);
    if (core::errors::is_error(content_result)) {
        auto error = core::errors::get_error(content_result);
        if (error.category == core::errors::ErrorCategory::NotFound) {
            error.message = "File not found: " + args.path;
        }
        return support::from_error(error, started);
    }
    const std::string& content = core::errors::get_value(content_result);

    const auto found = fuzzy_find_unique(content, args.old_text);
    if (!found.ok) {
        switch (found.error) {
            case FindError::NotFound:
                return support::failure(
                    ErrorCode::NotFound,
                    "old_text not found in file (tried exact + fuzzy matching)", started);
            case FindError::Ambiguous:
                return support::failure(
                    ErrorCode::InvalidArgs,
                    "old_text is ambiguous: found " + std::to_string(found.count) +
                        " times (must be exactly 1). Include surrounding lines to make "
                        "it unique.",
                    started, true);
            case FindError::InvalidArgs:
            default:
                return support::failure(ErrorCode::InvalidArgs, "old_text cannot be empty",
                                        started);
        }
    }

    std::string patched = content.substr(0, found.index);
    patched += args.new_text;
    patched += content.substr(found.index + found.length);

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return support::failure(ErrorCode::ExecutionError,
                                "Failed to open file for writing: " + args.path, started);
    }
    out << patched;
    out.flush();
    if (!out.good()) {
        return support::failure(ErrorCode::ExecutionError,
                                "Failed to write file: " + args.path, started);
    }

    return support::success("Patched " + args.path + ": -" +
                                std::to_string(count_lines(args.old_text)) + " lines, +" +
                                std::to_string(count_lines(args.new_text)) + " lines",
                            started);
}

}  // namespace toolsrv::tools
