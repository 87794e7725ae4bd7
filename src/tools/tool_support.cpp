#include "tools/tool_support.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <iterator>
#include <system_error>

namespace toolsrv::tools::support {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

constexpr std::size_t kBinarySniffBytes = 512;

bool is_ignored_directory(const std::string& name) {
    return name == "node_modules" || (!name.empty() && name.front() == '.');
}

struct DirEntry {
    std::string name;
    bool is_directory = false;
};

void walk(const std::filesystem::path& dir, const std::string& prefix,
          const WalkOptions& options, std::vector<std::string>& files) {
    std::error_code ec;
    std::vector<DirEntry> entries;
    std::filesystem::directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        // symlink_status: links are neither walked into nor reported.
        const auto status = it->symlink_status(ec);
        if (ec) {
            ec.clear();
            continue;
        }
        if (std::filesystem::is_directory(status)) {
            entries.push_back({it->path().filename().string(), true});
        } else if (std::filesystem::is_regular_file(status)) {
            entries.push_back({it->path().filename().string(), false});
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });

    for (const auto& entry : entries) {
        if (options.max_entries != 0 && files.size() >= options.max_entries) {
            return;
        }
        const std::string relative = prefix.empty() ? entry.name : prefix + "/" + entry.name;
        if (entry.is_directory) {
            if (is_ignored_directory(entry.name)) {
                continue;
            }
            walk(dir / entry.name, relative, options, files);
        } else {
            files.push_back(relative);
        }
    }
}

}  // namespace

bool looks_binary(const std::string& bytes) {
    const std::size_t sniffed = std::min(bytes.size(), kBinarySniffBytes);
    return std::find(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(sniffed),
                     '\0') != bytes.begin() + static_cast<std::ptrdiff_t>(sniffed);
}

core::errors::Result<std::string> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        const int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            return ToolError{ErrorCategory::NotFound, "File not found: " + path.string(),
                             "file_not_found"};
        }
        return ToolError{ErrorCategory::Execution,
                         "Failed to open file: " + path.string() + " (" +
                             std::strerror(err) + ")",
                         "file_open_failed"};
    }

    std::string bytes((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
    if (in.bad()) {
        return ToolError{ErrorCategory::Execution,
                         "I/O error while reading file: " + path.string(),
                         "file_read_failed"};
    }
    return bytes;
}

std::vector<std::string> walk_files(const std::filesystem::path& root,
                                    const WalkOptions& options) {
    std::vector<std::string> files;
    walk(root, "", options, files);
    return files;
}

}  // namespace toolsrv::tools::support
