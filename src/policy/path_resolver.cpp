#include "policy/path_resolver.hpp"

#include <system_error>
#include <utility>

namespace toolsrv::policy {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

ToolError denied() {
    return ToolError{ErrorCategory::Policy,
                     "Path traversal denied: path must stay within allowed directories",
                     "path_denied"};
}

}  // namespace

PathResolver::PathResolver(std::filesystem::path workspace_root,
                           std::filesystem::path shared_root)
    : workspace_root_(normalize(std::filesystem::absolute(workspace_root))),
      shared_root_(normalize(std::filesystem::absolute(shared_root))) {}

std::vector<std::filesystem::path> PathResolver::roots_for(const PathAccess access) const {
    if (access == PathAccess::Write) {
        return {workspace_root_};
    }
    return {workspace_root_, shared_root_};
}

std::filesystem::path PathResolver::normalize(const std::filesystem::path& path) {
    std::filesystem::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

bool PathResolver::is_within_root(const std::filesystem::path& root,
                                  const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::optional<std::filesystem::path> PathResolver::real_location(
    const std::filesystem::path& candidate) {
    std::error_code ec;
    std::filesystem::path existing = candidate;
    std::vector<std::filesystem::path> tail;

    // Walk up to the nearest ancestor that exists (a dangling symlink counts).
    while (true) {
        const auto status = std::filesystem::symlink_status(existing, ec);
        if (!ec && std::filesystem::exists(status)) {
            break;
        }
        if (existing == existing.root_path() || !existing.has_parent_path()) {
            return std::nullopt;
        }
        tail.push_back(existing.filename());
        existing = existing.parent_path();
    }

    std::filesystem::path real = std::filesystem::canonical(existing, ec);
    if (ec) {
        return std::nullopt;
    }
    for (auto it = tail.rbegin(); it != tail.rend(); ++it) {
        real /= *it;
    }
    return real;
}

core::errors::Result<std::filesystem::path> PathResolver::resolve(
    const std::string& requested, const PathAccess access) const {
    if (requested.find('\0') != std::string::npos) {
        return denied();
    }

    const auto roots = roots_for(access);
    for (const auto& root : roots) {
        const std::filesystem::path candidate = normalize(root / requested);
        const std::filesystem::path relative = candidate.lexically_relative(root);
        if (relative.empty() || relative.is_absolute() ||
            *relative.begin() == "..") {
            continue;
        }

        const auto real = real_location(candidate);
        if (!real.has_value()) {
            return denied();
        }

        std::error_code ec;
        for (const auto& allowed : roots) {
            const auto real_root = std::filesystem::canonical(allowed, ec);
            if (ec) {
                continue;
            }
            if (is_within_root(real_root, real.value())) {
                return real.value();
            }
        }
        return denied();
    }
    return denied();
}

std::optional<std::string> PathResolver::suggest_writable_path(
    const std::string& requested) const {
    const std::filesystem::path path(requested);
    if (!path.is_absolute()) {
        return std::nullopt;
    }
    const std::filesystem::path relative = normalize(path).lexically_relative(shared_root_);
    if (relative.empty() || *relative.begin() == "..") {
        return std::nullopt;
    }
    std::filesystem::path suggestion = shared_root_.filename();
    if (relative != ".") {
        suggestion /= relative;
    }
    return suggestion.generic_string();
}

}  // namespace toolsrv::policy
