#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace toolsrv::policy {

enum class PathAccess {
    Read,   // workspace root, then the read-only shared root
    Write   // workspace root only
};

// Confines caller-supplied paths to the configured roots, following symlinks.
class PathResolver {
public:
    PathResolver(std::filesystem::path workspace_root,
                 std::filesystem::path shared_root);

    // Roots are tried in order and the first one that accepts the path wins.
    core::errors::Result<std::filesystem::path> resolve(
        const std::string& requested, PathAccess access) const;

    // For a path that names the read-only root, the equivalent workspace-relative
    // path (e.g. "/skills/a.md" -> "skills/a.md").
    std::optional<std::string> suggest_writable_path(const std::string& requested) const;

    const std::filesystem::path& workspace_root() const { return workspace_root_; }
    const std::filesystem::path& shared_root() const { return shared_root_; }

private:
    std::vector<std::filesystem::path> roots_for(PathAccess access) const;

    static std::filesystem::path normalize(const std::filesystem::path& path);
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::optional<std::filesystem::path> real_location(
        const std::filesystem::path& candidate);

    std::filesystem::path workspace_root_;
    std::filesystem::path shared_root_;
};

}  // namespace toolsrv::policy
