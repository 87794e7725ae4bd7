#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"

namespace toolsrv::tools {

struct BashArgs {
    std::string command;
    std::optional<std::uint32_t> timeout_ms;
    std::optional<std::string> description;
};

struct ReadArgs {
    std::string path;
    std::optional<std::int64_t> offset;
    std::optional<std::int64_t> limit;
};

struct WriteArgs {
    std::string path;
    std::string content;
};

struct ListArgs {
    std::string path = ".";
    bool recursive = false;
};

struct GlobArgs {
    std::string pattern;
    std::string path = ".";
};

struct GrepArgs {
    std::string pattern;
    std::string path = ".";
    std::optional<std::string> glob;
};

struct PatchArgs {
    std::string path;
    std::string old_text;
    std::string new_text;
};

using ToolCall = std::variant<
    BashArgs,
    ReadArgs,
    WriteArgs,
    ListArgs,
    GlobArgs,
    GrepArgs,
    PatchArgs>;

std::string tool_name(const ToolCall& call);

// Decodes a tool name plus raw arguments. Unknown names and malformed
// arguments come back as Input errors carrying a usage hint.
core::errors::Result<ToolCall> parse_tool_call(const std::string& tool,
                                               const nlohmann::json& args);

}  // namespace toolsrv::tools
