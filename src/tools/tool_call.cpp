#include "tools/tool_call.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <type_traits>

namespace toolsrv::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

// Models often reach for intuitive names instead of the documented ones.
const std::initializer_list<const char*> kPathAliases = {"path", "file", "filename",
                                                         "filepath"};
const std::initializer_list<const char*> kOldTextAliases = {"old_text", "oldText", "search",
                                                            "match", "text"};
const std::initializer_list<const char*> kNewTextAliases = {"new_text", "newText", "replace",
                                                            "replacement"};

std::optional<std::string> string_field(const json& args,
                                        std::initializer_list<const char*> names) {
    for (const char* name : names) {
        const auto it = args.find(name);
        if (it != args.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

std::optional<std::int64_t> integer_field(const json& args, const char* name) {
    const auto it = args.find(name);
    if (it == args.end() || !it->is_number()) {
        return std::nullopt;
    }
    const double value = std::floor(it->get<double>());
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    if (value > 9.0e15) {
        return static_cast<std::int64_t>(9.0e15);
    }
    if (value < -9.0e15) {
        return static_cast<std::int64_t>(-9.0e15);
    }
    return static_cast<std::int64_t>(value);
}

std::string received_keys(const json& args) {
    std::string keys;
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (!keys.empty()) {
            keys += ", ";
        }
        keys += it.key();
    }
    return keys;
}

ToolError missing_path(const json& args, const std::string& usage) {
    std::string message = "Missing \"path\" argument. Usage: " + usage + ".";
    const std::string received = received_keys(args);
    if (!received.empty()) {
        message += " You passed: {" + received + "}. Use \"path\" instead.";
    }
    return ToolError{ErrorCategory::Input, message, "missing_path"};
}

core::errors::Result<ToolCall> parse_bash(const json& args) {
    BashArgs call;
    const auto command = string_field(args, {"command"});
    if (!command.has_value() || command->empty()) {
        return ToolError{ErrorCategory::Input,
                         "Missing \"command\" argument. Usage: bash({command: \"ls -la\"}).",
                         "missing_command"};
    }
    call.command = command.value();
    const auto timeout = integer_field(args, "timeout");
    if (timeout.has_value() && timeout.value() > 0) {
        call.timeout_ms = static_cast<std::uint32_t>(
            std::min<std::int64_t>(timeout.value(), 0xFFFFFFFFLL));
    }
    call.description = string_field(args, {"description"});
    return call;
}

core::errors::Result<ToolCall> parse_read(const json& args) {
    ReadArgs call;
    const auto path = string_field(args, kPathAliases);
    if (!path.has_value() || path->empty()) {
        return missing_path(args, "read({path: \"file.txt\"})");
    }
    call.path = path.value();
    call.offset = integer_field(args, "offset");
    call.limit = integer_field(args, "limit");
    return call;
}

core::errors::Result<ToolCall> parse_write(const json& args) {
    WriteArgs call;
    const auto path = string_field(args, kPathAliases);
    if (!path.has_value() || path->empty()) {
        return missing_path(args, "write({path: \"file.txt\", content: \"...\"})");
    }
    call.path = path.value();

    const auto content = args.find("content");
    if (content == args.end() || content->is_null()) {
        return ToolError{ErrorCategory::Input,
                         "Missing \"content\" argument. Provide the file content as a string.",
                         "missing_content"};
    }
    if (content->is_string()) {
        call.content = content->get<std::string>();
    } else {
        call.content = content->dump(2, ' ', false, json::error_handler_t::replace);
    }
    return call;
}

core::errors::Result<ToolCall> parse_list(const json& args) {
    ListArgs call;
    const auto path = string_field(args, {"path", "directory"});
    if (path.has_value() && !path->empty()) {
        call.path = path.value();
    }
    const auto recursive = args.find("recursive");
    call.recursive = recursive != args.end() && recursive->is_boolean() &&
                     recursive->get<bool>();
    return call;
}

core::errors::Result<ToolCall> parse_glob(const json& args) {
    GlobArgs call;
    const auto pattern = string_field(args, {"pattern"});
    if (!pattern.has_value() || pattern->empty()) {
        return ToolError{ErrorCategory::Input, "Missing \"pattern\" argument.",
                         "missing_pattern"};
    }
    call.pattern = pattern.value();
    const auto path = string_field(args, {"path"});
    if (path.has_value() && !path->empty()) {
        call.path = path.value();
    }
    return call;
}

core::errors::Result<ToolCall> parse_grep(const json& args) {
    GrepArgs call;
    const auto pattern = string_field(args, {"pattern"});
    if (!pattern.has_value() || pattern->empty()) {
        std::string message =
            "Missing \"pattern\" argument. Usage: grep({pattern: \"regex\", path: \"dir\"}).";
        const std::string received = received_keys(args);
        if (!received.empty()) {
            message += " You passed: {" + received + "}.";
        }
        return ToolError{ErrorCategory::Input, message, "missing_pattern"};
    }
    call.pattern = pattern.value();
    const auto path = string_field(args, {"path"});
    if (path.has_value() && !path->empty()) {
        call.path = path.value();
    }
    const auto glob = string_field(args, {"glob"});
    if (glob.has_value() && !glob->empty()) {
        call.glob = glob;
    }
    return call;
}

core::errors::Result<ToolCall> parse_patch(const json& args) {
    const auto path = string_field(args, kPathAliases);
    const auto old_text = string_field(args, kOldTextAliases);
    const auto new_text = string_field(args, kNewTextAliases);

    std::string missing;
    auto note_missing = [&missing](const char* name) {
        if (!missing.empty()) {
            missing += ", ";
        }
        missing += name;
    };
    if (!path.has_value() || path->empty()) {
        note_missing("\"path\"");
    }
    if (!old_text.has_value() || old_text->empty()) {
        note_missing("\"old_text\"");
    }
    if (!new_text.has_value()) {
        note_missing("\"new_text\"");
    }

    if (!missing.empty()) {
        std::string message =
            "Missing required arguments: " + missing +
            ". Usage: patch({path: \"file.txt\", old_text: \"find this\", new_text: "
            "\"replace with\"}).";
        const std::string received = received_keys(args);
        if (!received.empty()) {
            message += " You passed: {" + received + "}.";
        }
        return ToolError{ErrorCategory::Input, message, "missing_patch_arguments"};
    }

    return PatchArgs{path.value(), old_text.value(), new_text.value()};
}

// Older sessions address the filesystem family as {action, path}.
core::errors::Result<ToolCall> parse_legacy_filesystem(json args) {
    if (!args.contains("action") && !args.contains("path")) {
        for (const char* action : {"read", "write", "list"}) {
            const auto it = args.find(action);
            if (it != args.end() && it->is_string()) {
                args["path"] = *it;
                args["action"] = action;
                break;
            }
        }
    }

    const auto action = string_field(args, {"action"});
    if (action.has_value() && action.value() == "write") {
        return parse_write(args);
    }
    if (action.has_value() && action.value() == "list") {
        return parse_list(args);
    }
    return parse_read(args);
}

}  // namespace

std::string tool_name(const ToolCall& call) {
    return std::visit(
        [](const auto& args) -> std::string {
            using T = std::decay_t<decltype(args)>;
            if constexpr (std::is_same_v<T, BashArgs>) {
                return "bash";
            } else if constexpr (std::is_same_v<T, ReadArgs>) {
                return "read";
            } else if constexpr (std::is_same_v<T, WriteArgs>) {
                return "write";
            } else if constexpr (std::is_same_v<T, ListArgs>) {
                return "list";
            } else if constexpr (std::is_same_v<T, GlobArgs>) {
                return "glob";
            } else if constexpr (std::is_same_v<T, GrepArgs>) {
                return "grep";
            } else {
                static_assert(std::is_same_v<T, PatchArgs>, "unhandled tool call");
                return "patch";
            }
        },
        call);
}

core::errors::Result<ToolCall> parse_tool_call(const std::string& tool,
                                               const json& args) {
    const json& object = args.is_object() ? args : json::object();
    if (!args.is_object() && !args.is_null()) {
        return ToolError{ErrorCategory::Input, "Tool arguments must be a JSON object.",
                         "invalid_arguments"};
    }

    if (tool == "bash") {
        return parse_bash(object);
    }
    if (tool == "read") {
        return parse_read(object);
    }
    if (tool == "write") {
        return parse_write(object);
    }
    if (tool == "list") {
        return parse_list(object);
    }
    if (tool == "glob") {
        return parse_glob(object);
    }
    if (tool == "grep") {
        return parse_grep(object);
    }
    if (tool == "patch") {
        return parse_patch(object);
    }
    if (tool == "filesystem") {
        return parse_legacy_filesystem(object);
    }

    return ToolError{ErrorCategory::Input, "Unknown tool: " + tool, "unknown_tool"};
}

}  // namespace toolsrv::tools
