#include "policy/pipeline_validator.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace toolsrv::policy {

namespace {

// Everything that enables injection once the lone pipe is taken out.
constexpr const char kDangerousMetachars[] = ";`$()><!\n\\&";

PipelineValidation reject(std::string message) {
    PipelineValidation result;
    result.ok = false;
    result.error = std::move(message);
    result.has_network = false;
    return result;
}

}  // namespace

PipelineValidator::PipelineValidator(PipelinePolicy policy)
    : policy_(std::move(policy)) {}

std::string PipelineValidator::trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::string PipelineValidator::command_name(const std::string& segment) {
    std::size_t token_end = 0;
    while (token_end < segment.size() &&
           std::isspace(static_cast<unsigned char>(segment[token_end])) == 0) {
        ++token_end;
    }
    const std::string token = segment.substr(0, token_end);
    const auto slash = token.find_last_of('/');
    if (slash == std::string::npos) {
        return token;
    }
    return token.substr(slash + 1);
}

std::string PipelineValidator::allowlist_text() const {
    std::string text;
    for (const auto& name : policy_.allowed_commands) {
        if (!text.empty()) {
            text += ", ";
        }
        text += name;
    }
    return text;
}

PipelineValidation PipelineValidator::validate(const std::string& command) const {
    if (command.find("&&") != std::string::npos ||
        command.find("||") != std::string::npos) {
        return reject("Command contains disallowed control operators (|| or &&)");
    }

    std::string without_pipes;
    without_pipes.reserve(command.size());
    for (const char c : command) {
        if (c != '|') {
            without_pipes.push_back(c);
        }
    }
    if (without_pipes.find_first_of(kDangerousMetachars) != std::string::npos) {
        return reject("Command contains disallowed metacharacters");
    }

    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        const auto pipe = command.find('|', start);
        if (pipe == std::string::npos) {
            segments.push_back(trim(command.substr(start)));
            break;
        }
        segments.push_back(trim(command.substr(start, pipe - start)));
        start = pipe + 1;
    }

    for (const auto& segment : segments) {
        if (segment.empty()) {
            return reject("Empty pipeline segment");
        }
    }

    PipelineValidation result;
    for (const auto& segment : segments) {
        const std::string name = command_name(segment);
        if (policy_.allowed_commands.count(name) == 0) {
            return reject("Command not allowed: " + name + ". Allowed: " +
                          allowlist_text());
        }
        if (policy_.network_commands.count(name) > 0) {
            result.has_network = true;
        }
    }

    result.ok = true;
    return result;
}

}  // namespace toolsrv::policy
