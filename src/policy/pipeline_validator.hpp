#pragma once

#include <optional>
#include <set>
#include <string>

namespace toolsrv::policy {

struct PipelinePolicy {
    std::set<std::string> allowed_commands = {
        "echo", "cat",  "head", "tail", "wc",   "grep",  "sort",   "uniq",
        "cut",  "awk",  "sed",  "ls",   "pwd",  "mkdir", "cp",     "mv",
        "find", "date", "curl", "wget", "jq",   "uname", "whoami", "id"};
    std::set<std::string> network_commands = {"curl", "wget"};
};

struct PipelineValidation {
    bool ok = false;
    std::optional<std::string> error;
    bool has_network = false;
};

class PipelineValidator {
public:
    explicit PipelineValidator(PipelinePolicy policy = {});

    // Accepts one or more allowlisted commands joined by single pipes.
    PipelineValidation validate(const std::string& command) const;

    const PipelinePolicy& policy() const { return policy_; }

private:
    static std::string trim(const std::string& value);
    static std::string command_name(const std::string& segment);
    std::string allowlist_text() const;

    PipelinePolicy policy_;
};

}  // namespace toolsrv::policy
