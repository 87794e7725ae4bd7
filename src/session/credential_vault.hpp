#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace toolsrv::session {

// Process-scoped secret store. Values only leave through lookup(), placeholder
// resolution for a shell command, and the environment of a spawned shell.
class CredentialVault {
public:
    CredentialVault() = default;
    CredentialVault(const CredentialVault&) = delete;
    CredentialVault& operator=(const CredentialVault&) = delete;

    // Returns the stored name. Names must be usable as environment variable names.
    core::errors::Result<std::string> insert(const std::string& name, std::string value);
    std::optional<std::string> lookup(const std::string& name) const;
    bool erase(const std::string& name);
    std::size_t size() const;

    // Replaces every <credential:NAME> with its value; unknown names stay verbatim.
    std::string resolve_placeholders(const std::string& text) const;

    // Consistent copy of all entries, for building a subprocess environment.
    std::vector<std::pair<std::string, std::string>> snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> secrets_;
};

}  // namespace toolsrv::session
