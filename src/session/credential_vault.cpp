#include "session/credential_vault.hpp"

#include <cctype>
#include <mutex>

namespace toolsrv::session {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

constexpr const char kPlaceholderPrefix[] = "<credential:";
constexpr std::size_t kPlaceholderPrefixLength = sizeof(kPlaceholderPrefix) - 1;

bool is_name_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

}  // namespace

core::errors::Result<std::string> CredentialVault::insert(const std::string& name,
                                                          std::string value) {
    if (name.empty()) {
        return ToolError{ErrorCategory::Input, "Credential name cannot be empty.",
                         "invalid_credential_name"};
    }
    if (name.find('=') != std::string::npos ||
        name.find('\0') != std::string::npos) {
        return ToolError{ErrorCategory::Input,
                         "Credential name cannot contain '=' or NUL: " + name,
                         "invalid_credential_name"};
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    secrets_[name] = std::move(value);
    return name;
}

std::optional<std::string> CredentialVault::lookup(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = secrets_.find(name);
    if (it == secrets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CredentialVault::erase(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return secrets_.erase(name) > 0;
}

std::size_t CredentialVault::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return secrets_.size();
}

std::string CredentialVault::resolve_placeholders(const std::string& text) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::string resolved;
    resolved.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto start = text.find(kPlaceholderPrefix, pos);
        if (start == std::string::npos) {
            resolved.append(text, pos, std::string::npos);
            break;
        }
        resolved.append(text, pos, start - pos);

        std::size_t name_end = start + kPlaceholderPrefixLength;
        while (name_end < text.size() && is_name_char(text[name_end])) {
            ++name_end;
        }
        const std::size_t name_length = name_end - (start + kPlaceholderPrefixLength);
        if (name_length == 0 || name_end >= text.size() || text[name_end] != '>') {
            // Not a well-formed placeholder; keep the '<' and scan on.
            resolved.push_back(text[start]);
            pos = start + 1;
            continue;
        }

        const std::string name = text.substr(start + kPlaceholderPrefixLength, name_length);
        const auto it = secrets_.find(name);
        if (it != secrets_.end()) {
            resolved += it->second;
        } else {
            resolved.append(text, start, name_end + 1 - start);
        }
        pos = name_end + 1;
    }
    return resolved;
}

std::vector<std::pair<std::string, std::string>> CredentialVault::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return {secrets_.begin(), secrets_.end()};
}

}  // namespace toolsrv::session
