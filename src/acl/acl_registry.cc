#include "acl_registry.h"

#include <glog/logging.h>

namespace Meshwork {

MeshError AclRegistry::AddNamespace(NamespaceRule rule) {
    if (rule.prefix.empty()) {
        LOG(ERROR) << "ACL namespace with empty prefix";
        return MeshError::kInvalidArgument;
    }
    if (rule.writers.empty() && !rule.read_only) {
        LOG(ERROR) << "ACL namespace " << rule.prefix << " has no writers and is not read_only";
        return MeshError::kInvalidArgument;
    }
    if (!rule.writers.empty() && rule.read_only) {
        LOG(ERROR) << "ACL namespace " << rule.prefix << " is read_only but names writers";
        return MeshError::kInvalidArgument;
    }
    absl::MutexLock lock(&mu_);
    std::string prefix = rule.prefix;
    rules_[prefix] = std::move(rule);
    VLOG(1) << "ACL namespace registered: " << prefix;
    return MeshError::kOk;
}

void AclRegistry::Clear() {
    absl::MutexLock lock(&mu_);
    rules_.clear();
}

void AclRegistry::SetDefaultAllow(bool allow) {
    absl::MutexLock lock(&mu_);
    default_allow_ = allow;
}

bool AclRegistry::DefaultAllow() const {
    absl::ReaderMutexLock lock(&mu_);
    return default_allow_;
}

const NamespaceRule* AclRegistry::ResolveLocked(const std::string& key) const {
    auto whole = rules_.find(key);
    if (whole != rules_.end()) {
        return &whole->second;
    }
    // Walk ':' boundaries from the longest candidate to the shortest
    size_t pos = key.rfind(':');
    while (pos != std::string::npos) {
        auto it = rules_.find(key.substr(0, pos));
        if (it != rules_.end()) {
            return &it->second;
        }
        if (pos == 0) break;
        pos = key.rfind(':', pos - 1);
    }
    return nullptr;
}

bool AclRegistry::Check(const std::string& unit, const std::string& key, bool write) const {
    bool allowed;
    {
        absl::ReaderMutexLock lock(&mu_);
        const NamespaceRule* rule = ResolveLocked(key);
        if (rule == nullptr) {
            allowed = default_allow_;
        } else {
            const auto& members = write ? rule->writers : rule->readers;
            allowed = members.contains(unit) || members.contains(kAclWildcard);
        }
    }
    if (!allowed) {
        denials_.fetch_add(1, std::memory_order_relaxed);
        VLOG(2) << "ACL denied " << (write ? "write" : "read") << " of " << key << " to " << unit;
    }
    return allowed;
}

bool AclRegistry::CanRead(const std::string& unit, const std::string& key) const {
    return Check(unit, key, false);
}

bool AclRegistry::CanWrite(const std::string& unit, const std::string& key) const {
    return Check(unit, key, true);
}

std::string AclRegistry::NamespaceOf(const std::string& key) const {
    absl::ReaderMutexLock lock(&mu_);
    const NamespaceRule* rule = ResolveLocked(key);
    return rule == nullptr ? std::string() : rule->prefix;
}

size_t AclRegistry::NamespaceCount() const {
    absl::ReaderMutexLock lock(&mu_);
    return rules_.size();
}

} // namespace Meshwork
