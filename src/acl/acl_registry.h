#ifndef MESHWORK_ACL_ACL_REGISTRY_H_
#define MESHWORK_ACL_ACL_REGISTRY_H_

#include <atomic>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "common/mesh_error.h"

namespace Meshwork {

// Grants every unit when present in a reader or writer set.
constexpr char kAclWildcard[] = "*";

struct NamespaceRule {
    // Key prefix, matched on ':' boundaries ("content" governs "content:a:1").
    std::string prefix;
    absl::flat_hash_set<std::string> readers;
    absl::flat_hash_set<std::string> writers;
    // Frozen namespaces carry no writers on purpose.
    bool read_only = false;
};

/**
 * AclRegistry maps key namespaces to the units that may read or write them.
 * Units are named by their descriptor name, which stays stable across
 * restarts, unlike the UnitId handed out at registration.
 */
class AclRegistry {
public:
    explicit AclRegistry(bool default_allow = false) : default_allow_(default_allow) {}

    AclRegistry(const AclRegistry&) = delete;
    AclRegistry& operator=(const AclRegistry&) = delete;

    // Rejects rules with no writers unless read_only, and read_only rules that
    // name writers.
    MeshError AddNamespace(NamespaceRule rule);
    void Clear();
    void SetDefaultAllow(bool allow);
    bool DefaultAllow() const;

    bool CanRead(const std::string& unit, const std::string& key) const;
    bool CanWrite(const std::string& unit, const std::string& key) const;

    // Longest declared namespace governing key, empty if none.
    std::string NamespaceOf(const std::string& key) const;
    size_t NamespaceCount() const;
    uint64_t Denials() const { return denials_.load(std::memory_order_relaxed); }

private:
    const NamespaceRule* ResolveLocked(const std::string& key) const
        ABSL_SHARED_LOCKS_REQUIRED(mu_);
    bool Check(const std::string& unit, const std::string& key, bool write) const;

    mutable absl::Mutex mu_;
    absl::flat_hash_map<std::string, NamespaceRule> rules_ ABSL_GUARDED_BY(mu_);
    bool default_allow_ ABSL_GUARDED_BY(mu_);
    mutable std::atomic<uint64_t> denials_{0};
};

/**
 * Loads an ACL manifest document into registry. Every problem found is
 * appended to errors; the registry is left untouched on failure.
 *
 *   default_policy: deny
 *   namespaces:
 *     - prefix: content
 *       readers: ["*"]
 *       writers: [publisher]
 *     - prefix: settings
 *       read_only: true
 *       readers: ["*"]
 */
bool LoadAclManifestFile(const std::string& path, AclRegistry& registry,
                         std::vector<std::string>* errors);
bool LoadAclManifestString(const std::string& yaml_content, AclRegistry& registry,
                           std::vector<std::string>* errors);

} // namespace Meshwork

#endif // MESHWORK_ACL_ACL_REGISTRY_H_
