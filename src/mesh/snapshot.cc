#include "snapshot.h"

#include <glog/logging.h>
#include "version_store.h"

namespace Meshwork {

std::optional<VersionedValue> Snapshot::Get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const VersionedValue* Snapshot::Find(const std::string& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

uint64_t Snapshot::VersionOf(const std::string& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? 0 : it->second.version;
}

std::vector<std::string> Snapshot::KeysMatching(const std::string& pattern) const {
    std::vector<std::string> keys;
    if (!IsPrefixPattern(pattern)) {
        if (Contains(pattern)) keys.push_back(pattern);
        return keys;
    }
    const std::string prefix = pattern.substr(0, pattern.size() - 1);
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        keys.push_back(it->first);
    }
    return keys;
}

SnapshotManager::SnapshotManager(const VersionStore& store, size_t max_keys)
    : store_(store), max_keys_(max_keys) {}

MeshError SnapshotManager::Capture(const std::vector<std::string>& patterns, SnapshotPtr* out) {
    Snapshot::Entries entries;
    MeshError err = store_.ReadConsistent(patterns, max_keys_, &entries);
    if (err != MeshError::kOk) {
        return err;
    }
    SnapshotId id = next_id_.fetch_add(1, std::memory_order_relaxed);
    *out = std::make_shared<const Snapshot>(id, WallClock::now(), std::move(entries));
    VLOG(3) << "Captured snapshot " << id << " with " << (*out)->size() << " entries";
    return MeshError::kOk;
}

} // namespace Meshwork
