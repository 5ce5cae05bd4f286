#ifndef MESHWORK_MESH_SNAPSHOT_H_
#define MESHWORK_MESH_SNAPSHOT_H_

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

#include "common/mesh_error.h"
#include "common/types.h"
#include "mesh_entry.h"

namespace Meshwork {

class VersionStore;

/**
 * Immutable point-in-time copy of a key subset.
 * Every accessor is const and the entries are owned by value, so any number
 * of threads may read one Snapshot without synchronization.
 */
class Snapshot {
public:
    using Entries = absl::btree_map<std::string, VersionedValue>;

    Snapshot(SnapshotId id, WallTime captured_at, Entries entries)
        : id_(id), captured_at_(captured_at), entries_(std::move(entries)) {}

    SnapshotId id() const { return id_; }
    // Wall-clock time of capture; temporal triggers evaluate against it.
    WallTime captured_at() const { return captured_at_; }

    std::optional<VersionedValue> Get(const std::string& key) const;
    const VersionedValue* Find(const std::string& key) const;
    bool Contains(const std::string& key) const { return entries_.count(key) > 0; }
    // Version captured for key, 0 when absent.
    uint64_t VersionOf(const std::string& key) const;

    std::vector<std::string> KeysMatching(const std::string& pattern) const;
    const Entries& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

private:
    const SnapshotId id_;
    const WallTime captured_at_;
    const Entries entries_;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

/**
 * Produces snapshots from the version store. Snapshots are never persisted;
 * they live as long as the last holder of the SnapshotPtr.
 */
class SnapshotManager {
public:
    SnapshotManager(const VersionStore& store, size_t max_keys);

    MeshError Capture(const std::vector<std::string>& patterns, SnapshotPtr* out);

    uint64_t CapturedCount() const { return next_id_.load(std::memory_order_relaxed) - 1; }

private:
    const VersionStore& store_;
    const size_t max_keys_;
    std::atomic<SnapshotId> next_id_{1};
};

} // namespace Meshwork

#endif // MESHWORK_MESH_SNAPSHOT_H_
