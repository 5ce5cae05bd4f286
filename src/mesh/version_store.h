#ifndef MESHWORK_MESH_VERSION_STORE_H_
#define MESHWORK_MESH_VERSION_STORE_H_

#include <array>
#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "common/mesh_error.h"
#include "interfaces.h"
#include "mesh_entry.h"

namespace Meshwork {

/**
 * VersionStore owns every mesh entry.
 *
 * Keys are spread over a fixed number of shards, each guarded by its own
 * shared_mutex. Compare-and-set is the only mutation primitive; a WriteBatch
 * takes the exclusive locks of the shards it touches in ascending shard order,
 * validates every expected version and applies all writes before releasing
 * them, so a multi-key mutation becomes visible all at once. Readers only ever
 * lock the shards of the keys they ask for.
 *
 * Deleted keys stay behind as tombstones so a key recreated later continues
 * above its old version.
 */
class VersionStore {
public:
    static constexpr size_t kNumShards = 64;

    explicit VersionStore(size_t max_value_bytes = 1UL << 20);

    VersionStore(const VersionStore&) = delete;
    VersionStore& operator=(const VersionStore&) = delete;

    std::optional<VersionedValue> Get(const std::string& key) const;
    std::optional<MeshEntry> GetEntry(const std::string& key) const;

    // expected_version 0 means the key must not exist yet.
    MeshError CompareAndSet(const std::string& key, uint64_t expected_version,
                            std::string value, UnitId writer, uint64_t* new_version);
    // Leaves a tombstone at the next version. expected_version must name the
    // live version; a missing key conflicts.
    MeshError CompareAndDelete(const std::string& key, uint64_t expected_version,
                               UnitId writer, uint64_t* tombstone_version);

    // All-or-nothing commit. On conflict, conflict_key names the first stale key.
    MeshError Commit(const WriteBatch& batch,
                     std::vector<uint64_t>* new_versions,
                     std::string* conflict_key);

    // Consistent read of every key matching one of the patterns. Fails with
    // kInvalidArgument when more than max_keys entries match.
    MeshError ReadConsistent(const std::vector<std::string>& patterns,
                             size_t max_keys,
                             absl::btree_map<std::string, VersionedValue>* out) const;

    // Keys committed since the previous drain, in commit order, deduplicated.
    std::vector<std::string> DrainChanges();

    void SetBackend(IMeshBackend* backend) { backend_ = backend; }
    void SetChangeListener(IChangeListener* listener) { listener_ = listener; }
    // Merges the backend's entries. A loaded version lower than the one held
    // in memory marks the store corrupted.
    MeshError LoadFromBackend();

    bool Corrupted() const { return corrupted_.load(std::memory_order_acquire); }
    uint64_t CommittedMutations() const { return committed_mutations_.load(std::memory_order_relaxed); }
    uint64_t Conflicts() const { return conflicts_.load(std::memory_order_relaxed); }
    // Live keys; tombstones are not counted.
    size_t Size() const;

private:
    struct Shard {
        absl::flat_hash_map<std::string, MeshEntry> data;
        mutable std::shared_mutex mutex;

        Shard() = default;
        Shard(const Shard&) = delete;
        Shard& operator=(const Shard&) = delete;
    };

    size_t GetShardIndex(const std::string& key) const;
    std::vector<size_t> ShardsFor(const std::vector<std::string>& keys) const;
    void MarkCorrupted(const std::string& key, uint64_t held, uint64_t seen);
    void RecordChanges(const std::vector<MeshEntry>& committed);

    std::array<Shard, kNumShards> shards_;
    const size_t max_value_bytes_;
    IMeshBackend* backend_ = nullptr;
    IChangeListener* listener_ = nullptr;

    absl::Mutex journal_mu_;
    std::vector<std::string> journal_;

    std::atomic<bool> corrupted_{false};
    std::atomic<uint64_t> committed_mutations_{0};
    std::atomic<uint64_t> conflicts_{0};
};

} // namespace Meshwork

#endif // MESHWORK_MESH_VERSION_STORE_H_
