#ifndef MESHWORK_REACTOR_MESH_HANDLE_H_
#define MESHWORK_REACTOR_MESH_HANDLE_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"

#include "acl/acl_registry.h"
#include "mesh/snapshot.h"
#include "mesh/version_store.h"
#include "unit.h"

namespace Meshwork {

/**
 * Read access for a unit, bound to one snapshot.
 *
 * Every read is checked against the ACL. Keys outside the snapshot are read
 * from the store the first time they are touched and then pinned, so a view
 * never returns two different versions of one key.
 */
class MeshView {
public:
    // Invoked for every denied access; write is false for reads.
    using DeniedCallback = std::function<void(const std::string& key, bool write)>;

    MeshView(UnitId unit_id, std::string unit_name, SnapshotPtr snapshot,
             const VersionStore* store, const AclRegistry& acl,
             DeniedCallback on_denied);
    virtual ~MeshView() = default;

    MeshView(const MeshView&) = delete;
    MeshView& operator=(const MeshView&) = delete;

    std::optional<VersionedValue> Get(const std::string& key);
    std::optional<std::string> GetValue(const std::string& key);
    // 0 when the key is absent or unreadable.
    uint64_t VersionOf(const std::string& key);
    // Readable snapshot keys matching pattern.
    std::vector<std::string> KeysMatching(const std::string& pattern);

    // Capture time of the snapshot; temporal triggers compare against it.
    WallTime Now() const { return snapshot_->captured_at(); }
    SnapshotId snapshot_id() const { return snapshot_->id(); }
    UnitId unit_id() const { return unit_id_; }
    const std::string& unit_name() const { return unit_name_; }
    size_t denied_accesses() const { return denied_; }

protected:
    bool Allowed(const std::string& key, bool write);
    // Value observed by this view, version 0 when absent.
    const VersionedValue& Observe(const std::string& key);

    const UnitId unit_id_;
    const std::string unit_name_;
    SnapshotPtr snapshot_;
    const VersionStore* store_;
    const AclRegistry& acl_;
    DeniedCallback on_denied_;
    size_t denied_ = 0;

private:
    absl::flat_hash_map<std::string, VersionedValue> pinned_;
};

/**
 * Write access handed to Unit::Act.
 *
 * Writes are buffered as compare-and-set intents against the version the
 * handle observed. Nothing reaches the store until the action returns; then
 * the whole buffer commits as one batch or not at all. Reads keep returning
 * snapshot values, not buffered writes or deletes.
 */
class MeshHandle : public MeshView {
public:
    MeshHandle(UnitId unit_id, std::string unit_name, SnapshotPtr snapshot,
               const VersionStore* store, const AclRegistry& acl,
               DeniedCallback on_denied,
               std::shared_ptr<const CancellationToken> token);

    // CAS against the observed version of key.
    MeshError Put(const std::string& key, std::string value);
    // CAS against an explicit version; 0 requires the key to be absent.
    MeshError CompareAndSet(const std::string& key, uint64_t expected_version, std::string value);
    // Deletes key at its observed version. kNotFound when the unit sees no
    // such key; deleting a key created earlier in the action drops the write.
    MeshError Delete(const std::string& key);

    // Safe point for cooperative cancellation. True once the execution was
    // interrupted, deregistered or ran past its deadline.
    bool ShouldStop() const;
    // kOk, or the reason the execution should stop.
    MeshError Checkpoint() const;

    bool HasWrites() const { return !writes_.empty(); }
    bool HasDeniedWrite() const { return denied_writes_ > 0; }

    WriteBatch TakeBatch();
    // Values observed for every written key before the action ran.
    absl::btree_map<std::string, std::string> BeforeImage();
    absl::btree_map<std::string, std::string> AfterImage() const;

private:
    MeshError Buffer(const std::string& key, uint64_t expected_version, std::string value,
                     bool remove = false);

    std::shared_ptr<const CancellationToken> token_;
    std::vector<WriteIntent> writes_;
    absl::flat_hash_map<std::string, size_t> write_index_;
    size_t denied_writes_ = 0;
};

} // namespace Meshwork

#endif // MESHWORK_REACTOR_MESH_HANDLE_H_
