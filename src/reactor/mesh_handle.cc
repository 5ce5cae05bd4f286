#include "mesh_handle.h"

#include <glog/logging.h>

namespace Meshwork {

MeshView::MeshView(UnitId unit_id, std::string unit_name, SnapshotPtr snapshot,
                   const VersionStore* store, const AclRegistry& acl,
                   DeniedCallback on_denied)
    : unit_id_(unit_id),
      unit_name_(std::move(unit_name)),
      snapshot_(std::move(snapshot)),
      store_(store),
      acl_(acl),
      on_denied_(std::move(on_denied)) {
    if (!snapshot_) {
        LOG(FATAL) << "MeshView for unit " << unit_name_ << " created without a snapshot";
    }
}

bool MeshView::Allowed(const std::string& key, bool write) {
    bool ok = write ? acl_.CanWrite(unit_name_, key) : acl_.CanRead(unit_name_, key);
    if (!ok) {
        denied_++;
        VLOG(1) << "Unit " << unit_name_ << " denied " << (write ? "write" : "read")
                << " of " << key;
        if (on_denied_) {
            on_denied_(key, write);
        }
    }
    return ok;
}

const VersionedValue& MeshView::Observe(const std::string& key) {
    if (const VersionedValue* captured = snapshot_->Find(key)) {
        return *captured;
    }
    auto it = pinned_.find(key);
    if (it != pinned_.end()) {
        return it->second;
    }
    VersionedValue live;
    if (store_) {
        if (auto current = store_->Get(key)) {
            live = std::move(*current);
        }
    }
    return pinned_.emplace(key, std::move(live)).first->second;
}

std::optional<VersionedValue> MeshView::Get(const std::string& key) {
    if (!Allowed(key, false)) {
        return std::nullopt;
    }
    const VersionedValue& observed = Observe(key);
    if (observed.version == 0) {
        return std::nullopt;
    }
    return observed;
}

std::optional<std::string> MeshView::GetValue(const std::string& key) {
    auto value = Get(key);
    if (!value) {
        return std::nullopt;
    }
    return std::move(value->value);
}

uint64_t MeshView::VersionOf(const std::string& key) {
    auto value = Get(key);
    return value ? value->version : 0;
}

std::vector<std::string> MeshView::KeysMatching(const std::string& pattern) {
    std::vector<std::string> out;
    for (auto& key : snapshot_->KeysMatching(pattern)) {
        if (acl_.CanRead(unit_name_, key)) {
            out.push_back(std::move(key));
        }
    }
    return out;
}

MeshHandle::MeshHandle(UnitId unit_id, std::string unit_name, SnapshotPtr snapshot,
                       const VersionStore* store, const AclRegistry& acl,
                       DeniedCallback on_denied,
                       std::shared_ptr<const CancellationToken> token)
    : MeshView(unit_id, std::move(unit_name), std::move(snapshot), store, acl,
               std::move(on_denied)),
      token_(std::move(token)) {}

MeshError MeshHandle::Put(const std::string& key, std::string value) {
    if (!Allowed(key, true)) {
        denied_writes_++;
        return MeshError::kAccessDenied;
    }
    uint64_t expected = Observe(key).version;
    return Buffer(key, expected, std::move(value));
}

MeshError MeshHandle::CompareAndSet(const std::string& key, uint64_t expected_version,
                                    std::string value) {
    if (!Allowed(key, true)) {
        denied_writes_++;
        return MeshError::kAccessDenied;
    }
    // Pin the key so the before image reflects what the unit could have seen.
    Observe(key);
    return Buffer(key, expected_version, std::move(value));
}

MeshError MeshHandle::Delete(const std::string& key) {
    if (!Allowed(key, true)) {
        denied_writes_++;
        return MeshError::kAccessDenied;
    }
    uint64_t expected = Observe(key).version;
    return Buffer(key, expected, std::string(), /*remove=*/true);
}

MeshError MeshHandle::Buffer(const std::string& key, uint64_t expected_version, std::string value,
                             bool remove) {
    if (key.empty()) {
        return MeshError::kInvalidArgument;
    }
    MeshError stop = Checkpoint();
    if (stop != MeshError::kOk) {
        return stop;
    }
    auto it = write_index_.find(key);
    if (it != write_index_.end()) {
        // Rewriting a key keeps the first expected version: one CAS per key.
        WriteIntent& intent = writes_[it->second];
        if (remove && intent.expected_version == 0) {
            // Created and deleted within one action: nothing to commit.
            writes_.erase(writes_.begin() + it->second);
            write_index_.clear();
            for (size_t i = 0; i < writes_.size(); ++i) {
                write_index_.emplace(writes_[i].key, i);
            }
            return MeshError::kOk;
        }
        intent.value = std::move(value);
        intent.remove = remove;
        return MeshError::kOk;
    }
    if (remove && expected_version == 0) {
        return MeshError::kNotFound;
    }
    write_index_.emplace(key, writes_.size());
    WriteIntent intent;
    intent.key = key;
    intent.expected_version = expected_version;
    intent.value = std::move(value);
    intent.remove = remove;
    writes_.push_back(std::move(intent));
    return MeshError::kOk;
}

bool MeshHandle::ShouldStop() const {
    return Checkpoint() != MeshError::kOk;
}

MeshError MeshHandle::Checkpoint() const {
    if (!token_) {
        return MeshError::kOk;
    }
    MeshError reason = token_->reason();
    if (reason != MeshError::kOk) {
        return reason;
    }
    if (token_->Expired(SteadyClock::now())) {
        return MeshError::kTimeout;
    }
    return MeshError::kOk;
}

WriteBatch MeshHandle::TakeBatch() {
    WriteBatch batch;
    batch.writer = unit_id_;
    batch.writes = std::move(writes_);
    writes_.clear();
    write_index_.clear();
    return batch;
}

absl::btree_map<std::string, std::string> MeshHandle::BeforeImage() {
    absl::btree_map<std::string, std::string> before;
    for (const auto& write : writes_) {
        const VersionedValue& observed = Observe(write.key);
        if (observed.version != 0) {
            before[write.key] = observed.value;
        }
    }
    return before;
}

absl::btree_map<std::string, std::string> MeshHandle::AfterImage() const {
    absl::btree_map<std::string, std::string> after;
    for (const auto& write : writes_) {
        if (!write.remove) {
            after[write.key] = write.value;
        }
    }
    return after;
}

} // namespace Meshwork
