#include "version_store.h"

#include <algorithm>
#include <limits>
#include <mutex>

#include <glog/logging.h>
#include "absl/container/flat_hash_set.h"
#include "absl/hash/hash.h"

namespace Meshwork {

VersionStore::VersionStore(size_t max_value_bytes)
    : max_value_bytes_(max_value_bytes) {}

size_t VersionStore::GetShardIndex(const std::string& key) const {
    return absl::Hash<std::string>{}(key) & (kNumShards - 1);
}

std::vector<size_t> VersionStore::ShardsFor(const std::vector<std::string>& keys) const {
    std::vector<size_t> ids;
    ids.reserve(keys.size());
    for (const auto& key : keys) {
        ids.push_back(GetShardIndex(key));
    }
    // Ascending order keeps concurrent multi-shard lockers deadlock free
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

std::optional<VersionedValue> VersionStore::Get(const std::string& key) const {
    const Shard& shard = shards_[GetShardIndex(key)];
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.data.find(key);
    if (it == shard.data.end() || it->second.deleted) {
        return std::nullopt;
    }
    return VersionedValue{it->second.value, it->second.version};
}

std::optional<MeshEntry> VersionStore::GetEntry(const std::string& key) const {
    const Shard& shard = shards_[GetShardIndex(key)];
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.data.find(key);
    if (it == shard.data.end() || it->second.deleted) {
        return std::nullopt;
    }
    return it->second;
}

MeshError VersionStore::CompareAndSet(const std::string& key, uint64_t expected_version,
                                      std::string value, UnitId writer, uint64_t* new_version) {
    WriteBatch batch;
    batch.writer = writer;
    batch.writes.push_back(WriteIntent{key, expected_version, std::move(value)});
    std::vector<uint64_t> versions;
    MeshError err = Commit(batch, &versions, nullptr);
    if (err == MeshError::kOk && new_version != nullptr) {
        *new_version = versions.front();
    }
    return err;
}

MeshError VersionStore::CompareAndDelete(const std::string& key, uint64_t expected_version,
                                         UnitId writer, uint64_t* tombstone_version) {
    WriteBatch batch;
    batch.writer = writer;
    WriteIntent intent;
    intent.key = key;
    intent.expected_version = expected_version;
    intent.remove = true;
    batch.writes.push_back(std::move(intent));
    std::vector<uint64_t> versions;
    MeshError err = Commit(batch, &versions, nullptr);
    if (err == MeshError::kOk && tombstone_version != nullptr) {
        *tombstone_version = versions.front();
    }
    return err;
}

MeshError VersionStore::Commit(const WriteBatch& batch,
                               std::vector<uint64_t>* new_versions,
                               std::string* conflict_key) {
    if (batch.writes.empty()) {
        return MeshError::kOk;
    }
    if (Corrupted()) {
        return MeshError::kStoreCorruption;
    }

    std::vector<std::string> keys;
    keys.reserve(batch.writes.size());
    absl::flat_hash_set<std::string> seen;
    for (const auto& write : batch.writes) {
        if (write.key.empty()) {
            LOG(WARNING) << "Rejecting write with empty key from writer " << batch.writer;
            return MeshError::kInvalidArgument;
        }
        if (write.value.size() > max_value_bytes_) {
            LOG(WARNING) << "Rejecting write to " << write.key << ": value of "
                         << write.value.size() << " bytes exceeds " << max_value_bytes_;
            return MeshError::kInvalidArgument;
        }
        if (write.remove && write.expected_version == 0) {
            LOG(WARNING) << "Rejecting delete of " << write.key << " without an expected version";
            return MeshError::kInvalidArgument;
        }
        if (!seen.insert(write.key).second) {
            LOG(WARNING) << "Rejecting batch with duplicate key " << write.key;
            return MeshError::kInvalidArgument;
        }
        keys.push_back(write.key);
    }

    std::vector<MeshEntry> committed;
    committed.reserve(batch.writes.size());
    {
        std::vector<std::unique_lock<std::shared_mutex>> locks;
        for (size_t id : ShardsFor(keys)) {
            locks.emplace_back(shards_[id].mutex);
        }

        // Validate every expected version before touching anything
        for (const auto& write : batch.writes) {
            const Shard& shard = shards_[GetShardIndex(write.key)];
            auto it = shard.data.find(write.key);
            uint64_t held = (it == shard.data.end()) ? 0 : it->second.version;
            // A tombstone reads as absent
            uint64_t current = (it == shard.data.end() || it->second.deleted) ? 0 : held;
            if (current != write.expected_version) {
                conflicts_.fetch_add(1, std::memory_order_relaxed);
                if (conflict_key != nullptr) {
                    *conflict_key = write.key;
                }
                VLOG(2) << "Version conflict on " << write.key << " expected "
                        << write.expected_version << " held " << current
                        << " writer " << batch.writer;
                return MeshError::kVersionConflict;
            }
            if (held == std::numeric_limits<uint64_t>::max()) {
                MarkCorrupted(write.key, held, held);
                return MeshError::kStoreCorruption;
            }
        }

        WallTime now = WallClock::now();
        for (const auto& write : batch.writes) {
            Shard& shard = shards_[GetShardIndex(write.key)];
            MeshEntry& entry = shard.data[write.key];
            entry.key = write.key;
            entry.value = write.remove ? std::string() : write.value;
            entry.version = entry.version + 1;
            entry.deleted = write.remove;
            entry.last_written_by = batch.writer;
            entry.written_at = now;
            committed.push_back(entry);
        }
    }

    if (new_versions != nullptr) {
        new_versions->clear();
        for (const auto& entry : committed) {
            new_versions->push_back(entry.version);
        }
    }
    committed_mutations_.fetch_add(committed.size(), std::memory_order_relaxed);
    RecordChanges(committed);

    if (backend_ != nullptr && !backend_->Persist(committed)) {
        // The in-memory commit stands; the backend catches up on its own
        LOG(ERROR) << "Backend failed to persist batch of " << committed.size()
                   << " entries from writer " << batch.writer;
    }
    if (listener_ != nullptr) {
        listener_->OnCommitted(committed);
    }
    return MeshError::kOk;
}

MeshError VersionStore::ReadConsistent(const std::vector<std::string>& patterns,
                                       size_t max_keys,
                                       absl::btree_map<std::string, VersionedValue>* out) const {
    out->clear();
    bool has_prefix = std::any_of(patterns.begin(), patterns.end(), IsPrefixPattern);

    std::vector<size_t> shard_ids;
    if (has_prefix) {
        shard_ids.resize(kNumShards);
        for (size_t i = 0; i < kNumShards; ++i) shard_ids[i] = i;
    } else {
        shard_ids = ShardsFor(patterns);
    }

    std::vector<std::shared_lock<std::shared_mutex>> locks;
    locks.reserve(shard_ids.size());
    for (size_t id : shard_ids) {
        locks.emplace_back(shards_[id].mutex);
    }

    if (has_prefix) {
        for (size_t id : shard_ids) {
            for (const auto& [key, entry] : shards_[id].data) {
                if (entry.deleted) continue;
                bool selected = false;
                for (const auto& pattern : patterns) {
                    if (MatchesPattern(pattern, key)) {
                        selected = true;
                        break;
                    }
                }
                if (!selected) continue;
                if (out->size() >= max_keys) {
                    LOG(WARNING) << "Snapshot request exceeds " << max_keys << " keys";
                    out->clear();
                    return MeshError::kInvalidArgument;
                }
                out->emplace(key, VersionedValue{entry.value, entry.version});
            }
        }
        return MeshError::kOk;
    }

    for (const auto& key : patterns) {
        const Shard& shard = shards_[GetShardIndex(key)];
        auto it = shard.data.find(key);
        if (it == shard.data.end() || it->second.deleted) continue;
        if (out->size() >= max_keys) {
            LOG(WARNING) << "Snapshot request exceeds " << max_keys << " keys";
            out->clear();
            return MeshError::kInvalidArgument;
        }
        out->emplace(key, VersionedValue{it->second.value, it->second.version});
    }
    return MeshError::kOk;
}

void VersionStore::RecordChanges(const std::vector<MeshEntry>& committed) {
    absl::MutexLock lock(&journal_mu_);
    for (const auto& entry : committed) {
        journal_.push_back(entry.key);
    }
}

std::vector<std::string> VersionStore::DrainChanges() {
    std::vector<std::string> drained;
    {
        absl::MutexLock lock(&journal_mu_);
        drained.swap(journal_);
    }
    absl::flat_hash_set<std::string> seen;
    std::vector<std::string> unique;
    unique.reserve(drained.size());
    for (auto& key : drained) {
        if (seen.insert(key).second) {
            unique.push_back(std::move(key));
        }
    }
    return unique;
}

void VersionStore::MarkCorrupted(const std::string& key, uint64_t held, uint64_t seen) {
    corrupted_.store(true, std::memory_order_release);
    LOG(ERROR) << "Version store invariant violated on key " << key
               << ": held version " << held << ", observed " << seen;
}

MeshError VersionStore::LoadFromBackend() {
    if (backend_ == nullptr) {
        return MeshError::kOk;
    }
    std::vector<MeshEntry> entries;
    if (!backend_->Load(entries)) {
        LOG(ERROR) << "Backend load failed";
        return MeshError::kNotFound;
    }

    size_t loaded = 0;
    for (auto& incoming : entries) {
        Shard& shard = shards_[GetShardIndex(incoming.key)];
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.data.find(incoming.key);
        if (it != shard.data.end()) {
            if (incoming.version < it->second.version) {
                MarkCorrupted(incoming.key, it->second.version, incoming.version);
                return MeshError::kStoreCorruption;
            }
            if (incoming.version == it->second.version) {
                continue;
            }
        }
        std::string key = incoming.key;
        shard.data[key] = std::move(incoming);
        ++loaded;
    }
    LOG(INFO) << "Loaded " << loaded << " entries from backend";
    return MeshError::kOk;
}

size_t VersionStore::Size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        for (const auto& entry : shard.data) {
            if (!entry.second.deleted) total++;
        }
    }
    return total;
}

} // namespace Meshwork
