#include "mutex_arbiter.h"

#include <algorithm>

#include <glog/logging.h>

namespace Meshwork {

namespace {

// Heap comparator: true when a ranks below b.
bool RanksBelow(const MutexQueueEntry& a, const MutexQueueEntry& b) {
    if (a.preempting != b.preempting) {
        return !a.preempting;
    }
    if (a.effective_priority != b.effective_priority) {
        return a.effective_priority < b.effective_priority;
    }
    if (a.enqueued_cycle != b.enqueued_cycle) {
        return a.enqueued_cycle > b.enqueued_cycle;
    }
    return a.sequence > b.sequence;
}

} // namespace

MutexArbiter::MutexArbiter(int starvation_threshold_cycles, int boost_per_cycle)
    : starvation_threshold_(std::max(0, starvation_threshold_cycles)),
      boost_per_cycle_(std::max(1, boost_per_cycle)) {}

bool MutexArbiter::IsBusy(const std::string& group) const {
    absl::ReaderMutexLock lock(&mu_);
    auto it = groups_.find(group);
    return it != groups_.end() && it->second.holder.has_value();
}

std::optional<UnitId> MutexArbiter::Holder(const std::string& group) const {
    absl::ReaderMutexLock lock(&mu_);
    auto it = groups_.find(group);
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return it->second.holder;
}

bool MutexArbiter::Acquire(const std::string& group, UnitId unit) {
    absl::MutexLock lock(&mu_);
    Group& g = groups_[group];
    if (g.holder) {
        return false;
    }
    g.holder = unit;
    VLOG(2) << "Mutex group " << group << " acquired by unit #" << unit;
    return true;
}

void MutexArbiter::Release(const std::string& group, UnitId unit) {
    absl::MutexLock lock(&mu_);
    auto it = groups_.find(group);
    if (it == groups_.end() || !it->second.holder || *it->second.holder != unit) {
        LOG(WARNING) << "Unit #" << unit << " released mutex group " << group
                     << " it does not hold";
        return;
    }
    it->second.holder.reset();
    VLOG(2) << "Mutex group " << group << " released by unit #" << unit;
}

bool MutexArbiter::Enqueue(MutexQueueEntry entry) {
    absl::MutexLock lock(&mu_);
    if (queued_.contains(entry.unit_id)) {
        return false;
    }
    entry.sequence = next_sequence_++;
    entry.effective_priority = std::max<int64_t>(entry.effective_priority, entry.static_priority);
    queued_[entry.unit_id] = entry.mutex_group;
    Group& g = groups_[entry.mutex_group];
    g.statics[entry.static_priority]++;
    g.dirty = true;
    g.heap.push_back(std::move(entry));
    std::push_heap(g.heap.begin(), g.heap.end(), RanksBelow);
    return true;
}

bool MutexArbiter::IsQueued(UnitId unit) const {
    absl::ReaderMutexLock lock(&mu_);
    return queued_.contains(unit);
}

bool MutexArbiter::HasWaiters(const std::string& group) const {
    absl::ReaderMutexLock lock(&mu_);
    auto it = groups_.find(group);
    return it != groups_.end() && !it->second.heap.empty();
}

int64_t MutexArbiter::EffectivePriority(const MutexQueueEntry& entry, CycleId now,
                                        int32_t competitor_max) const {
    int64_t waited = now > entry.enqueued_cycle ? static_cast<int64_t>(now - entry.enqueued_cycle) : 0;
    int64_t aged = std::max<int64_t>(0, waited - starvation_threshold_);
    int64_t boosted = static_cast<int64_t>(entry.static_priority) + aged * boost_per_cycle_;
    int64_t cap = std::max<int64_t>(entry.static_priority, static_cast<int64_t>(competitor_max) + 1);
    return std::min(boosted, cap);
}

void MutexArbiter::DropStatic(Group& group, int32_t priority) {
    auto it = group.statics.find(priority);
    if (it != group.statics.end() && --it->second == 0) {
        group.statics.erase(it);
    }
}

int32_t MutexArbiter::CompetitorMax(const Group& group, int32_t own) {
    auto top = group.statics.rbegin();
    if (top == group.statics.rend()) {
        return own;
    }
    if (top->first != own || top->second > 1) {
        return top->first;
    }
    ++top;
    return top == group.statics.rend() ? own : top->first;
}

void MutexArbiter::RefreshLocked(Group& group, CycleId now) {
    if (group.refreshed_at == now && !group.dirty) {
        return;
    }
    group.refreshed_at = now;
    group.dirty = false;

    bool changed = false;
    for (auto& entry : group.heap) {
        // Below the threshold the recomputed priority is the static one.
        if (now <= entry.enqueued_cycle + static_cast<CycleId>(starvation_threshold_)) {
            continue;
        }
        int64_t recomputed = EffectivePriority(entry, now, CompetitorMax(group, entry.static_priority));
        if (recomputed > entry.effective_priority) {
            entry.effective_priority = recomputed;
            changed = true;
        }
    }
    if (changed) {
        std::make_heap(group.heap.begin(), group.heap.end(), RanksBelow);
    }
}

std::optional<MutexQueueEntry> MutexArbiter::DequeueBest(const std::string& group, CycleId now,
                                                         const EntryFilter& filter) {
    absl::MutexLock lock(&mu_);
    auto it = groups_.find(group);
    if (it == groups_.end() || it->second.heap.empty()) {
        return std::nullopt;
    }
    Group& g = it->second;
    RefreshLocked(g, now);

    std::vector<MutexQueueEntry> skipped;
    std::optional<MutexQueueEntry> chosen;
    while (!g.heap.empty()) {
        std::pop_heap(g.heap.begin(), g.heap.end(), RanksBelow);
        MutexQueueEntry top = std::move(g.heap.back());
        g.heap.pop_back();
        if (!filter || filter(top)) {
            chosen = std::move(top);
            break;
        }
        skipped.push_back(std::move(top));
    }
    for (auto& entry : skipped) {
        g.heap.push_back(std::move(entry));
        std::push_heap(g.heap.begin(), g.heap.end(), RanksBelow);
    }
    if (chosen) {
        queued_.erase(chosen->unit_id);
        DropStatic(g, chosen->static_priority);
        VLOG(2) << "Dequeued unit #" << chosen->unit_id << " from " << group
                << " (static=" << chosen->static_priority
                << ", effective=" << chosen->effective_priority
                << ", waited=" << (now - chosen->enqueued_cycle) << " cycles)";
    }
    return chosen;
}

size_t MutexArbiter::RemoveUnit(UnitId unit) {
    absl::MutexLock lock(&mu_);
    auto q = queued_.find(unit);
    if (q == queued_.end()) {
        return 0;
    }
    Group& g = groups_[q->second];
    queued_.erase(q);
    size_t before = g.heap.size();
    for (const auto& entry : g.heap) {
        if (entry.unit_id == unit) {
            DropStatic(g, entry.static_priority);
        }
    }
    g.heap.erase(std::remove_if(g.heap.begin(), g.heap.end(),
                                [unit](const MutexQueueEntry& e) { return e.unit_id == unit; }),
                 g.heap.end());
    std::make_heap(g.heap.begin(), g.heap.end(), RanksBelow);
    return before - g.heap.size();
}

std::vector<std::string> MutexArbiter::GroupsWithWaiters() const {
    std::vector<std::string> out;
    absl::ReaderMutexLock lock(&mu_);
    for (const auto& entry : groups_) {
        if (!entry.second.heap.empty()) {
            out.push_back(entry.first);
        }
    }
    // Deterministic dequeue order across groups.
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<UnitId> MutexArbiter::QueuedUnits() const {
    std::vector<UnitId> out;
    absl::ReaderMutexLock lock(&mu_);
    out.reserve(queued_.size());
    for (const auto& entry : queued_) {
        out.push_back(entry.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t MutexArbiter::QueueDepth(const std::string& group) const {
    absl::ReaderMutexLock lock(&mu_);
    auto it = groups_.find(group);
    return it == groups_.end() ? 0 : it->second.heap.size();
}

absl::btree_map<std::string, size_t> MutexArbiter::QueueDepths() const {
    absl::btree_map<std::string, size_t> out;
    absl::ReaderMutexLock lock(&mu_);
    for (const auto& entry : groups_) {
        out[entry.first] = entry.second.heap.size();
    }
    return out;
}

} // namespace Meshwork
