#ifndef MESHWORK_REACTOR_MUTEX_ARBITER_H_
#define MESHWORK_REACTOR_MUTEX_ARBITER_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "common/types.h"

namespace Meshwork {

struct MutexQueueEntry {
    UnitId unit_id = 0;
    std::string mutex_group;
    SteadyTime enqueued_at;
    CycleId enqueued_cycle = 0;
    int32_t static_priority = 0;
    // Never decreases while the entry waits.
    int64_t effective_priority = 0;
    bool critical = false;
    // Set for an Interrupt-policy unit that signalled the holder; it goes
    // ahead of every ordinary waiter.
    bool preempting = false;
    uint64_t sequence = 0;
};

/**
 * Tracks which unit holds each mutex group and the units waiting for it.
 *
 * Waiters live in a per-group binary heap keyed on effective priority. The
 * priority is recomputed from the number of cycles waited only when the
 * group is dequeued, at most once per cycle and only for entries past the
 * starvation threshold:
 *
 *   effective = static + boost_per_cycle * max(0, waited - threshold)
 *
 * capped one above the highest static priority among the group's other
 * waiters, so an aged entry overtakes a continuously arriving stronger unit
 * once and no more.
 */
class MutexArbiter {
public:
    using EntryFilter = std::function<bool(const MutexQueueEntry&)>;

    MutexArbiter(int starvation_threshold_cycles, int boost_per_cycle);

    MutexArbiter(const MutexArbiter&) = delete;
    MutexArbiter& operator=(const MutexArbiter&) = delete;

    bool IsBusy(const std::string& group) const;
    std::optional<UnitId> Holder(const std::string& group) const;
    // False when the group is already held.
    bool Acquire(const std::string& group, UnitId unit);
    void Release(const std::string& group, UnitId unit);

    // False when the unit already waits somewhere.
    bool Enqueue(MutexQueueEntry entry);
    bool IsQueued(UnitId unit) const;
    bool HasWaiters(const std::string& group) const;
    // Pops the best waiter accepted by filter (all waiters when filter is empty).
    std::optional<MutexQueueEntry> DequeueBest(const std::string& group, CycleId now,
                                               const EntryFilter& filter = nullptr);
    // Drops every queue entry of unit; returns how many were removed.
    size_t RemoveUnit(UnitId unit);

    std::vector<std::string> GroupsWithWaiters() const;
    std::vector<UnitId> QueuedUnits() const;
    size_t QueueDepth(const std::string& group) const;
    absl::btree_map<std::string, size_t> QueueDepths() const;

    // Priority entry would have at cycle now, against competitors with the
    // given highest static priority.
    int64_t EffectivePriority(const MutexQueueEntry& entry, CycleId now,
                              int32_t competitor_max) const;

private:
    struct Group {
        std::optional<UnitId> holder;
        std::vector<MutexQueueEntry> heap;
        // Waiter count per static priority.
        absl::btree_map<int32_t, size_t> statics;
        CycleId refreshed_at = 0;
        // Set when a waiter arrived after the last refresh.
        bool dirty = false;
    };

    static void DropStatic(Group& group, int32_t priority);
    // Highest static priority among the waiters other than one of priority own.
    static int32_t CompetitorMax(const Group& group, int32_t own);
    void RefreshLocked(Group& group, CycleId now) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

    const int starvation_threshold_;
    const int boost_per_cycle_;

    mutable absl::Mutex mu_;
    absl::flat_hash_map<std::string, Group> groups_ ABSL_GUARDED_BY(mu_);
    absl::flat_hash_map<UnitId, std::string> queued_ ABSL_GUARDED_BY(mu_);
    uint64_t next_sequence_ ABSL_GUARDED_BY(mu_) = 0;
};

} // namespace Meshwork

#endif // MESHWORK_REACTOR_MUTEX_ARBITER_H_
