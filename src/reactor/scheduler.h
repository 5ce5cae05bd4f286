#ifndef MESHWORK_REACTOR_SCHEDULER_H_
#define MESHWORK_REACTOR_SCHEDULER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "acl/acl_registry.h"
#include "common/worker_pool.h"
#include "mesh/snapshot.h"
#include "mesh/version_store.h"
#include "mesh_handle.h"
#include "mutex_arbiter.h"
#include "throttle_monitor.h"
#include "trace/trace_recorder.h"
#include "unit_registry.h"

namespace Meshwork {

struct SchedulerOptions {
    std::chrono::milliseconds default_deadline{5000};
    uint32_t timeout_disable_streak = 3;
    // Units admitted per cycle before the throttle scales it down.
    size_t max_admissions_per_cycle = 1000;
    size_t max_units_per_cycle = 20000;
};

// Snapshots one cycle evaluates against. Normally one snapshot shared by
// every unit; when the union of their keys exceeds the snapshot key limit,
// each unit gets its own, scoped to its declared interests.
struct CycleSnapshots {
    CycleSnapshots() = default;
    CycleSnapshots(SnapshotPtr snapshot) : shared(std::move(snapshot)) {}

    // Null when the unit has no snapshot this cycle.
    SnapshotPtr For(UnitId id) const {
        auto it = per_unit.find(id);
        return it == per_unit.end() ? shared : it->second;
    }

    SnapshotPtr shared;
    absl::flat_hash_map<UnitId, SnapshotPtr> per_unit;
};

// Output of the Collect and Order phases.
struct CollectResult {
    // Triggered units, highest priority first, then registration order.
    std::vector<UnitRef> matches;
    std::vector<UnitId> not_triggered;
    std::vector<std::pair<UnitId, std::string>> faulted;
};

struct CycleReport {
    CycleId cycle = 0;
    SnapshotId snapshot_id = 0;
    size_t candidates = 0;
    size_t matched = 0;
    size_t admitted = 0;
    size_t queued = 0;
    size_t dequeued = 0;
    size_t suppressed = 0;
    size_t deferred = 0;
    size_t interrupts = 0;
    MeshError error = MeshError::kOk;
};

/**
 * Runs the reactor cycle: Collect -> Order -> Admit, then hands admitted
 * units to the worker pool for Execute. Cooldown and timeouts are settled
 * when executions complete.
 *
 * RunCycle must be driven from a single thread. Executions finish on worker
 * threads and report back through a completion list that the next cycle
 * reaps; a mutex group is released only then.
 */
class Scheduler {
public:
    Scheduler(SchedulerOptions options,
              VersionStore& store,
              SnapshotManager& snapshots,
              const AclRegistry& acl,
              UnitRegistry& registry,
              MutexArbiter& arbiter,
              ThrottleMonitor& throttle,
              TraceRecorder& trace,
              WorkerPool& pool);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    CycleReport RunCycle();

    // Evaluates the triggers of candidates against their snapshots and orders
    // the matches. Touches no scheduler state, so repeating it on the same
    // snapshots yields the same list.
    CollectResult Collect(const std::vector<UnitRef>& candidates,
                          const CycleSnapshots& snapshots) const;
    static void Order(std::vector<UnitRef>* matches);

    // Hot swap: cancels a running execution of id and drops its queue entries.
    void OnDeregister(UnitId id);
    // Owes id an evaluation on the next cycle (new registration, re-enable).
    // Safe to call from any thread.
    void MarkPending(UnitId id);
    // Signals every running execution to stop; used on shutdown.
    size_t CancelAll(MeshError reason);

    bool WaitForIdle(std::chrono::milliseconds timeout);
    size_t RunningCount() const;
    bool IsRunning(UnitId id) const;
    CycleId cycles() const { return cycle_.load(std::memory_order_relaxed); }

private:
    struct Running {
        std::shared_ptr<CancellationToken> token;
        std::optional<std::string> group;
        CycleId cycle = 0;
        SteadyTime started;
        bool overdue = false;
    };

    struct Completion {
        UnitId id = 0;
        std::optional<std::string> group;
        bool retrigger = false;
    };

    void Reap();
    void Watchdog(SteadyTime now);
    std::vector<UnitRef> SelectCandidates(const absl::flat_hash_set<std::string>& changed,
                                          SteadyTime now);
    bool HasDrainableGroup() const;
    std::vector<UnitRef> CaptureEach(const std::vector<UnitRef>& candidates,
                                     const std::vector<UnitId>& queued,
                                     CycleSnapshots* snapshots);
    void Admit(const std::vector<UnitRef>& matches, const CycleSnapshots& snapshots,
               SteadyTime now, CycleReport* report);
    void DrainGroups(const CycleSnapshots& snapshots, SteadyTime now, bool degraded,
                     size_t budget, CycleReport* report);
    bool Dispatch(const UnitRef& ref, const SnapshotPtr& snapshot, SteadyTime now);
    void Execute(UnitRef ref, SnapshotPtr snapshot, std::shared_ptr<CancellationToken> token,
                 CycleId cycle);
    void Interrupt(UnitId holder, const UnitRef& interrupter);

    void RecordDecision(const UnitRef& ref, const SnapshotPtr& snapshot, RecordKind kind,
                        Outcome outcome, MeshError error, std::string detail);
    MeshView::DeniedCallback DeniedRecorder(UnitId id, const std::string& name,
                                            SnapshotId snapshot_id, CycleId cycle) const;

    bool IdleLocked() const ABSL_SHARED_LOCKS_REQUIRED(mu_) { return running_.empty(); }

    const SchedulerOptions options_;
    VersionStore& store_;
    SnapshotManager& snapshots_;
    const AclRegistry& acl_;
    UnitRegistry& registry_;
    MutexArbiter& arbiter_;
    ThrottleMonitor& throttle_;
    TraceRecorder& trace_;
    WorkerPool& pool_;

    std::atomic<CycleId> cycle_{0};
    // Units owed an evaluation: their keys changed while they were cooling
    // down, queued or running, or their last attempt failed or was deferred.
    // Cycle thread only.
    absl::flat_hash_set<UnitId> pending_;
    size_t admitted_this_cycle_ = 0;

    mutable absl::Mutex mu_;
    absl::flat_hash_map<UnitId, Running> running_ ABSL_GUARDED_BY(mu_);
    std::vector<Completion> completions_ ABSL_GUARDED_BY(mu_);
    std::vector<UnitId> inbox_ ABSL_GUARDED_BY(mu_);
};

} // namespace Meshwork

#endif // MESHWORK_REACTOR_SCHEDULER_H_
