#include "scheduler.h"

#include <algorithm>

#include <glog/logging.h>

#include "absl/container/btree_set.h"
#include "absl/time/time.h"

namespace Meshwork {

namespace {

bool InterestTouched(const UnitDescriptor& descriptor,
                     const absl::flat_hash_set<std::string>& changed) {
    for (const auto& pattern : descriptor.interests) {
        if (!IsPrefixPattern(pattern)) {
            if (changed.contains(pattern)) return true;
            continue;
        }
        for (const auto& key : changed) {
            if (MatchesPattern(pattern, key)) return true;
        }
    }
    return false;
}

bool CoolingDown(const UnitRef& ref, SteadyTime now) {
    return ref.last_fired_at && now < *ref.last_fired_at + ref.descriptor->cooldown;
}

} // namespace

Scheduler::Scheduler(SchedulerOptions options,
                     VersionStore& store,
                     SnapshotManager& snapshots,
                     const AclRegistry& acl,
                     UnitRegistry& registry,
                     MutexArbiter& arbiter,
                     ThrottleMonitor& throttle,
                     TraceRecorder& trace,
                     WorkerPool& pool)
    : options_(options),
      store_(store),
      snapshots_(snapshots),
      acl_(acl),
      registry_(registry),
      arbiter_(arbiter),
      throttle_(throttle),
      trace_(trace),
      pool_(pool) {}

CycleReport Scheduler::RunCycle() {
    CycleReport report;
    report.cycle = cycle_.fetch_add(1, std::memory_order_relaxed) + 1;
    SteadyTime now = SteadyClock::now();
    admitted_this_cycle_ = 0;

    Reap();
    Watchdog(now);
    throttle_.Sample(store_.CommittedMutations(), now);

    absl::flat_hash_set<std::string> changed;
    for (auto& key : store_.DrainChanges()) {
        changed.insert(std::move(key));
    }

    std::vector<UnitRef> candidates = SelectCandidates(changed, now);
    report.candidates = candidates.size();
    if (candidates.empty() && !HasDrainableGroup()) {
        return report;
    }

    // Queued units are re-evaluated when dequeued, so their keys belong in
    // the cycle snapshot as well.
    std::vector<UnitId> queued = arbiter_.QueuedUnits();
    absl::btree_set<std::string> patterns;
    for (const auto& ref : candidates) {
        patterns.insert(ref.descriptor->interests.begin(), ref.descriptor->interests.end());
    }
    for (UnitId id : queued) {
        if (auto ref = registry_.Find(id)) {
            patterns.insert(ref->descriptor->interests.begin(), ref->descriptor->interests.end());
        }
    }

    CycleSnapshots snapshots;
    MeshError err = snapshots_.Capture(std::vector<std::string>(patterns.begin(), patterns.end()),
                                       &snapshots.shared);
    if (err == MeshError::kInvalidArgument) {
        // Too many keys for one snapshot: only the units whose own interests
        // are too broad fail.
        VLOG(1) << "Cycle " << report.cycle << ": " << patterns.size()
                << " patterns exceed one snapshot, capturing per unit";
        candidates = CaptureEach(candidates, queued, &snapshots);
    } else if (err != MeshError::kOk) {
        LOG_EVERY_N(ERROR, 100) << "Cycle " << report.cycle << ": snapshot capture failed ("
                                << MeshErrorName(err) << "), " << candidates.size()
                                << " candidates postponed";
        for (const auto& ref : candidates) {
            pending_.insert(ref.id);
        }
        report.error = err;
        return report;
    }
    report.snapshot_id = snapshots.shared ? snapshots.shared->id() : 0;

    CollectResult collected = Collect(candidates, snapshots);
    report.matched = collected.matches.size();

    for (UnitId id : collected.not_triggered) {
        if (auto ref = registry_.Find(id)) {
            RecordDecision(*ref, snapshots.For(id), RecordKind::kEvaluation, Outcome::kNoOp,
                           MeshError::kOk, "trigger not satisfied");
        }
    }
    for (const auto& fault : collected.faulted) {
        if (auto ref = registry_.Find(fault.first)) {
            LOG(ERROR) << "Trigger of unit " << ref->descriptor->name << " threw: " << fault.second;
            registry_.RecordOutcome(fault.first, Outcome::kFailed, MeshError::kUnitFault, 0);
            RecordDecision(*ref, snapshots.For(fault.first), RecordKind::kEvaluation,
                           Outcome::kFailed, MeshError::kUnitFault, fault.second);
        }
    }

    Admit(collected.matches, snapshots, now, &report);

    VLOG(1) << "Cycle " << report.cycle << ": candidates=" << report.candidates
            << " matched=" << report.matched << " admitted=" << report.admitted
            << " queued=" << report.queued << " dequeued=" << report.dequeued
            << " suppressed=" << report.suppressed << " deferred=" << report.deferred;
    return report;
}

void Scheduler::Reap() {
    std::vector<Completion> done;
    std::vector<UnitId> inbox;
    {
        absl::MutexLock lock(&mu_);
        done.swap(completions_);
        inbox.swap(inbox_);
    }
    for (UnitId id : inbox) {
        pending_.insert(id);
    }
    for (const auto& completion : done) {
        if (completion.group) {
            arbiter_.Release(*completion.group, completion.id);
        }
        if (completion.retrigger && registry_.Contains(completion.id)) {
            pending_.insert(completion.id);
        }
    }
}

void Scheduler::Watchdog(SteadyTime now) {
    absl::MutexLock lock(&mu_);
    for (auto& entry : running_) {
        Running& running = entry.second;
        if (!running.overdue && running.token->Expired(now)) {
            running.overdue = true;
            running.token->Cancel(MeshError::kTimeout);
            LOG(WARNING) << "Unit #" << entry.first << " passed its deadline after "
                         << MicrosBetween(running.started, now) / 1000
                         << " ms, asking it to stop";
        }
    }
}

bool Scheduler::HasDrainableGroup() const {
    for (const auto& group : arbiter_.GroupsWithWaiters()) {
        if (!arbiter_.IsBusy(group)) {
            return true;
        }
    }
    return false;
}

std::vector<UnitRef> Scheduler::CaptureEach(const std::vector<UnitRef>& candidates,
                                            const std::vector<UnitId>& queued,
                                            CycleSnapshots* snapshots) {
    snapshots->shared.reset();
    std::vector<UnitRef> captured;
    captured.reserve(candidates.size());
    for (const auto& ref : candidates) {
        SnapshotPtr snapshot;
        MeshError err = snapshots_.Capture(ref.descriptor->interests, &snapshot);
        if (err != MeshError::kOk) {
            LOG_EVERY_N(WARNING, 100) << "Unit " << ref.descriptor->name
                                      << " skipped: snapshot of its interests failed ("
                                      << MeshErrorName(err) << ")";
            registry_.RecordOutcome(ref.id, Outcome::kFailed, err, 0);
            RecordDecision(ref, nullptr, RecordKind::kEvaluation, Outcome::kFailed, err,
                           "interests exceed the snapshot key limit");
            continue;
        }
        snapshots->per_unit[ref.id] = std::move(snapshot);
        captured.push_back(ref);
    }
    // A queued unit without a snapshot fails when it is dequeued.
    for (UnitId id : queued) {
        auto ref = registry_.Find(id);
        if (!ref) {
            continue;
        }
        SnapshotPtr snapshot;
        if (snapshots_.Capture(ref->descriptor->interests, &snapshot) == MeshError::kOk) {
            snapshots->per_unit[id] = std::move(snapshot);
        }
    }
    return captured;
}

std::vector<UnitRef> Scheduler::SelectCandidates(const absl::flat_hash_set<std::string>& changed,
                                                 SteadyTime now) {
    std::vector<UnitRef> candidates;
    std::vector<UnitRef> enabled = registry_.EnabledUnits();

    absl::flat_hash_set<UnitId> registered;
    for (const auto& ref : enabled) {
        registered.insert(ref.id);
    }
    for (auto it = pending_.begin(); it != pending_.end();) {
        // Deregistered units drop out; disabled ones keep their claim.
        if (!registered.contains(*it) && !registry_.Contains(*it)) {
            pending_.erase(it++);
        } else {
            ++it;
        }
    }

    size_t overflow = 0;
    for (const auto& ref : enabled) {
        const UnitDescriptor& descriptor = *ref.descriptor;
        bool owed = pending_.contains(ref.id);
        if (!descriptor.temporal && !owed && !InterestTouched(descriptor, changed)) {
            continue;
        }
        bool busy = IsRunning(ref.id) || arbiter_.IsQueued(ref.id);
        if (busy || CoolingDown(ref, now)) {
            if (!descriptor.temporal) {
                pending_.insert(ref.id);
            }
            continue;
        }
        if (candidates.size() >= options_.max_units_per_cycle) {
            pending_.insert(ref.id);
            overflow++;
            continue;
        }
        pending_.erase(ref.id);
        candidates.push_back(ref);
    }
    if (overflow > 0) {
        LOG_EVERY_N(WARNING, 100) << overflow << " units postponed, more than "
                                  << options_.max_units_per_cycle << " candidates in one cycle";
    }
    return candidates;
}

CollectResult Scheduler::Collect(const std::vector<UnitRef>& candidates,
                                 const CycleSnapshots& snapshots) const {
    CollectResult result;
    CycleId cycle = cycle_.load(std::memory_order_relaxed);
    for (const auto& ref : candidates) {
        SnapshotPtr snapshot = snapshots.For(ref.id);
        MeshView view(ref.id, ref.descriptor->name, snapshot, &store_, acl_,
                      DeniedRecorder(ref.id, ref.descriptor->name, snapshot->id(), cycle));
        registry_.CountEvaluation(ref.id);
        bool fired = false;
        try {
            fired = ref.unit->Trigger(view);
        } catch (const std::exception& e) {
            result.faulted.emplace_back(ref.id, e.what());
            continue;
        } catch (...) {
            result.faulted.emplace_back(ref.id, "non-standard exception");
            continue;
        }
        if (fired) {
            result.matches.push_back(ref);
        } else {
            result.not_triggered.push_back(ref.id);
        }
    }
    Order(&result.matches);
    return result;
}

void Scheduler::Order(std::vector<UnitRef>* matches) {
    std::sort(matches->begin(), matches->end(), [](const UnitRef& a, const UnitRef& b) {
        if (a.descriptor->priority != b.descriptor->priority) {
            return a.descriptor->priority > b.descriptor->priority;
        }
        return a.id < b.id;
    });
}

void Scheduler::Admit(const std::vector<UnitRef>& matches, const CycleSnapshots& snapshots,
                      SteadyTime now, CycleReport* report) {
    const bool degraded = throttle_.Degraded();
    const size_t budget = throttle_.AdmissionBudget(options_.max_admissions_per_cycle);
    CycleId cycle = report->cycle;

    for (const auto& ref : matches) {
        const UnitDescriptor& descriptor = *ref.descriptor;
        SnapshotPtr snapshot = snapshots.For(ref.id);

        if (degraded && !descriptor.critical) {
            throttle_.CountDeferred();
            registry_.RecordOutcome(ref.id, Outcome::kDeferred, MeshError::kPressureExceeded, 0);
            pending_.insert(ref.id);
            RecordDecision(ref, snapshot, RecordKind::kExecution, Outcome::kDeferred,
                           MeshError::kPressureExceeded, "degraded mode admits critical units only");
            report->deferred++;
            continue;
        }
        if (admitted_this_cycle_ >= budget) {
            throttle_.CountDeferred();
            registry_.RecordOutcome(ref.id, Outcome::kDeferred, MeshError::kPressureExceeded, 0);
            pending_.insert(ref.id);
            RecordDecision(ref, snapshot, RecordKind::kExecution, Outcome::kDeferred,
                           MeshError::kPressureExceeded,
                           "admission budget of " + std::to_string(budget) + " exhausted");
            report->deferred++;
            continue;
        }

        if (!descriptor.mutex_group) {
            if (Dispatch(ref, snapshot, now)) report->admitted++;
            continue;
        }

        const std::string& group = *descriptor.mutex_group;
        if (!arbiter_.HasWaiters(group) && arbiter_.Acquire(group, ref.id)) {
            if (Dispatch(ref, snapshot, now)) report->admitted++;
            continue;
        }

        MutexQueueEntry entry;
        entry.unit_id = ref.id;
        entry.mutex_group = group;
        entry.enqueued_at = now;
        entry.enqueued_cycle = cycle;
        entry.static_priority = descriptor.priority;
        entry.effective_priority = descriptor.priority;
        entry.critical = descriptor.critical;

        switch (descriptor.policy) {
            case ExecutionPolicy::kAbortLower:
                registry_.RecordOutcome(ref.id, Outcome::kSuppressed, MeshError::kOk, 0);
                RecordDecision(ref, snapshot, RecordKind::kExecution, Outcome::kSuppressed,
                               MeshError::kOk, "mutex group " + group + " busy");
                report->suppressed++;
                break;
            case ExecutionPolicy::kQueue:
                if (arbiter_.Enqueue(std::move(entry))) {
                    RecordDecision(ref, snapshot, RecordKind::kEvaluation, Outcome::kNoOp,
                                   MeshError::kOk, "queued on mutex group " + group);
                    report->queued++;
                }
                break;
            case ExecutionPolicy::kInterrupt: {
                entry.preempting = true;
                auto holder = arbiter_.Holder(group);
                if (holder) {
                    Interrupt(*holder, ref);
                    report->interrupts++;
                }
                if (arbiter_.Enqueue(std::move(entry))) {
                    RecordDecision(ref, snapshot, RecordKind::kEvaluation, Outcome::kNoOp,
                                   MeshError::kOk, "waiting for interrupted holder of " + group);
                    report->queued++;
                }
                break;
            }
        }
    }

    DrainGroups(snapshots, now, degraded, budget, report);
}

void Scheduler::DrainGroups(const CycleSnapshots& snapshots, SteadyTime now, bool degraded,
                            size_t budget, CycleReport* report) {
    CycleId cycle = report->cycle;
    auto admissible = [degraded](const MutexQueueEntry& entry) {
        return !degraded || entry.critical;
    };

    for (const auto& group : arbiter_.GroupsWithWaiters()) {
        while (!arbiter_.IsBusy(group) && admitted_this_cycle_ < budget) {
            auto entry = arbiter_.DequeueBest(group, cycle, admissible);
            if (!entry) {
                break;
            }
            auto ref = registry_.Find(entry->unit_id);
            if (!ref || !registry_.IsEnabled(entry->unit_id)) {
                continue;
            }
            SnapshotPtr snapshot = snapshots.For(ref->id);
            if (!snapshot) {
                registry_.RecordOutcome(ref->id, Outcome::kFailed, MeshError::kInvalidArgument, 0);
                RecordDecision(*ref, nullptr, RecordKind::kEvaluation, Outcome::kFailed,
                               MeshError::kInvalidArgument,
                               "left queue of " + group + ", interests exceed the snapshot key limit");
                continue;
            }

            // The state may have moved on while the unit waited.
            MeshView view(ref->id, ref->descriptor->name, snapshot, &store_, acl_,
                          DeniedRecorder(ref->id, ref->descriptor->name, snapshot->id(), cycle));
            bool still_fires = false;
            try {
                still_fires = ref->unit->Trigger(view);
            } catch (const std::exception& e) {
                LOG(ERROR) << "Trigger of unit " << ref->descriptor->name << " threw: " << e.what();
                registry_.RecordOutcome(ref->id, Outcome::kFailed, MeshError::kUnitFault, 0);
                RecordDecision(*ref, snapshot, RecordKind::kEvaluation, Outcome::kFailed,
                               MeshError::kUnitFault, e.what());
                continue;
            } catch (...) {
                LOG(ERROR) << "Trigger of unit " << ref->descriptor->name
                           << " threw a non-standard exception";
                registry_.RecordOutcome(ref->id, Outcome::kFailed, MeshError::kUnitFault, 0);
                RecordDecision(*ref, snapshot, RecordKind::kEvaluation, Outcome::kFailed,
                               MeshError::kUnitFault, "non-standard exception");
                continue;
            }
            if (!still_fires) {
                RecordDecision(*ref, snapshot, RecordKind::kEvaluation, Outcome::kNoOp,
                               MeshError::kOk, "left queue of " + group + ", trigger no longer holds");
                continue;
            }
            if (!arbiter_.Acquire(group, ref->id)) {
                break;
            }
            if (Dispatch(*ref, snapshot, now)) {
                report->dequeued++;
                report->admitted++;
            }
        }
    }
}

bool Scheduler::Dispatch(const UnitRef& ref, const SnapshotPtr& snapshot, SteadyTime now) {
    const UnitDescriptor& descriptor = *ref.descriptor;
    auto deadline = descriptor.deadline.count() > 0 ? descriptor.deadline : options_.default_deadline;
    auto token = std::make_shared<CancellationToken>(now + deadline);
    CycleId cycle = cycle_.load(std::memory_order_relaxed);

    {
        absl::MutexLock lock(&mu_);
        Running running;
        running.token = token;
        running.group = descriptor.mutex_group;
        running.cycle = cycle;
        running.started = now;
        running_[ref.id] = std::move(running);
    }
    admitted_this_cycle_++;

    bool submitted = pool_.Submit([this, ref, snapshot, token, cycle]() {
        Execute(ref, snapshot, token, cycle);
    });
    if (!submitted) {
        LOG(WARNING) << "Worker pool stopping, unit " << descriptor.name << " not dispatched";
        {
            absl::MutexLock lock(&mu_);
            running_.erase(ref.id);
        }
        if (descriptor.mutex_group) {
            arbiter_.Release(*descriptor.mutex_group, ref.id);
        }
        pending_.insert(ref.id);
        return false;
    }
    VLOG(2) << "Dispatched unit " << descriptor.name << " in cycle " << cycle;
    return true;
}

void Scheduler::Execute(UnitRef ref, SnapshotPtr snapshot, std::shared_ptr<CancellationToken> token,
                        CycleId cycle) {
    const UnitDescriptor& descriptor = *ref.descriptor;
    MutationRecord record;
    record.kind = RecordKind::kExecution;
    record.unit_id = ref.id;
    record.unit_name = descriptor.name;
    record.snapshot_id = snapshot->id();
    record.cycle_id = cycle;
    record.started_at = WallClock::now();
    SteadyTime started = SteadyClock::now();

    // The group stays held until the next cycle reaps this completion, which
    // must happen however the execution ends.
    bool retrigger = false;
    ScopeGuard finish([this, &ref, &retrigger] {
        absl::MutexLock lock(&mu_);
        running_.erase(ref.id);
        completions_.push_back(Completion{ref.id, ref.descriptor->mutex_group, retrigger});
    });

    MeshHandle handle(ref.id, descriptor.name, snapshot, &store_, acl_,
                      DeniedRecorder(ref.id, descriptor.name, snapshot->id(), cycle), token);

    MeshError error = MeshError::kOk;
    try {
        ref.unit->Act(handle);
    } catch (const std::exception& e) {
        error = MeshError::kUnitFault;
        record.detail = e.what();
        LOG(ERROR) << "Unit " << descriptor.name << " threw from its action: " << e.what();
    } catch (...) {
        error = MeshError::kUnitFault;
        record.detail = "non-standard exception";
        LOG(ERROR) << "Unit " << descriptor.name << " threw a non-standard exception from its action";
    }

    SteadyTime finished = SteadyClock::now();
    if (error == MeshError::kOk) {
        error = token->reason();
        if (error == MeshError::kOk && token->Expired(finished)) {
            error = MeshError::kTimeout;
        }
    }
    if (error == MeshError::kOk && handle.HasDeniedWrite()) {
        error = MeshError::kAccessDenied;
        record.detail = "action attempted writes outside its namespaces";
    }

    record.before = handle.BeforeImage();
    if (error == MeshError::kOk && handle.HasWrites()) {
        auto after = handle.AfterImage();
        WriteBatch batch = handle.TakeBatch();
        std::vector<uint64_t> versions;
        std::string conflict_key;
        error = store_.Commit(batch, &versions, &conflict_key);
        if (error == MeshError::kOk) {
            for (const auto& write : batch.writes) {
                record.keys_changed.push_back(write.key);
            }
            record.after = std::move(after);
        } else if (!conflict_key.empty()) {
            record.detail = "conflict on " + conflict_key;
        }
    }

    Outcome outcome = error == MeshError::kOk ? Outcome::kSuccess : Outcome::kFailed;
    int64_t exec_us = MicrosBetween(started, finished);
    bool registered = registry_.Contains(ref.id);
    if (registered) {
        uint32_t streak = registry_.RecordOutcome(ref.id, outcome, error, exec_us);
        if (error == MeshError::kTimeout && streak >= options_.timeout_disable_streak) {
            registry_.Quarantine(ref.id);
            outcome = Outcome::kQuarantined;
        }
        registry_.MarkFired(ref.id, finished);
    } else if (error == MeshError::kCancelled) {
        record.detail = "deregistered while running";
    }

    record.finished_at = WallClock::now();
    record.outcome = outcome;
    record.error = error;
    if (outcome == Outcome::kSuccess) {
        VLOG(1) << "Unit " << descriptor.name << " succeeded, " << record.keys_changed.size()
                << " keys changed in " << exec_us << " us";
    } else {
        LOG(WARNING) << "Unit " << descriptor.name << " " << OutcomeName(outcome) << ": "
                     << MeshErrorName(error)
                     << (record.detail.empty() ? "" : " (" + record.detail + ")");
    }
    trace_.Record(std::move(record));
    retrigger = registered && outcome == Outcome::kFailed;
}

void Scheduler::Interrupt(UnitId holder, const UnitRef& interrupter) {
    absl::MutexLock lock(&mu_);
    auto it = running_.find(holder);
    if (it == running_.end()) {
        return;
    }
    it->second.token->Cancel(MeshError::kCancelled);
    LOG(INFO) << "Unit " << interrupter.descriptor->name << " interrupts unit #" << holder
              << " in group " << interrupter.descriptor->mutex_group.value_or("-");
}

void Scheduler::OnDeregister(UnitId id) {
    size_t dropped = arbiter_.RemoveUnit(id);
    absl::MutexLock lock(&mu_);
    auto it = running_.find(id);
    if (it != running_.end()) {
        it->second.token->Cancel(MeshError::kCancelled);
        LOG(INFO) << "Unit #" << id << " deregistered while running, cancellation signalled";
    }
    if (dropped > 0) {
        VLOG(1) << "Dropped " << dropped << " queue entries of deregistered unit #" << id;
    }
}

void Scheduler::MarkPending(UnitId id) {
    absl::MutexLock lock(&mu_);
    inbox_.push_back(id);
}

size_t Scheduler::CancelAll(MeshError reason) {
    absl::MutexLock lock(&mu_);
    for (auto& entry : running_) {
        entry.second.token->Cancel(reason);
    }
    if (!running_.empty()) {
        LOG(INFO) << "Signalled " << running_.size() << " running units to stop ("
                  << MeshErrorName(reason) << ")";
    }
    return running_.size();
}

bool Scheduler::WaitForIdle(std::chrono::milliseconds timeout) {
    absl::MutexLock lock(&mu_);
    return mu_.AwaitWithTimeout(absl::Condition(this, &Scheduler::IdleLocked),
                                absl::FromChrono(timeout));
}

size_t Scheduler::RunningCount() const {
    absl::ReaderMutexLock lock(&mu_);
    return running_.size();
}

bool Scheduler::IsRunning(UnitId id) const {
    absl::ReaderMutexLock lock(&mu_);
    return running_.contains(id);
}

void Scheduler::RecordDecision(const UnitRef& ref, const SnapshotPtr& snapshot, RecordKind kind,
                               Outcome outcome, MeshError error, std::string detail) {
    MutationRecord record;
    record.kind = kind;
    record.unit_id = ref.id;
    record.unit_name = ref.descriptor->name;
    record.snapshot_id = snapshot ? snapshot->id() : 0;
    record.cycle_id = cycle_.load(std::memory_order_relaxed);
    record.started_at = WallClock::now();
    record.finished_at = record.started_at;
    record.outcome = outcome;
    record.error = error;
    record.detail = std::move(detail);
    trace_.Record(std::move(record));
}

MeshView::DeniedCallback Scheduler::DeniedRecorder(UnitId id, const std::string& name,
                                                   SnapshotId snapshot_id, CycleId cycle) const {
    UnitRegistry* registry = &registry_;
    TraceRecorder* trace = &trace_;
    return [registry, trace, id, name, snapshot_id, cycle](const std::string& key, bool write) {
        registry->CountAccessDenied(id);
        MutationRecord record;
        record.kind = RecordKind::kSecurity;
        record.unit_id = id;
        record.unit_name = name;
        record.snapshot_id = snapshot_id;
        record.cycle_id = cycle;
        record.started_at = WallClock::now();
        record.finished_at = record.started_at;
        record.outcome = Outcome::kFailed;
        record.error = MeshError::kAccessDenied;
        record.detail = std::string(write ? "write " : "read ") + key;
        trace->Record(std::move(record));
    };
}

} // namespace Meshwork
