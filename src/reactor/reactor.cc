#include "reactor.h"

#include <glog/logging.h>

#include "absl/time/time.h"

namespace Meshwork {

ReactorOptions ReactorOptions::FromConfig(const MeshworkConfig& config) {
    ReactorOptions options;
    options.cycle_interval = std::chrono::milliseconds(config.reactor.cycle_interval_ms.get());
    options.worker_threads = static_cast<size_t>(config.reactor.worker_threads.get());
    options.scheduler.default_deadline = std::chrono::milliseconds(config.reactor.default_deadline_ms.get());
    options.scheduler.timeout_disable_streak = static_cast<uint32_t>(config.reactor.timeout_disable_streak.get());
    options.scheduler.max_admissions_per_cycle =
        static_cast<size_t>(config.reactor.max_admissions_per_cycle.get());
    options.scheduler.max_units_per_cycle = static_cast<size_t>(config.reactor.max_units_per_cycle.get());
    options.starvation_threshold_cycles = config.mutex.starvation_threshold_cycles.get();
    options.boost_per_cycle = config.mutex.boost_per_cycle.get();
    options.throttle.sample_interval = std::chrono::milliseconds(config.throttle.sample_interval_ms.get());
    options.throttle.throttle_threshold = config.throttle.throttle_threshold.get();
    options.throttle.emergency_threshold = config.throttle.emergency_threshold.get();
    options.throttle.max_mutation_rate = static_cast<uint64_t>(config.throttle.max_mutation_rate.get());
    options.trace_buffer_capacity = config.trace.buffer_capacity.get();
    options.trace_retry_capacity = config.trace.retry_capacity.get();
    options.trace_history_size = config.trace.history_size.get();
    options.trace_retention = std::chrono::seconds(config.trace.retention_s.get());
    options.max_value_bytes = config.safety.max_value_bytes.get();
    options.max_snapshot_keys = config.safety.max_snapshot_keys.get();
    options.acl_default_allow = config.acl.default_policy.get() == "allow";
    return options;
}

Reactor::Reactor(ReactorOptions options)
    : options_(options),
      store_(options.max_value_bytes),
      snapshots_(store_, options.max_snapshot_keys),
      acl_(options.acl_default_allow),
      arbiter_(options.starvation_threshold_cycles, options.boost_per_cycle),
      throttle_(options.throttle),
      trace_(options.trace_buffer_capacity, options.trace_retry_capacity,
             options.trace_history_size, options.trace_retention),
      pool_(options.worker_threads),
      scheduler_(options.scheduler, store_, snapshots_, acl_, registry_, arbiter_,
                 throttle_, trace_, pool_) {
    store_.SetChangeListener(&feed_);
    LOG(INFO) << "Reactor created: cycle=" << options_.cycle_interval.count() << "ms"
              << " workers=" << options_.worker_threads
              << " deadline=" << options_.scheduler.default_deadline.count() << "ms";
}

Reactor::~Reactor() {
    Stop();
}

void Reactor::SetBackend(IMeshBackend* backend) {
    store_.SetBackend(backend);
}

void Reactor::SetTraceSink(std::shared_ptr<ITraceSink> sink) {
    if (running_.load(std::memory_order_acquire)) {
        LOG(ERROR) << "Trace sink must be set before the reactor starts";
        return;
    }
    trace_.SetSink(std::move(sink));
}

MeshError Reactor::LoadFromBackend() {
    MeshError err = store_.LoadFromBackend();
    if (err == MeshError::kStoreCorruption) {
        Halt("backend returned a version older than the one in memory");
    }
    return err;
}

void Reactor::Start() {
    if (stopped_.load(std::memory_order_acquire)) {
        LOG(ERROR) << "Reactor cannot be restarted after Stop()";
        return;
    }
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    trace_.Start();
    loop_thread_ = std::thread(&Reactor::LoopThread, this);
    LOG(INFO) << "Reactor started";
}

void Reactor::Stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    {
        absl::MutexLock lock(&stop_mu_);
        stopping_ = true;
    }
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    // Running units see their cancellation at the next checkpoint; the pool
    // joins once they return.
    scheduler_.CancelAll(MeshError::kCancelled);
    pool_.Stop();
    trace_.Flush();
    trace_.Stop();
    running_.store(false, std::memory_order_release);
    LOG(INFO) << "Reactor stopped after " << scheduler_.cycles() << " cycles";
}

void Reactor::LoopThread() {
    auto last_prune = SteadyClock::now();
    while (true) {
        {
            absl::MutexLock lock(&stop_mu_);
            if (stop_mu_.AwaitWithTimeout(absl::Condition(&stopping_),
                                          absl::FromChrono(options_.cycle_interval))) {
                return;
            }
        }
        RunCycle();
        auto now = SteadyClock::now();
        if (now - last_prune > std::chrono::seconds(1)) {
            last_prune = now;
            trace_.PruneExpired(WallClock::now());
        }
    }
}

MeshError Reactor::CheckIngest(const std::string& key) {
    if (Halted()) {
        return MeshError::kStoreCorruption;
    }
    // Ingest is only subject to the ACL once a manifest declares namespaces.
    if (acl_.NamespaceCount() > 0 && !acl_.CanWrite(kExternalWriterName, key)) {
        LOG_EVERY_N(WARNING, 100) << "Ingest write to " << key << " denied by ACL";
        return MeshError::kAccessDenied;
    }
    return MeshError::kOk;
}

MeshError Reactor::SubmitMutation(const std::string& key, std::string value,
                                  uint64_t expected_version, uint64_t* new_version) {
    MeshError err = CheckIngest(key);
    if (err != MeshError::kOk) {
        return err;
    }
    err = store_.CompareAndSet(key, expected_version, std::move(value), kExternalWriter, new_version);
    if (err == MeshError::kStoreCorruption) {
        Halt("store reported corruption on ingest");
    }
    return err;
}

MeshError Reactor::DeleteKey(const std::string& key, uint64_t expected_version,
                             uint64_t* tombstone_version) {
    MeshError err = CheckIngest(key);
    if (err != MeshError::kOk) {
        return err;
    }
    err = store_.CompareAndDelete(key, expected_version, kExternalWriter, tombstone_version);
    if (err == MeshError::kStoreCorruption) {
        Halt("store reported corruption on ingest");
    }
    return err;
}

MeshError Reactor::Subscribe(std::string pattern, ChangeFeed::Callback callback, SubscriptionId* id) {
    SubscriptionId assigned = feed_.Subscribe(std::move(pattern), std::move(callback));
    if (assigned == 0) {
        return MeshError::kInvalidArgument;
    }
    if (id) *id = assigned;
    return MeshError::kOk;
}

MeshError Reactor::Unsubscribe(SubscriptionId id) {
    return feed_.Unsubscribe(id) ? MeshError::kOk : MeshError::kNotFound;
}

std::optional<VersionedValue> Reactor::Get(const std::string& key) const {
    return store_.Get(key);
}

MeshError Reactor::RegisterUnit(UnitDescriptor descriptor, std::shared_ptr<Unit> unit, UnitId* id) {
    UnitId assigned = 0;
    MeshError err = registry_.Register(std::move(descriptor), std::move(unit), &assigned);
    if (err != MeshError::kOk) {
        return err;
    }
    scheduler_.MarkPending(assigned);
    if (id) *id = assigned;
    return MeshError::kOk;
}

MeshError Reactor::DeregisterUnit(UnitId id) {
    MeshError err = registry_.Deregister(id);
    if (err != MeshError::kOk) {
        return err;
    }
    scheduler_.OnDeregister(id);
    return MeshError::kOk;
}

MeshError Reactor::SetEnabled(UnitId id, bool enabled) {
    MeshError err = registry_.SetEnabled(id, enabled);
    if (err == MeshError::kOk && enabled) {
        scheduler_.MarkPending(id);
    }
    return err;
}

MeshError Reactor::ReportPressure(double pressure) {
    return throttle_.ReportPressure(pressure);
}

CycleReport Reactor::RunCycle() {
    absl::MutexLock lock(&cycle_mu_);
    if (!Halted() && store_.Corrupted()) {
        Halt("version store invariant violated");
    }
    if (Halted()) {
        CycleReport report;
        report.cycle = scheduler_.cycles();
        report.error = MeshError::kStoreCorruption;
        return report;
    }
    return scheduler_.RunCycle();
}

bool Reactor::WaitForIdle(std::chrono::milliseconds timeout) {
    return scheduler_.WaitForIdle(timeout);
}

void Reactor::Halt(const std::string& reason) {
    if (!halted_.exchange(true)) {
        LOG(ERROR) << "Reactor halted: " << reason << " ("
                   << MeshErrorName(MeshError::kStoreCorruption)
                   << "). Dispatch stopped; operator action required";
    }
}

HealthReport Reactor::GetHealth() const {
    HealthReport health;
    health.pressure = throttle_.Pressure();
    health.external_pressure = throttle_.ExternalPressure();
    health.mutation_rate = throttle_.MutationRate();
    health.throttled = throttle_.Throttled();
    health.degraded = throttle_.Degraded();
    health.halted = Halted();
    health.cycles = scheduler_.cycles();
    health.committed_mutations = store_.CommittedMutations();
    health.conflicts = store_.Conflicts();
    health.store_keys = store_.Size();
    health.running_units = scheduler_.RunningCount();
    health.busy_workers = pool_.BusyWorkers();
    health.worker_queue_depth = pool_.QueueDepth();
    health.queue_depths = arbiter_.QueueDepths();
    health.deferred = throttle_.Deferred();
    health.acl_denials = acl_.Denials();
    health.trace_recorded = trace_.Recorded();
    health.trace_dropped = trace_.Dropped();
    health.trace_exported = trace_.Exported();
    health.trace_sink_failures = trace_.SinkFailures();
    health.trace_sink_available = trace_.SinkAvailable();
    health.subscriptions = feed_.Subscriptions();
    health.units = registry_.AllStatus();
    return health;
}

} // namespace Meshwork
