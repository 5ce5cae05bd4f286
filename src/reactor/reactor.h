#ifndef MESHWORK_REACTOR_REACTOR_H_
#define MESHWORK_REACTOR_REACTOR_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"

#include "acl/acl_registry.h"
#include "common/configuration.h"
#include "common/worker_pool.h"
#include "mesh/change_feed.h"
#include "mesh/snapshot.h"
#include "mesh/version_store.h"
#include "mutex_arbiter.h"
#include "scheduler.h"
#include "throttle_monitor.h"
#include "trace/trace_recorder.h"
#include "unit_registry.h"

namespace Meshwork {

struct ReactorOptions {
    std::chrono::milliseconds cycle_interval{50};
    size_t worker_threads = 8;
    SchedulerOptions scheduler;
    int starvation_threshold_cycles = 3;
    int boost_per_cycle = 1;
    ThrottleOptions throttle;
    size_t trace_buffer_capacity = 8192;
    size_t trace_retry_capacity = 1024;
    size_t trace_history_size = 10000;
    std::chrono::seconds trace_retention{24 * 3600};
    size_t max_value_bytes = 1UL << 20;
    size_t max_snapshot_keys = 100000;
    bool acl_default_allow = false;

    static ReactorOptions FromConfig(const MeshworkConfig& config);
};

// Everything the health endpoint reports.
struct HealthReport {
    double pressure = 0.0;
    double external_pressure = 0.0;
    double mutation_rate = 0.0;
    bool throttled = false;
    bool degraded = false;
    bool halted = false;
    CycleId cycles = 0;
    uint64_t committed_mutations = 0;
    uint64_t conflicts = 0;
    size_t store_keys = 0;
    size_t running_units = 0;
    size_t busy_workers = 0;
    size_t worker_queue_depth = 0;
    absl::btree_map<std::string, size_t> queue_depths;
    uint64_t deferred = 0;
    uint64_t acl_denials = 0;
    uint64_t trace_recorded = 0;
    uint64_t trace_dropped = 0;
    uint64_t trace_exported = 0;
    uint64_t trace_sink_failures = 0;
    bool trace_sink_available = true;
    size_t subscriptions = 0;
    std::vector<UnitStatus> units;
};

/**
 * The mesh coordination engine: owns the store, the unit population and the
 * scheduler, and exposes the ingest, registration and health APIs.
 *
 * Cycles run on an internal thread after Start(), or one at a time through
 * RunCycle() when the caller drives the reactor itself.
 */
class Reactor {
public:
    explicit Reactor(ReactorOptions options);
    ~Reactor();

    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    // Both must be called before Start().
    void SetBackend(IMeshBackend* backend);
    void SetTraceSink(std::shared_ptr<ITraceSink> sink);

    // Seeds the store from the backend. Corruption halts the reactor.
    MeshError LoadFromBackend();

    void Start();
    void Stop();
    bool Running() const { return running_.load(std::memory_order_acquire); }

    // Ingest API.
    MeshError SubmitMutation(const std::string& key, std::string value,
                             uint64_t expected_version, uint64_t* new_version);
    MeshError DeleteKey(const std::string& key, uint64_t expected_version,
                        uint64_t* tombstone_version);
    std::optional<VersionedValue> Get(const std::string& key) const;

    // Change observation: callback sees every committed change to a key
    // matching pattern. See ChangeFeed for the delivery rules.
    MeshError Subscribe(std::string pattern, ChangeFeed::Callback callback, SubscriptionId* id);
    MeshError Unsubscribe(SubscriptionId id);

    // Registration API.
    MeshError RegisterUnit(UnitDescriptor descriptor, std::shared_ptr<Unit> unit, UnitId* id);
    MeshError DeregisterUnit(UnitId id);
    MeshError SetEnabled(UnitId id, bool enabled);

    MeshError ReportPressure(double pressure);

    // One Collect/Order/Admit pass. Fails with kStoreCorruption once halted.
    CycleReport RunCycle();
    bool WaitForIdle(std::chrono::milliseconds timeout);

    HealthReport GetHealth() const;
    bool Halted() const { return halted_.load(std::memory_order_acquire); }

    AclRegistry& acl() { return acl_; }
    VersionStore& store() { return store_; }
    UnitRegistry& registry() { return registry_; }
    Scheduler& scheduler() { return scheduler_; }
    TraceRecorder& trace() { return trace_; }
    ThrottleMonitor& throttle() { return throttle_; }
    MutexArbiter& arbiter() { return arbiter_; }

private:
    void LoopThread();
    void Halt(const std::string& reason);
    MeshError CheckIngest(const std::string& key);

    const ReactorOptions options_;

    ChangeFeed feed_;
    VersionStore store_;
    SnapshotManager snapshots_;
    AclRegistry acl_;
    UnitRegistry registry_;
    MutexArbiter arbiter_;
    ThrottleMonitor throttle_;
    TraceRecorder trace_;
    WorkerPool pool_;
    Scheduler scheduler_;

    absl::Mutex cycle_mu_;

    absl::Mutex stop_mu_;
    bool stopping_ ABSL_GUARDED_BY(stop_mu_) = false;
    std::thread loop_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> halted_{false};
};

} // namespace Meshwork

#endif // MESHWORK_REACTOR_REACTOR_H_
