#ifndef MESHWORK_REACTOR_THROTTLE_MONITOR_H_
#define MESHWORK_REACTOR_THROTTLE_MONITOR_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

#include "absl/synchronization/mutex.h"

#include "common/mesh_error.h"
#include "common/types.h"

namespace Meshwork {

struct ThrottleOptions {
    std::chrono::milliseconds sample_interval{100};
    double throttle_threshold = 0.8;
    double emergency_threshold = 0.95;
    // Mutations per second that count as pressure 1.0; 0 disables the
    // rate-derived signal.
    uint64_t max_mutation_rate = 10000;
};

/**
 * Derives a pressure level in [0, 1] from the externally reported signal and
 * the sampled commit rate, whichever is higher.
 *
 * Above throttle_threshold the scheduler's admission budget shrinks by
 * (1 - pressure); above emergency_threshold the reactor runs degraded and
 * admits critical units only. Matches refused for either reason are deferred,
 * not failed.
 */
class ThrottleMonitor {
public:
    explicit ThrottleMonitor(ThrottleOptions options);

    // Rejects values outside [0, 1] with kInvalidArgument.
    MeshError ReportPressure(double pressure);

    // Feeds the store's running commit counter. A new rate is computed once
    // per sample interval.
    void Sample(uint64_t committed_total, SteadyTime now);

    double Pressure() const;
    double ExternalPressure() const;
    double MutationRate() const;
    bool Throttled() const { return Pressure() > options_.throttle_threshold; }
    bool Degraded() const { return Pressure() > options_.emergency_threshold; }

    // Admissions allowed this cycle given the unthrottled maximum.
    size_t AdmissionBudget(size_t max_per_cycle) const;

    void CountDeferred() { deferred_.fetch_add(1, std::memory_order_relaxed); }
    uint64_t Deferred() const { return deferred_.load(std::memory_order_relaxed); }

    const ThrottleOptions& options() const { return options_; }

private:
    double PressureLocked() const ABSL_SHARED_LOCKS_REQUIRED(mu_);
    void NoteModeLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

    const ThrottleOptions options_;

    mutable absl::Mutex mu_;
    double external_ ABSL_GUARDED_BY(mu_) = 0.0;
    double rate_ ABSL_GUARDED_BY(mu_) = 0.0;
    std::optional<SteadyTime> last_sample_at_ ABSL_GUARDED_BY(mu_);
    uint64_t last_sample_total_ ABSL_GUARDED_BY(mu_) = 0;
    bool was_throttled_ ABSL_GUARDED_BY(mu_) = false;
    bool was_degraded_ ABSL_GUARDED_BY(mu_) = false;

    std::atomic<uint64_t> deferred_{0};
};

} // namespace Meshwork

#endif // MESHWORK_REACTOR_THROTTLE_MONITOR_H_
