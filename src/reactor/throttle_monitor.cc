#include "throttle_monitor.h"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

namespace Meshwork {

ThrottleMonitor::ThrottleMonitor(ThrottleOptions options) : options_(options) {
    if (options_.emergency_threshold < options_.throttle_threshold) {
        LOG(WARNING) << "Emergency threshold " << options_.emergency_threshold
                     << " is below throttle threshold " << options_.throttle_threshold;
    }
}

MeshError ThrottleMonitor::ReportPressure(double pressure) {
    if (!(pressure >= 0.0 && pressure <= 1.0)) {
        LOG(WARNING) << "Ignoring out-of-range pressure signal " << pressure;
        return MeshError::kInvalidArgument;
    }
    absl::MutexLock lock(&mu_);
    external_ = pressure;
    NoteModeLocked();
    return MeshError::kOk;
}

void ThrottleMonitor::Sample(uint64_t committed_total, SteadyTime now) {
    absl::MutexLock lock(&mu_);
    if (!last_sample_at_) {
        last_sample_at_ = now;
        last_sample_total_ = committed_total;
        return;
    }
    auto elapsed = now - *last_sample_at_;
    if (elapsed < options_.sample_interval) {
        return;
    }
    double seconds = std::chrono::duration<double>(elapsed).count();
    uint64_t delta = committed_total >= last_sample_total_ ? committed_total - last_sample_total_ : 0;
    rate_ = seconds > 0 ? static_cast<double>(delta) / seconds : 0.0;
    last_sample_at_ = now;
    last_sample_total_ = committed_total;
    VLOG(2) << "Mutation rate " << rate_ << "/s, pressure " << PressureLocked();
    NoteModeLocked();
}

double ThrottleMonitor::PressureLocked() const {
    double derived = 0.0;
    if (options_.max_mutation_rate > 0) {
        derived = std::min(1.0, rate_ / static_cast<double>(options_.max_mutation_rate));
    }
    return std::max(external_, derived);
}

void ThrottleMonitor::NoteModeLocked() {
    double pressure = PressureLocked();
    bool throttled = pressure > options_.throttle_threshold;
    bool degraded = pressure > options_.emergency_threshold;
    if (degraded != was_degraded_) {
        if (degraded) {
            LOG(WARNING) << "Pressure " << pressure << " above emergency threshold "
                         << options_.emergency_threshold << ", admitting critical units only";
        } else {
            LOG(INFO) << "Pressure " << pressure << " back below emergency threshold, leaving degraded mode";
        }
    } else if (throttled != was_throttled_) {
        LOG(INFO) << "Pressure " << pressure << (throttled ? " above" : " below")
                  << " throttle threshold " << options_.throttle_threshold;
    }
    was_throttled_ = throttled;
    was_degraded_ = degraded;
}

double ThrottleMonitor::Pressure() const {
    absl::ReaderMutexLock lock(&mu_);
    return PressureLocked();
}

double ThrottleMonitor::ExternalPressure() const {
    absl::ReaderMutexLock lock(&mu_);
    return external_;
}

double ThrottleMonitor::MutationRate() const {
    absl::ReaderMutexLock lock(&mu_);
    return rate_;
}

size_t ThrottleMonitor::AdmissionBudget(size_t max_per_cycle) const {
    double pressure = Pressure();
    if (pressure <= options_.throttle_threshold) {
        return max_per_cycle;
    }
    return static_cast<size_t>(std::floor(static_cast<double>(max_per_cycle) * (1.0 - pressure)));
}

} // namespace Meshwork
