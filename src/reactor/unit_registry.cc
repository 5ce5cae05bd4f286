#include "unit_registry.h"

#include <glog/logging.h>

namespace Meshwork {

const char* ExecutionPolicyName(ExecutionPolicy policy) {
    switch (policy) {
        case ExecutionPolicy::kQueue: return "queue";
        case ExecutionPolicy::kAbortLower: return "abort_lower";
        case ExecutionPolicy::kInterrupt: return "interrupt";
    }
    return "unknown";
}

bool ParseExecutionPolicy(const std::string& name, ExecutionPolicy* policy) {
    if (name == "queue") {
        *policy = ExecutionPolicy::kQueue;
    } else if (name == "abort_lower") {
        *policy = ExecutionPolicy::kAbortLower;
    } else if (name == "interrupt") {
        *policy = ExecutionPolicy::kInterrupt;
    } else {
        return false;
    }
    return true;
}

MeshError UnitRegistry::Register(UnitDescriptor descriptor, std::shared_ptr<Unit> unit, UnitId* id) {
    if (descriptor.name.empty() || descriptor.name == kExternalWriterName) {
        LOG(ERROR) << "Rejecting unit registration: invalid name '" << descriptor.name << "'";
        return MeshError::kInvalidArgument;
    }
    if (!unit) {
        LOG(ERROR) << "Rejecting unit " << descriptor.name << ": no implementation";
        return MeshError::kInvalidArgument;
    }
    if (descriptor.interests.empty() && !descriptor.temporal) {
        LOG(ERROR) << "Rejecting unit " << descriptor.name
                   << ": declares no keys and is not temporal, it could never trigger";
        return MeshError::kInvalidArgument;
    }
    if (descriptor.mutex_group && descriptor.mutex_group->empty()) {
        descriptor.mutex_group.reset();
    }
    if (descriptor.cooldown.count() < 0 || descriptor.deadline.count() < 0) {
        LOG(ERROR) << "Rejecting unit " << descriptor.name << ": negative cooldown or deadline";
        return MeshError::kInvalidArgument;
    }

    absl::MutexLock lock(&mu_);
    if (by_name_.contains(descriptor.name)) {
        LOG(ERROR) << "Rejecting unit " << descriptor.name << ": name already registered";
        return MeshError::kInvalidArgument;
    }
    UnitId assigned = next_id_++;
    Slot slot;
    slot.descriptor = std::make_shared<const UnitDescriptor>(std::move(descriptor));
    slot.unit = std::move(unit);
    by_name_[slot.descriptor->name] = assigned;
    LOG(INFO) << "Registered unit " << slot.descriptor->name << " as #" << assigned
              << " (priority=" << slot.descriptor->priority
              << ", group=" << slot.descriptor->mutex_group.value_or("-")
              << ", policy=" << ExecutionPolicyName(slot.descriptor->policy) << ")";
    units_.emplace(assigned, std::move(slot));
    if (id) *id = assigned;
    return MeshError::kOk;
}

MeshError UnitRegistry::Deregister(UnitId id) {
    absl::MutexLock lock(&mu_);
    auto it = units_.find(id);
    if (it == units_.end()) {
        return MeshError::kNotFound;
    }
    by_name_.erase(it->second.descriptor->name);
    LOG(INFO) << "Deregistered unit " << it->second.descriptor->name << " (#" << id << ")";
    units_.erase(it);
    return MeshError::kOk;
}

MeshError UnitRegistry::SetEnabled(UnitId id, bool enabled) {
    absl::MutexLock lock(&mu_);
    auto it = units_.find(id);
    if (it == units_.end()) {
        return MeshError::kNotFound;
    }
    Slot& slot = it->second;
    if (slot.enabled != enabled) {
        LOG(INFO) << (enabled ? "Enabled" : "Disabled") << " unit " << slot.descriptor->name;
    }
    slot.enabled = enabled;
    if (enabled) {
        slot.stats.timeout_streak = 0;
    }
    return MeshError::kOk;
}

void UnitRegistry::Quarantine(UnitId id) {
    absl::MutexLock lock(&mu_);
    auto it = units_.find(id);
    if (it == units_.end()) {
        return;
    }
    it->second.enabled = false;
    it->second.stats.quarantines++;
    LOG(WARNING) << "Quarantined unit " << it->second.descriptor->name << " after "
                 << it->second.stats.timeout_streak << " consecutive timeouts";
}

bool UnitRegistry::Contains(UnitId id) const {
    absl::ReaderMutexLock lock(&mu_);
    return units_.contains(id);
}

bool UnitRegistry::IsEnabled(UnitId id) const {
    absl::ReaderMutexLock lock(&mu_);
    auto it = units_.find(id);
    return it != units_.end() && it->second.enabled;
}

UnitRef UnitRegistry::RefLocked(UnitId id, const Slot& slot) const {
    UnitRef ref;
    ref.id = id;
    ref.descriptor = slot.descriptor;
    ref.unit = slot.unit;
    ref.last_fired_at = slot.last_fired_at;
    return ref;
}

std::optional<UnitRef> UnitRegistry::Find(UnitId id) const {
    absl::ReaderMutexLock lock(&mu_);
    auto it = units_.find(id);
    if (it == units_.end()) {
        return std::nullopt;
    }
    return RefLocked(id, it->second);
}

std::optional<UnitId> UnitRegistry::FindByName(const std::string& name) const {
    absl::ReaderMutexLock lock(&mu_);
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<UnitRef> UnitRegistry::EnabledUnits() const {
    std::vector<UnitRef> out;
    absl::ReaderMutexLock lock(&mu_);
    out.reserve(units_.size());
    for (const auto& entry : units_) {
        if (entry.second.enabled) {
            out.push_back(RefLocked(entry.first, entry.second));
        }
    }
    return out;
}

void UnitRegistry::MarkFired(UnitId id, SteadyTime when) {
    absl::MutexLock lock(&mu_);
    auto it = units_.find(id);
    if (it != units_.end()) {
        it->second.last_fired_at = when;
    }
}

void UnitRegistry::CountEvaluation(UnitId id) {
    absl::MutexLock lock(&mu_);
    auto it = units_.find(id);
    if (it != units_.end()) {
        it->second.stats.evaluations++;
    }
}

void UnitRegistry::CountAccessDenied(UnitId id) {
    absl::MutexLock lock(&mu_);
    auto it = units_.find(id);
    if (it != units_.end()) {
        it->second.stats.access_denials++;
    }
}

uint32_t UnitRegistry::RecordOutcome(UnitId id, Outcome outcome, MeshError error, int64_t exec_us) {
    absl::MutexLock lock(&mu_);
    auto it = units_.find(id);
    if (it == units_.end()) {
        return 0;
    }
    UnitStats& stats = it->second.stats;
    switch (outcome) {
        case Outcome::kSuppressed:
            stats.suppressions++;
            return stats.timeout_streak;
        case Outcome::kDeferred:
            stats.deferrals++;
            return stats.timeout_streak;
        case Outcome::kNoOp:
            return stats.timeout_streak;
        case Outcome::kSuccess:
        case Outcome::kFailed:
        case Outcome::kQuarantined:
            break;
    }

    stats.executions++;
    if (exec_us > 0) {
        stats.total_exec_us += static_cast<uint64_t>(exec_us);
    }
    if (outcome == Outcome::kSuccess) {
        stats.successes++;
    } else {
        stats.failures++;
    }
    if (error == MeshError::kVersionConflict) {
        stats.conflicts++;
    }
    if (error == MeshError::kTimeout) {
        stats.timeouts++;
        stats.timeout_streak++;
    } else {
        stats.timeout_streak = 0;
    }
    return stats.timeout_streak;
}

std::optional<UnitStatus> UnitRegistry::Status(UnitId id) const {
    absl::ReaderMutexLock lock(&mu_);
    auto it = units_.find(id);
    if (it == units_.end()) {
        return std::nullopt;
    }
    return UnitStatus{id, it->second.descriptor->name, it->second.enabled, it->second.stats};
}

std::vector<UnitStatus> UnitRegistry::AllStatus() const {
    std::vector<UnitStatus> out;
    absl::ReaderMutexLock lock(&mu_);
    out.reserve(units_.size());
    for (const auto& entry : units_) {
        out.push_back(UnitStatus{entry.first, entry.second.descriptor->name,
                                 entry.second.enabled, entry.second.stats});
    }
    return out;
}

size_t UnitRegistry::Size() const {
    absl::ReaderMutexLock lock(&mu_);
    return units_.size();
}

} // namespace Meshwork
