#ifndef MESHWORK_REACTOR_UNIT_REGISTRY_H_
#define MESHWORK_REACTOR_UNIT_REGISTRY_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "common/mesh_error.h"
#include "common/types.h"
#include "trace/mutation_record.h"
#include "unit.h"

namespace Meshwork {

// Per-unit counters exposed on the health surface.
struct UnitStats {
    uint64_t evaluations = 0;
    uint64_t executions = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t timeouts = 0;
    uint64_t conflicts = 0;
    uint64_t suppressions = 0;
    uint64_t deferrals = 0;
    uint64_t quarantines = 0;
    uint64_t access_denials = 0;
    uint64_t total_exec_us = 0;
    uint32_t timeout_streak = 0;

    uint64_t AverageExecMicros() const { return executions ? total_exec_us / executions : 0; }
};

// Immutable view of one registration handed to the scheduler.
struct UnitRef {
    UnitId id = 0;
    std::shared_ptr<const UnitDescriptor> descriptor;
    std::shared_ptr<Unit> unit;
    std::optional<SteadyTime> last_fired_at;
};

struct UnitStatus {
    UnitId id = 0;
    std::string name;
    bool enabled = false;
    UnitStats stats;
};

/**
 * Holds every registered unit. Descriptors never change after registration;
 * only the enabled flag, the cooldown clock and the counters do.
 * Ids are handed out in registration order, so ordering by id is ordering
 * by registration.
 */
class UnitRegistry {
public:
    UnitRegistry() = default;

    UnitRegistry(const UnitRegistry&) = delete;
    UnitRegistry& operator=(const UnitRegistry&) = delete;

    MeshError Register(UnitDescriptor descriptor, std::shared_ptr<Unit> unit, UnitId* id);
    MeshError Deregister(UnitId id);
    // Enabling a unit also clears its timeout streak.
    MeshError SetEnabled(UnitId id, bool enabled);

    // Disables the unit until SetEnabled(id, true).
    void Quarantine(UnitId id);

    bool Contains(UnitId id) const;
    bool IsEnabled(UnitId id) const;
    std::optional<UnitRef> Find(UnitId id) const;
    std::optional<UnitId> FindByName(const std::string& name) const;

    // Enabled units in registration order.
    std::vector<UnitRef> EnabledUnits() const;

    void MarkFired(UnitId id, SteadyTime when);
    void CountEvaluation(UnitId id);
    void CountAccessDenied(UnitId id);

    // Applies an execution outcome and returns the resulting timeout streak.
    uint32_t RecordOutcome(UnitId id, Outcome outcome, MeshError error, int64_t exec_us);

    std::optional<UnitStatus> Status(UnitId id) const;
    std::vector<UnitStatus> AllStatus() const;
    size_t Size() const;

private:
    struct Slot {
        std::shared_ptr<const UnitDescriptor> descriptor;
        std::shared_ptr<Unit> unit;
        bool enabled = true;
        std::optional<SteadyTime> last_fired_at;
        UnitStats stats;
    };

    UnitRef RefLocked(UnitId id, const Slot& slot) const;

    mutable absl::Mutex mu_;
    // btree keeps iteration in id (registration) order.
    absl::btree_map<UnitId, Slot> units_ ABSL_GUARDED_BY(mu_);
    absl::flat_hash_map<std::string, UnitId> by_name_ ABSL_GUARDED_BY(mu_);
    UnitId next_id_ ABSL_GUARDED_BY(mu_) = kExternalWriter + 1;
};

} // namespace Meshwork

#endif // MESHWORK_REACTOR_UNIT_REGISTRY_H_
