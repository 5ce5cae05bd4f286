#ifndef MESHWORK_REACTOR_UNIT_H_
#define MESHWORK_REACTOR_UNIT_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/mesh_error.h"
#include "common/types.h"

namespace Meshwork {

class MeshView;
class MeshHandle;

// What happens to a matched unit whose mutex group is already taken.
enum class ExecutionPolicy {
    kQueue,       // wait in the group's queue
    kAbortLower,  // give up this cycle, recorded as Suppressed
    kInterrupt,   // ask the running holder to stop, then run next
};

const char* ExecutionPolicyName(ExecutionPolicy policy);
// Accepts "queue", "abort_lower" and "interrupt".
bool ParseExecutionPolicy(const std::string& name, ExecutionPolicy* policy);

struct UnitDescriptor {
    // Stable name; the ACL manifest refers to units by it.
    std::string name;
    int32_t priority = 0;
    std::chrono::milliseconds cooldown{0};
    std::optional<std::string> mutex_group;
    ExecutionPolicy policy = ExecutionPolicy::kQueue;
    // 0 selects the reactor's default deadline.
    std::chrono::milliseconds deadline{0};
    // Still admitted while the reactor runs degraded.
    bool critical = false;
    // Evaluated every cycle against the snapshot's capture time, whether or
    // not any of its keys changed.
    bool temporal = false;
    // Keys and prefix patterns ("content:*") the unit reads.
    std::vector<std::string> interests;
};

/**
 * Cooperative cancellation flag carried by every execution.
 * The engine never preempts a unit; long actions are expected to poll
 * MeshHandle::ShouldStop() between steps.
 */
class CancellationToken {
public:
    explicit CancellationToken(SteadyTime deadline) : deadline_(deadline) {}

    // The first reason wins.
    void Cancel(MeshError reason) {
        int expected = static_cast<int>(MeshError::kOk);
        reason_.compare_exchange_strong(expected, static_cast<int>(reason));
    }

    bool Cancelled() const { return reason() != MeshError::kOk; }
    MeshError reason() const { return static_cast<MeshError>(reason_.load(std::memory_order_acquire)); }

    bool Expired(SteadyTime now) const { return now > deadline_; }
    SteadyTime deadline() const { return deadline_; }

private:
    const SteadyTime deadline_;
    std::atomic<int> reason_{static_cast<int>(MeshError::kOk)};
};

/**
 * A reactive handler. Trigger must be a pure predicate over the view;
 * Act mutates the mesh only through the handle, whose writes are committed
 * all at once after Act returns.
 */
class Unit {
public:
    virtual ~Unit() = default;

    virtual bool Trigger(MeshView& view) = 0;
    virtual void Act(MeshHandle& handle) = 0;
};

// Adapter for units written as two callables.
class LambdaUnit : public Unit {
public:
    using TriggerFn = std::function<bool(MeshView&)>;
    using ActFn = std::function<void(MeshHandle&)>;

    LambdaUnit(TriggerFn trigger, ActFn act)
        : trigger_(std::move(trigger)), act_(std::move(act)) {}

    bool Trigger(MeshView& view) override { return trigger_ ? trigger_(view) : false; }
    void Act(MeshHandle& handle) override {
        if (act_) act_(handle);
    }

private:
    TriggerFn trigger_;
    ActFn act_;
};

inline std::shared_ptr<Unit> MakeUnit(LambdaUnit::TriggerFn trigger, LambdaUnit::ActFn act) {
    return std::make_shared<LambdaUnit>(std::move(trigger), std::move(act));
}

} // namespace Meshwork

#endif // MESHWORK_REACTOR_UNIT_H_
