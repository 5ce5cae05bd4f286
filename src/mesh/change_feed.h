#ifndef MESHWORK_MESH_CHANGE_FEED_H_
#define MESHWORK_MESH_CHANGE_FEED_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"

#include "interfaces.h"
#include "mesh_entry.h"

namespace Meshwork {

using SubscriptionId = uint64_t;

/**
 * Pattern subscriptions on committed mesh changes.
 *
 * The store hands every committed batch to OnCommitted once its shard locks
 * are released. Callbacks run on the committing thread, possibly on several
 * threads at once, and see each entry of a batch in commit order. A deleted
 * key arrives as an entry with deleted set and an empty value.
 *
 * A callback that throws is logged and counted. After kMaxConsecutiveFailures
 * failures in a row its subscription is deactivated.
 */
class ChangeFeed : public IChangeListener {
public:
    using Callback = std::function<void(const MeshEntry& change)>;

    static constexpr uint32_t kMaxConsecutiveFailures = 3;

    ChangeFeed() = default;

    ChangeFeed(const ChangeFeed&) = delete;
    ChangeFeed& operator=(const ChangeFeed&) = delete;

    // 0 when pattern is empty or callback unset.
    SubscriptionId Subscribe(std::string pattern, Callback callback);
    bool Unsubscribe(SubscriptionId id);

    void OnCommitted(const std::vector<MeshEntry>& committed) override;

    size_t Subscriptions() const;
    uint64_t Delivered() const { return delivered_.load(std::memory_order_relaxed); }
    uint64_t Failures() const { return failures_.load(std::memory_order_relaxed); }

private:
    struct Subscription {
        SubscriptionId id = 0;
        std::string pattern;
        Callback callback;
        std::atomic<uint32_t> consecutive_failures{0};
    };

    // False when the callback threw.
    bool Deliver(Subscription& subscription, const MeshEntry& change);

    mutable absl::Mutex mu_;
    absl::btree_map<SubscriptionId, std::shared_ptr<Subscription>> subscriptions_ ABSL_GUARDED_BY(mu_);
    SubscriptionId next_id_ ABSL_GUARDED_BY(mu_) = 1;

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace Meshwork

#endif // MESHWORK_MESH_CHANGE_FEED_H_
