#include "change_feed.h"

#include <exception>

#include <glog/logging.h>

namespace Meshwork {

SubscriptionId ChangeFeed::Subscribe(std::string pattern, Callback callback) {
    if (pattern.empty() || !callback) {
        LOG(WARNING) << "Rejecting subscription without pattern or callback";
        return 0;
    }
    auto subscription = std::make_shared<Subscription>();
    subscription->pattern = std::move(pattern);
    subscription->callback = std::move(callback);

    absl::MutexLock lock(&mu_);
    subscription->id = next_id_++;
    VLOG(1) << "Subscription " << subscription->id << " on " << subscription->pattern;
    subscriptions_.emplace(subscription->id, subscription);
    return subscription->id;
}

bool ChangeFeed::Unsubscribe(SubscriptionId id) {
    absl::MutexLock lock(&mu_);
    return subscriptions_.erase(id) > 0;
}

size_t ChangeFeed::Subscriptions() const {
    absl::ReaderMutexLock lock(&mu_);
    return subscriptions_.size();
}

bool ChangeFeed::Deliver(Subscription& subscription, const MeshEntry& change) {
    try {
        subscription.callback(change);
        return true;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Subscription " << subscription.id << " (" << subscription.pattern
                   << ") failed on " << change.key << ": " << e.what();
    } catch (...) {
        LOG(ERROR) << "Subscription " << subscription.id << " (" << subscription.pattern
                   << ") failed on " << change.key << " with a non-standard exception";
    }
    return false;
}

void ChangeFeed::OnCommitted(const std::vector<MeshEntry>& committed) {
    std::vector<std::shared_ptr<Subscription>> active;
    {
        absl::ReaderMutexLock lock(&mu_);
        if (subscriptions_.empty()) {
            return;
        }
        active.reserve(subscriptions_.size());
        for (const auto& entry : subscriptions_) {
            active.push_back(entry.second);
        }
    }

    // Callbacks run without mu_ so they may subscribe or unsubscribe.
    std::vector<SubscriptionId> exhausted;
    for (const auto& subscription : active) {
        for (const auto& change : committed) {
            if (!MatchesPattern(subscription->pattern, change.key)) {
                continue;
            }
            if (Deliver(*subscription, change)) {
                delivered_.fetch_add(1, std::memory_order_relaxed);
                subscription->consecutive_failures.store(0, std::memory_order_relaxed);
                continue;
            }
            failures_.fetch_add(1, std::memory_order_relaxed);
            if (subscription->consecutive_failures.fetch_add(1) + 1 >= kMaxConsecutiveFailures) {
                exhausted.push_back(subscription->id);
                break;
            }
        }
    }

    if (exhausted.empty()) {
        return;
    }
    absl::MutexLock lock(&mu_);
    for (SubscriptionId id : exhausted) {
        if (subscriptions_.erase(id) > 0) {
            LOG(WARNING) << "Subscription " << id << " deactivated after "
                         << kMaxConsecutiveFailures << " consecutive failures";
        }
    }
}

} // namespace Meshwork
