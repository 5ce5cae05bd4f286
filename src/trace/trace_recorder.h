#ifndef MESHWORK_TRACE_TRACE_RECORDER_H_
#define MESHWORK_TRACE_TRACE_RECORDER_H_

#include <atomic>
#include <chrono>
#include <deque>
#include <limits>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "folly/MPMCQueue.h"

#include "mutation_record.h"
#include "trace_sink.h"

namespace Meshwork {

struct TraceFilter {
    std::optional<UnitId> unit_id;
    std::optional<Outcome> outcome;
    std::optional<RecordKind> kind;
    CycleId min_cycle = 0;
    CycleId max_cycle = std::numeric_limits<CycleId>::max();
    size_t limit = std::numeric_limits<size_t>::max();
};

/**
 * TraceRecorder accepts records from the scheduler and workers without ever
 * blocking them. Records go through a bounded MPMC queue to a drain thread
 * that appends them to the audit history and exports them to the sink.
 *
 * Loss is always counted: a full queue drops the incoming record, and while
 * the sink is down records wait in a bounded retry buffer whose overflow drops
 * the oldest record.
 */
class TraceRecorder {
public:
    TraceRecorder(size_t buffer_capacity, size_t retry_capacity,
                  size_t history_size, std::chrono::seconds retention);
    ~TraceRecorder();

    TraceRecorder(const TraceRecorder&) = delete;
    TraceRecorder& operator=(const TraceRecorder&) = delete;

    // Must be called before Start.
    void SetSink(std::shared_ptr<ITraceSink> sink) { sink_ = std::move(sink); }

    void Start();
    void Stop();

    // Non-blocking; returns false when the record had to be dropped.
    bool Record(MutationRecord record);

    // Waits until every accepted record reached the history (and the sink
    // when it is available), up to timeout.
    bool Flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    std::vector<MutationRecord> Query(const TraceFilter& filter) const;
    // Removes history records finished before now - retention.
    size_t PruneExpired(WallTime now);

    uint64_t Recorded() const { return accepted_.load(std::memory_order_relaxed); }
    uint64_t Dropped() const { return dropped_.load(std::memory_order_relaxed); }
    uint64_t Exported() const { return exported_.load(std::memory_order_relaxed); }
    uint64_t SinkFailures() const { return sink_failures_.load(std::memory_order_relaxed); }
    bool SinkAvailable() const { return sink_available_.load(std::memory_order_relaxed); }
    size_t PendingRetry() const;
    size_t HistorySize() const;

private:
    void DrainThread();
    void Handle(MutationRecord record);
    void ExportPending();

    // Records are boxed so the queue slot type is trivially nothrow-movable.
    folly::MPMCQueue<std::unique_ptr<MutationRecord>> queue_;
    const size_t retry_capacity_;
    const size_t history_size_;
    const std::chrono::seconds retention_;
    std::shared_ptr<ITraceSink> sink_;

    std::thread drain_thread_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> next_sequence_{1};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> handled_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> exported_{0};
    std::atomic<uint64_t> sink_failures_{0};
    std::atomic<bool> sink_available_{true};

    mutable absl::Mutex retry_mu_;
    std::deque<MutationRecord> retry_ ABSL_GUARDED_BY(retry_mu_);

    mutable absl::Mutex history_mu_;
    std::deque<MutationRecord> history_ ABSL_GUARDED_BY(history_mu_);
};

} // namespace Meshwork

#endif // MESHWORK_TRACE_TRACE_RECORDER_H_
