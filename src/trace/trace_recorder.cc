#include "trace_recorder.h"

#include <glog/logging.h>

namespace Meshwork {

TraceRecorder::TraceRecorder(size_t buffer_capacity, size_t retry_capacity,
                             size_t history_size, std::chrono::seconds retention)
    : queue_(buffer_capacity),
      retry_capacity_(retry_capacity),
      history_size_(history_size),
      retention_(retention) {
    if (buffer_capacity == 0) {
        LOG(FATAL) << "TraceRecorder requires a non-zero buffer capacity";
    }
}

TraceRecorder::~TraceRecorder() {
    Stop();
}

void TraceRecorder::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    stop_.store(false, std::memory_order_release);
    drain_thread_ = std::thread(&TraceRecorder::DrainThread, this);
    VLOG(1) << "TraceRecorder started (sink=" << (sink_ ? "set" : "none") << ")";
}

void TraceRecorder::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    stop_.store(true, std::memory_order_release);
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
    // Whatever is still queued is handled here so nothing accepted is lost
    // silently.
    std::unique_ptr<MutationRecord> record;
    while (queue_.read(record)) {
        Handle(std::move(*record));
    }
    ExportPending();
    if (sink_ && !sink_->Flush()) {
        LOG(WARNING) << "Trace sink flush failed during shutdown";
    }
    size_t pending = PendingRetry();
    if (pending > 0) {
        LOG(WARNING) << "TraceRecorder stopped with " << pending
                     << " records not exported";
    }
}

bool TraceRecorder::Record(MutationRecord record) {
    if (!queue_.write(std::make_unique<MutationRecord>(std::move(record)))) {
        uint64_t dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        LOG_EVERY_N(WARNING, 1000) << "Trace buffer full, dropped " << dropped
                                   << " records so far";
        return false;
    }
    accepted_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool TraceRecorder::Flush(std::chrono::milliseconds timeout) {
    auto deadline = SteadyClock::now() + timeout;
    while (handled_.load(std::memory_order_acquire) <
           accepted_.load(std::memory_order_acquire)) {
        if (!running_.load(std::memory_order_acquire)) {
            // Nobody is draining; do it inline.
            std::unique_ptr<MutationRecord> record;
            while (queue_.read(record)) {
                Handle(std::move(*record));
            }
            break;
        }
        if (SteadyClock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

void TraceRecorder::DrainThread() {
    const auto poll = std::chrono::milliseconds(10);
    auto last_retry = SteadyClock::now();
    while (!stop_.load(std::memory_order_acquire)) {
        std::unique_ptr<MutationRecord> record;
        if (queue_.tryReadUntil(SteadyClock::now() + poll, record)) {
            Handle(std::move(*record));
        }
        // Sink down: retry the backlog at most every 100 ms.
        if (!sink_available_.load(std::memory_order_relaxed) &&
            SteadyClock::now() - last_retry > std::chrono::milliseconds(100)) {
            last_retry = SteadyClock::now();
            ExportPending();
        }
    }
}

void TraceRecorder::Handle(MutationRecord record) {
    record.sequence = next_sequence_.fetch_add(1, std::memory_order_relaxed);

    {
        absl::MutexLock lock(&history_mu_);
        history_.push_back(record);
        while (history_.size() > history_size_) {
            history_.pop_front();
        }
    }

    if (sink_) {
        // Keep export order: nothing new goes out while a backlog exists.
        bool backlog = PendingRetry() > 0;
        if (backlog) {
            ExportPending();
            backlog = PendingRetry() > 0;
        }
        if (!backlog && sink_->Write(record)) {
            exported_.fetch_add(1, std::memory_order_relaxed);
            sink_available_.store(true, std::memory_order_relaxed);
        } else {
            if (!backlog) {
                sink_failures_.fetch_add(1, std::memory_order_relaxed);
                if (sink_available_.exchange(false)) {
                    LOG(ERROR) << "Trace sink unavailable ("
                               << MeshErrorName(MeshError::kTraceSinkUnavailable)
                               << "), buffering for retry";
                }
            }
            absl::MutexLock lock(&retry_mu_);
            retry_.push_back(std::move(record));
            while (retry_.size() > retry_capacity_) {
                retry_.pop_front();
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }

    handled_.fetch_add(1, std::memory_order_release);
}

void TraceRecorder::ExportPending() {
    if (!sink_) {
        return;
    }
    absl::MutexLock lock(&retry_mu_);
    while (!retry_.empty()) {
        if (!sink_->Write(retry_.front())) {
            sink_failures_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        retry_.pop_front();
        exported_.fetch_add(1, std::memory_order_relaxed);
    }
    if (!sink_available_.exchange(true)) {
        LOG(INFO) << "Trace sink recovered";
    }
}

std::vector<MutationRecord> TraceRecorder::Query(const TraceFilter& filter) const {
    std::vector<MutationRecord> out;
    absl::MutexLock lock(&history_mu_);
    for (const auto& record : history_) {
        if (out.size() >= filter.limit) {
            break;
        }
        if (filter.unit_id && record.unit_id != *filter.unit_id) continue;
        if (filter.outcome && record.outcome != *filter.outcome) continue;
        if (filter.kind && record.kind != *filter.kind) continue;
        if (record.cycle_id < filter.min_cycle || record.cycle_id > filter.max_cycle) continue;
        out.push_back(record);
    }
    return out;
}

size_t TraceRecorder::PruneExpired(WallTime now) {
    WallTime cutoff = now - retention_;
    size_t removed = 0;
    absl::MutexLock lock(&history_mu_);
    while (!history_.empty() && history_.front().finished_at < cutoff) {
        history_.pop_front();
        ++removed;
    }
    if (removed > 0) {
        VLOG(1) << "Pruned " << removed << " expired trace records";
    }
    return removed;
}

size_t TraceRecorder::PendingRetry() const {
    absl::MutexLock lock(&retry_mu_);
    return retry_.size();
}

size_t TraceRecorder::HistorySize() const {
    absl::MutexLock lock(&history_mu_);
    return history_.size();
}

} // namespace Meshwork
