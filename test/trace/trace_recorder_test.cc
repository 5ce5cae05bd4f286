#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/trace/trace_recorder.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

using namespace Meshwork;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

class MockTraceSink : public ITraceSink {
public:
    MOCK_METHOD(bool, Write, (const MutationRecord& record), (override));
    MOCK_METHOD(bool, Flush, (), (override));
};

// Sink whose availability the test flips.
class FlakySink : public ITraceSink {
public:
    bool Write(const MutationRecord& record) override {
        if (!up.load()) return false;
        std::lock_guard<std::mutex> lock(mu);
        sequences.push_back(record.sequence);
        return true;
    }

    std::atomic<bool> up{true};
    std::mutex mu;
    std::vector<uint64_t> sequences;
};

namespace {

MutationRecord MakeRecord(UnitId unit, CycleId cycle, Outcome outcome) {
    MutationRecord record;
    record.unit_id = unit;
    record.unit_name = "unit-" + std::to_string(unit);
    record.cycle_id = cycle;
    record.outcome = outcome;
    record.started_at = WallClock::now();
    record.finished_at = record.started_at;
    return record;
}

} // namespace

TEST(TraceRecorderTest, AssignsSequenceAndKeepsHistory) {
    TraceRecorder recorder(64, 16, 100, std::chrono::seconds(3600));
    recorder.Start();
    for (CycleId cycle = 1; cycle <= 5; ++cycle) {
        EXPECT_TRUE(recorder.Record(MakeRecord(1, cycle, Outcome::kSuccess)));
    }
    ASSERT_TRUE(recorder.Flush());
    recorder.Stop();

    auto all = recorder.Query(TraceFilter{});
    ASSERT_EQ(all.size(), 5u);
    for (size_t i = 1; i < all.size(); ++i) {
        EXPECT_GT(all[i].sequence, all[i - 1].sequence);
    }
    EXPECT_EQ(recorder.Recorded(), 5u);
    EXPECT_EQ(recorder.Dropped(), 0u);
}

TEST(TraceRecorderTest, QueryFilters) {
    TraceRecorder recorder(64, 16, 100, std::chrono::seconds(3600));
    recorder.Record(MakeRecord(1, 1, Outcome::kSuccess));
    recorder.Record(MakeRecord(2, 1, Outcome::kDeferred));
    recorder.Record(MakeRecord(2, 2, Outcome::kDeferred));
    recorder.Record(MakeRecord(1, 3, Outcome::kFailed));
    ASSERT_TRUE(recorder.Flush());

    TraceFilter by_unit;
    by_unit.unit_id = 2;
    EXPECT_EQ(recorder.Query(by_unit).size(), 2u);

    TraceFilter by_outcome;
    by_outcome.outcome = Outcome::kFailed;
    auto failed = recorder.Query(by_outcome);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].cycle_id, 3u);

    TraceFilter by_cycle;
    by_cycle.min_cycle = 2;
    by_cycle.max_cycle = 2;
    EXPECT_EQ(recorder.Query(by_cycle).size(), 1u);

    TraceFilter limited;
    limited.limit = 3;
    EXPECT_EQ(recorder.Query(limited).size(), 3u);
}

TEST(TraceRecorderTest, FullBufferDropsWithCounter) {
    // Not started: nothing drains the buffer.
    TraceRecorder recorder(4, 16, 100, std::chrono::seconds(3600));
    int accepted = 0;
    for (int i = 0; i < 10; ++i) {
        if (recorder.Record(MakeRecord(1, i, Outcome::kNoOp))) accepted++;
    }
    EXPECT_EQ(accepted, 4);
    EXPECT_EQ(recorder.Dropped(), 6u);
    EXPECT_EQ(recorder.Recorded(), 4u);

    ASSERT_TRUE(recorder.Flush());
    EXPECT_EQ(recorder.HistorySize(), 4u);
}

TEST(TraceRecorderTest, ExportsToSink) {
    auto sink = std::make_shared<MockTraceSink>();
    EXPECT_CALL(*sink, Write(_)).Times(3).WillRepeatedly(Return(true));
    EXPECT_CALL(*sink, Flush()).WillRepeatedly(Return(true));

    TraceRecorder recorder(64, 16, 100, std::chrono::seconds(3600));
    recorder.SetSink(sink);
    recorder.Start();
    for (int i = 0; i < 3; ++i) {
        recorder.Record(MakeRecord(1, i, Outcome::kSuccess));
    }
    ASSERT_TRUE(recorder.Flush());
    recorder.Stop();
    EXPECT_EQ(recorder.Exported(), 3u);
    EXPECT_TRUE(recorder.SinkAvailable());
}

TEST(TraceRecorderTest, UnavailableSinkBuffersThenDropsOldest) {
    auto sink = std::make_shared<MockTraceSink>();
    EXPECT_CALL(*sink, Write(_)).WillRepeatedly(Return(false));
    EXPECT_CALL(*sink, Flush()).WillRepeatedly(Return(false));

    TraceRecorder recorder(64, 2, 100, std::chrono::seconds(3600));
    recorder.SetSink(sink);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(recorder.Record(MakeRecord(1, i, Outcome::kSuccess)));
    }
    ASSERT_TRUE(recorder.Flush());

    EXPECT_FALSE(recorder.SinkAvailable());
    EXPECT_GE(recorder.SinkFailures(), 1u);
    EXPECT_EQ(recorder.PendingRetry(), 2u);
    EXPECT_EQ(recorder.Dropped(), 3u);
    EXPECT_EQ(recorder.Exported(), 0u);
    // The audit history is independent of export
    EXPECT_EQ(recorder.HistorySize(), 5u);
}

TEST(TraceRecorderTest, RecoveredSinkReceivesBacklogInOrder) {
    auto sink = std::make_shared<FlakySink>();
    sink->up = false;

    TraceRecorder recorder(64, 16, 100, std::chrono::seconds(3600));
    recorder.SetSink(sink);
    for (int i = 0; i < 3; ++i) {
        recorder.Record(MakeRecord(1, i, Outcome::kSuccess));
    }
    ASSERT_TRUE(recorder.Flush());
    EXPECT_EQ(recorder.PendingRetry(), 3u);

    sink->up = true;
    recorder.Record(MakeRecord(1, 3, Outcome::kSuccess));
    ASSERT_TRUE(recorder.Flush());

    EXPECT_TRUE(recorder.SinkAvailable());
    EXPECT_EQ(recorder.PendingRetry(), 0u);
    EXPECT_EQ(recorder.Exported(), 4u);
    ASSERT_EQ(sink->sequences.size(), 4u);
    EXPECT_TRUE(std::is_sorted(sink->sequences.begin(), sink->sequences.end()));
}

TEST(TraceRecorderTest, PruneExpiredHonoursRetention) {
    TraceRecorder recorder(64, 16, 100, std::chrono::seconds(3600));
    WallTime now = WallClock::now();
    auto old_record = MakeRecord(1, 1, Outcome::kSuccess);
    old_record.finished_at = now - std::chrono::hours(2);
    recorder.Record(old_record);
    recorder.Record(MakeRecord(1, 2, Outcome::kSuccess));
    ASSERT_TRUE(recorder.Flush());

    EXPECT_EQ(recorder.PruneExpired(now), 1u);
    auto left = recorder.Query(TraceFilter{});
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].cycle_id, 2u);
}

TEST(TraceRecorderTest, HistoryIsBounded) {
    TraceRecorder recorder(64, 16, 3, std::chrono::seconds(3600));
    for (int i = 0; i < 10; ++i) {
        recorder.Record(MakeRecord(1, i, Outcome::kNoOp));
    }
    ASSERT_TRUE(recorder.Flush());
    auto kept = recorder.Query(TraceFilter{});
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept.front().cycle_id, 7u);
}

TEST(FileTraceSinkTest, AppendsJsonLines) {
    std::string path = ::testing::TempDir() + "meshwork_trace_test.jsonl";
    std::remove(path.c_str());
    {
        FileTraceSink sink(path);
        ASSERT_TRUE(sink.Write(MakeRecord(4, 1, Outcome::kSuccess)));
        ASSERT_TRUE(sink.Write(MakeRecord(4, 2, Outcome::kFailed)));
        ASSERT_TRUE(sink.Flush());
    }
    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
        lines++;
    }
    EXPECT_EQ(lines, 2);
    std::remove(path.c_str());
}

TEST(FileTraceSinkTest, UnwritablePathReportsUnavailable) {
    FileTraceSink sink("/nonexistent-dir/trace.jsonl");
    EXPECT_FALSE(sink.Write(MakeRecord(1, 1, Outcome::kSuccess)));
}
