#include <gtest/gtest.h>
#include "../../src/reactor/scheduler.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace Meshwork;
using namespace std::chrono_literals;

class SchedulerTest : public ::testing::Test {
protected:
    SchedulerTest()
        : snapshots_(store_, 1000),
          acl_(/*default_allow=*/true),
          arbiter_(/*starvation_threshold_cycles=*/3, /*boost_per_cycle=*/1),
          throttle_(Throttle()),
          trace_(4096, 64, 4096, std::chrono::seconds(3600)),
          pool_(4),
          scheduler_(Options(), store_, snapshots_, acl_, registry_, arbiter_, throttle_, trace_, pool_) {}

    ~SchedulerTest() override {
        scheduler_.WaitForIdle(5000ms);
        pool_.Stop();
    }

    static ThrottleOptions Throttle() {
        ThrottleOptions options;
        options.max_mutation_rate = 0;
        return options;
    }

    static SchedulerOptions Options() {
        SchedulerOptions options;
        options.default_deadline = 2000ms;
        options.timeout_disable_streak = 3;
        return options;
    }

    UnitId Register(UnitDescriptor descriptor, std::shared_ptr<Unit> unit) {
        UnitId id = 0;
        EXPECT_EQ(registry_.Register(std::move(descriptor), std::move(unit), &id), MeshError::kOk);
        scheduler_.MarkPending(id);
        return id;
    }

    static UnitDescriptor Describe(const std::string& name, std::vector<std::string> interests,
                                   int32_t priority = 0) {
        UnitDescriptor descriptor;
        descriptor.name = name;
        descriptor.priority = priority;
        descriptor.interests = std::move(interests);
        return descriptor;
    }

    void Ingest(const std::string& key, const std::string& value) {
        uint64_t expected = store_.Get(key) ? store_.Get(key)->version : 0;
        uint64_t version = 0;
        ASSERT_EQ(store_.CompareAndSet(key, expected, value, kExternalWriter, &version), MeshError::kOk);
    }

    CycleReport Cycle() {
        CycleReport report = scheduler_.RunCycle();
        EXPECT_TRUE(scheduler_.WaitForIdle(5000ms));
        return report;
    }

    std::vector<MutationRecord> Executions(UnitId id) {
        EXPECT_TRUE(trace_.Flush());
        TraceFilter filter;
        filter.unit_id = id;
        filter.kind = RecordKind::kExecution;
        return trace_.Query(filter);
    }

    VersionStore store_;
    SnapshotManager snapshots_;
    AclRegistry acl_;
    UnitRegistry registry_;
    MutexArbiter arbiter_;
    ThrottleMonitor throttle_;
    TraceRecorder trace_;
    WorkerPool pool_;
    Scheduler scheduler_;
};

TEST_F(SchedulerTest, CollectIsRepeatableAndOrdered) {
    Ingest("doc:1", "x");
    auto fires = [](MeshView& view) { return view.Get("doc:1").has_value(); };
    auto idle = [](MeshHandle&) {};
    UnitId low = Register(Describe("low", {"doc:*"}, 1), MakeUnit(fires, idle));
    UnitId high_a = Register(Describe("high-a", {"doc:*"}, 9), MakeUnit(fires, idle));
    UnitId high_b = Register(Describe("high-b", {"doc:*"}, 9), MakeUnit(fires, idle));
    UnitId never = Register(Describe("never", {"doc:*"}, 50),
                            MakeUnit([](MeshView&) { return false; }, idle));

    SnapshotPtr snapshot;
    ASSERT_EQ(snapshots_.Capture({"doc:*"}, &snapshot), MeshError::kOk);
    auto candidates = registry_.EnabledUnits();

    CollectResult first = scheduler_.Collect(candidates, snapshot);
    CollectResult second = scheduler_.Collect(candidates, snapshot);

    ASSERT_EQ(first.matches.size(), 3u);
    EXPECT_EQ(first.matches[0].id, high_a);
    EXPECT_EQ(first.matches[1].id, high_b);
    EXPECT_EQ(first.matches[2].id, low);
    ASSERT_EQ(second.matches.size(), first.matches.size());
    for (size_t i = 0; i < first.matches.size(); ++i) {
        EXPECT_EQ(second.matches[i].id, first.matches[i].id);
    }
    EXPECT_EQ(first.not_triggered, std::vector<UnitId>{never});
    EXPECT_TRUE(first.faulted.empty());
}

TEST_F(SchedulerTest, ExecutesMatchedUnitAndCommitsWrites) {
    UnitId id = Register(Describe("copier", {"in:*"}),
                         MakeUnit([](MeshView& view) { return view.Get("in:value").has_value(); },
                                  [](MeshHandle& handle) {
                                      auto value = handle.GetValue("in:value");
                                      handle.Put("out:value", value.value_or("") + "!");
                                  }));
    Ingest("in:value", "hello");

    CycleReport report = Cycle();
    EXPECT_EQ(report.matched, 1u);
    EXPECT_EQ(report.admitted, 1u);
    ASSERT_TRUE(store_.Get("out:value").has_value());
    EXPECT_EQ(store_.Get("out:value")->value, "hello!");
    EXPECT_EQ(store_.GetEntry("out:value")->last_written_by, id);

    auto records = Executions(id);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, Outcome::kSuccess);
    EXPECT_EQ(records[0].keys_changed, std::vector<std::string>{"out:value"});
    EXPECT_EQ(records[0].after.at("out:value"), "hello!");
    EXPECT_EQ(records[0].snapshot_id, report.snapshot_id);
}

TEST_F(SchedulerTest, UntouchedUnitsAreNotEvaluated) {
    std::atomic<int> evaluations{0};
    Register(Describe("watcher", {"watched:key"}),
             MakeUnit([&evaluations](MeshView&) { evaluations++; return false; },
                      [](MeshHandle&) {}));
    Cycle();
    EXPECT_EQ(evaluations.load(), 1);

    Ingest("other:key", "1");
    CycleReport report = Cycle();
    EXPECT_EQ(report.candidates, 0u);
    EXPECT_EQ(evaluations.load(), 1);

    Ingest("watched:key", "1");
    report = Cycle();
    EXPECT_EQ(report.candidates, 1u);
    EXPECT_EQ(evaluations.load(), 2);
}

TEST_F(SchedulerTest, CooldownPostponesRefire) {
    std::atomic<int> runs{0};
    UnitDescriptor descriptor = Describe("slowpoke", {"tick:*"});
    descriptor.cooldown = std::chrono::hours(1);
    UnitId id = Register(descriptor,
                         MakeUnit([](MeshView& view) { return view.Get("tick:n").has_value(); },
                                  [&runs](MeshHandle&) { runs++; }));
    Ingest("tick:n", "1");
    Cycle();
    EXPECT_EQ(runs.load(), 1);

    Ingest("tick:n", "2");
    CycleReport report = Cycle();
    EXPECT_EQ(report.candidates, 0u);
    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(registry_.Status(id)->stats.executions, 1u);
}

TEST_F(SchedulerTest, AbortLowerIsSuppressedWhileGroupHeld) {
    auto fires = [](MeshView& view) { return view.Get("job:go").has_value(); };
    UnitDescriptor holder = Describe("holder", {"job:*"}, 10);
    holder.mutex_group = "printer";
    UnitDescriptor polite = Describe("polite", {"job:*"}, 1);
    polite.mutex_group = "printer";
    polite.policy = ExecutionPolicy::kAbortLower;

    UnitId holder_id = Register(holder, MakeUnit(fires, [](MeshHandle&) {}));
    UnitId polite_id = Register(polite, MakeUnit(fires, [](MeshHandle&) {}));
    Ingest("job:go", "1");

    CycleReport report = scheduler_.RunCycle();
    EXPECT_EQ(report.admitted, 1u);
    EXPECT_EQ(report.suppressed, 1u);
    ASSERT_TRUE(scheduler_.WaitForIdle(5000ms));

    auto records = Executions(polite_id);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, Outcome::kSuppressed);
    EXPECT_EQ(registry_.Status(polite_id)->stats.suppressions, 1u);
    EXPECT_EQ(Executions(holder_id).size(), 1u);
}

TEST_F(SchedulerTest, QueuedUnitRunsAfterHolderReleases) {
    auto fires = [](MeshView& view) { return view.Get("job:go").has_value(); };
    UnitDescriptor first = Describe("first", {"job:*"}, 10);
    first.mutex_group = "printer";
    UnitDescriptor second = Describe("second", {"job:*"}, 1);
    second.mutex_group = "printer";

    std::atomic<int> second_runs{0};
    Register(first, MakeUnit(fires, [](MeshHandle&) {}));
    UnitId second_id = Register(second, MakeUnit(fires, [&second_runs](MeshHandle&) { second_runs++; }));
    Ingest("job:go", "1");

    CycleReport report = Cycle();
    EXPECT_EQ(report.queued, 1u);
    EXPECT_EQ(second_runs.load(), 0);
    EXPECT_EQ(arbiter_.QueueDepth("printer"), 1u);

    report = Cycle();
    EXPECT_EQ(report.dequeued, 1u);
    EXPECT_EQ(second_runs.load(), 1);
    EXPECT_EQ(Executions(second_id).back().outcome, Outcome::kSuccess);
}

TEST_F(SchedulerTest, InterruptCancelsHolderAndRunsNext) {
    std::atomic<int> holder_runs{0};
    std::atomic<bool> interrupter_ran{false};

    UnitDescriptor holder = Describe("long-job", {"job:start"}, 1);
    holder.mutex_group = "gpu";
    UnitDescriptor urgent = Describe("urgent", {"job:urgent"}, 5);
    urgent.mutex_group = "gpu";
    urgent.policy = ExecutionPolicy::kInterrupt;

    UnitId holder_id = Register(holder, MakeUnit(
        [&holder_runs](MeshView& view) { return holder_runs.load() == 0 && view.Get("job:start").has_value(); },
        [&holder_runs](MeshHandle& handle) {
            holder_runs++;
            while (!handle.ShouldStop()) {
                std::this_thread::sleep_for(1ms);
            }
            handle.Put("job:partial", "discarded");
        }));
    UnitId urgent_id = Register(urgent, MakeUnit(
        [](MeshView& view) { return view.Get("job:urgent").has_value(); },
        [&interrupter_ran](MeshHandle&) { interrupter_ran = true; }));

    Ingest("job:start", "1");
    scheduler_.RunCycle();
    while (holder_runs.load() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    Ingest("job:urgent", "1");
    CycleReport report = scheduler_.RunCycle();
    EXPECT_EQ(report.interrupts, 1u);
    ASSERT_TRUE(scheduler_.WaitForIdle(5000ms));
    EXPECT_FALSE(interrupter_ran.load());

    Cycle();
    EXPECT_TRUE(interrupter_ran.load());

    auto holder_records = Executions(holder_id);
    ASSERT_FALSE(holder_records.empty());
    EXPECT_EQ(holder_records.front().outcome, Outcome::kFailed);
    EXPECT_EQ(holder_records.front().error, MeshError::kCancelled);
    EXPECT_FALSE(store_.Get("job:partial").has_value());
    EXPECT_EQ(Executions(urgent_id).back().outcome, Outcome::kSuccess);
}

TEST_F(SchedulerTest, TriggerFaultIsContained) {
    UnitId bad = Register(Describe("bad", {"k:*"}),
                          MakeUnit([](MeshView&) -> bool { throw std::runtime_error("boom"); },
                                   [](MeshHandle&) {}));
    std::atomic<int> good_runs{0};
    Register(Describe("good", {"k:*"}),
             MakeUnit([](MeshView&) { return true; }, [&good_runs](MeshHandle&) { good_runs++; }));
    Ingest("k:1", "v");

    CycleReport report = Cycle();
    EXPECT_EQ(report.matched, 1u);
    EXPECT_EQ(good_runs.load(), 1);

    ASSERT_TRUE(trace_.Flush());
    TraceFilter filter;
    filter.unit_id = bad;
    auto records = trace_.Query(filter);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].kind, RecordKind::kEvaluation);
    EXPECT_EQ(records[0].error, MeshError::kUnitFault);
    EXPECT_EQ(records[0].detail, "boom");
    EXPECT_EQ(registry_.Status(bad)->stats.failures, 1u);
}

TEST_F(SchedulerTest, NonStandardExceptionsAreContained) {
    UnitId odd_trigger = Register(Describe("odd-trigger", {"k:*"}),
                                  MakeUnit([](MeshView&) -> bool { throw std::string("raw"); },
                                           [](MeshHandle&) {}));
    UnitId odd_action = Register(Describe("odd-action", {"k:*"}),
                                 MakeUnit([](MeshView&) { return true; },
                                          [](MeshHandle& handle) {
                                              handle.Put("k:out", "never");
                                              throw 42;
                                          }));
    std::atomic<int> good_runs{0};
    Register(Describe("good", {"k:*"}),
             MakeUnit([](MeshView&) { return true; }, [&good_runs](MeshHandle&) { good_runs++; }));
    Ingest("k:1", "v");

    CycleReport report = Cycle();
    EXPECT_EQ(report.matched, 2u);
    EXPECT_EQ(good_runs.load(), 1);
    EXPECT_FALSE(store_.Get("k:out").has_value());

    ASSERT_TRUE(trace_.Flush());
    TraceFilter filter;
    filter.unit_id = odd_trigger;
    auto records = trace_.Query(filter);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].error, MeshError::kUnitFault);
    EXPECT_EQ(records[0].detail, "non-standard exception");

    records = Executions(odd_action);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, Outcome::kFailed);
    EXPECT_EQ(records[0].error, MeshError::kUnitFault);
    EXPECT_EQ(records[0].detail, "non-standard exception");
    EXPECT_EQ(registry_.Status(odd_action)->stats.failures, 1u);
}

TEST_F(SchedulerTest, QueuedUnitWhoseTriggerThrowsLeavesQueue) {
    UnitDescriptor holder = Describe("holder", {"job:*"}, 10);
    holder.mutex_group = "printer";
    UnitDescriptor waiter = Describe("waiter", {"job:*"}, 1);
    waiter.mutex_group = "printer";

    std::atomic<int> evaluations{0};
    Register(holder, MakeUnit([](MeshView&) { return true; }, [](MeshHandle&) {}));
    UnitId waiter_id = Register(waiter, MakeUnit(
        [&evaluations](MeshView&) -> bool {
            if (evaluations++ > 0) throw 'x';
            return true;
        },
        [](MeshHandle&) {}));
    Ingest("job:go", "1");

    CycleReport report = Cycle();
    EXPECT_EQ(report.queued, 1u);

    report = Cycle();
    EXPECT_EQ(report.candidates, 0u);
    EXPECT_EQ(report.dequeued, 0u);
    EXPECT_EQ(evaluations.load(), 2);
    EXPECT_FALSE(arbiter_.IsQueued(waiter_id));

    ASSERT_TRUE(trace_.Flush());
    TraceFilter filter;
    filter.unit_id = waiter_id;
    filter.outcome = Outcome::kFailed;
    auto records = trace_.Query(filter);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].error, MeshError::kUnitFault);
}

TEST_F(SchedulerTest, UnitDeletesKeyThroughItsBatch) {
    Ingest("cache:stale", "old");
    UnitId id = Register(Describe("evictor", {"cache:*"}),
                         MakeUnit([](MeshView& view) { return view.Get("cache:stale").has_value(); },
                                  [](MeshHandle& handle) { handle.Delete("cache:stale"); }));

    Cycle();
    EXPECT_FALSE(store_.Get("cache:stale").has_value());

    auto records = Executions(id);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].outcome, Outcome::kSuccess);
    EXPECT_EQ(records[0].keys_changed, std::vector<std::string>{"cache:stale"});
    EXPECT_EQ(records[0].before.at("cache:stale"), "old");
    EXPECT_TRUE(records[0].after.empty());

    // The deletion is a change: the unit is evaluated again and stays quiet.
    CycleReport report = Cycle();
    EXPECT_EQ(report.candidates, 1u);
    EXPECT_EQ(report.matched, 0u);
}

TEST_F(SchedulerTest, CancelAllStopsRunningUnits) {
    std::atomic<bool> started{false};
    UnitId id = Register(Describe("spinner", {"spin:*"}),
                         MakeUnit([](MeshView&) { return true; },
                                  [&started](MeshHandle& handle) {
                                      started = true;
                                      while (!handle.ShouldStop()) {
                                          std::this_thread::sleep_for(1ms);
                                      }
                                  }));
    Ingest("spin:1", "go");
    scheduler_.RunCycle();
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_EQ(scheduler_.CancelAll(MeshError::kCancelled), 1u);
    ASSERT_TRUE(scheduler_.WaitForIdle(1000ms));
    auto records = Executions(id);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].error, MeshError::kCancelled);
}

TEST_F(SchedulerTest, ActionFaultDiscardsWrites) {
    UnitId id = Register(Describe("thrower", {"k:*"}),
                         MakeUnit([](MeshView&) { return true; },
                                  [](MeshHandle& handle) {
                                      handle.Put("k:out", "half");
                                      throw std::runtime_error("midway");
                                  }));
    Ingest("k:in", "v");
    Cycle();
    EXPECT_FALSE(store_.Get("k:out").has_value());
    auto records = Executions(id);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].error, MeshError::kUnitFault);
    EXPECT_EQ(records[0].detail, "midway");
}

TEST_F(SchedulerTest, DeniedWriteFailsWholeAction) {
    NamespaceRule locked;
    locked.prefix = "locked";
    locked.readers = {"*"};
    locked.writers = {"owner"};
    ASSERT_EQ(acl_.AddNamespace(locked), MeshError::kOk);

    UnitId id = Register(Describe("intruder", {"free:*"}),
                         MakeUnit([](MeshView&) { return true; },
                                  [](MeshHandle& handle) {
                                      handle.Put("free:ok", "1");
                                      handle.Put("locked:x", "1");
                                  }));
    Ingest("free:trigger", "v");
    Cycle();

    EXPECT_FALSE(store_.Get("free:ok").has_value());
    EXPECT_FALSE(store_.Get("locked:x").has_value());
    auto records = Executions(id);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].error, MeshError::kAccessDenied);

    TraceFilter security;
    security.kind = RecordKind::kSecurity;
    auto denials = trace_.Query(security);
    ASSERT_EQ(denials.size(), 1u);
    EXPECT_EQ(denials[0].detail, "write locked:x");
    EXPECT_EQ(registry_.Status(id)->stats.access_denials, 1u);
}

TEST_F(SchedulerTest, DeregisterCancelsRunningExecution) {
    std::atomic<bool> started{false};
    UnitId id = Register(Describe("spinner", {"s:*"}),
                         MakeUnit([](MeshView&) { return true; },
                                  [&started](MeshHandle& handle) {
                                      started = true;
                                      while (!handle.ShouldStop()) {
                                          std::this_thread::sleep_for(1ms);
                                      }
                                      handle.Put("s:out", "late");
                                  }));
    Ingest("s:in", "v");
    scheduler_.RunCycle();
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }

    ASSERT_EQ(registry_.Deregister(id), MeshError::kOk);
    scheduler_.OnDeregister(id);
    ASSERT_TRUE(scheduler_.WaitForIdle(5000ms));

    EXPECT_FALSE(store_.Get("s:out").has_value());
    auto records = Executions(id);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].error, MeshError::kCancelled);

    // Nothing of the unit survives into later cycles.
    Ingest("s:in", "w");
    CycleReport report = Cycle();
    EXPECT_EQ(report.candidates, 0u);
}

TEST_F(SchedulerTest, RepeatedTimeoutsQuarantineUnit) {
    UnitDescriptor descriptor = Describe("sleeper", {"t:*"});
    descriptor.deadline = 20ms;
    std::atomic<int> runs{0};
    UnitId id = Register(descriptor,
                         MakeUnit([](MeshView&) { return true; },
                                  [&runs](MeshHandle&) {
                                      runs++;
                                      std::this_thread::sleep_for(40ms);
                                  }));
    Ingest("t:1", "v");
    for (int i = 0; i < 3; ++i) {
        Cycle();
    }
    EXPECT_EQ(runs.load(), 3);
    EXPECT_FALSE(registry_.IsEnabled(id));
    auto status = registry_.Status(id);
    EXPECT_EQ(status->stats.timeouts, 3u);
    EXPECT_EQ(status->stats.quarantines, 1u);
    EXPECT_EQ(Executions(id).back().outcome, Outcome::kQuarantined);

    Cycle();
    EXPECT_EQ(runs.load(), 3);
}
