#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <set>
#include <vector>

#include "simulations/Scheduler.hpp"

namespace
{

using Simulations::ArrivalPolicy;
using Simulations::Scheduler;
using Simulations::SchedulerConfig;
using Simulations::Workload;

auto make_workload(std::vector<Os::ProcessDescriptor> processes, const SchedulerConfig& config = {}) -> Workload
{
    return Workload { .config = config, .processes = std::move(processes) };
}

auto make_scheduler(const Workload& workload) -> Scheduler
{
    auto scheduler = Scheduler::create(workload);
    EXPECT_TRUE(scheduler.has_value());
    return std::move(scheduler).value();
}

auto queued_vruntime(const Scheduler& scheduler, const std::size_t pid) -> std::optional<Os::VirtualRuntime>
{
    for (const auto& process : scheduler.run_queue().processes()) {
        if (process->pid == pid) { return process->vruntime; }
    }
    return std::nullopt;
}

// Checks that every pid starts a turn inside each window [start, start + length) that closes by `horizon`.
auto every_window_serves_all(
  const std::vector<Simulations::SchedulingEvent>& events,
  const Os::Tick                                   length,
  const Os::Tick                                   horizon,
  const std::set<std::size_t>&                     pids
) -> testing::AssertionResult
{
    for (const auto& window : events) {
        const auto window_end = window.start_time + length;
        if (window_end > horizon) { break; }

        std::set<std::size_t> served;
        for (const auto& event : events) {
            if (event.start_time >= window.start_time && event.start_time < window_end) { served.insert(event.pid); }
        }

        if (served != pids) {
            return testing::AssertionFailure() << "window [" << window.start_time << ", " << window_end
                                               << ") served " << served.size() << " of " << pids.size() << " pids";
        }
    }

    return testing::AssertionSuccess();
}

auto average_slice_of(const Scheduler& scheduler, const std::size_t pid) -> double
{
    Os::Tick    granted = 0;
    std::size_t turns   = 0;
    for (const auto& event : scheduler.event_log().events()) {
        if (event.pid != pid) { continue; }
        granted += event.granted();
        ++turns;
    }

    EXPECT_GT(turns, 0U) << "pid " << pid;
    return turns > 0 ? static_cast<double>(granted) / static_cast<double>(turns) : 0.0;
}

auto vruntime_spread(const Scheduler& scheduler) -> Os::VirtualRuntime
{
    const auto minimum = scheduler.run_queue().min_vruntime();
    if (!minimum) { return 0; }

    Os::VirtualRuntime maximum = *minimum;
    for (const auto& process : scheduler.run_queue().processes()) { maximum = std::max(maximum, process->vruntime); }
    return maximum - *minimum;
}

const auto MIXED_WORKLOAD = std::vector<Os::ProcessDescriptor> {
    { .name = "editor", .pid = 1, .nice = -5, .burst = 30 },
    { .name = "compiler", .pid = 2, .nice = 0, .burst = 60 },
    { .name = "shell", .pid = 3, .nice = 0, .burst = 12, .arrival = 4 },
    { .name = "backup", .pid = 4, .nice = 10, .burst = 80, .arrival = 15 },
    { .name = "late", .pid = 5, .nice = 3, .burst = 9, .arrival = 500 },
};

TEST(SchedulerTest, ThreeEqualProcessesAlternate)
{
    const auto workload = make_workload(
      {
        { .name = "A", .pid = 1, .burst = 10 },
        { .name = "B", .pid = 2, .burst = 10 },
        { .name = "C", .pid = 3, .burst = 10 },
      },
      { .target_latency = 6, .min_granularity = 1 }
    );

    auto scheduler = make_scheduler(workload);
    scheduler.run_to_completion();

    const auto& events = scheduler.event_log().events();
    ASSERT_EQ(events.size(), 15U);
    for (std::size_t idx = 0; idx < events.size(); ++idx) {
        EXPECT_EQ(events[idx].granted(), 2U) << "event " << idx;
        EXPECT_EQ(events[idx].pid, (idx % 3) + 1) << "event " << idx;
    }

    EXPECT_EQ(scheduler.timer(), 30U);
    EXPECT_EQ(scheduler.idle_time(), 0U);
    EXPECT_EQ(scheduler.state(), Simulations::SchedulerState::Finished);
}

TEST(SchedulerTest, SingleProcessRunsInOneEvent)
{
    auto scheduler = make_scheduler(make_workload({ { .name = "solo", .pid = 1, .burst = 5 } }));

    scheduler.step();

    ASSERT_EQ(scheduler.event_log().size(), 1U);
    const auto event = scheduler.event_log().events().front();
    EXPECT_EQ(event.start_time, 0U);
    EXPECT_EQ(event.end_time, 5U);
    EXPECT_EQ(event.vruntime_after, 5 * Os::VRUNTIME_SCALE);
    EXPECT_TRUE(scheduler.complete());
    EXPECT_EQ(scheduler.state(), Simulations::SchedulerState::Finished);
}

TEST(SchedulerTest, LateArrivalStartsAtMinimumVruntime)
{
    const auto workload = make_workload(
      {
        { .name = "A", .pid = 1, .burst = 100 },
        { .name = "B", .pid = 2, .burst = 20, .arrival = 15 },
      },
      { .target_latency = 5, .min_granularity = 1 }
    );

    auto scheduler = make_scheduler(workload);
    scheduler.run_until([](const Scheduler& sim) { return sim.timer() >= 15; });

    EXPECT_EQ(scheduler.timer(), 15U);
    EXPECT_EQ(scheduler.decisions(), 3U);
    EXPECT_EQ(queued_vruntime(scheduler, 1), 15 * Os::VRUNTIME_SCALE);
    EXPECT_EQ(queued_vruntime(scheduler, 2), 15 * Os::VRUNTIME_SCALE);

    // Tie on vruntime goes to the lower pid, and the slice is now halved.
    scheduler.step();
    const auto last = scheduler.event_log().back();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->pid, 1U);
    EXPECT_EQ(last->granted(), 2U);
}

TEST(SchedulerTest, ZeroArrivalPolicyLetsNewcomerCatchUp)
{
    const auto workload = make_workload(
      {
        { .name = "A", .pid = 1, .burst = 100 },
        { .name = "B", .pid = 2, .burst = 20, .arrival = 15 },
      },
      { .target_latency = 5, .min_granularity = 1, .arrival_policy = ArrivalPolicy::Zero }
    );

    auto scheduler = make_scheduler(workload);
    scheduler.run_until([](const Scheduler& sim) { return sim.timer() >= 15; });
    EXPECT_EQ(queued_vruntime(scheduler, 2), 0U);

    scheduler.step();
    EXPECT_EQ(scheduler.current()->pid, 2U);

    // B runs back to back in 2 tick slices until its vruntime passes A's.
    scheduler.run_until([](const Scheduler& sim) { return sim.current()->pid == 1; });
    EXPECT_EQ(scheduler.decisions(), 12U);
    EXPECT_EQ(scheduler.timer(), 33U);
    EXPECT_EQ(queued_vruntime(scheduler, 2), 16 * Os::VRUNTIME_SCALE);
}

TEST(SchedulerTest, TimesliceFollowsWeight)
{
    const auto workload = make_workload(
      {
        { .name = "heavy", .pid = 1, .nice = -5, .burst = 100 },
        { .name = "light", .pid = 2, .nice = 5, .burst = 100 },
      },
      { .target_latency = 20, .min_granularity = 1 }
    );

    auto scheduler = make_scheduler(workload);
    scheduler.step();
    scheduler.step();

    const auto& events = scheduler.event_log().events();
    ASSERT_EQ(events.size(), 2U);
    EXPECT_EQ(events[0].pid, 1U);
    EXPECT_EQ(events[0].granted(), 18U);
    EXPECT_EQ(events[1].pid, 2U);
    EXPECT_EQ(events[1].granted(), 1U);
}

TEST(SchedulerTest, MinGranularityBoundsTheSlice)
{
    const auto workload = make_workload(
      {
        { .name = "A", .pid = 1, .burst = 9 },
        { .name = "B", .pid = 2, .burst = 9 },
        { .name = "C", .pid = 3, .burst = 9 },
        { .name = "D", .pid = 4, .burst = 9 },
      },
      { .target_latency = 4, .min_granularity = 3 }
    );

    auto scheduler = make_scheduler(workload);
    scheduler.run_to_completion();

    for (const auto& event : scheduler.event_log().events()) { EXPECT_EQ(event.granted(), 3U); }
    EXPECT_EQ(scheduler.timer(), 36U);
}

TEST(SchedulerTest, LowerNiceFinishesFirst)
{
    const auto workload = make_workload({
      { .name = "light", .pid = 1, .nice = 5, .burst = 50 },
      { .name = "heavy", .pid = 2, .nice = -5, .burst = 50 },
    });

    auto scheduler = make_scheduler(workload);
    scheduler.run_to_completion();

    ASSERT_EQ(scheduler.finished().size(), 2U);
    EXPECT_EQ(scheduler.finished().front()->pid, 2U);
    EXPECT_LT(*scheduler.finished()[0]->turnaround_time(), *scheduler.finished()[1]->turnaround_time());
}

TEST(SchedulerTest, FavorableNiceGetsLongerSlices)
{
    const auto workload = make_workload(
      {
        { .name = "editor", .pid = 1, .nice = -5, .burst = 80 },
        { .name = "compiler", .pid = 2, .nice = 0, .burst = 80 },
        { .name = "linker", .pid = 3, .nice = 0, .burst = 80 },
        { .name = "indexer", .pid = 4, .nice = 3, .burst = 80 },
      },
      { .target_latency = 20, .min_granularity = 1 }
    );

    auto scheduler = make_scheduler(workload);
    scheduler.run_to_completion();

    EXPECT_DOUBLE_EQ(average_slice_of(scheduler, 1), 10.0);
    EXPECT_DOUBLE_EQ(average_slice_of(scheduler, 2), 5.0);
    EXPECT_DOUBLE_EQ(average_slice_of(scheduler, 3), 5.0);
    EXPECT_GE(average_slice_of(scheduler, 2), average_slice_of(scheduler, 4));
    EXPECT_LT(average_slice_of(scheduler, 4), 5.0);
}

TEST(SchedulerTest, EqualWeightsAreServedWithinOneLatencyPeriod)
{
    const auto workload = make_workload(
      {
        { .name = "A", .pid = 1, .burst = 40 },
        { .name = "B", .pid = 2, .burst = 40 },
        { .name = "C", .pid = 3, .burst = 40 },
        { .name = "D", .pid = 4, .burst = 40 },
      },
      { .target_latency = 8, .min_granularity = 1 }
    );

    auto scheduler = make_scheduler(workload);
    scheduler.run_to_completion();

    // The runnable set only stays fixed until the first process finishes.
    ASSERT_FALSE(scheduler.finished().empty());
    const auto horizon = scheduler.finished().front()->finish_time.value();
    EXPECT_EQ(horizon, 154U);
    EXPECT_TRUE(every_window_serves_all(scheduler.event_log().events(), 8, horizon, { 1, 2, 3, 4 }));
}

TEST(SchedulerTest, ModerateWeightMixIsServedWithinOneLatencyPeriod)
{
    const auto workload = make_workload(
      {
        { .name = "editor", .pid = 1, .nice = -5, .burst = 80 },
        { .name = "compiler", .pid = 2, .nice = 0, .burst = 80 },
        { .name = "linker", .pid = 3, .nice = 0, .burst = 80 },
        { .name = "indexer", .pid = 4, .nice = 3, .burst = 80 },
      },
      { .target_latency = 20, .min_granularity = 1 }
    );

    auto scheduler = make_scheduler(workload);
    scheduler.run_to_completion();

    ASSERT_FALSE(scheduler.finished().empty());
    EXPECT_EQ(scheduler.finished().front()->pid, 1U);
    const auto horizon = scheduler.finished().front()->finish_time.value();
    EXPECT_EQ(horizon, 140U);
    EXPECT_TRUE(every_window_serves_all(scheduler.event_log().events(), 20, horizon, { 1, 2, 3, 4 }));
}

TEST(SchedulerTest, ExtremeWeightSpreadOutlastsTheLatencyPeriod)
{
    const auto workload = make_workload(
      {
        { .name = "realtime", .pid = 1, .nice = -20, .burst = 200 },
        { .name = "batch", .pid = 2, .nice = 19, .burst = 200 },
      },
      { .target_latency = 20, .min_granularity = 1 }
    );

    auto scheduler = make_scheduler(workload);
    scheduler.run_until([](const Scheduler& sim) { return sim.finished().size() == 1; });

    // The light slice is floored to min_granularity, which charges it far more than its fair share.
    EXPECT_FALSE(every_window_serves_all(
      scheduler.event_log().events(), 20, scheduler.finished().front()->finish_time.value(), { 1, 2 }
    ));
}

TEST(SchedulerTest, ConservesWorkAndKeepsTheClockMonotonic)
{
    auto scheduler = make_scheduler(make_workload(MIXED_WORKLOAD));
    scheduler.run_to_completion();

    const auto total_burst = std::accumulate(
      MIXED_WORKLOAD.begin(), MIXED_WORKLOAD.end(), Os::Tick { 0 }, [](const auto acc, const auto& process) {
          return acc + process.burst;
      }
    );

    EXPECT_EQ(scheduler.event_log().total_granted(), total_burst);
    EXPECT_EQ(scheduler.timer(), total_burst + scheduler.idle_time());
    EXPECT_GT(scheduler.idle_time(), 0U);

    const auto& events = scheduler.event_log().events();
    for (std::size_t idx = 1; idx < events.size(); ++idx) {
        EXPECT_LE(events[idx - 1].end_time, events[idx].start_time);
        EXPECT_GT(events[idx].end_time, events[idx].start_time);
    }

    for (const auto& process : scheduler.finished()) {
        EXPECT_EQ(process->remaining_burst, 0U);
        EXPECT_GE(*process->finish_time, process->arrival + process->burst);
    }
}

TEST(SchedulerTest, EveryStepEmitsExactlyOneEvent)
{
    auto scheduler = make_scheduler(make_workload(MIXED_WORKLOAD));

    while (!scheduler.complete()) {
        const auto before = scheduler.event_log().size();
        scheduler.step();
        EXPECT_EQ(scheduler.event_log().size(), before + 1);
        EXPECT_EQ(scheduler.decisions(), scheduler.event_log().size());
    }

    const auto after = scheduler.event_log().size();
    scheduler.step();
    EXPECT_EQ(scheduler.event_log().size(), after);
}

TEST(SchedulerTest, VruntimeSpreadIsBoundedBySingleSlice)
{
    auto scheduler = make_scheduler(make_workload(MIXED_WORKLOAD));

    Os::VirtualRuntime largest_delta = 0;
    while (!scheduler.complete()) {
        scheduler.step();
        const auto event = *scheduler.event_log().back();
        largest_delta    = std::max(largest_delta, event.vruntime_after - event.vruntime_before);
        EXPECT_LE(vruntime_spread(scheduler), largest_delta) << "at tick " << scheduler.timer();
    }
}

TEST(SchedulerTest, VruntimeOnlyGrowsWhileRunning)
{
    auto scheduler = make_scheduler(make_workload(MIXED_WORKLOAD));
    scheduler.run_to_completion();

    for (const auto& event : scheduler.event_log().events()) { EXPECT_GT(event.vruntime_after, event.vruntime_before); }
}

TEST(SchedulerTest, IdleJumpToNextArrival)
{
    auto scheduler = make_scheduler(make_workload({ { .name = "late", .pid = 7, .burst = 5, .arrival = 10 } }));
    EXPECT_EQ(scheduler.state(), Simulations::SchedulerState::Idle);

    scheduler.step();

    const auto event = scheduler.event_log().back();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->start_time, 10U);
    EXPECT_EQ(event->end_time, 15U);
    EXPECT_EQ(scheduler.idle_time(), 10U);
    EXPECT_TRUE(scheduler.complete());
}

TEST(SchedulerTest, DeterministicTrace)
{
    auto first  = make_scheduler(make_workload(MIXED_WORKLOAD));
    auto second = make_scheduler(make_workload(MIXED_WORKLOAD));
    first.run_to_completion();
    second.run_to_completion();

    EXPECT_EQ(first.event_log().events(), second.event_log().events());
}

TEST(SchedulerTest, RejectsInvalidWorkloads)
{
    const auto valid = Os::ProcessDescriptor { .name = "ok", .pid = 1, .burst = 3 };

    EXPECT_FALSE(Scheduler::create(make_workload({ valid }, { .target_latency = 0 })).has_value());
    EXPECT_FALSE(Scheduler::create(make_workload({ valid }, { .min_granularity = 0 })).has_value());
    EXPECT_FALSE(Scheduler::create(make_workload({ valid }, { .target_latency = SchedulerConfig::MAX_SLICE_TICKS + 1 }))
                   .has_value());
    EXPECT_FALSE(
      Scheduler::create(make_workload({ valid }, { .min_granularity = SchedulerConfig::MAX_SLICE_TICKS + 1 }))
        .has_value()
    );
    EXPECT_TRUE(Scheduler::create(make_workload({ valid }, { .target_latency = SchedulerConfig::MAX_SLICE_TICKS }))
                  .has_value());
    EXPECT_FALSE(Scheduler::create(make_workload({ valid, valid })).has_value());
    EXPECT_FALSE(Scheduler::create(make_workload({ { .name = "bad", .pid = 2, .nice = -21, .burst = 3 } }))
                   .has_value());
    EXPECT_FALSE(Scheduler::create(make_workload({ { .name = "empty", .pid = 3, .burst = 0 } })).has_value());

    auto empty = Scheduler::create(make_workload({}));
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->complete());
}

TEST(SchedulerTest, EmplaceDuringRun)
{
    auto scheduler = make_scheduler(make_workload({ { .name = "A", .pid = 1, .burst = 40 } }));
    scheduler.step();
    ASSERT_EQ(scheduler.timer(), 20U);

    EXPECT_FALSE(scheduler.emplace_process({ .name = "past", .pid = 2, .burst = 5, .arrival = 10 }));
    EXPECT_FALSE(scheduler.emplace_process({ .name = "dup", .pid = 1, .burst = 5, .arrival = 30 }));
    ASSERT_TRUE(scheduler.emplace_process({ .name = "B", .pid = 2, .burst = 5, .arrival = 20 }));

    scheduler.step();
    EXPECT_EQ(scheduler.event_log().back()->pid, 1U);
    EXPECT_EQ(scheduler.event_log().back()->granted(), 10U);

    scheduler.run_to_completion();
    EXPECT_EQ(scheduler.timer(), 45U);
    EXPECT_EQ(scheduler.descriptors().size(), 2U);
}

TEST(SchedulerTest, RunUntilStopsOnPredicate)
{
    auto scheduler = make_scheduler(make_workload(MIXED_WORKLOAD));
    scheduler.run_until([](const Scheduler& sim) { return sim.decisions() >= 4; });

    EXPECT_EQ(scheduler.decisions(), 4U);
    EXPECT_FALSE(scheduler.complete());
}

TEST(SchedulerTest, RestartReplaysTheSameTrace)
{
    auto scheduler = make_scheduler(make_workload(MIXED_WORKLOAD));
    scheduler.run_to_completion();
    const auto trace = scheduler.event_log().events();

    scheduler.restart();
    EXPECT_EQ(scheduler.timer(), 0U);
    EXPECT_EQ(scheduler.decisions(), 0U);
    EXPECT_TRUE(scheduler.event_log().empty());
    EXPECT_TRUE(scheduler.finished().empty());
    EXPECT_EQ(scheduler.current(), nullptr);

    scheduler.run_to_completion();
    EXPECT_EQ(scheduler.event_log().events(), trace);
}

TEST(SchedulerTest, ReconfigureValidatesAndRestarts)
{
    auto scheduler = make_scheduler(make_workload(MIXED_WORKLOAD));
    scheduler.run_until([](const Scheduler& sim) { return sim.decisions() >= 3; });

    EXPECT_FALSE(scheduler.reconfigure({ .target_latency = 0 }));
    EXPECT_EQ(scheduler.configuration().target_latency, 20U);
    EXPECT_EQ(scheduler.decisions(), 3U);

    ASSERT_TRUE(scheduler.reconfigure({ .target_latency = 8, .min_granularity = 2 }));
    EXPECT_EQ(scheduler.configuration().target_latency, 8U);
    EXPECT_EQ(scheduler.decisions(), 0U);
    EXPECT_EQ(scheduler.timer(), 0U);
}

TEST(SchedulerTest, DrainHandsOverEventsIncrementally)
{
    auto                                      scheduler = make_scheduler(make_workload(MIXED_WORKLOAD));
    std::vector<Simulations::SchedulingEvent> collected;

    while (!scheduler.complete()) {
        scheduler.step();
        for (const auto& event : scheduler.event_log().drain()) { collected.push_back(event); }
    }

    auto reference = make_scheduler(make_workload(MIXED_WORKLOAD));
    reference.run_to_completion();
    EXPECT_EQ(collected, reference.event_log().events());
}

TEST(SchedulerTest, ReportMatchesFinishedProcesses)
{
    auto scheduler = make_scheduler(make_workload(
      {
        { .name = "A", .pid = 1, .burst = 10 },
        { .name = "B", .pid = 2, .burst = 10 },
        { .name = "C", .pid = 3, .burst = 10 },
      },
      { .target_latency = 6, .min_granularity = 1 }
    ));
    scheduler.run_to_completion();

    // Finish times 26, 28 and 30.
    const auto report = scheduler.report();
    EXPECT_EQ(report.name, "Completely Fair");
    ASSERT_EQ(report.outcomes.size(), 3U);
    EXPECT_DOUBLE_EQ(report.average_waiting_time(), 18.0);
    EXPECT_DOUBLE_EQ(report.average_turnaround_time(), 28.0);
    EXPECT_DOUBLE_EQ(report.cpu_utilization(), 1.0);
    EXPECT_DOUBLE_EQ(report.throughput(), 0.1);
}

TEST(SchedulerTest, RunReturnsTheTrace)
{
    const auto processes = std::vector<Os::ProcessDescriptor> {
        { .name = "A", .pid = 1, .burst = 4 },
        { .name = "B", .pid = 2, .burst = 4 },
    };

    const auto trace = Simulations::run(processes, 4, 1);
    ASSERT_TRUE(trace.has_value());
    ASSERT_EQ(trace->size(), 4U);
    EXPECT_EQ(trace->back().end_time, 8U);

    EXPECT_FALSE(Simulations::run(processes, 0, 1).has_value());
}

TEST(SchedulerTest, ArrivalPolicyFromString)
{
    EXPECT_EQ(Simulations::arrival_policy_try_from_str("min_vruntime"), ArrivalPolicy::MinVruntime);
    EXPECT_EQ(Simulations::arrival_policy_try_from_str("ZERO"), ArrivalPolicy::Zero);
    EXPECT_FALSE(Simulations::arrival_policy_try_from_str("fifo").has_value());
    EXPECT_EQ(std::format("{}", ArrivalPolicy::Zero), "zero");
}

} // namespace
