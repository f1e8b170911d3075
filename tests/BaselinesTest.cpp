#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "simulations/Baselines.hpp"

namespace
{

using Simulations::BaselinePolicy;

auto waiting_time_of(const Simulations::PolicyReport& report, const std::size_t pid) -> Os::Tick
{
    const auto outcome =
      std::ranges::find_if(report.outcomes, [pid](const auto& candidate) { return candidate.pid == pid; });
    EXPECT_NE(outcome, report.outcomes.end()) << "pid " << pid;
    return outcome != report.outcomes.end() ? outcome->waiting_time : 0;
}

const auto CONVOY = std::vector<Os::ProcessDescriptor> {
    { .name = "P1", .pid = 1, .burst = 24 },
    { .name = "P2", .pid = 2, .burst = 3 },
    { .name = "P3", .pid = 3, .burst = 3 },
};

TEST(BaselinesTest, FirstComeFirstServedConvoy)
{
    const auto report = Simulations::simulate_baseline(BaselinePolicy::FirstComeFirstServed, CONVOY, 4);

    EXPECT_EQ(report.name, "First Come First Served");
    EXPECT_EQ(waiting_time_of(report, 1), 0U);
    EXPECT_EQ(waiting_time_of(report, 2), 24U);
    EXPECT_EQ(waiting_time_of(report, 3), 27U);
    EXPECT_DOUBLE_EQ(report.average_waiting_time(), 17.0);
    EXPECT_EQ(report.makespan, 30U);
}

TEST(BaselinesTest, RoundRobinConvoy)
{
    const auto report = Simulations::simulate_baseline(BaselinePolicy::RoundRobin, CONVOY, 4);

    EXPECT_EQ(report.name, "Round Robin");
    EXPECT_EQ(waiting_time_of(report, 1), 6U);
    EXPECT_EQ(waiting_time_of(report, 2), 4U);
    EXPECT_EQ(waiting_time_of(report, 3), 7U);
    EXPECT_EQ(report.makespan, 30U);
}

TEST(BaselinesTest, RoundRobinRequeuesPreemptedJobBeforeNewArrivals)
{
    const auto processes = std::vector<Os::ProcessDescriptor> {
        { .name = "P1", .pid = 1, .burst = 5, .arrival = 0 },
        { .name = "P2", .pid = 2, .burst = 3, .arrival = 1 },
        { .name = "P3", .pid = 3, .burst = 4, .arrival = 2 },
    };

    const auto report = Simulations::simulate_baseline(BaselinePolicy::RoundRobin, processes, 2);

    // P1 runs [0, 2) and is queued again before P2 and P3, so it also runs [2, 4).
    EXPECT_EQ(waiting_time_of(report, 1), 4U);
    EXPECT_EQ(waiting_time_of(report, 2), 6U);
    EXPECT_EQ(waiting_time_of(report, 3), 6U);
    EXPECT_DOUBLE_EQ(report.average_waiting_time(), 16.0 / 3.0);
    EXPECT_EQ(report.makespan, 12U);
    EXPECT_EQ(report.idle_time, 0U);
}

TEST(BaselinesTest, ShortestRemainingTimeFirstPreempts)
{
    const auto processes = std::vector<Os::ProcessDescriptor> {
        { .name = "P1", .pid = 1, .burst = 8, .arrival = 0 },
        { .name = "P2", .pid = 2, .burst = 4, .arrival = 1 },
        { .name = "P3", .pid = 3, .burst = 9, .arrival = 2 },
        { .name = "P4", .pid = 4, .burst = 5, .arrival = 3 },
    };

    const auto report = Simulations::simulate_baseline(BaselinePolicy::ShortestRemainingTimeFirst, processes, 1);

    EXPECT_EQ(waiting_time_of(report, 1), 9U);
    EXPECT_EQ(waiting_time_of(report, 2), 0U);
    EXPECT_EQ(waiting_time_of(report, 3), 15U);
    EXPECT_EQ(waiting_time_of(report, 4), 2U);
    EXPECT_DOUBLE_EQ(report.average_waiting_time(), 6.5);
}

TEST(BaselinesTest, PriorityRunsLowestNiceFirst)
{
    const auto processes = std::vector<Os::ProcessDescriptor> {
        { .name = "background", .pid = 1, .nice = 5, .burst = 4 },
        { .name = "urgent", .pid = 2, .nice = -5, .burst = 4 },
    };

    const auto report = Simulations::simulate_baseline(BaselinePolicy::Priority, processes, 2);

    EXPECT_EQ(waiting_time_of(report, 2), 0U);
    EXPECT_EQ(waiting_time_of(report, 1), 4U);
    EXPECT_DOUBLE_EQ(report.average_waiting_time(), 2.0);
}

TEST(BaselinesTest, IdleGapCountsAgainstUtilization)
{
    const auto processes = std::vector<Os::ProcessDescriptor> {
        { .name = "late", .pid = 1, .burst = 3, .arrival = 5 },
    };

    for (const auto policy : Simulations::BASELINE_POLICIES) {
        const auto report = Simulations::simulate_baseline(policy, processes, 2);
        EXPECT_EQ(report.idle_time, 5U) << std::format("{}", policy);
        EXPECT_EQ(report.makespan, 8U) << std::format("{}", policy);
        EXPECT_DOUBLE_EQ(report.cpu_utilization(), 3.0 / 8.0);
        EXPECT_DOUBLE_EQ(report.throughput(), 1.0 / 8.0);
    }
}

TEST(BaselinesTest, EmptyWorkload)
{
    const auto report = Simulations::simulate_baseline(BaselinePolicy::RoundRobin, {}, 3);

    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_EQ(report.makespan, 0U);
    EXPECT_DOUBLE_EQ(report.average_waiting_time(), 0.0);
    EXPECT_DOUBLE_EQ(report.waiting_time_stddev(), 0.0);
    EXPECT_DOUBLE_EQ(report.throughput(), 0.0);
}

TEST(PolicyReportTest, WaitingTimeStddev)
{
    const auto report = Simulations::PolicyReport {
        .name     = "manual",
        .outcomes = {
            { .pid = 1, .arrival = 0, .burst = 1, .waiting_time = 2, .turnaround_time = 3 },
            { .pid = 2, .arrival = 0, .burst = 1, .waiting_time = 4, .turnaround_time = 5 },
            { .pid = 3, .arrival = 0, .burst = 1, .waiting_time = 6, .turnaround_time = 7 },
        },
        .makespan = 7,
    };

    EXPECT_DOUBLE_EQ(report.average_waiting_time(), 4.0);
    EXPECT_NEAR(report.waiting_time_stddev(), 1.632993, 1e-6);
    EXPECT_DOUBLE_EQ(report.average_turnaround_time(), 5.0);
}

} // namespace
