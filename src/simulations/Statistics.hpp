#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "os/Os.hpp"

namespace Simulations
{

struct [[nodiscard]] ProcessOutcome final
{
    std::size_t pid;
    Os::Tick    arrival;
    Os::Tick    burst;
    Os::Tick    waiting_time;
    Os::Tick    turnaround_time;
};

// Outcome of running one workload to completion under one policy.
struct [[nodiscard]] PolicyReport final
{
    std::string                 name;
    std::vector<ProcessOutcome> outcomes;
    Os::Tick                    makespan  = 0;
    Os::Tick                    idle_time = 0;

    [[nodiscard]] auto average_waiting_time() const -> double;
    [[nodiscard]] auto average_turnaround_time() const -> double;

    // Population standard deviation, the spread of how long processes sat in the queue.
    [[nodiscard]] auto waiting_time_stddev() const -> double;

    [[nodiscard]] auto throughput() const -> double;
    [[nodiscard]] auto cpu_utilization() const -> double;
};

} // namespace Simulations
