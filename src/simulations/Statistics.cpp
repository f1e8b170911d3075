#include "Statistics.hpp"

#include <cmath>
#include <numeric>

namespace Simulations
{

auto PolicyReport::average_waiting_time() const -> double
{
    if (outcomes.empty()) { return 0.0; }

    const auto total = std::accumulate(outcomes.begin(), outcomes.end(), 0UL, [](const auto acc, const auto& outcome) {
        return acc + outcome.waiting_time;
    });

    return static_cast<double>(total) / static_cast<double>(outcomes.size());
}

auto PolicyReport::average_turnaround_time() const -> double
{
    if (outcomes.empty()) { return 0.0; }

    const auto total = std::accumulate(outcomes.begin(), outcomes.end(), 0UL, [](const auto acc, const auto& outcome) {
        return acc + outcome.turnaround_time;
    });

    return static_cast<double>(total) / static_cast<double>(outcomes.size());
}

auto PolicyReport::waiting_time_stddev() const -> double
{
    if (outcomes.empty()) { return 0.0; }

    const auto mean     = average_waiting_time();
    const auto variance =
      std::accumulate(outcomes.begin(), outcomes.end(), 0.0, [mean](const auto acc, const auto& outcome) {
          const auto diff = static_cast<double>(outcome.waiting_time) - mean;
          return acc + (diff * diff);
      });

    return std::sqrt(variance / static_cast<double>(outcomes.size()));
}

auto PolicyReport::throughput() const -> double
{
    return makespan != 0 ? static_cast<double>(outcomes.size()) / static_cast<double>(makespan) : 0.0;
}

auto PolicyReport::cpu_utilization() const -> double
{
    return makespan != 0 ? static_cast<double>(makespan - idle_time) / static_cast<double>(makespan) : 0.0;
}

} // namespace Simulations
