#include "Metrics.hpp"

#include <format>
#include <sstream>

static void write_report(std::stringstream& ss, const Simulations::PolicyReport& report)
{
    ss << "separator\n";
    ss << std::format("policy = {}\n", report.name);
    ss << std::format("finished = {}\n", report.outcomes.size());
    ss << std::format("avg_waiting_time = {:.3f}\n", report.average_waiting_time());
    ss << std::format("stddev_waiting_time = {:.3f}\n", report.waiting_time_stddev());
    ss << std::format("avg_turnaround_time = {:.3f}\n", report.average_turnaround_time());
    ss << std::format("throughput = {:.4f}\n", report.throughput());
    ss << std::format("cpu_utilization = {:.2f}\n", report.cpu_utilization() * 100);
}

namespace Simulations
{

auto metrics_file_content(const Scheduler& sim, std::span<const PolicyReport> baselines) -> std::string
{
    const auto& config = sim.configuration();

    std::stringstream ss;
    ss << std::format("timer = {}\n", sim.timer());
    ss << std::format("decisions = {}\n", sim.decisions());
    ss << std::format("target_latency = {}\n", config.target_latency);
    ss << std::format("min_granularity = {}\n", config.min_granularity);
    ss << std::format("arrival_policy = {}\n", config.arrival_policy);

    write_report(ss, sim.report());
    for (const auto& baseline : baselines) { write_report(ss, baseline); }

    return ss.str();
}

} // namespace Simulations
