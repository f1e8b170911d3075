#include "Scheduler.hpp"

#include <algorithm>

namespace Simulations
{

auto SchedulerConfig::validate() const -> bool
{
    if (target_latency == 0) {
        std::println(stderr, "[ERROR] target_latency must be positive");
        return false;
    }

    if (min_granularity == 0) {
        std::println(stderr, "[ERROR] min_granularity must be positive");
        return false;
    }

    if (target_latency > MAX_SLICE_TICKS || min_granularity > MAX_SLICE_TICKS) {
        std::println(
          stderr,
          "[ERROR] target_latency {} and min_granularity {} must not exceed {}",
          target_latency,
          min_granularity,
          MAX_SLICE_TICKS
        );
        return false;
    }

    if (std::to_underlying(arrival_policy) >= std::to_underlying(ArrivalPolicy::Count)) {
        std::println(stderr, "[ERROR] invalid arrival policy {}", std::to_underlying(arrival_policy));
        return false;
    }

    return true;
}

auto Scheduler::create(const Workload& workload) -> std::optional<Scheduler>
{
    if (!workload.config.validate()) { return std::nullopt; }

    Scheduler scheduler(workload.config);
    for (const auto& descriptor : workload.processes) {
        if (!scheduler.emplace_process(descriptor)) { return std::nullopt; }
    }

    return scheduler;
}

Scheduler::Scheduler(const SchedulerConfig& config)
  : config { config }
{}

auto Scheduler::emplace_process(const Os::ProcessDescriptor& descriptor) -> bool
{
    if (!ensure_pid_is_unique(descriptor.pid)) {
        std::println(stderr, "[ERROR] process {} with pid {} is already in use", descriptor.name, descriptor.pid);
        return false;
    }

    if (descriptor.arrival < clock) {
        std::println(
          stderr,
          "[ERROR] process {} with pid {} arrives at {}, which is before the current time {}",
          descriptor.name,
          descriptor.pid,
          descriptor.arrival,
          clock
        );
        return false;
    }

    auto process = Os::Process::from_descriptor(descriptor);
    if (!process) { return false; }

    arrivals.emplace(descriptor.arrival, std::make_shared<Os::Process>(std::move(*process)));
    known_pids.insert(descriptor.pid);
    workload.push_back(descriptor);

    return true;
}

auto Scheduler::complete() const -> bool { return queue.is_empty() && arrivals.empty(); }

auto Scheduler::state() const -> SchedulerState
{
    if (complete()) { return SchedulerState::Finished; }
    if (queue.is_empty()) { return SchedulerState::Idle; }

    return SchedulerState::Running;
}

void Scheduler::step()
{
    admit_arrivals();

    if (queue.is_empty()) {
        if (arrivals.empty()) { return; }

        const auto next_arrival = arrivals.begin()->first;
        assert(next_arrival > clock && "arrivals at or before the current time must already be admitted");
        idle += next_arrival - clock;
        clock = next_arrival;
        admit_arrivals();
    }

    auto candidate = queue.pop_min();
    assert(candidate != nullptr && "run queue must not be empty after admitting arrivals");
    last_selected = candidate;

    const auto granted = std::min(timeslice_for(*candidate), candidate->remaining_burst);
    const auto start   = clock;
    clock += granted;

    const auto vruntime_before = candidate->vruntime;
    candidate->vruntime += Os::delta_vruntime(granted, candidate->weight);
    candidate->remaining_burst -= granted;
    ++candidate->turns;
    if (!candidate->start_time.has_value()) { candidate->start_time = start; }

    [[maybe_unused]] const auto appended = log.append(SchedulingEvent {
      .start_time      = start,
      .end_time        = clock,
      .pid             = candidate->pid,
      .vruntime_before = vruntime_before,
      .vruntime_after  = candidate->vruntime,
    });
    assert(appended && "scheduling events must be sequential");

    if (candidate->remaining_burst > 0) {
        [[maybe_unused]] const auto requeued = queue.insert(candidate);
        assert(requeued && "a selected process cannot already be queued");
    } else {
        candidate->finish_time = clock;
        retired.push_back(candidate);
    }

    ++decision_count;
    admit_arrivals();
}

void Scheduler::restart()
{
    const auto descriptors = std::exchange(workload, {});

    queue.clear();
    arrivals.clear();
    known_pids.clear();
    retired.clear();
    log.clear();
    last_selected  = nullptr;
    clock          = 0;
    idle           = 0;
    decision_count = 0;

    for (const auto& descriptor : descriptors) {
        [[maybe_unused]] const auto emplaced = emplace_process(descriptor);
        assert(emplaced && "descriptors were validated when first emplaced");
    }
}

auto Scheduler::reconfigure(const SchedulerConfig& new_config) -> bool
{
    if (!new_config.validate()) { return false; }

    config = new_config;
    restart();
    return true;
}

auto Scheduler::report() const -> PolicyReport
{
    PolicyReport result { .name = "Completely Fair", .makespan = clock, .idle_time = idle };
    result.outcomes.reserve(retired.size());

    for (const auto& process : retired) {
        result.outcomes.push_back(ProcessOutcome {
          .pid             = process->pid,
          .arrival         = process->arrival,
          .burst           = process->burst,
          .waiting_time    = process->waiting_time().value(),
          .turnaround_time = process->turnaround_time().value(),
        });
    }

    return result;
}

auto Scheduler::timeslice_for(const Os::Process& candidate) const -> Os::Tick
{
    // The candidate has been popped, so its weight is added back to the queue load.
    const auto total_weight = queue.total_weight() + candidate.weight;
    const auto ideal_slice  = static_cast<Os::Tick>(config.target_latency * candidate.weight / total_weight);

    return std::max(ideal_slice, config.min_granularity);
}

auto Scheduler::arrival_vruntime() const -> Os::VirtualRuntime
{
    static_assert(
      std::to_underlying(ArrivalPolicy::Count) == 2,
      "Exhaustive handling of all enum variants for ArrivalPolicy is required."
    );

    switch (config.arrival_policy) {
        case ArrivalPolicy::MinVruntime: {
            return queue.min_vruntime().value_or(0);
        }
        case ArrivalPolicy::Zero: {
            return 0;
        }
        default: {
            assert(false && "unreachable");
            return 0;
        }
    }
}

void Scheduler::admit_arrivals()
{
    if (arrivals.empty() || arrivals.begin()->first > clock) { return; }

    // Every process admitted in this batch shares the same baseline.
    const auto baseline = arrival_vruntime();
    while (!arrivals.empty() && arrivals.begin()->first <= clock) {
        auto node         = arrivals.extract(arrivals.begin());
        auto process      = std::move(node.mapped());
        process->vruntime = baseline;

        [[maybe_unused]] const auto inserted = queue.insert(process);
        assert(inserted && "pids are unique across the workload");
    }
}

auto Scheduler::ensure_pid_is_unique(const std::size_t pid) const -> bool { return !known_pids.contains(pid); }

auto run(
  std::span<const Os::ProcessDescriptor> processes,
  const Os::Tick                         target_latency,
  const Os::Tick                         min_granularity
) -> std::optional<std::vector<SchedulingEvent>>
{
    const auto workload = Workload {
        .config =
          SchedulerConfig {
            .target_latency  = target_latency,
            .min_granularity = min_granularity,
          },
        .processes = std::vector(processes.begin(), processes.end()),
    };

    auto scheduler = Scheduler::create(workload);
    if (!scheduler) { return std::nullopt; }

    scheduler->run_to_completion();
    return scheduler->event_log().drain();
}

} // namespace Simulations
