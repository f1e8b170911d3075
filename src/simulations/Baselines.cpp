#include "Baselines.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <set>
#include <tuple>
#include <vector>

namespace
{

struct [[nodiscard]] Job final
{
    const Os::ProcessDescriptor* descriptor;
    Os::Tick                     remaining;
};

class [[nodiscard]] FifoQueue final
{
  public:
    // Same constructor as KeyedQueue so simulate_with builds every ready queue alike.
    explicit FifoQueue(const std::vector<Job>& /* jobs */) {}

    void push(const std::size_t job_idx) { ready.push_back(job_idx); }

    [[nodiscard]] auto pop() -> std::size_t
    {
        assert(!ready.empty() && "ready queue must not be empty");
        const auto job_idx = ready.front();
        ready.pop_front();
        return job_idx;
    }

    [[nodiscard]] auto empty() const -> bool { return ready.empty(); }

  private:
    std::deque<std::size_t> ready;
};

// Orders jobs by (primary, arrival, pid); the primary key is sampled when the job is queued.
template<typename PrimaryKey>
class [[nodiscard]] KeyedQueue final
{
  public:
    using Key = std::tuple<std::int64_t, Os::Tick, std::size_t>;

    explicit KeyedQueue(const std::vector<Job>& jobs)
      : jobs { jobs }
    {}

    void push(const std::size_t job_idx)
    {
        const auto& job = jobs[job_idx];
        ready.emplace(Key { PrimaryKey {}(job), job.descriptor->arrival, job.descriptor->pid }, job_idx);
    }

    [[nodiscard]] auto pop() -> std::size_t
    {
        assert(!ready.empty() && "ready queue must not be empty");
        const auto job_idx = ready.begin()->second;
        ready.erase(ready.begin());
        return job_idx;
    }

    [[nodiscard]] auto empty() const -> bool { return ready.empty(); }

  private:
    const std::vector<Job>&               jobs;
    std::set<std::pair<Key, std::size_t>> ready;
};

struct [[nodiscard]] RemainingTime final
{
    auto operator()(const Job& job) const -> std::int64_t { return static_cast<std::int64_t>(job.remaining); }
};

struct [[nodiscard]] Niceness final
{
    auto operator()(const Job& job) const -> std::int64_t { return job.descriptor->nice; }
};

template<typename ReadyQueue>
[[nodiscard]] auto simulate_with(
  Simulations::BaselinePolicy            policy,
  std::span<const Os::ProcessDescriptor> processes,
  const Os::Tick                         quantum
) -> Simulations::PolicyReport
{
    std::vector<Job> jobs;
    jobs.reserve(processes.size());
    for (const auto& descriptor : processes) {
        jobs.push_back(Job { .descriptor = &descriptor, .remaining = descriptor.burst });
    }

    std::ranges::sort(jobs, [](const Job& lhs, const Job& rhs) {
        return std::tie(lhs.descriptor->arrival, lhs.descriptor->pid)
               < std::tie(rhs.descriptor->arrival, rhs.descriptor->pid);
    });

    auto report = Simulations::PolicyReport { .name = std::format("{}", policy) };
    report.outcomes.reserve(jobs.size());

    ReadyQueue  ready(jobs);
    Os::Tick    timer        = 0;
    std::size_t next_arrival = 0;

    const auto admit_arrivals = [&] {
        while (next_arrival < jobs.size() && jobs[next_arrival].descriptor->arrival <= timer) {
            ready.push(next_arrival++);
        }
    };

    while (next_arrival < jobs.size() || !ready.empty()) {
        admit_arrivals();
        if (ready.empty()) {
            const auto arrival = jobs[next_arrival].descriptor->arrival;
            report.idle_time += arrival - timer;
            timer = arrival;
            admit_arrivals();
        }

        const auto job_idx = ready.pop();
        auto&      job     = jobs[job_idx];
        const auto ran     = std::min(quantum, job.remaining);
        timer += ran;
        job.remaining -= ran;

        // The preempted job goes back before anything that arrived during its slice.
        if (job.remaining > 0) {
            ready.push(job_idx);
            continue;
        }

        const auto turnaround = timer - job.descriptor->arrival;
        report.outcomes.push_back(Simulations::ProcessOutcome {
          .pid             = job.descriptor->pid,
          .arrival         = job.descriptor->arrival,
          .burst           = job.descriptor->burst,
          .waiting_time    = turnaround - job.descriptor->burst,
          .turnaround_time = turnaround,
        });
    }

    report.makespan = timer;
    return report;
}

} // namespace

namespace Simulations
{

auto simulate_baseline(BaselinePolicy policy, std::span<const Os::ProcessDescriptor> processes, const Os::Tick quantum)
  -> PolicyReport
{
    static_assert(
      std::to_underlying(BaselinePolicy::Count) == 4,
      "Exhaustive handling of all enum variants for BaselinePolicy is required."
    );
    assert(quantum > 0 && "quantum must be positive");

    switch (policy) {
        case BaselinePolicy::FirstComeFirstServed: {
            return simulate_with<FifoQueue>(policy, processes, std::numeric_limits<Os::Tick>::max());
        }
        case BaselinePolicy::ShortestRemainingTimeFirst: {
            return simulate_with<KeyedQueue<RemainingTime>>(policy, processes, quantum);
        }
        case BaselinePolicy::Priority: {
            return simulate_with<KeyedQueue<Niceness>>(policy, processes, quantum);
        }
        case BaselinePolicy::RoundRobin: {
            return simulate_with<FifoQueue>(policy, processes, quantum);
        }
        default: {
            assert(false && "unreachable");
            return PolicyReport {};
        }
    }
}

} // namespace Simulations
