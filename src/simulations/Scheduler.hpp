#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "os/Os.hpp"
#include "simulations/EventLog.hpp"
#include "simulations/RunQueue.hpp"
#include "simulations/Statistics.hpp"
#include "Util.hpp"

namespace Simulations
{

// How a process admitted after time 0 seeds its virtual runtime.
enum class ArrivalPolicy : std::uint8_t
{
    MinVruntime = 0,
    Zero,
    Count,
};

[[nodiscard]] constexpr static auto arrival_policy_try_from_str(std::string_view str) -> std::optional<ArrivalPolicy>
{
    static_assert(
      std::to_underlying(ArrivalPolicy::Count) == 2,
      "[ERROR] Exhaustive handling of all enum variants for ArrivalPolicy is required"
    );

    const auto lowered = Util::to_lower(str);
    if (lowered == "min_vruntime") {
        return ArrivalPolicy::MinVruntime;
    } else if (lowered == "zero") {
        return ArrivalPolicy::Zero;
    }

    std::println(stderr, "[ERROR] Unknown arrival policy: {}", str);
    return std::nullopt;
}

enum class SchedulerState : std::uint8_t
{
    Idle = 0,
    Running,
    Finished,
    Count,
};

struct [[nodiscard]] SchedulerConfig final
{
    // Keeps target_latency * weight and the vruntime delta of one slice inside 64 bits.
    constexpr static Os::Tick MAX_SLICE_TICKS = 1UL << 32;

    Os::Tick      target_latency  = 20;
    Os::Tick      min_granularity = 1;
    ArrivalPolicy arrival_policy  = ArrivalPolicy::MinVruntime;

    [[nodiscard]] auto validate() const -> bool;
};

struct [[nodiscard]] Workload final
{
    SchedulerConfig                    config;
    std::vector<Os::ProcessDescriptor> processes;
};

class [[nodiscard]] Scheduler final
{
  public:
    using ProcessPtr = std::shared_ptr<Os::Process>;

    // Validates the whole workload up front; nothing is built if any part is invalid.
    [[nodiscard]] static auto create(const Workload& workload) -> std::optional<Scheduler>;

    ~Scheduler() = default;

    Scheduler(const Scheduler&)            = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    Scheduler(Scheduler&&) noexcept            = default;
    Scheduler& operator=(Scheduler&&) noexcept = default;

    // Registers a process before the run or as a mid-run arrival.
    [[nodiscard]] auto emplace_process(const Os::ProcessDescriptor& descriptor) -> bool;

    [[nodiscard]] auto complete() const -> bool;
    [[nodiscard]] auto state() const -> SchedulerState;

    // One full scheduling decision. Emits exactly one event unless already complete.
    void step();

    template<std::predicate<const Scheduler&> StopPredicate>
    void run_until(StopPredicate&& stop)
    {
        while (!complete() && !stop(std::as_const(*this))) { step(); }
    }

    void run_to_completion()
    {
        run_until([](const Scheduler&) { return false; });
    }

    void restart();
    [[nodiscard]] auto reconfigure(const SchedulerConfig& new_config) -> bool;

    [[nodiscard]] auto configuration() const -> const SchedulerConfig& { return config; }
    [[nodiscard]] auto timer() const -> Os::Tick { return clock; }
    [[nodiscard]] auto idle_time() const -> Os::Tick { return idle; }
    [[nodiscard]] auto decisions() const -> std::size_t { return decision_count; }
    [[nodiscard]] auto run_queue() const -> const RunQueue& { return queue; }
    [[nodiscard]] auto current() const -> std::shared_ptr<const Os::Process> { return last_selected; }
    [[nodiscard]] auto finished() const -> const std::vector<ProcessPtr>& { return retired; }
    [[nodiscard]] auto event_log() const -> const EventLog& { return log; }
    [[nodiscard]] auto event_log() -> EventLog& { return log; }
    [[nodiscard]] auto descriptors() const -> std::span<const Os::ProcessDescriptor> { return workload; }

    [[nodiscard]] auto pending_arrivals() const { return arrivals | std::views::values; }

    [[nodiscard]] auto report() const -> PolicyReport;

  private:
    explicit Scheduler(const SchedulerConfig& config);

    [[nodiscard]] auto timeslice_for(const Os::Process& candidate) const -> Os::Tick;
    [[nodiscard]] auto arrival_vruntime() const -> Os::VirtualRuntime;
    [[nodiscard]] auto ensure_pid_is_unique(const std::size_t pid) const -> bool;
    void               admit_arrivals();

  private:
    SchedulerConfig                    config;
    std::vector<Os::ProcessDescriptor> workload;
    std::unordered_set<std::size_t>    known_pids;

    RunQueue                            queue;
    std::multimap<Os::Tick, ProcessPtr> arrivals;
    ProcessPtr                          last_selected = nullptr;
    std::vector<ProcessPtr>             retired;
    EventLog                            log;

    Os::Tick    clock          = 0;
    Os::Tick    idle           = 0;
    std::size_t decision_count = 0;
};

// Runs a whole workload with the default arrival policy and returns its trace.
[[nodiscard]] auto run(
  std::span<const Os::ProcessDescriptor> processes,
  const Os::Tick                         target_latency,
  const Os::Tick                         min_granularity
) -> std::optional<std::vector<SchedulingEvent>>;

} // namespace Simulations

template<>
struct std::formatter<Simulations::ArrivalPolicy>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Simulations::ArrivalPolicy policy, auto& ctx) const
    {
        constexpr static auto visitor = [](Simulations::ArrivalPolicy value) constexpr -> std::string_view {
            static_assert(
              std::to_underlying(Simulations::ArrivalPolicy::Count) == 2,
              "[ERROR] Exhaustive handling of all enum variants for ArrivalPolicy is required"
            );

            switch (value) {
                case Simulations::ArrivalPolicy::MinVruntime: {
                    return "min_vruntime";
                }
                case Simulations::ArrivalPolicy::Zero: {
                    return "zero";
                }
                default: {
                    assert(false && "unreachable");
                    return "unreachable";
                }
            }
        };

        return std::format_to(ctx.out(), "{}", visitor(policy));
    }
};

template<>
struct std::formatter<Simulations::SchedulerState>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Simulations::SchedulerState state, auto& ctx) const
    {
        constexpr static auto visitor = [](Simulations::SchedulerState value) constexpr -> std::string_view {
            static_assert(
              std::to_underlying(Simulations::SchedulerState::Count) == 3,
              "[ERROR] Exhaustive handling of all enum variants for SchedulerState is required"
            );

            switch (value) {
                case Simulations::SchedulerState::Idle: {
                    return "Idle";
                }
                case Simulations::SchedulerState::Running: {
                    return "Running";
                }
                case Simulations::SchedulerState::Finished: {
                    return "Finished";
                }
                default: {
                    assert(false && "unreachable");
                    return "unreachable";
                }
            }
        };

        return std::format_to(ctx.out(), "{}", visitor(state));
    }
};

template<>
struct std::formatter<Simulations::SchedulerConfig>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Simulations::SchedulerConfig& config, auto& ctx) const
    {
        return std::format_to(
          ctx.out(),
          "SchedulerConfig {{ target_latency: {}, min_granularity: {}, arrival_policy: {} }}",
          config.target_latency,
          config.min_granularity,
          config.arrival_policy
        );
    }
};
