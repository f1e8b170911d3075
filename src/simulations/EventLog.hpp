#pragma once

#include <cstddef>
#include <format>
#include <optional>
#include <vector>

#include "os/Os.hpp"

namespace Simulations
{

struct [[nodiscard]] SchedulingEvent final
{
    Os::Tick           start_time;
    Os::Tick           end_time;
    std::size_t        pid;
    Os::VirtualRuntime vruntime_before;
    Os::VirtualRuntime vruntime_after;

    [[nodiscard]] auto granted() const -> Os::Tick { return end_time - start_time; }

    auto operator==(const SchedulingEvent&) const -> bool = default;
};

// Append-only record of decisions on a single core: events never overlap.
class [[nodiscard]] EventLog final
{
  public:
    [[nodiscard]] auto append(const SchedulingEvent& event) -> bool;

    // Hands the recorded events over and leaves the log empty.
    [[nodiscard]] auto drain() -> std::vector<SchedulingEvent>;

    [[nodiscard]] auto events() const -> const std::vector<SchedulingEvent>& { return log; }
    [[nodiscard]] auto back() const -> std::optional<SchedulingEvent>;
    [[nodiscard]] auto size() const -> std::size_t { return log.size(); }
    [[nodiscard]] auto empty() const -> bool { return log.empty(); }
    [[nodiscard]] auto total_granted() const -> Os::Tick { return granted_sum; }

    void clear();

  private:
    std::vector<SchedulingEvent> log;
    std::optional<Os::Tick>      last_end_time = std::nullopt;
    Os::Tick                     granted_sum   = 0;
};

} // namespace Simulations

template<>
struct std::formatter<Simulations::SchedulingEvent>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Simulations::SchedulingEvent& event, auto& ctx) const
    {
        return std::format_to(
          ctx.out(),
          "[{:>6} - {:>6}] pid {:>4} ran {:>4}, vruntime {:.3f} -> {:.3f}",
          event.start_time,
          event.end_time,
          event.pid,
          event.granted(),
          Os::vruntime_as_ticks(event.vruntime_before),
          Os::vruntime_as_ticks(event.vruntime_after)
        );
    }
};
