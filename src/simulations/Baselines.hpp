#pragma once

#include <array>
#include <cassert>
#include <cstdint>
#include <format>
#include <span>
#include <string_view>
#include <utility>

#include "os/Os.hpp"
#include "simulations/Statistics.hpp"

namespace Simulations
{

// Classic policies the fair scheduler is compared against.
enum class BaselinePolicy : std::uint8_t
{
    FirstComeFirstServed = 0,
    ShortestRemainingTimeFirst,
    Priority,
    RoundRobin,
    Count,
};

constexpr static auto BASELINE_POLICIES = std::array<BaselinePolicy, 4> {
    BaselinePolicy::FirstComeFirstServed,
    BaselinePolicy::ShortestRemainingTimeFirst,
    BaselinePolicy::Priority,
    BaselinePolicy::RoundRobin,
};

// First come first served ignores the quantum and runs each process to completion.
[[nodiscard]] auto simulate_baseline(
  BaselinePolicy                         policy,
  std::span<const Os::ProcessDescriptor> processes,
  const Os::Tick                         quantum
) -> PolicyReport;

} // namespace Simulations

template<>
struct std::formatter<Simulations::BaselinePolicy>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Simulations::BaselinePolicy policy, auto& ctx) const
    {
        constexpr static auto visitor = [](Simulations::BaselinePolicy value) constexpr -> std::string_view {
            static_assert(
              std::to_underlying(Simulations::BaselinePolicy::Count) == 4,
              "[ERROR] Exhaustive handling of all enum variants for BaselinePolicy is required"
            );

            switch (value) {
                case Simulations::BaselinePolicy::FirstComeFirstServed: {
                    return "First Come First Served";
                }
                case Simulations::BaselinePolicy::ShortestRemainingTimeFirst: {
                    return "Shortest Remaining Time First";
                }
                case Simulations::BaselinePolicy::Priority: {
                    return "Priority";
                }
                case Simulations::BaselinePolicy::RoundRobin: {
                    return "Round Robin";
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
