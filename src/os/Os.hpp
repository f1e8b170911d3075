#pragma once

#include <cassert>
#include <cstdint>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <utility>

#include "os/Weight.hpp"

namespace Os
{

using Tick = std::size_t;

// Virtual runtime is fixed point: VRUNTIME_SCALE units per tick of nice-0 execution.
using VirtualRuntime = std::uint64_t;

constexpr static VirtualRuntime VRUNTIME_SCALE = 1UL << 10;

[[nodiscard]] constexpr static auto delta_vruntime(const Tick granted, const Weight weight) -> VirtualRuntime
{
    assert(weight > 0 && "weight must be positive");
    return static_cast<VirtualRuntime>(granted) * NICE_0_WEIGHT * VRUNTIME_SCALE / weight;
}

[[nodiscard]] constexpr static auto vruntime_as_ticks(const VirtualRuntime vruntime) -> double
{
    return static_cast<double>(vruntime) / static_cast<double>(VRUNTIME_SCALE);
}

struct [[nodiscard]] ProcessDescriptor final
{
    std::string  name    = "Process";
    std::size_t  pid     = 0;
    std::int64_t nice    = 0;
    Tick         burst   = 0;
    Tick         arrival = 0;
};

struct [[nodiscard]] Process final
{
    [[nodiscard]] static auto from_descriptor(const ProcessDescriptor& descriptor) -> std::optional<Process>
    {
        const auto weight = weight_of(descriptor.nice);
        if (!weight) {
            std::println(
              stderr,
              "[ERROR] process {} with pid {} has nice {} outside of [{}, {}]",
              descriptor.name,
              descriptor.pid,
              descriptor.nice,
              NICE_MIN,
              NICE_MAX
            );
            return std::nullopt;
        }

        if (descriptor.burst == 0) {
            std::println(
              stderr, "[ERROR] process {} with pid {} must have a positive burst", descriptor.name, descriptor.pid
            );
            return std::nullopt;
        }

        return Process {
            .name            = descriptor.name,
            .pid             = descriptor.pid,
            .nice            = static_cast<int>(descriptor.nice),
            .weight          = *weight,
            .burst           = descriptor.burst,
            .arrival         = descriptor.arrival,
            .remaining_burst = descriptor.burst,
        };
    }

    [[nodiscard]] auto finished() const -> bool { return remaining_burst == 0; }

    [[nodiscard]] auto turnaround_time() const -> std::optional<Tick>
    {
        if (!finish_time.has_value()) { return std::nullopt; }
        return *finish_time - arrival;
    }

    [[nodiscard]] auto waiting_time() const -> std::optional<Tick>
    {
        if (!finish_time.has_value()) { return std::nullopt; }
        return *finish_time - arrival - burst;
    }

    [[nodiscard]] auto response_time() const -> std::optional<Tick>
    {
        if (!start_time.has_value()) { return std::nullopt; }
        return *start_time - arrival;
    }

    std::string    name;
    std::size_t    pid;
    int            nice;
    Weight         weight;
    Tick           burst;
    Tick           arrival;
    VirtualRuntime vruntime        = 0;
    Tick           remaining_burst = 0;
    std::size_t    turns           = 0;

    std::optional<Tick> start_time  = std::nullopt;
    std::optional<Tick> finish_time = std::nullopt;
};

} // namespace Os

template<>
struct std::formatter<Os::ProcessDescriptor>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Os::ProcessDescriptor& descriptor, auto& ctx) const
    {
        return std::format_to(
          ctx.out(),
          "ProcessDescriptor {{ name: {}, pid: {}, nice: {}, burst: {}, arrival: {} }}",
          descriptor.name,
          descriptor.pid,
          descriptor.nice,
          descriptor.burst,
          descriptor.arrival
        );
    }
};

template<>
struct std::formatter<Os::Process>
{
    constexpr auto parse(auto& ctx)
    {
        auto       it  = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it == 's') {
            line_mode = LineMode::SingleLine;
            ++it;
        } else if (it != end && *it == 'm') {
            line_mode = LineMode::Multiline;
            ++it;
        }

        if (it != end && *it != '}') { throw std::format_error("invalid format"); }

        return it;
    }

    auto format(const Os::Process& process, auto& ctx) const
    {
        switch (line_mode) {
            case LineMode::Multiline: {
                return std::format_to(
                  ctx.out(),
                  "Process {{\n        name: {},\n        pid: {},\n        nice: {},\n        weight: {},\n        "
                  "arrival: {},\n        burst: {},\n        remaining: {},\n        vruntime: {:.3f}\n    }}",
                  process.name,
                  process.pid,
                  process.nice,
                  process.weight,
                  process.arrival,
                  process.burst,
                  process.remaining_burst,
                  Os::vruntime_as_ticks(process.vruntime)
                );
            }
            case LineMode::SingleLine: {
                return std::format_to(
                  ctx.out(),
                  "Process {{ name: {}, pid: {}, nice: {}, weight: {}, arrival: {}, burst: {}, remaining: {}, "
                  "vruntime: {:.3f} }}",
                  process.name,
                  process.pid,
                  process.nice,
                  process.weight,
                  process.arrival,
                  process.burst,
                  process.remaining_burst,
                  Os::vruntime_as_ticks(process.vruntime)
                );
            }
        }

        assert(false && "unreachable");
        return ctx.out();
    }

  private:
    enum class LineMode : std::uint8_t
    {
        SingleLine = 0,
        Multiline,
    };

    LineMode line_mode = LineMode::Multiline;
};
