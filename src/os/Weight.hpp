#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace Os
{

using Weight = std::uint32_t;

constexpr static int    NICE_MIN      = -20;
constexpr static int    NICE_MAX      = 19;
constexpr static Weight NICE_0_WEIGHT = 1024;

// Each nice step is roughly a 1.25 ratio, so one level gives about 10% CPU share.
constexpr static std::array<Weight, NICE_MAX - NICE_MIN + 1> NICE_TO_WEIGHT = {
    /* -20 */ 88761, 71755, 56483, 46273, 36291,
    /* -15 */ 29154, 23254, 18705, 14949, 11916,
    /* -10 */ 9548,  7620,  6100,  4904,  3906,
    /*  -5 */ 3121,  2501,  1991,  1586,  1277,
    /*   0 */ 1024,  820,   655,   526,   423,
    /*   5 */ 335,   272,   215,   172,   137,
    /*  10 */ 110,   87,    70,    56,    45,
    /*  15 */ 36,    29,    23,    18,    15,
};

static_assert(NICE_TO_WEIGHT[0 - NICE_MIN] == NICE_0_WEIGHT, "nice 0 must map to the baseline weight");
static_assert(
  [] {
      for (std::size_t idx = 1; idx < NICE_TO_WEIGHT.size(); ++idx) {
          if (NICE_TO_WEIGHT[idx] >= NICE_TO_WEIGHT[idx - 1]) { return false; }
      }
      return true;
  }(),
  "weights must be strictly decreasing in nice"
);

[[nodiscard]] constexpr static auto nice_in_range(const std::int64_t nice) -> bool
{
    return nice >= NICE_MIN && nice <= NICE_MAX;
}

[[nodiscard]] constexpr static auto weight_of(const std::int64_t nice) -> std::optional<Weight>
{
    if (!nice_in_range(nice)) { return std::nullopt; }

    return NICE_TO_WEIGHT[static_cast<std::size_t>(nice - NICE_MIN)];
}

} // namespace Os
