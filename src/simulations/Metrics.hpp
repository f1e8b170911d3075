#pragma once

#include <span>
#include <string>

#include "simulations/Scheduler.hpp"
#include "simulations/Statistics.hpp"

namespace Simulations
{

// `key = value` lines, one `separator` line between sections.
[[nodiscard]] auto metrics_file_content(const Scheduler& sim, std::span<const PolicyReport> baselines) -> std::string;

} // namespace Simulations
