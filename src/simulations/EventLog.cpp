#include "EventLog.hpp"

#include <print>
#include <utility>

namespace Simulations
{

auto EventLog::append(const SchedulingEvent& event) -> bool
{
    if (event.end_time <= event.start_time) {
        std::println(stderr, "[ERROR] (eventlog) rejected empty interval: {}", event);
        return false;
    }

    if (last_end_time.has_value() && event.start_time < *last_end_time) {
        std::println(
          stderr, "[ERROR] (eventlog) event starting at {} overlaps previous end {}", event.start_time, *last_end_time
        );
        return false;
    }

    log.push_back(event);
    last_end_time = event.end_time;
    granted_sum += event.granted();

    return true;
}

auto EventLog::drain() -> std::vector<SchedulingEvent>
{
    auto drained = std::exchange(log, {});
    granted_sum  = 0;

    return drained;
}

auto EventLog::back() const -> std::optional<SchedulingEvent>
{
    if (log.empty()) { return std::nullopt; }

    return log.back();
}

void EventLog::clear()
{
    log.clear();
    last_end_time = std::nullopt;
    granted_sum   = 0;
}

} // namespace Simulations
