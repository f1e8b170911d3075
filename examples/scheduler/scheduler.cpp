#include <filesystem>
#include <print>

#include "lang/Interpreter.hpp"
#include "os/Os.hpp"
#include "simulations/Scheduler.hpp"
#include "Util.hpp"

// Embeds the scheduler: streams decisions out of the log as they happen, then
// replays the same workload with arrivals seeded at zero.
auto main(int argc, const char** argv) -> int
{
    const auto path         = std::filesystem::path(argc > 1 ? argv[1] : "examples/scheduler/late_arrival.sl");
    const auto file_content = Util::read_entire_file(path);
    if (!file_content) { return 1; }

    const auto workload = Interpreter::Interpreter::eval(*file_content);
    if (!workload) {
        std::println(stderr, "[ERROR] Could not correctly evaluate script {}", path.string());
        return 1;
    }

    auto sim = Simulations::Scheduler::create(*workload);
    if (!sim) { return 1; }

    while (!sim->complete()) {
        sim->step();
        for (const auto& event : sim->event_log().drain()) { std::println("{}", event); }
    }

    std::println("{}: {:.3f} avg waiting", sim->configuration().arrival_policy, sim->report().average_waiting_time());

    auto config           = sim->configuration();
    config.arrival_policy = Simulations::ArrivalPolicy::Zero;
    if (!sim->reconfigure(config)) { return 1; }

    sim->run_to_completion();
    std::println("{}: {:.3f} avg waiting", sim->configuration().arrival_policy, sim->report().average_waiting_time());

    for (const auto& process : sim->finished()) { std::println("    {:s}", *process); }
}
