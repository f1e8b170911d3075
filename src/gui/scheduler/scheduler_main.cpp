#include <memory>
#include <print>
#include <utility>

#include "Application.hpp"
#include "lang/Interpreter.hpp"
#include "simulations/Scheduler.hpp"
#include "Util.hpp"

auto main(int argc, const char** argv) -> int
{
    if (argc < 2) {
        std::println(stderr, "[ERROR] expected file path to simulation script");
        std::println("usage: cfs-scheduler <file.sl>");
        return 1;
    }

    const auto* const script_path          = argv[1];
    const auto        maybe_script_content = Util::read_entire_file(script_path);
    if (!maybe_script_content) { return 1; }

    const auto workload = Interpreter::Interpreter::eval(*maybe_script_content);
    if (!workload) {
        std::println(stderr, "[ERROR] Could not correctly evaluate script {}", script_path);
        return 1;
    }

    auto maybe_sim = Simulations::Scheduler::create(*workload);
    if (!maybe_sim) {
        std::println(stderr, "[ERROR] Invalid workload in script {}", script_path);
        return 1;
    }

    const auto sim = std::make_shared<Simulations::Scheduler>(std::move(*maybe_sim));

    auto app = Application::create(sim);
    if (!app) { return 1; }
    app->render();
}
