#include <filesystem>
#include <optional>
#include <print>
#include <string_view>
#include <vector>

#include "lang/Interpreter.hpp"
#include "simulations/Baselines.hpp"
#include "simulations/Metrics.hpp"
#include "simulations/Scheduler.hpp"
#include "Util.hpp"

struct [[nodiscard]] Options final
{
    std::filesystem::path                script_path;
    std::optional<std::size_t>           max_decisions = std::nullopt;
    std::optional<Os::Tick>              max_ticks     = std::nullopt;
    std::optional<std::filesystem::path> metrics_path  = std::nullopt;
    bool                                 compare       = false;
    std::optional<Os::Tick>              quantum       = std::nullopt;
};

static void print_usage()
{
    std::println(
      "usage: cfs-trace <file.sl> [--decisions N] [--ticks N] [--metrics <file.met>] [--compare] [--quantum N]"
    );
}

[[nodiscard]] static auto parse_arguments(const int argc, const char** argv) -> std::optional<Options>
{
    if (argc < 2) {
        std::println(stderr, "[ERROR] expected file path to simulation script");
        print_usage();
        return std::nullopt;
    }

    Options options { .script_path = argv[1] };
    for (int idx = 2; idx < argc; ++idx) {
        const std::string_view flag = argv[idx];

        const auto flag_value = [&] -> std::optional<std::string_view> {
            if (idx + 1 >= argc) {
                std::println(stderr, "[ERROR] missing value for `{}`", flag);
                return std::nullopt;
            }
            return argv[++idx];
        };

        if (flag == "--decisions") {
            options.max_decisions = TRY(Util::parse_number(TRY(flag_value())));
        } else if (flag == "--ticks") {
            options.max_ticks = TRY(Util::parse_number(TRY(flag_value())));
        } else if (flag == "--metrics") {
            options.metrics_path = TRY(flag_value());
        } else if (flag == "--compare") {
            options.compare = true;
        } else if (flag == "--quantum") {
            const auto quantum = TRY(Util::parse_number(TRY(flag_value())));
            if (quantum == 0) {
                std::println(stderr, "[ERROR] `--quantum` must be positive");
                return std::nullopt;
            }
            options.quantum = quantum;
        } else {
            std::println(stderr, "[ERROR] unknown option `{}`", flag);
            print_usage();
            return std::nullopt;
        }
    }

    return options;
}

static void print_report(const Simulations::PolicyReport& report)
{
    std::println(
      "{:<32} avg waiting {:>9.3f}  stddev {:>9.3f}  avg turnaround {:>9.3f}  throughput {:.4f}  cpu {:.2f}%",
      report.name,
      report.average_waiting_time(),
      report.waiting_time_stddev(),
      report.average_turnaround_time(),
      report.throughput(),
      report.cpu_utilization() * 100
    );
}

static void print_process_table(const Simulations::Scheduler& sim)
{
    std::println(
      "{:>6} {:<16} {:>5} {:>7} {:>8} {:>6} {:>8} {:>11}",
      "pid",
      "name",
      "nice",
      "weight",
      "arrival",
      "burst",
      "waiting",
      "turnaround"
    );

    for (const auto& process : sim.finished()) {
        std::println(
          "{:>6} {:<16} {:>5} {:>7} {:>8} {:>6} {:>8} {:>11}",
          process->pid,
          process->name,
          process->nice,
          process->weight,
          process->arrival,
          process->burst,
          process->waiting_time().value_or(0),
          process->turnaround_time().value_or(0)
        );
    }
}

auto main(int argc, const char** argv) -> int
{
    const auto options = parse_arguments(argc, argv);
    if (!options) { return 1; }

    const auto maybe_script_content = Util::read_entire_file(options->script_path);
    if (!maybe_script_content) { return 1; }

    const auto workload = Interpreter::Interpreter::eval(*maybe_script_content);
    if (!workload) {
        std::println(stderr, "[ERROR] Could not correctly evaluate script {}", options->script_path.string());
        return 1;
    }

    auto sim = Simulations::Scheduler::create(*workload);
    if (!sim) {
        std::println(stderr, "[ERROR] Invalid workload in script {}", options->script_path.string());
        return 1;
    }

    std::println("{}", sim->configuration());
    sim->run_until([&](const Simulations::Scheduler& scheduler) {
        if (options->max_decisions && scheduler.decisions() >= *options->max_decisions) { return true; }
        if (options->max_ticks && scheduler.timer() >= *options->max_ticks) { return true; }
        return false;
    });

    for (const auto& event : sim->event_log().events()) { std::println("{}", event); }

    std::println("");
    print_process_table(*sim);

    if (!sim->complete()) {
        std::println("[NOTE] stopped at tick {} after {} decisions", sim->timer(), sim->decisions());
    }

    std::vector<Simulations::PolicyReport> baselines;
    if (options->compare) {
        const auto quantum = options->quantum.value_or(sim->configuration().target_latency);
        for (const auto policy : Simulations::BASELINE_POLICIES) {
            baselines.push_back(Simulations::simulate_baseline(policy, sim->descriptors(), quantum));
        }
    }

    std::println("");
    print_report(sim->report());
    for (const auto& report : baselines) { print_report(report); }

    if (options->metrics_path) {
        const auto content = Simulations::metrics_file_content(*sim, baselines);
        if (!Util::write_to_file(*options->metrics_path, content)) { return 1; }
        std::println("[NOTE] metrics written to {}", options->metrics_path->string());
    }

    return 0;
}
