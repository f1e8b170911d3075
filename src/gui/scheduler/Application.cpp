#include "Application.hpp"

#include <algorithm>
#include <array>
#include <ranges>
#include <type_traits>

#include "simulations/Baselines.hpp"
#include "simulations/Metrics.hpp"
#include "Util.hpp"

constexpr static auto TABLE_FLAGS = Gui::TableFlags::Borders | Gui::TableFlags::RowBackground;

static void draw_process_table(const std::string& name, const auto& processes)
{
    constexpr static auto HEADERS = std::array<const char*, 6> { "Pid", "Name", "Nice", "Weight", "Vruntime", "Left" };

    Gui::draw_table(name, HEADERS, TABLE_FLAGS, [&] {
        for (const auto& process : processes) {
            Gui::draw_table_row(
              [&] { Gui::text("{}", process->pid); },
              [&] { Gui::text("{}", process->name); },
              [&] { Gui::text("{}", process->nice); },
              [&] { Gui::text("{}", process->weight); },
              [&] { Gui::text("{:.3f}", Os::vruntime_as_ticks(process->vruntime)); },
              [&] { Gui::text("{}", process->remaining_burst); }
            );
        }
    });
}

static void draw_run_queue(const Simulations::Scheduler& sim, const ImVec2& child_size)
{
    Gui::title(std::format("Run queue ({})", sim.run_queue().size()), child_size, [&](const auto&) {
        draw_process_table("##RunQueueTable", sim.run_queue().processes());
    });
}

static void draw_pending_arrivals(const Simulations::Scheduler& sim, const ImVec2& child_size)
{
    Gui::title("Arrivals", child_size, [&](const auto&) {
        constexpr static auto HEADERS = std::array<const char*, 5> { "Pid", "Name", "Nice", "Arrival", "Burst" };

        Gui::draw_table("##ArrivalsTable", HEADERS, TABLE_FLAGS, [&] {
            for (const auto& process : sim.pending_arrivals()) {
                Gui::draw_table_row(
                  [&] { Gui::text("{}", process->pid); },
                  [&] { Gui::text("{}", process->name); },
                  [&] { Gui::text("{}", process->nice); },
                  [&] { Gui::text("{}", process->arrival); },
                  [&] { Gui::text("{}", process->burst); }
                );
            }
        });
    });
}

// Distance between the most and the least served runnable process, in ticks.
[[nodiscard]] static auto vruntime_spread(const Simulations::RunQueue& queue) -> double
{
    const auto minimum = queue.min_vruntime();
    if (!minimum) { return 0.0; }

    Os::VirtualRuntime maximum = *minimum;
    for (const auto& process : queue.processes()) { maximum = std::max(maximum, process->vruntime); }

    return Os::vruntime_as_ticks(maximum - *minimum);
}

auto Application::create(const std::shared_ptr<Simulations::Scheduler>& sim) -> std::unique_ptr<Application>
{
    const auto window = Gui::init_window("cfs-scheduler", WINDOW_WIDTH, WINDOW_HEIGHT);
    if (!window) { return nullptr; }
    ImPlot::CreateContext();

    Gui::load_default_fonts();
    Gui::black_and_red_style();

    return std::unique_ptr<Application>(new Application { *window, sim });
}

void Application::render()
{
    while (!quit) {
        if (glfwWindowShouldClose(window) == 1) { quit = true; }

        if (ImGui::IsKeyPressed(ImGuiKey_Enter, false)) { should_finish = !should_finish; }

        if (should_finish) {
            step();
        } else if (ImGui::IsKeyPressed(ImGuiKey_Space, false)) {
            step();
        }

        glfwPollEvents();
        if (glfwGetWindowAttrib(window, GLFW_ICONIFIED) != 0) { continue; }

        Gui::new_frame();

        ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
        Gui::window(
          "cfs-scheduler",
          Gui::WindowFlags::NoDecoration | Gui::WindowFlags::NoResize | Gui::WindowFlags::NoMove,
          [this] {
              draw_save_button();

              ImGui::SameLine();

              draw_control_buttons();

              ImGui::SameLine();

              draw_arrival_policy_picker();

              const std::array<Gui::IndexGridCallback, 6> drawables = {
                  [&](const auto& size) { draw_run_queue(*sim, size); },
                  [&](const auto& size) { draw_running_process(size); },
                  [&](const auto& size) { draw_pending_arrivals(*sim, size); },
                  [&](const auto& size) { draw_graphs(size); },
                  [&](const auto& size) { draw_policy_comparison(size); },
                  [&](const auto& size) { draw_statistics(size); },
              };

              const auto available_space = ImGui::GetContentRegionAvail();
              Gui::grid(2UL, 3UL, 6UL, available_space, [&](const auto& child_size, const auto& idx) {
                  drawables[idx](child_size);
              });
          }
        );

        Gui::draw_call(window, BACKGROUND_COLOR);
    }
}

void Application::step()
{
    if (sim->complete()) {
        should_finish = false;
        return;
    }

    sim->step();
    record_samples();
}

void Application::restart()
{
    sim->restart();
    should_finish = false;

    vruntime_spread_buffer.clear();
    max_vruntime_spread = 0;
    average_waiting_time_buffer.clear();
    max_waiting_time = 0;
    cpu_utilization_buffer.clear();
    throughput_buffer.clear();
    max_throughput = 0;
}

void Application::record_samples()
{
    const auto timer  = static_cast<float>(sim->timer());
    const auto report = sim->report();

    const auto spread   = vruntime_spread(sim->run_queue());
    max_vruntime_spread = std::max(max_vruntime_spread, spread);
    vruntime_spread_buffer.emplace_point(timer, static_cast<float>(spread));

    const auto waiting = report.average_waiting_time();
    max_waiting_time   = std::max(max_waiting_time, waiting);
    average_waiting_time_buffer.emplace_point(timer, static_cast<float>(waiting));

    cpu_utilization_buffer.emplace_point(timer, static_cast<float>(report.cpu_utilization() * 100));

    const auto throughput = report.throughput();
    max_throughput        = std::max(max_throughput, throughput);
    throughput_buffer.emplace_point(timer, static_cast<float>(throughput));
}

void Application::compute_policy_comparison()
{
    baseline_reports.clear();
    policy_names.clear();
    policy_waiting_times.clear();

    const auto quantum = sim->configuration().target_latency;
    for (const auto policy : Simulations::BASELINE_POLICIES) {
        baseline_reports.push_back(Simulations::simulate_baseline(policy, sim->descriptors(), quantum));
    }

    const auto workload = Simulations::Workload {
        .config    = sim->configuration(),
        .processes = sim->descriptors() | std::ranges::to<std::vector>(),
    };

    if (auto fair = Simulations::Scheduler::create(workload); fair.has_value()) {
        fair->run_to_completion();
        const auto report = fair->report();
        policy_names.push_back(report.name);
        policy_waiting_times.push_back(report.average_waiting_time());
    }

    for (const auto& report : baseline_reports) {
        policy_names.push_back(report.name);
        policy_waiting_times.push_back(report.average_waiting_time());
    }
}

void Application::draw_save_button()
{
    if (show_save_path) {
        const auto input = Gui::input_text_popup("Enter file path: ", show_save_path);
        if (input.has_value()) {
            const auto file_path = std::string(Util::trim(*input));
            if (file_path.empty()) {
                Gui::toast("Failed to save metrics: empty path", std::chrono::seconds(3), Gui::ToastLevel::Error);
                return;
            }

            const auto content = Simulations::metrics_file_content(*sim, baseline_reports);
            if (Util::write_to_file(file_path, content)) {
                const auto message = std::format("Saved metrics to {}", file_path);
                Gui::toast(message, std::chrono::seconds(2), Gui::ToastLevel::Info);
            } else {
                const auto message = std::format("Failed to save metrics to {}", file_path);
                Gui::toast(message, std::chrono::seconds(3), Gui::ToastLevel::Error);
            }
        }
    }

    if (sim->complete() && ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_S, false)) { show_save_path = true; }

    Gui::enabled_if(sim->complete(), [&] {
        Gui::image_button("##Save", save_texture, BUTTON_SIZE, "[Ctrl+S]ave Metrics", [&] { show_save_path = true; });
    });
}

void Application::draw_control_buttons()
{
    constexpr static auto BUTTONS_COUNT = 3;
    Gui::center_content_horizontally(BUTTON_SIZE.x * BUTTONS_COUNT);

    Gui::image_button("##Restart", restart_texture, BUTTON_SIZE, "[Ctrl+R]estart", [this] { restart(); });
    if (ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_R, false)) { restart(); }

    ImGui::SameLine();

    Gui::enabled_if(!sim->complete(), [&] {
        Gui::image_button("##Play", play_texture, BUTTON_SIZE, "[Enter] Play", [this] {
            should_finish = !should_finish;
        });
    });

    ImGui::SameLine();

    Gui::enabled_if(!sim->complete(), [&] {
        Gui::image_button("##Next", next_texture, BUTTON_SIZE, "[Space] Next", [this] { step(); });
    });
}

void Application::draw_arrival_policy_picker()
{
    static_assert(
      std::to_underlying(Simulations::ArrivalPolicy::Count) == 2,
      "[ERROR] Exhaustive handling of all enum variants for ArrivalPolicy is required"
    );

    constexpr static auto ITEMS = std::array<Simulations::ArrivalPolicy, 2> {
        Simulations::ArrivalPolicy::MinVruntime,
        Simulations::ArrivalPolicy::Zero,
    };

    Gui::combo(
      "##ArrivalPolicyPicker",
      std::span<const Simulations::ArrivalPolicy>(ITEMS),
      sim->configuration().arrival_policy,
      [&](const auto selected) {
          auto config           = sim->configuration();
          config.arrival_policy = selected;
          if (!sim->reconfigure(config)) {
              Gui::toast("Could not switch arrival policy", std::chrono::seconds(3), Gui::ToastLevel::Error);
              return;
          }

          restart();
          compute_policy_comparison();
      }
    );
}

void Application::draw_running_process(const ImVec2& child_size) const
{
    Gui::title(std::format("CPU ({})", sim->state()), child_size, [&](const auto&) {
        const auto running = sim->current();
        if (running == nullptr) {
            Gui::text("No process has been selected yet");
            return;
        }

        Gui::collapsing(std::format("{} #{}", running->name, running->pid), Gui::TreeNodeFlags::DefaultOpen, [&] {
            Gui::text("Nice: {} (weight {})", running->nice, running->weight);
            Gui::text("Arrival: {}", running->arrival);
            Gui::text("Remaining: {} of {}", running->remaining_burst, running->burst);
            Gui::text("Vruntime: {:.3f}", Os::vruntime_as_ticks(running->vruntime));
            Gui::text("Turns: {}", running->turns);
        });

        if (const auto event = sim->event_log().back(); event.has_value()) {
            ImGui::Separator();
            Gui::bold_text("Last decision");
            Gui::text("{}", *event);
        }
    });
}

void Application::draw_graphs(const ImVec2& child_size)
{
    const std::array<Gui::IndexGridCallback, 4> callbacks = {
        [&](const auto& elem_size) { draw_vruntime_spread_graph(elem_size); },
        [&](const auto& elem_size) { draw_average_waiting_time_graph(elem_size); },
        [&](const auto& elem_size) { draw_cpu_utilization_graph(elem_size); },
        [&](const auto& elem_size) { draw_throughput_graph(elem_size); },
    };

    Gui::grid(2UL, 2UL, 4UL, child_size, [&](const auto& elem_size, const auto& idx) { callbacks[idx](elem_size); });
}

[[nodiscard]] static auto scrolling_plot_opts(const Simulations::Scheduler& sim, const double history)
  -> Gui::Plotting::PlotOpts
{
    const auto timer = static_cast<double>(sim.timer());
    return Gui::Plotting::PlotOpts {
        .x_axis_flags = Gui::Plotting::AxisFlags::NoTickLabels | Gui::Plotting::AxisFlags::NoTickMarks,
        .y_axis_flags = Gui::Plotting::AxisFlags::None,
        .x_min        = std::max(0.0, timer - history),
        .x_max        = std::max(1.0, timer),
        .y_min        = 0,
        .scrollable   = sim.complete(),
    };
}

void Application::draw_vruntime_spread_graph(const ImVec2& child_size)
{
    auto plot_opts        = scrolling_plot_opts(*sim, PLOT_HISTORY);
    plot_opts.y_max       = max_vruntime_spread + 1;
    plot_opts.color       = ImPlot::GetColormapColor(1);
    plot_opts.line_weight = LINE_WEIGHT;

    Gui::title("Vruntime spread", child_size, [&](const auto& remaining_size) {
        Gui::Plotting::plot("##VruntimeSpreadPlot", remaining_size, plot_opts, [&] {
            Gui::Plotting::line("max - min vruntime", vruntime_spread_buffer);
        });
    });
}

void Application::draw_average_waiting_time_graph(const ImVec2& child_size)
{
    auto plot_opts        = scrolling_plot_opts(*sim, PLOT_HISTORY);
    plot_opts.y_max       = max_waiting_time + 5;
    plot_opts.color       = ImPlot::GetColormapColor(7);
    plot_opts.line_weight = LINE_WEIGHT;

    Gui::title("Waiting time", child_size, [&](const auto& remaining_size) {
        Gui::Plotting::plot("##WaitingTimePlot", remaining_size, plot_opts, [&] {
            Gui::Plotting::line("avg waiting time", average_waiting_time_buffer);
        });
    });
}

void Application::draw_cpu_utilization_graph(const ImVec2& child_size)
{
    auto plot_opts        = scrolling_plot_opts(*sim, PLOT_HISTORY);
    plot_opts.y_max       = 100;
    plot_opts.color       = ImPlot::GetColormapColor(2);
    plot_opts.line_weight = LINE_WEIGHT;

    Gui::title("Cpu utilization", child_size, [&](const auto& remaining_size) {
        Gui::Plotting::plot("##CpuUtilizationPlot", remaining_size, plot_opts, [&] {
            Gui::Plotting::line("cpu %", cpu_utilization_buffer);
        });
    });
}

void Application::draw_throughput_graph(const ImVec2& child_size)
{
    auto plot_opts        = scrolling_plot_opts(*sim, PLOT_HISTORY);
    plot_opts.y_max       = std::max(max_throughput * 1.2, 0.1);
    plot_opts.color       = ImPlot::GetColormapColor(3);
    plot_opts.line_weight = LINE_WEIGHT;

    Gui::title("Throughput", child_size, [&](const auto& remaining_size) {
        Gui::Plotting::plot("##ThroughputPlot", remaining_size, plot_opts, [&] {
            Gui::Plotting::line("processes / tick", throughput_buffer);
        });
    });
}

void Application::draw_policy_comparison(const ImVec2& child_size) const
{
    const auto highest = policy_waiting_times.empty() ? 1.0 : std::ranges::max(policy_waiting_times);

    const auto plot_opts = Gui::Plotting::PlotOpts {
        .x_axis_flags = Gui::Plotting::AxisFlags::NoTickLabels,
        .y_axis_flags = Gui::Plotting::AxisFlags::None,
        .x_min        = -0.5,
        .x_max        = static_cast<double>(policy_names.size()) - 0.5,
        .y_min        = 0,
        .y_max        = highest * 1.2 + 1,
        .y_label      = "avg waiting time",
        .scrollable   = false,
    };

    const auto title = std::format("Policies (quantum {})", sim->configuration().target_latency);
    Gui::title(title, child_size, [&](const auto& size) {
        Gui::Plotting::plot("##PolicyComparisonPlot", size, plot_opts, [&] {
            Gui::Plotting::bars(policy_names, policy_waiting_times);
        });
    });
}

void Application::draw_statistics(const ImVec2& child_size) const
{
    const auto draw_key_value = [](const std::string_view key, const auto& value) {
        Gui::draw_table_row(
          [&] { Gui::text("{}", key); },
          [&] {
              using Type = std::decay_t<decltype(value)>;
              if constexpr (std::is_same_v<Type, double>) {
                  Gui::text("{:.3f}", value);
              } else {
                  Gui::text("{}", value);
              }
          }
        );
    };

    constexpr static auto HEADERS = std::array<const char*, 2> { "Key", "Value" };

    Gui::title("Stats", child_size, [&](const auto&) {
        Gui::draw_table("##ConfigTable", HEADERS, TABLE_FLAGS, [&] {
            draw_key_value("Timer", sim->timer());
            draw_key_value("Decisions", sim->decisions());
            draw_key_value("Target latency", sim->configuration().target_latency);
            draw_key_value("Min granularity", sim->configuration().min_granularity);
            draw_key_value("Arrival policy", std::format("{}", sim->configuration().arrival_policy));
        });

        ImGui::Separator();

        Gui::draw_table("##QueuesTable", HEADERS, TABLE_FLAGS, [&] {
            const auto min_vruntime = sim->run_queue().min_vruntime();

            draw_key_value("Runnable", sim->run_queue().size());
            draw_key_value("Queue weight", sim->run_queue().total_weight());
            draw_key_value("Min vruntime", min_vruntime ? Os::vruntime_as_ticks(*min_vruntime) : 0.0);
            draw_key_value("Pending arrivals", std::ranges::distance(sim->pending_arrivals()));
            draw_key_value("Finished", sim->finished().size());
        });

        ImGui::Separator();

        const auto report = sim->report();
        Gui::draw_table("##MetricsTable", HEADERS, TABLE_FLAGS, [&] {
            draw_key_value("Avg. waiting time", report.average_waiting_time());
            draw_key_value("Max. waiting time", max_waiting_time);
            draw_key_value("Stddev. waiting time", report.waiting_time_stddev());
            draw_key_value("Avg. turnaround time", report.average_turnaround_time());
            draw_key_value("Throughput", report.throughput());
            draw_key_value("Cpu utilization", report.cpu_utilization() * 100);
            draw_key_value("Idle time", sim->idle_time());
        });
    });
}

Application::Application(GLFWwindow* window, const std::shared_ptr<Simulations::Scheduler>& sim)
  : window { window },
    sim { sim },
    restart_texture { Gui::Texture::load_from_file("resources/restart.png") },
    play_texture { Gui::Texture::load_from_file("resources/play.png") },
    next_texture { Gui::Texture::load_from_file("resources/next.png") },
    save_texture { Gui::Texture::load_from_file("resources/save.png") }
{
    compute_policy_comparison();
}

Application::~Application()
{
    Gui::shutdown(window);
    ImPlot::DestroyContext();
}
