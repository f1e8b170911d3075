#pragma once

#include <memory>
#include <string>
#include <vector>

#include <imgui.h>

#include "gui/Gui.hpp"
#include "simulations/Scheduler.hpp"
#include "simulations/Statistics.hpp"

class [[nodiscard]] Application final
{
  public:
    [[nodiscard]] static auto create(const std::shared_ptr<Simulations::Scheduler>& sim)
      -> std::unique_ptr<Application>;

    void render();

    void draw_save_button();
    void draw_control_buttons();
    void draw_arrival_policy_picker();

    void draw_running_process(const ImVec2& child_size) const;
    void draw_graphs(const ImVec2& child_size);
    void draw_vruntime_spread_graph(const ImVec2& child_size);
    void draw_average_waiting_time_graph(const ImVec2& child_size);
    void draw_cpu_utilization_graph(const ImVec2& child_size);
    void draw_throughput_graph(const ImVec2& child_size);
    void draw_policy_comparison(const ImVec2& child_size) const;
    void draw_statistics(const ImVec2& child_size) const;

    ~Application();
    Application(const Application&)            = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&)                 = delete;
    Application& operator=(Application&&)      = delete;

  private:
    explicit Application(GLFWwindow* window, const std::shared_ptr<Simulations::Scheduler>& sim);

    void step();
    void restart();
    void record_samples();
    void compute_policy_comparison();

  private:
    constexpr static auto WINDOW_WIDTH     = 1920;
    constexpr static auto WINDOW_HEIGHT    = 1080;
    constexpr static auto BACKGROUND_COLOR = Gui::hex_colour_to_imvec4(0x181818);
    constexpr static auto BUTTON_SIZE      = ImVec2(16, 16);
    constexpr static auto PLOT_HISTORY     = 200.0;
    constexpr static auto LINE_WEIGHT      = 2.5F;

  private:
    GLFWwindow*                             window = nullptr;
    bool                                    quit   = false;
    std::shared_ptr<Simulations::Scheduler> sim;
    bool                                    should_finish  = false;
    bool                                    show_save_path = false;
    Gui::Texture                            restart_texture;
    Gui::Texture                            play_texture;
    Gui::Texture                            next_texture;
    Gui::Texture                            save_texture;
    Gui::Plotting::RingBuffer               vruntime_spread_buffer;
    double                                  max_vruntime_spread = 0;
    Gui::Plotting::RingBuffer               average_waiting_time_buffer;
    double                                  max_waiting_time = 0;
    Gui::Plotting::RingBuffer               cpu_utilization_buffer;
    Gui::Plotting::RingBuffer               throughput_buffer;
    double                                  max_throughput = 0;
    std::vector<Simulations::PolicyReport>  baseline_reports;
    std::vector<std::string>                policy_names;
    std::vector<double>                     policy_waiting_times;
};
