#include "Gui.hpp"

#include <array>
#include <ranges>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

static void glfw_error_callback(int error, const char* description)
{
    std::println(stderr, "[ERROR] (GLFW) Error ({}): {}", error, description);
}

namespace Gui
{

auto init_window(const std::string& title, const int width, const int height) -> std::optional<GLFWwindow*>
{
    glfwSetErrorCallback(glfw_error_callback);

    if (glfwInit() == 0) {
        std::println(stderr, "[ERROR] (GLFW) Failed to initialize");
        return std::nullopt;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (window == nullptr) {
        std::println(stderr, "[ERROR] (GLFW) Failed to create window");
        glfwTerminate();
        return std::nullopt;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(GLSL_VERSION);

    return window;
}

void shutdown(GLFWwindow* window)
{
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
}

void new_frame()
{
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void load_default_fonts(const float regular_size, const float bold_size)
{
    constexpr static auto REGULAR_FONT_PATH = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
    constexpr static auto BOLD_FONT_PATH    = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";

    auto& io = ImGui::GetIO();
    if (!std::filesystem::exists(REGULAR_FONT_PATH) || !std::filesystem::exists(BOLD_FONT_PATH)) {
        std::println(stderr, "[NOTE] (ImGui) DejaVu fonts not found, falling back to the default font");
        regular_font = io.Fonts->AddFontDefault();
        bold_font    = regular_font;
        return;
    }

    io.Fonts->Clear();

    regular_font   = io.Fonts->AddFontFromFileTTF(REGULAR_FONT_PATH, regular_size);
    io.FontDefault = regular_font;

    bold_font = io.Fonts->AddFontFromFileTTF(BOLD_FONT_PATH, bold_size);
}

void black_and_red_style()
{
    constexpr static auto BLACK      = hex_colour_to_imvec4(0x181818);
    constexpr static auto DARK_GREY  = hex_colour_to_imvec4(0x242424);
    constexpr static auto GREY       = hex_colour_to_imvec4(0x3A3A3A);
    constexpr static auto RED        = hex_colour_to_imvec4(0xB3261E);
    constexpr static auto LIGHT_RED  = hex_colour_to_imvec4(0xD9483B);
    constexpr static auto WHITE      = hex_colour_to_imvec4(0xE6E6E6);
    constexpr static auto DIMMED_RED = hex_colour_to_imvec4(0xB3261E, 0.6F);

    auto& style            = ImGui::GetStyle();
    style.WindowRounding   = 0.0F;
    style.ChildRounding    = 4.0F;
    style.FrameRounding    = 4.0F;
    style.GrabRounding     = 4.0F;
    style.WindowBorderSize = 0.0F;

    auto& colors                      = style.Colors;
    colors[ImGuiCol_Text]             = WHITE;
    colors[ImGuiCol_WindowBg]         = BLACK;
    colors[ImGuiCol_ChildBg]          = BLACK;
    colors[ImGuiCol_PopupBg]          = DARK_GREY;
    colors[ImGuiCol_Border]           = GREY;
    colors[ImGuiCol_FrameBg]          = DARK_GREY;
    colors[ImGuiCol_FrameBgHovered]   = GREY;
    colors[ImGuiCol_FrameBgActive]    = GREY;
    colors[ImGuiCol_TitleBg]          = DARK_GREY;
    colors[ImGuiCol_TitleBgActive]    = RED;
    colors[ImGuiCol_Button]           = DIMMED_RED;
    colors[ImGuiCol_ButtonHovered]    = LIGHT_RED;
    colors[ImGuiCol_ButtonActive]     = RED;
    colors[ImGuiCol_Header]           = DIMMED_RED;
    colors[ImGuiCol_HeaderHovered]    = LIGHT_RED;
    colors[ImGuiCol_HeaderActive]     = RED;
    colors[ImGuiCol_TableHeaderBg]    = DARK_GREY;
    colors[ImGuiCol_TableRowBgAlt]    = DARK_GREY;
    colors[ImGuiCol_CheckMark]        = LIGHT_RED;
    colors[ImGuiCol_SliderGrab]       = RED;
    colors[ImGuiCol_SliderGrabActive] = LIGHT_RED;
}

void center_content_horizontally(const float content_width)
{
    const auto spacing         = ImGui::GetStyle().ItemSpacing.x;
    const auto total_width     = content_width + spacing;
    const auto available_width = ImGui::GetContentRegionAvail().x;
    ImGui::SetCursorPosX((available_width - total_width) * 0.5F);
}

auto grid_layout_calc_size(const std::size_t rows, const std::size_t cols, const ImVec2& available_space) -> ImVec2
{
    const auto spacing = ImGui::GetStyle().ItemSpacing;

    return {
        (available_space.x - (spacing.x * static_cast<float>(cols - 1))) / static_cast<float>(cols),
        (available_space.y - (spacing.y * static_cast<float>(rows - 1))) / static_cast<float>(rows),
    };
}

auto Texture::load_from_file(const std::filesystem::path& path) -> Texture
{
    int           width    = -1;
    int           height   = -1;
    int           channels = -1;
    std::uint8_t* bytes    = stbi_load(path.string().c_str(), &width, &height, &channels, 4);
    if (bytes == nullptr) {
        std::println(stderr, "[ERROR] (stb) Failed to load file: {}", path.string());
        return Texture(std::nullopt);
    }

    GLuint texture_id = 0;
    glGenTextures(1, &texture_id);
    glBindTexture(GL_TEXTURE_2D, texture_id);

    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, bytes);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);

    stbi_image_free(bytes);

    return Texture(texture_id);
}

void ToastManager::render()
{
    constexpr static auto TOAST_HEIGHT = 30.0F;
    constexpr static auto window_flags = WindowFlags::NoDecoration | WindowFlags::NoSavedSettings;

    const auto delta_time    = std::chrono::duration<float>(ImGui::GetIO().DeltaTime);
    const auto spacing       = ImGui::GetStyle().ItemSpacing;
    const auto work_position = ImGui::GetMainViewport()->WorkPos;
    const auto work_size     = ImGui::GetMainViewport()->WorkSize;

    float y_offset = 0.0F;
    for (auto it = toasts.begin(); it != toasts.end();) {
        auto& toast = *it;

        toast.duration -= delta_time;
        if (toast.duration <= std::chrono::seconds(0)) {
            it = toasts.erase(it);
            continue;
        }

        const auto toast_size = ImVec2(ImGui::CalcTextSize(toast.message.c_str()).x + (spacing.x * 2), TOAST_HEIGHT);
        const auto position   = ImVec2(
          work_position.x + work_size.x - toast_size.x - spacing.x,
          work_position.y + work_size.y - toast_size.y - spacing.y - y_offset
        );

        ImGui::SetNextWindowPos(position);
        ImGui::SetNextWindowSize(toast_size);
        Gui::window(std::format("##Toast{}", y_offset), window_flags, [&] {
            ImGui::PushStyleColor(ImGuiCol_Text, toast_level_to_color(toast.level));
            Gui::text("{}", toast.message);
            ImGui::PopStyleColor();
        });

        y_offset += toast_size.y + spacing.y;
        ++it;
    }
}

auto ToastManager::toast_level_to_color(ToastLevel level) -> ImVec4
{
    switch (level) {
        case ToastLevel::Info: {
            return { 0.2F, 0.6F, 1.0F, 1.0F };
        }
        case ToastLevel::Warning: {
            return { 1.0F, 0.6F, 0.0F, 1.0F };
        }
        case ToastLevel::Error: {
            return { 1.0F, 0.2F, 0.2F, 1.0F };
        }
    }

    assert(false && "unreachable");
    return { 1.0F, 0.2F, 0.2F, 1.0F };
}

void toast(const std::string& message, const std::chrono::duration<float> duration, ToastLevel level)
{
    ToastManager::add(Toast {
      .message  = message,
      .duration = duration,
      .level    = level,
    });
}

auto input_text_popup(const std::string& label, bool& condition) -> std::optional<std::string>
{
    static std::array<char, 256> buffer {};

    auto center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5F, 0.5F));
    ImGui::SetNextWindowSize(ImVec2(300, 120), ImGuiCond_Appearing);

    ImGui::OpenPopup("##InputPopup");
    if (ImGui::BeginPopupModal("##InputPopup", &condition, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::SetKeyboardFocusHere();

        if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            condition = false;
            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return std::nullopt;
        }

        Gui::bold_text("{}", label);
        ImGui::SameLine();

        if (ImGui::InputText("##InputText", buffer.data(), buffer.size(), ImGuiInputTextFlags_EnterReturnsTrue)) {
            auto result = std::string(buffer.data());
            buffer.fill('\0');
            condition = false;

            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return result;
        }

        ImGui::EndPopup();
    }

    return std::nullopt;
}

namespace Plotting
{

void line(const std::string& label, const RingBuffer& buffer)
{
    if (buffer.empty()) { return; }

    ImPlot::PlotLine(
      label.c_str(), &buffer[0].x, &buffer[0].y, buffer.size(), 0, buffer.offset(), 2 * sizeof(float)
    );
}

void bars(const std::span<const std::string> labels, const std::span<const double> values)
{
    constexpr static auto BAR_WIDTH = 0.5F;

    std::vector<const char*> labels_cstr;
    for (const auto& label : labels) { labels_cstr.push_back(label.c_str()); }

    std::vector<double> positions {};
    positions.reserve(labels.size());
    for (std::size_t pos = 0; pos < labels.size(); ++pos) { positions.push_back(static_cast<double>(pos)); }

    ImPlot::SetupAxisTicks(ImAxis_X1, positions.data(), static_cast<int>(positions.size()), nullptr);

    const auto point = std::views::zip(positions, values);
    for (const auto& [idx, coords] : std::views::zip(std::views::iota(0UL), point)) {
        const auto& [x, y] = coords;
        ImPlot::PushStyleColor(
          ImPlotCol_Fill, ImPlot::GetColormapColor(static_cast<int>(idx) % ImPlot::GetColormapSize())
        );
        ImPlot::PlotBars(labels_cstr[idx], &x, &y, 1, BAR_WIDTH);
        ImPlot::PopStyleColor();
    }

    // Check for hover and display tooltip to show value
    ImPlotPoint mouse_position = ImPlot::GetPlotMousePos();
    for (const auto& [idx, position] : std::views::zip(std::views::iota(0UL), positions)) {
        const auto half_width = BAR_WIDTH / 2.0;
        const auto x_range    = ImPlotRange(position - half_width, position + half_width);
        const auto y_range    = ImPlotRange(0, values[idx]);

        if (x_range.Contains(mouse_position.x) && y_range.Contains(mouse_position.y)) {
            if (ImPlot::IsPlotHovered()) { Gui::tooltip("{}: {:.2f}", labels[idx], values[idx]); }
        }
    }
}

} // namespace Plotting

void draw_call(GLFWwindow* window, const ImVec4& clear_color)
{
    ToastManager::render();
    ImGui::Render();
    int display_w = 0;
    int display_h = 0;
    glfwGetFramebufferSize(window, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    glClearColor(
      clear_color.x * clear_color.w, clear_color.y * clear_color.w, clear_color.z * clear_color.w, clear_color.w
    );
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
}

} // namespace Gui
