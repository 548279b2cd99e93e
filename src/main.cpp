#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#define GL_SILENCE_DEPRECATION
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#include <GLFW/glfw3.h>
#include <curl/curl.h>
#include <nfd.h>

#include "adapters/app_settings.h"
#include "app/app_shell.h"
#include "core/config_paths.h"
#include "core/logging.h"
#include "core/version.h"
#include "ui/theme.h"

static void glfw_error_callback(int error, const char* description) {
    occm::ui_log(spdlog::level::err, "GLFW error {}: {}", error, description);
}

static GLFWwindow* g_main_window = nullptr;
namespace fs = std::filesystem;

// resources/fonts next to the working directory or the executable, then
// common system fonts.
static std::vector<fs::path> font_candidates(const char* argv0) {
    std::vector<fs::path> dirs;

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
        dirs.push_back(cwd / "resources" / "fonts");
    }
    if (argv0 && argv0[0] != '\0') {
        fs::path exe_path = fs::path(argv0);
        if (exe_path.is_relative() && !cwd.empty()) {
            exe_path = cwd / exe_path;
        }
        const fs::path exe_dir = exe_path.parent_path();
        if (!exe_dir.empty()) {
            dirs.push_back(exe_dir / "resources" / "fonts");
            dirs.push_back(exe_dir.parent_path() / "share" / "occm" / "fonts");
        }
    }

    std::vector<fs::path> fonts;
    for (const auto& dir : dirs) {
        for (const char* name : {"Inter-Regular.ttf", "NotoSans-Regular.ttf", "DejaVuSans.ttf"}) {
            fonts.push_back(dir / name);
        }
    }
#if defined(__APPLE__)
    fonts.push_back("/System/Library/Fonts/SFNS.ttf");
    fonts.push_back("/System/Library/Fonts/Supplemental/Arial.ttf");
#elif defined(_WIN32)
    fonts.push_back("C:\\Windows\\Fonts\\segoeui.ttf");
#else
    fonts.push_back("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
    fonts.push_back("/usr/share/fonts/TTF/DejaVuSans.ttf");
    fonts.push_back("/usr/share/fonts/noto/NotoSans-Regular.ttf");
#endif
    return fonts;
}

static void load_fonts(ImGuiIO& io, const char* argv0) {
    const float font_size = 16.0f;
    ImFontConfig font_config;
    font_config.OversampleH = 2;
    font_config.OversampleV = 1;

    for (const auto& candidate : font_candidates(argv0)) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) continue;
        if (io.Fonts->AddFontFromFileTTF(candidate.string().c_str(), font_size, &font_config)) {
            occm::ui_log(spdlog::level::debug, "Using font {}", candidate.string());
            return;
        }
    }
    io.Fonts->AddFontDefault();
}

extern "C" void occm_request_exit() {
    if (g_main_window) {
        glfwSetWindowShouldClose(g_main_window, GLFW_TRUE);
    }
}

int main(int argc, char** argv) {
    (void)argc;

    occm::ConfigPaths paths;
    const occm::AppSettings settings = occm::AppSettingsStore(paths.app_settings_file()).load();

    try {
        occm::Logger::setup_loggers(paths.log_dir().string(), occm::Logger::parse_level(settings.log_level));
    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Logging disabled: %s\n", ex.what());
    }
    occm::ui_log(spdlog::level::info, "OCCM {} starting", occm::kAppVersion);

    curl_global_init(CURL_GLOBAL_DEFAULT);

    if (NFD_Init() != NFD_OKAY) {
        occm::ui_log(spdlog::level::warn, "File dialogs unavailable: {}", NFD_GetError());
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) {
        occm::ui_log(spdlog::level::critical, "Failed to initialize GLFW");
        curl_global_cleanup();
        return 1;
    }

#if defined(__APPLE__)
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#else
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#endif

    GLFWwindow* window = glfwCreateWindow(1440, 900, "OCCM - OpenCode Config Manager", nullptr, nullptr);
    if (!window) {
        occm::ui_log(spdlog::level::critical, "Failed to create GLFW window");
        glfwTerminate();
        curl_global_cleanup();
        return 1;
    }
    g_main_window = window;

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
    io.IniSavingRate = 1.0f;

    static std::string ini_path;
    {
        std::error_code ec;
        fs::create_directories(paths.app_dir(), ec);
        if (!ec) {
            ini_path = (paths.app_dir() / "imgui.ini").string();
            io.IniFilename = ini_path.c_str();
        }
    }

    ImGui::StyleColorsDark();
    occm::set_theme_mode(occm::theme_mode_from_string(settings.theme_mode));
    occm::update_system_theme();

    load_fonts(io, argv ? argv[0] : "");

    const char* glsl_version = "#version 150";
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(glsl_version);

    {
        occm::AppShell app_shell;
        app_shell.init(paths, settings);

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            occm::update_system_theme();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            app_shell.render();

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            const ImVec4 clear = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
            glClearColor(clear.x, clear.y, clear.z, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }

        app_shell.shutdown();
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    g_main_window = nullptr;
    glfwTerminate();

    NFD_Quit();
    curl_global_cleanup();
    spdlog::shutdown();

    return 0;
}
