// main_vis.cpp
// - Orchestrator (stdin -> verdicts) runs on a worker thread and owns the lattice.
// - This thread owns the window: GLFW requires window/event calls on the main thread.
// - The window only reads EntropyProbe samples; closing it never affects verdicts.
// - When stdin ends, the probe's finished flag closes the window and the process exits.

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <iostream>
#include <thread>

#include "CommandLine.h"
#include "EntropyProbe.h"
#include "Governor.h"

// Display-independent ring model (no UI dependencies)
#include "ring_indicator.h"

#include "imgui.h"
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

struct VisualUIState {
    bool show_hud = true;
    bool show_plot = true;
};

// 0x00RRGGBB -> RGBA bytes for glDrawPixels.
static void pack_rgba(const std::vector<std::uint32_t>& rgb, std::vector<std::uint8_t>& rgba) {
    rgba.resize(rgb.size() * 4);
    for (std::size_t i = 0; i < rgb.size(); ++i) {
        const std::uint32_t c = rgb[i];
        rgba[i * 4 + 0] = (std::uint8_t)((c >> 16) & 0xFFu);
        rgba[i * 4 + 1] = (std::uint8_t)((c >> 8) & 0xFFu);
        rgba[i * 4 + 2] = (std::uint8_t)(c & 0xFFu);
        rgba[i * 4 + 3] = 0xFFu;
    }
}

static int run_presentation(const onix::EntropyProbe& probe, const onix::AppConfig& app) {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

    GLFWwindow* window = glfwCreateWindow(app.window_px, app.window_px,
                                          "ONIX GOVERNOR v2.0 \xE2\x80\x94 UNIVERSAL", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    // Validate OpenGL context exists.
    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    VisualUIState ui;

    onix::world::RingIndicator ring;
    std::vector<std::uint32_t> ring_rgb;
    std::vector<std::uint8_t> ring_rgba;

    const double threshold = app.governor.threshold;

    // History buffers (publication sequence vs entropy)
    std::vector<double> seq_hist, entropy_hist;
    seq_hist.reserve(20000);
    entropy_hist.reserve(20000);

    constexpr size_t kMaxHistory = 200000;
    constexpr size_t kTrimChunk  = 10000;
    constexpr int kPlotWindowN   = 2000;

    auto trim_history_if_needed = [&]() {
        if (seq_hist.size() <= kMaxHistory) return;
        const size_t drop = std::min(kTrimChunk, seq_hist.size());
        seq_hist.erase(seq_hist.begin(), seq_hist.begin() + static_cast<std::ptrdiff_t>(drop));
        entropy_hist.erase(entropy_hist.begin(), entropy_hist.begin() + static_cast<std::ptrdiff_t>(drop));
    };

    std::uint64_t last_seq = 0;
    std::uint64_t nonfinite_samples = 0;

    const double frame_s = 1.0 / app.fps_limit;
    double next_frame_t = glfwGetTime();

    while (!glfwWindowShouldClose(window) && !probe.finished()) {
        glfwPollEvents();
        if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS) {
            glfwSetWindowShouldClose(window, GLFW_TRUE);
        }

        // --- cadence limit; a slow frame simply skips samples ---
        const double now = glfwGetTime();
        if (now < next_frame_t) {
            std::this_thread::sleep_for(std::chrono::duration<double>(next_frame_t - now));
        }
        next_frame_t = std::max(next_frame_t + frame_s, glfwGetTime());

        const onix::EntropySample s = probe.sample();
        ring.recompute(s.entropy);
        ring.rasterize(ring_rgb);
        pack_rgba(ring_rgb, ring_rgba);

        if (s.sequence != last_seq) {
            last_seq = s.sequence;
            if (std::isfinite(s.entropy)) {
                seq_hist.push_back((double)s.sequence);
                entropy_hist.push_back(s.entropy);
                trim_history_if_needed();
            } else {
                ++nonfinite_samples;
            }
        }

        // --- ImGui frame ---
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        const ImVec4 status_ok   = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_fail = ImVec4(1.0f, 0.2f, 0.2f, 1.0f);
        const ImVec4 status_warn = ImVec4(1.0f, 1.0f, 0.0f, 1.0f);

        if (ui.show_hud) {
            ImGuiWindowFlags hud_flags =
                ImGuiWindowFlags_NoDecoration |
                ImGuiWindowFlags_AlwaysAutoResize |
                ImGuiWindowFlags_NoSavedSettings |
                ImGuiWindowFlags_NoFocusOnAppearing |
                ImGuiWindowFlags_NoNav;

            ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_Always);
            ImGui::SetNextWindowBgAlpha(0.65f);

            if (ImGui::Begin("##Governor", &ui.show_hud, hud_flags)) {
                const bool finite = std::isfinite(s.entropy);
                const bool over = onix::Governor::classify(s.entropy, threshold,
                                                          app.governor.block_nonfinite) == onix::Verdict::Blocked;
                const ImVec4 col = !finite ? status_warn : (over ? status_fail : status_ok);

                ImGui::TextColored(col, "ENTROPY %s", onix::formatEntropy(s.entropy, 3).c_str());
                ImGui::Text("threshold %.3f", threshold);
                ImGui::TextColored(status_ok, "VERIFIED %llu", (unsigned long long)s.lines_verified);
                ImGui::SameLine(140);
                ImGui::TextColored(status_fail, "BLOCKED %llu", (unsigned long long)s.lines_blocked);
                ImGui::Text("samples %llu  non-finite %llu",
                            (unsigned long long)s.sequence, (unsigned long long)nonfinite_samples);
                ImGui::Checkbox("plot", &ui.show_plot);
            }
            ImGui::End();
        }

        if (ui.show_plot && seq_hist.size() > 1) {
            ImGui::SetNextWindowPos(ImVec2(10, (float)app.window_px - 190.0f), ImGuiCond_FirstUseEver);
            ImGui::SetNextWindowSize(ImVec2((float)app.window_px - 20.0f, 180.0f), ImGuiCond_FirstUseEver);
            if (ImGui::Begin("Entropy", &ui.show_plot)) {
                const int n = (int)seq_hist.size();
                const int count = std::min(n, kPlotWindowN);
                const int start = n - count;
                const double x0 = seq_hist[(size_t)start];
                const double x1 = seq_hist.back();
                const double thr_x[2] = {x0, x1};
                const double thr_y[2] = {threshold, threshold};

                if (ImPlot::BeginPlot("##entropy_hist", ImVec2(-1, -1))) {
                    ImPlot::SetupAxisLimits(ImAxis_X1, x0, x1, ImGuiCond_Always);
                    ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, 1.0, ImGuiCond_Always);
                    ImPlot::PlotLine("entropy", seq_hist.data() + start, entropy_hist.data() + start, count);
                    ImPlot::PlotLine("threshold", thr_x, thr_y, 2);
                    ImPlot::EndPlot();
                }
            }
            ImGui::End();
        }

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);

        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);

            const std::uint32_t bg = ring.config().background_rgb;
            glClearColor(((bg >> 16) & 0xFFu) / 255.0f, ((bg >> 8) & 0xFFu) / 255.0f, (bg & 0xFFu) / 255.0f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);

            glMatrixMode(GL_PROJECTION);
            glLoadIdentity();
            glMatrixMode(GL_MODELVIEW);
            glLoadIdentity();

            // Ring raster is top-down; flip while scaling to the framebuffer.
            const auto& rc = ring.config();
            glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
            glPixelZoom((float)fb_w / (float)rc.width_px, -(float)fb_h / (float)rc.height_px);
            glRasterPos2f(-1.0f, 1.0f);
            glDrawPixels(rc.width_px, rc.height_px, GL_RGBA, GL_UNSIGNED_BYTE, ring_rgba.data());
            glPixelZoom(1.0f, 1.0f);

            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

        glfwSwapBuffers(window);
    }

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}

int main(int argc, char** argv) {
    onix::AppConfig app;
    std::string error;

    const onix::ParseStatus status = onix::parseCommandLine(argc, argv, app, error);
    if (status == onix::ParseStatus::Help) {
        onix::printUsage(std::cout, argv[0]);
        return 0;
    }
    if (status == onix::ParseStatus::Error) {
        std::fprintf(stderr, "%s\n", error.c_str());
        onix::printUsage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }

    onix::EntropyProbe probe;
    onix::Governor governor(app.governor, &probe);

    // Status goes to stderr so stdout stays a clean pipe.
    std::fprintf(stderr, "ONIX GOVERNOR v2.0 \xE2\x80\x94 UNIVERSAL FINAL RELEASE\n");
    std::fprintf(stderr, "Status: Listening on stdin | Pipe any LLM output here\n");
    std::fprintf(stderr, "Config: N=%d K=%d threshold=%s hash=0x%08x\n",
                 governor.config().lattice.size_n, governor.config().steps,
                 onix::formatShortest(governor.config().threshold).c_str(),
                 (unsigned)governor.paramHash());
    std::fprintf(stderr, "\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80"
                         "\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80"
                         "\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80\n");

    std::thread orchestrator([&governor, &probe]() {
        governor.run(std::cin, std::cout, std::cerr);
        probe.markFinished();
    });

    if (!app.headless) {
        if (run_presentation(probe, app) != 0) {
            std::fprintf(stderr, "Presentation unavailable; filtering continues headless\n");
        }
    }

    orchestrator.join();

    const onix::GovernorStats& st = governor.stats();
    std::fprintf(stderr, "Input closed: %llu verified, %llu blocked, %llu blank\n",
                 (unsigned long long)st.verified, (unsigned long long)st.blocked,
                 (unsigned long long)st.blank_skipped);
    return 0;
}
