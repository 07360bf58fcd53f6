// PlotRenderer.cpp
// - Hidden-window rendering: every export runs a few full ImGui frames so
//   ImPlot has settled its axis fits before the back buffer is read.
// - PNG encoding goes through stb_image_write (single translation unit below).

#include "PlotRenderer.h"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <vector>

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

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace phinet {
namespace vis {

namespace {

constexpr int kSettleFrames = 3;
constexpr float kScaleWidth = 90.0f;

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static bool fail(std::string* error, const char* msg) {
    if (error) {
        *error = msg;
    }
    return false;
}

static void valueRange(const std::vector<double>& values, double& lo, double& hi) {
    lo = 0.0;
    hi = 1.0;
    if (values.empty()) {
        return;
    }
    const auto mm = std::minmax_element(values.begin(), values.end());
    lo = *mm.first;
    hi = *mm.second;
    if (!(hi > lo)) {
        // ImPlot needs a non-empty color scale.
        lo -= 0.5;
        hi += 0.5;
    }
}

static void drawHeatmap(const PlotLabels& labels, const SignalMatrix& m) {
    double lo = 0.0;
    double hi = 1.0;
    valueRange(m.values, lo, hi);

    const ImVec2 avail = ImGui::GetContentRegionAvail();
    ImPlot::PushColormap(ImPlotColormap_Viridis);
    if (ImPlot::BeginPlot(labels.title, ImVec2(avail.x - kScaleWidth, avail.y), ImPlotFlags_NoLegend)) {
        ImPlot::SetupAxes(labels.x_label, labels.y_label, ImPlotAxisFlags_AutoFit, ImPlotAxisFlags_AutoFit);
        if (!m.empty()) {
            ImPlot::PlotHeatmap("##values", m.values.data(), m.rows, m.cols, lo, hi, nullptr,
                                ImPlotPoint(0.0, 0.0),
                                ImPlotPoint(static_cast<double>(m.cols), static_cast<double>(m.rows)));
        }
        ImPlot::EndPlot();
    }
    ImGui::SameLine();
    ImPlot::ColormapScale("##scale", lo, hi, ImVec2(kScaleWidth - 10.0f, avail.y));
    ImPlot::PopColormap();
}

static void drawLine(const PlotLabels& labels, const std::vector<double>& ys) {
    if (ImPlot::BeginPlot(labels.title, ImVec2(-1.0f, -1.0f))) {
        ImPlot::SetupAxes(labels.x_label, labels.y_label, ImPlotAxisFlags_AutoFit, ImPlotAxisFlags_AutoFit);
        ImPlot::PlotLine(labels.y_label, ys.data(), static_cast<int>(ys.size()));
        ImPlot::EndPlot();
    }
}

static void drawColumnLines(const PlotLabels& labels, const SignalMatrix& m) {
    if (ImPlot::BeginPlot(labels.title, ImVec2(-1.0f, -1.0f), ImPlotFlags_NoLegend)) {
        ImPlot::SetupAxes(labels.x_label, labels.y_label, ImPlotAxisFlags_AutoFit, ImPlotAxisFlags_AutoFit);
        char id[32];
        for (int c = 0; c < m.cols; ++c) {
            const std::vector<double> column = m.columnCopy(c);
            std::snprintf(id, sizeof(id), "bin %d", c);
            ImPlot::PlotLine(id, column.data(), static_cast<int>(column.size()));
        }
        ImPlot::EndPlot();
    }
}

} // namespace

PlotRenderer::~PlotRenderer() {
    shutdown();
}

bool PlotRenderer::init(int width, int height, std::string* error) {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail(error, "glfwInit failed (no display or GLFW unavailable)");
    glfw_init_ = true;

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);

    window_ = glfwCreateWindow(width, height, "PhiNet Plots", nullptr, nullptr);
    if (!window_) {
        shutdown();
        return fail(error, "glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(0);

    if (!glGetString(GL_VERSION)) {
        shutdown();
        return fail(error, "OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx_ = true;
    ImGui::GetIO().IniFilename = nullptr;

    ImPlot::CreateContext();
    implot_ctx_ = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window_, true)) {
        shutdown();
        return fail(error, "ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw_ = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        shutdown();
        return fail(error, "ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3_ = true;
    return true;
}

void PlotRenderer::shutdown() {
    if (imgui_gl3_) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw_) ImGui_ImplGlfw_Shutdown();
    if (implot_ctx_) ImPlot::DestroyContext();
    if (imgui_ctx_) ImGui::DestroyContext();
    imgui_gl3_ = imgui_glfw_ = implot_ctx_ = imgui_ctx_ = false;

    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (glfw_init_) {
        glfwTerminate();
        glfw_init_ = false;
    }
}

void PlotRenderer::drawFrame(const char* canvas_id, const std::function<void()>& draw) {
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    const ImGuiViewport* vp = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(vp->Pos);
    ImGui::SetNextWindowSize(vp->Size);
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;
    if (ImGui::Begin(canvas_id, nullptr, flags)) {
        draw();
    }
    ImGui::End();

    ImGui::Render();

    int fb_w = 0, fb_h = 0;
    glfwGetFramebufferSize(window_, &fb_w, &fb_h);
    glViewport(0, 0, fb_w, fb_h);
    glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

bool PlotRenderer::renderToFile(const std::string& path, const std::function<void()>& draw) {
    if (!isReady()) {
        return false;
    }

    for (int frame = 0; frame < kSettleFrames; ++frame) {
        glfwPollEvents();
        drawFrame("##export", draw);
        if (frame + 1 < kSettleFrames) {
            glfwSwapBuffers(window_);
        }
    }

    int fb_w = 0, fb_h = 0;
    glfwGetFramebufferSize(window_, &fb_w, &fb_h);
    if (fb_w <= 0 || fb_h <= 0) {
        return false;
    }

    std::vector<unsigned char> pixels(static_cast<std::size_t>(fb_w) * static_cast<std::size_t>(fb_h) * 4u);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadBuffer(GL_BACK);
    glReadPixels(0, 0, fb_w, fb_h, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
    glfwSwapBuffers(window_);

    // GL rows start at the bottom.
    stbi_flip_vertically_on_write(1);
    return stbi_write_png(path.c_str(), fb_w, fb_h, 4, pixels.data(), fb_w * 4) != 0;
}

bool PlotRenderer::renderHeatmap(const std::string& path, const PlotLabels& labels, const SignalMatrix& m) {
    return renderToFile(path, [&]() { drawHeatmap(labels, m); });
}

bool PlotRenderer::renderLine(const std::string& path, const PlotLabels& labels, const std::vector<double>& ys) {
    return renderToFile(path, [&]() { drawLine(labels, ys); });
}

bool PlotRenderer::renderColumnLines(const std::string& path, const PlotLabels& labels, const SignalMatrix& m) {
    return renderToFile(path, [&]() { drawColumnLines(labels, m); });
}

void PlotRenderer::runViewer(const PipelineResult& result) {
    if (!isReady()) {
        return;
    }

    glfwSetWindowTitle(window_, "PhiNet Viewer");
    glfwShowWindow(window_);
    glfwSwapInterval(1); // vsync

    const PlotLabels heat{"Adjusted Oscillations", "Time Samples", "Nodes"};
    const PlotLabels energy{"Energy Loss", "Node", "Energy Loss"};
    const PlotLabels spectrum{"Spectral Magnitude Heatmap", "Node", "Magnitude"};

    while (!glfwWindowShouldClose(window_)) {
        glfwPollEvents();
        drawFrame("##viewer", [&]() {
            ImGui::Text("nodes=%d  samples=%d  perturbed=%.0f%%  mean energy=%.3f",
                        result.adjusted.rows, result.adjusted.cols,
                        result.metrics.perturbed_fraction * 100.0,
                        result.metrics.mean_energy_loss);
            if (ImGui::BeginTabBar("PlotTabs", ImGuiTabBarFlags_None)) {
                if (ImGui::BeginTabItem("  HEATMAP  ")) {
                    drawHeatmap(heat, result.adjusted);
                    ImGui::EndTabItem();
                }
                if (ImGui::BeginTabItem("  ENERGY  ")) {
                    drawLine(energy, result.energy_loss);
                    ImGui::EndTabItem();
                }
                if (ImGui::BeginTabItem("  SPECTRUM  ")) {
                    drawColumnLines(spectrum, result.spectral);
                    ImGui::EndTabItem();
                }
                ImGui::EndTabBar();
            }
        });
        glfwSwapBuffers(window_);
    }
}

} // namespace vis
} // namespace phinet
