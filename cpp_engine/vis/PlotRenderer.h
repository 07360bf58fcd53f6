#pragma once

// vis/PlotRenderer.h
//
// Offscreen plot rendering for pipeline outputs.
//   - Owns a hidden GLFW window, its OpenGL context and the ImGui/ImPlot contexts.
//   - Each render* call draws one full-window plot, reads the back buffer and
//     writes a PNG.
//   - runViewer() shows the same plots interactively.
// The numeric core never includes this header.

#include <functional>
#include <string>
#include <vector>

#include "OscillatorPipeline.h"
#include "SignalMatrix.h"

struct GLFWwindow;

namespace phinet {
namespace vis {

struct PlotLabels {
    const char* title = "";
    const char* x_label = "";
    const char* y_label = "";
};

class PlotRenderer {
public:
    PlotRenderer() = default;
    ~PlotRenderer();

    PlotRenderer(const PlotRenderer&) = delete;
    PlotRenderer& operator=(const PlotRenderer&) = delete;

    // Startup dependency check: GLFW, an OpenGL context and the ImGui backends.
    // On failure *error (if non-null) describes the first missing piece and
    // everything created so far is released.
    bool init(int width, int height, std::string* error);
    bool isReady() const { return imgui_gl3_; }
    void shutdown();

    bool renderHeatmap(const std::string& path, const PlotLabels& labels, const SignalMatrix& m);
    bool renderLine(const std::string& path, const PlotLabels& labels, const std::vector<double>& ys);
    // One line per column, x = row index.
    bool renderColumnLines(const std::string& path, const PlotLabels& labels, const SignalMatrix& m);

    // Blocks until the window is closed.
    void runViewer(const PipelineResult& result);

private:
    bool renderToFile(const std::string& path, const std::function<void()>& draw);
    void drawFrame(const char* canvas_id, const std::function<void()>& draw);

    GLFWwindow* window_ = nullptr;
    bool glfw_init_ = false;
    bool imgui_ctx_ = false;
    bool implot_ctx_ = false;
    bool imgui_glfw_ = false;
    bool imgui_gl3_ = false;
};

} // namespace vis
} // namespace phinet
