// main_vis.cpp
// - Runs the oscillator pipeline once with the fixed constants.
// - Renders three PNG plots and writes the CSV exports.
// - The plot stack (GLFW + OpenGL + ImGui/ImPlot) is checked once at startup;
//   a missing piece is fatal before any numeric work starts.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <system_error>

#include "OscillatorPipeline.h"
#include "PipelineExport.h"
#include "PlotRenderer.h"

namespace {

constexpr int kImageWidth = 1200;
constexpr int kImageHeight = 800;

constexpr const char* kHeatmapPngName = "adjusted_oscillations_heatmap.png";
constexpr const char* kEnergyPngName = "energy_loss.png";
constexpr const char* kSpectralPngName = "spectral_magnitude.png";

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

static void printUsage() {
    std::cout << "phinet_run usage:\n"
              << "  phinet_run [--seed <u32>] [--out-dir <dir>] [--show]\n";
}

} // namespace

int main(int argc, char** argv) {
    // --- CLI flags ---
    bool seed_set = false;
    std::uint32_t seed = 0;
    std::string out_dir = ".";
    bool show = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        if (arg == "--seed" && i + 1 < argc) {
            if (!phinet::parseSeed(argv[++i], &seed)) {
                std::cout << "Malformed seed (expected 0.." << UINT32_MAX << "): " << argv[i] << "\n";
                printUsage();
                return 1;
            }
            seed_set = true;
        } else if (arg == "--out-dir" && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (arg == "--show") {
            show = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    phinet::vis::PlotRenderer renderer;
    std::string dep_error;
    if (!renderer.init(kImageWidth, kImageHeight, &dep_error)) {
        const std::string msg = "missing plotting dependency: " + dep_error +
                                ". A working OpenGL display is required to render plots.";
        return fail(msg.c_str());
    }

    // One engine per process, seeded exactly once.
    if (!seed_set) {
        std::random_device rd;
        seed = static_cast<std::uint32_t>(rd());
    }
    std::mt19937 rng(seed);

    phinet::OscillatorPipeline pipeline;
    std::cout << "PhiNet oscillator pipeline (seed " << seed << ")\n"
              << phinet::describeConfig(pipeline.config());

    const phinet::PipelineResult result = pipeline.run(rng);
    if (!result.ok) {
        const std::string msg = "pipeline rejected its configuration: " + result.error;
        return fail(msg.c_str());
    }

    std::printf("perturbed nodes: %d/%d  mean energy loss: %.4f  mean dominant freq: %.4f Hz\n",
                static_cast<int>(result.metrics.perturbed_fraction * result.adjusted.rows + 0.5),
                result.adjusted.rows,
                result.metrics.mean_energy_loss,
                result.metrics.mean_dominant_freq_hz);
    std::printf("config hash: %08x  output digest: %08x\n",
                result.signatures.config_hash_u32,
                result.signatures.output_digest_u32);

    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        const std::string msg = "cannot create output directory " + out_dir + ": " + ec.message();
        return fail(msg.c_str());
    }

    struct ImageJob {
        const char* name;
        bool ok;
    };
    const ImageJob images[] = {
        {kHeatmapPngName,
         renderer.renderHeatmap(phinet::joinPath(out_dir, kHeatmapPngName),
                                {"Adjusted Oscillations", "Time Samples", "Nodes"},
                                result.adjusted)},
        {kEnergyPngName,
         renderer.renderLine(phinet::joinPath(out_dir, kEnergyPngName),
                             {"Energy Loss per Node", "Node", "Energy Loss"},
                             result.energy_loss)},
        {kSpectralPngName,
         renderer.renderColumnLines(phinet::joinPath(out_dir, kSpectralPngName),
                                    {"Spectral Magnitude Heatmap", "Node", "Magnitude"},
                                    result.spectral)},
    };
    for (const auto& img : images) {
        if (!img.ok) {
            const std::string msg = "could not write " + phinet::joinPath(out_dir, img.name);
            return fail(msg.c_str());
        }
    }

    std::string failed_path;
    if (!phinet::exportPipelineCSV(result, out_dir, &failed_path)) {
        const std::string msg = "could not write " + failed_path;
        return fail(msg.c_str());
    }

    std::cout << "Simulation completed. Plots and CSV exports written to: " << out_dir << "\n";

    if (show) {
        renderer.runViewer(result);
    }
    return 0;
}
