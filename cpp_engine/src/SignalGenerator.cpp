#include "SignalGenerator.h"

#include <cmath>
#include <cstddef>

namespace phinet {

std::vector<double> makeTimeGrid(int sample_count, double t_start_s, double t_end_s) {
    std::vector<double> grid;
    if (sample_count <= 0) {
        return grid;
    }

    grid.reserve(static_cast<std::size_t>(sample_count));
    if (sample_count == 1) {
        grid.push_back(t_start_s);
        return grid;
    }

    const double step = (t_end_s - t_start_s) / static_cast<double>(sample_count - 1);
    for (int k = 0; k < sample_count; ++k) {
        grid.push_back(t_start_s + step * static_cast<double>(k));
    }
    // Pin the last sample so the span is exact regardless of rounding.
    grid.back() = t_end_s;
    return grid;
}

NodeParameters drawNodeParameters(int node_count,
                                  double freq_min_hz,
                                  double freq_max_hz,
                                  std::mt19937& rng) {
    NodeParameters params;
    if (node_count <= 0) {
        return params;
    }

    const std::size_t n = static_cast<std::size_t>(node_count);
    params.base_freq_hz.reserve(n);
    params.base_phase_rad.reserve(n);

    std::uniform_real_distribution<double> freq_dist(freq_min_hz, freq_max_hz);
    for (std::size_t i = 0; i < n; ++i) {
        params.base_freq_hz.push_back(freq_dist(rng));
    }

    std::uniform_real_distribution<double> phase_dist(0.0, kTwoPi);
    for (std::size_t i = 0; i < n; ++i) {
        params.base_phase_rad.push_back(phase_dist(rng));
    }
    return params;
}

SignalMatrix synthesizeHarmonics(const NodeParameters& params,
                                 const std::vector<double>& time_grid,
                                 const std::vector<int>& harmonics) {
    const int rows = params.count();
    const int cols = static_cast<int>(time_grid.size());
    SignalMatrix out(rows, cols);

    for (int i = 0; i < rows; ++i) {
        const double weight = std::pow(kGoldenRatio, static_cast<double>(i));
        const double f = params.base_freq_hz[static_cast<std::size_t>(i)];
        const double phase = params.base_phase_rad[static_cast<std::size_t>(i)];

        double* row = out.row(i);
        for (int h : harmonics) {
            const double hd = static_cast<double>(h);
            for (int c = 0; c < cols; ++c) {
                const double t = time_grid[static_cast<std::size_t>(c)];
                row[c] += weight * std::sin(kTwoPi * hd * f * t + phase / hd);
            }
        }

        const double peak = rowPeakAbs(out, i);
        if (peak > 0.0) {
            for (int c = 0; c < cols; ++c) {
                row[c] /= peak;
            }
        }
    }
    return out;
}

} // namespace phinet
