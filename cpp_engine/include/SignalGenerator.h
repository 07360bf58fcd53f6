#pragma once

#include <random>
#include <vector>

#include "SignalMatrix.h"

namespace phinet {

// (1 + sqrt(5)) / 2
constexpr double kGoldenRatio = 1.6180339887498948482;
constexpr double kTwoPi = 6.283185307179586476925;

struct NodeParameters {
    std::vector<double> base_freq_hz;
    std::vector<double> base_phase_rad;

    int count() const { return static_cast<int>(base_freq_hz.size()); }
};

// Evenly spaced samples over [t_start_s, t_end_s], both endpoints included.
// sample_count == 1 yields {t_start_s}; sample_count <= 0 yields {}.
std::vector<double> makeTimeGrid(int sample_count, double t_start_s, double t_end_s);

// Frequencies uniform in [freq_min_hz, freq_max_hz), phases uniform in [0, 2pi).
// All frequencies are drawn before any phase.
NodeParameters drawNodeParameters(int node_count,
                                  double freq_min_hz,
                                  double freq_max_hz,
                                  std::mt19937& rng);

// Row i = sum_h phi^i * sin(2pi*h*f_i*t + phase_i/h), scaled to unit peak |x|.
// A row whose peak is exactly zero is returned unscaled.
// The phi^i factor is row-wide and cancels under normalization; it still
// scales the pre-normalization magnitudes.
SignalMatrix synthesizeHarmonics(const NodeParameters& params,
                                 const std::vector<double>& time_grid,
                                 const std::vector<int>& harmonics);

} // namespace phinet
