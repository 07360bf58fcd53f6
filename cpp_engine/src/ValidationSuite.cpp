#include "OscillatorPipeline.h"
#include "SignalGenerator.h"
#include "SpectralTransform.h"
#include "SummaryStatistics.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct CheckRow {
    std::string name;
    double predicted = 0.0;
    double expected = 0.0;
    double low = 0.0;
    double high = 0.0;
    std::string units;

    bool inRange() const { return predicted >= low && predicted <= high; }
};

// O(T^2) reference transform (forward, unscaled).
static std::vector<double> naiveDftMagnitude(const double* x, int n, int bins) {
    std::vector<double> out(static_cast<std::size_t>(bins), 0.0);
    for (int k = 0; k < bins; ++k) {
        std::complex<double> acc(0.0, 0.0);
        for (int t = 0; t < n; ++t) {
            const double ang = -phinet::kTwoPi * static_cast<double>(k) * static_cast<double>(t) / static_cast<double>(n);
            acc += x[t] * std::complex<double>(std::cos(ang), std::sin(ang));
        }
        out[static_cast<std::size_t>(k)] = std::abs(acc);
    }
    return out;
}

static phinet::NodeParameters singleNode(double freq_hz, double phase_rad) {
    phinet::NodeParameters p;
    p.base_freq_hz.push_back(freq_hz);
    p.base_phase_rad.push_back(phase_rad);
    return p;
}

static double relError(double predicted, double target) {
    if (target == 0.0) return std::fabs(predicted);
    return std::fabs(predicted - target) / std::fabs(target);
}

} // namespace

int main() {
    std::cout << "=== PHINET NUMERIC VALIDATION SUITE ===\n";
    std::cout << "Closed-form checks of synthesis, feedback, statistics and spectrum\n\n";

    std::vector<CheckRow> rows;

    // Single 1 Hz tone over 10 s (200 samples): peak lands in bin ~10.05 -> 10.
    std::cout << "=== Single-Tone Spectral Peak ===\n";
    {
        const std::vector<double> grid = phinet::makeTimeGrid(200, 0.0, 10.0);
        const phinet::SignalMatrix tone = phinet::synthesizeHarmonics(singleNode(1.0, 0.0), grid, {1});
        const phinet::SignalMatrix spec = phinet::computeSpectralMagnitude(tone);
        const int bin = phinet::dominantBins(spec).front();
        const double f_hz = phinet::binFrequencyHz(bin, 200, 10.0);
        std::cout << "Dominant bin: " << bin << " (" << std::fixed << std::setprecision(4) << f_hz << " Hz)\n";
        std::cout << "Bin resolution: " << phinet::binFrequencyHz(1, 200, 10.0) << " Hz\n\n";
        rows.push_back({"Single-tone dominant bin", static_cast<double>(bin), 10.0, 10.0, 10.0, "bin"});
        rows.push_back({"Single-tone dominant frequency", f_hz, 1.0, 0.95, 1.05, "Hz"});
    }

    // Default run: Eigen FFT against the O(T^2) definition.
    phinet::OscillatorPipeline pipeline;
    const phinet::PipelineResult run = pipeline.run(static_cast<std::uint32_t>(20240601u));
    if (!run.ok) {
        std::cerr << "FATAL: default pipeline run failed: " << run.error << "\n";
        return 1;
    }

    std::cout << "=== FFT vs Direct DFT ===\n";
    {
        double max_diff = 0.0;
        const int checked_rows = std::min(8, run.adjusted.rows);
        for (int i = 0; i < checked_rows; ++i) {
            const std::vector<double> ref = naiveDftMagnitude(run.adjusted.row(i), run.adjusted.cols, run.spectral.cols);
            for (int k = 0; k < run.spectral.cols; ++k) {
                max_diff = std::max(max_diff, std::fabs(ref[static_cast<std::size_t>(k)] - run.spectral.at(i, k)));
            }
        }
        std::cout << "Rows checked: " << checked_rows << "\n";
        std::cout << "Max |FFT - DFT|: " << std::scientific << std::setprecision(3) << max_diff << "\n\n";
        rows.push_back({"FFT vs direct DFT max error", max_diff, 0.0, 0.0, 1e-9, "magnitude"});
    }

    // phi^i is a row-wide factor: normalization must cancel it.
    std::cout << "=== Golden-Ratio Weight Neutrality ===\n";
    {
        const std::vector<double> grid = phinet::makeTimeGrid(200, 0.0, 10.0);
        phinet::NodeParameters p;
        for (int i = 0; i < 12; ++i) {
            p.base_freq_hz.push_back(0.8);
            p.base_phase_rad.push_back(1.1);
        }
        const phinet::SignalMatrix m = phinet::synthesizeHarmonics(p, grid, {3, 6, 9});
        double max_diff = 0.0;
        for (int i = 1; i < m.rows; ++i) {
            for (int c = 0; c < m.cols; ++c) {
                max_diff = std::max(max_diff, std::fabs(m.at(i, c) - m.at(0, c)));
            }
        }
        std::cout << "Raw weight of node 11: " << std::fixed << std::setprecision(3)
                  << std::pow(phinet::kGoldenRatio, 11.0) << "\n";
        std::cout << "Max row difference after normalization: " << std::scientific << std::setprecision(3)
                  << max_diff << "\n\n";
        rows.push_back({"Golden-ratio weight neutrality", max_diff, 0.0, 0.0, 1e-12, "amplitude"});
    }

    // 10 full periods at 20 samples/period: sum|sin| -> T * 2/pi.
    std::cout << "=== Full-Period Sine Energy ===\n";
    {
        const std::vector<double> grid = phinet::makeTimeGrid(200, 0.0, 9.95);
        const phinet::SignalMatrix tone = phinet::synthesizeHarmonics(singleNode(1.0, 0.0), grid, {1});
        const phinet::NodeSummary s = phinet::computeSummary(tone);
        const double expected = 200.0 * 2.0 / 3.14159265358979323846;
        const double energy = s.energy_loss.front();
        std::cout << "Energy: " << std::fixed << std::setprecision(3) << energy
                  << " (continuous limit " << expected << ")\n";
        std::cout << "Relative Error: " << std::setprecision(2) << relError(energy, expected) * 100.0 << "%\n\n";
        rows.push_back({"Full-period sine energy", energy, expected, expected * 0.98, expected * 1.02, "sum|x|"});
    }

    std::cout << "=== Unit-Peak Invariants (default run) ===\n";
    {
        int unit_harmonic = 0;
        int unit_adjusted = 0;
        for (int i = 0; i < run.harmonic.rows; ++i) {
            unit_harmonic += (phinet::rowPeakAbs(run.harmonic, i) == 1.0) ? 1 : 0;
            unit_adjusted += (phinet::rowPeakAbs(run.adjusted, i) == 1.0) ? 1 : 0;
        }
        const double n = static_cast<double>(run.harmonic.rows);
        std::cout << "Harmonic rows at unit peak: " << unit_harmonic << "/" << run.harmonic.rows << "\n";
        std::cout << "Adjusted rows at unit peak: " << unit_adjusted << "/" << run.adjusted.rows << "\n";
        std::cout << "Perturbed fraction: " << std::fixed << std::setprecision(3)
                  << run.metrics.perturbed_fraction << "\n\n";
        rows.push_back({"Harmonic unit-peak rows", static_cast<double>(unit_harmonic), n, n, n, "rows"});
        rows.push_back({"Adjusted unit-peak rows", static_cast<double>(unit_adjusted), n, n, n, "rows"});
    }

    // Summary table
    int pass = 0;
    std::cout << "Check                            | Error    | In Range | Status\n";
    std::cout << "----------------------------------------------------------------\n";
    for (const auto& row : rows) {
        const bool ok = row.inRange();
        if (ok) ++pass;
        std::cout << std::left << std::setw(32) << row.name << " | "
                  << std::setw(7) << std::fixed << std::setprecision(2) << (relError(row.predicted, row.expected) * 100.0) << "% | "
                  << std::setw(8) << (ok ? "YES" : "NO") << " | "
                  << (ok ? "PASS" : "FAIL") << "\n";
    }
    std::cout << "\nTOTAL: " << pass << "/" << rows.size() << " checks within tolerance\n\n";

    const std::string csv_name = "validation_results.csv";
    std::ofstream csv(csv_name);
    if (csv) {
        csv << "Check,Predicted,Expected,Lower_Bound,Upper_Bound,Within_Range,Units\n";
        csv << std::setprecision(12);
        for (const auto& row : rows) {
            csv << row.name << ',' << row.predicted << ',' << row.expected << ','
                << row.low << ',' << row.high << ',' << (row.inRange() ? "YES" : "NO") << ','
                << row.units << '\n';
        }
        csv.close();
        std::cout << "Results exported to: " << csv_name << "\n";
    } else {
        std::cerr << "Could not write " << csv_name << "\n";
    }

    return (pass == static_cast<int>(rows.size())) ? 0 : 1;
}
