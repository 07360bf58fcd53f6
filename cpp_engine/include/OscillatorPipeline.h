#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "FeedbackStabilizer.h"
#include "SignalGenerator.h"
#include "SignalMatrix.h"
#include "SummaryStatistics.h"

namespace phinet {

// ============================================================
// Fixed run constants. The main program never changes these; sweeps and
// tests override them through setConfig().
// ============================================================
struct PipelineConfig {
    int node_count = 100;
    int sample_count = 200;

    // Time span (seconds), endpoints included in the grid.
    double t_start_s = 0.0;
    double t_end_s = 10.0;

    std::vector<int> harmonics{3, 6, 9};

    // Base frequency draw range [min, max); min < max is required.
    double freq_min_hz = 0.5;
    double freq_max_hz = 2.0;

    double feedback_threshold = 0.7;
    double noise_amplitude = 0.1;
};

// Run-level scalars used by sweeps, UQ and the console report.
struct RunMetrics {
    double mean_energy_loss = 0.0;
    double mean_final_phase = 0.0;
    double perturbed_fraction = 0.0;
    double mean_dominant_freq_hz = 0.0;
};

struct RunSignatures {
    std::uint32_t config_hash_u32 = 0; // FNV-1a32 over effective parameters
    std::uint32_t output_digest_u32 = 0; // FNV-1a32 over all output arrays
};

struct PipelineResult {
    bool ok = false;
    std::string error;

    std::vector<double> time_grid;
    NodeParameters nodes;

    SignalMatrix harmonic;
    SignalMatrix adjusted;
    std::vector<std::uint8_t> perturbed;

    std::vector<double> energy_loss;
    std::vector<double> final_phase;

    SignalMatrix spectral;
    std::vector<int> dominant_bin;
    std::vector<double> dominant_freq_hz;

    RunMetrics metrics{};
    RunSignatures signatures{};
};

// Returns false and fills *reason (if non-null) for an unusable config.
bool validateConfig(const PipelineConfig& cfg, std::string* reason);

// One "key = value" line per parameter.
std::string describeConfig(const PipelineConfig& cfg);

// Command line seed: plain decimal digits in [0, 2^32 - 1]. A sign, spaces,
// trailing text or an out-of-range value returns false and leaves *seed alone.
bool parseSeed(const std::string& text, std::uint32_t* seed);

class OscillatorPipeline {
public:
    OscillatorPipeline();
    explicit OscillatorPipeline(const PipelineConfig& cfg);

    void setConfig(const PipelineConfig& cfg);
    const PipelineConfig& config() const { return cfg_; }

    // Draw order on rng: frequencies, phases, then stabilizer noise.
    // Never throws; an invalid config yields ok == false.
    PipelineResult run(std::mt19937& rng) const;

    // Seeds a fresh engine with `seed` and runs once.
    PipelineResult run(std::uint32_t seed) const;

private:
    PipelineConfig cfg_{};
};

} // namespace phinet
