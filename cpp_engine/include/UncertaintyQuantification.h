#pragma once

#include <cstdint>
#include <vector>

#include "OscillatorPipeline.h"

namespace phinet {

// Seed-to-seed spread of run-level metrics for a fixed PipelineConfig.
class MonteCarloUQ {
public:
    struct UQResult {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct UQSummary {
        int runs = 0;
        int failed_runs = 0;
        UQResult mean_energy_loss{};
        UQResult mean_final_phase{};
        UQResult perturbed_fraction{};
        UQResult mean_dominant_freq_hz{};
    };

    MonteCarloUQ();

    void setConfig(const PipelineConfig& cfg);
    void setBaseSeed(std::uint32_t seed);

    UQSummary runMonteCarlo(const PipelineConfig& cfg, int num_samples = 100) const;
    UQSummary runMonteCarlo(int num_samples = 100) const;

private:
    PipelineConfig cfg_{};
    std::uint32_t base_seed_ = 1337u;

    UQResult summarize(const std::vector<double>& values) const;
};

} // namespace phinet
