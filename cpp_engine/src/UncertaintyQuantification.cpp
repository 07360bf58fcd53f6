#include "UncertaintyQuantification.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <random>

namespace phinet {

namespace {
int clampSamples(int samples) {
    return samples < 1 ? 1 : samples;
}
} // namespace

MonteCarloUQ::MonteCarloUQ() = default;

void MonteCarloUQ::setConfig(const PipelineConfig& cfg) {
    cfg_ = cfg;
}

void MonteCarloUQ::setBaseSeed(std::uint32_t seed) {
    base_seed_ = seed;
}

MonteCarloUQ::UQResult MonteCarloUQ::summarize(const std::vector<double>& values) const {
    UQResult result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(const PipelineConfig& cfg, int num_samples) const {
    const int samples = clampSamples(num_samples);
    std::mt19937 seeder(base_seed_);

    std::vector<double> energy;
    std::vector<double> final_phase;
    std::vector<double> perturbed;
    std::vector<double> dominant;
    energy.reserve(static_cast<std::size_t>(samples));
    final_phase.reserve(static_cast<std::size_t>(samples));
    perturbed.reserve(static_cast<std::size_t>(samples));
    dominant.reserve(static_cast<std::size_t>(samples));

    OscillatorPipeline pipeline(cfg);
    UQSummary summary{};
    summary.runs = samples;

    for (int i = 0; i < samples; ++i) {
        const std::uint32_t seed = static_cast<std::uint32_t>(seeder());
        const PipelineResult r = pipeline.run(seed);
        if (!r.ok) {
            ++summary.failed_runs;
            continue;
        }
        energy.push_back(r.metrics.mean_energy_loss);
        final_phase.push_back(r.metrics.mean_final_phase);
        perturbed.push_back(r.metrics.perturbed_fraction);
        dominant.push_back(r.metrics.mean_dominant_freq_hz);
    }

    summary.mean_energy_loss = summarize(energy);
    summary.mean_final_phase = summarize(final_phase);
    summary.perturbed_fraction = summarize(perturbed);
    summary.mean_dominant_freq_hz = summarize(dominant);
    return summary;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(int num_samples) const {
    return runMonteCarlo(cfg_, num_samples);
}

} // namespace phinet
