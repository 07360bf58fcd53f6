#include "SensitivityAnalysis.h"

#include <cmath>
#include <cstddef>
#include <fstream>
#include <iomanip>

namespace phinet {

SensitivityAnalyzer::SensitivityAnalyzer() = default;

void SensitivityAnalyzer::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

SensitivityAnalyzer::SensitivityRow SensitivityAnalyzer::runScenario(const char* name,
                                                                     double value,
                                                                     const PipelineConfig& cfg) const {
    OscillatorPipeline pipeline(cfg);
    const PipelineResult r = pipeline.run(scenario_.seed);

    SensitivityRow row;
    row.parameter_name = name;
    row.parameter_value = value;
    row.ok = r.ok;
    row.metrics = r.metrics;
    return row;
}

void SensitivityAnalyzer::analyzeFeedbackThreshold(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        PipelineConfig cfg = scenario_.pipeline;
        cfg.feedback_threshold = value;
        results_.push_back(runScenario("feedback_threshold", value, cfg));
    }
}

void SensitivityAnalyzer::analyzeNoiseAmplitude(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        PipelineConfig cfg = scenario_.pipeline;
        cfg.noise_amplitude = value;
        results_.push_back(runScenario("noise_amplitude", value, cfg));
    }
}

void SensitivityAnalyzer::analyzeNodeCount(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        PipelineConfig cfg = scenario_.pipeline;
        cfg.node_count = static_cast<int>(std::lround(value));
        results_.push_back(runScenario("node_count", static_cast<double>(cfg.node_count), cfg));
    }
}

void SensitivityAnalyzer::analyzeSampleCount(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        PipelineConfig cfg = scenario_.pipeline;
        cfg.sample_count = static_cast<int>(std::lround(value));
        results_.push_back(runScenario("sample_count", static_cast<double>(cfg.sample_count), cfg));
    }
}

bool SensitivityAnalyzer::exportSensitivityMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,ok,mean_energy_loss,mean_final_phase,perturbed_fraction,mean_dominant_freq_hz\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << (row.ok ? 1 : 0) << ','
            << row.metrics.mean_energy_loss << ','
            << row.metrics.mean_final_phase << ','
            << row.metrics.perturbed_fraction << ','
            << row.metrics.mean_dominant_freq_hz << '\n';
    }
    out.flush();
    return static_cast<bool>(out);
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace phinet
