#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "OscillatorPipeline.h"

namespace phinet {

class SensitivityAnalyzer {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct ScenarioConfig {
        // Every sweep point reuses this seed so only the swept parameter varies.
        std::uint32_t seed = 1337u;
        PipelineConfig pipeline{};
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        bool ok = false;
        RunMetrics metrics{};
    };

    SensitivityAnalyzer();

    void setScenario(const ScenarioConfig& scenario);
    void clearResults();

    void analyzeFeedbackThreshold(const ParameterRange& range);
    void analyzeNoiseAmplitude(const ParameterRange& range);
    // Values are rounded to the nearest integer count.
    void analyzeNodeCount(const ParameterRange& range);
    void analyzeSampleCount(const ParameterRange& range);

    bool exportSensitivityMatrixCSV(const std::string& filename) const;
    const std::vector<SensitivityRow>& results() const;

private:
    ScenarioConfig scenario_{};
    std::vector<SensitivityRow> results_{};

    SensitivityRow runScenario(const char* name, double value, const PipelineConfig& cfg) const;
    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace phinet
