#include "OscillatorPipeline.h"
#include "SensitivityAnalysis.h"
#include "UncertaintyQuantification.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "PhiSweepTool usage:\n"
              << "  PhiSweepTool --param <threshold|noise|nodes|samples> [--min v] [--max v] [--samples n] [--seed s] [--out file]\n"
              << "  PhiSweepTool --uq <runs> [--seed s]\n";
}

void printUQRow(const char* name, const phinet::MonteCarloUQ::UQResult& r) {
    std::cout << std::left << std::setw(24) << name << std::right << std::fixed << std::setprecision(4)
              << " mean=" << r.mean
              << " median=" << r.median
              << " ci95=[" << r.ci_lower_95 << ", " << r.ci_upper_95 << "]"
              << " sd=" << r.std_dev << "\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    int uq_runs = 0;
    std::uint32_t seed = 1337u;
    std::string out = "sensitivity.csv";
    bool min_set = false;
    bool max_set = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = toLower(argv[++i]);
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                if (!phinet::parseSeed(argv[++i], &seed)) {
                    std::cout << "Malformed seed (expected 0.." << UINT32_MAX << "): " << argv[i] << "\n";
                    printUsage();
                    return 1;
                }
            } else if (arg == "--uq" && i + 1 < argc) {
                uq_runs = std::stoi(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cout << "Malformed numeric argument (" << e.what() << ")\n";
        printUsage();
        return 1;
    }

    phinet::PipelineConfig base;

    if (uq_runs > 0) {
        phinet::MonteCarloUQ uq;
        uq.setConfig(base);
        uq.setBaseSeed(seed);
        const auto summary = uq.runMonteCarlo(uq_runs);
        std::cout << "Monte Carlo over " << summary.runs << " seeds (base seed " << seed << ", "
                  << summary.failed_runs << " failed)\n";
        printUQRow("mean_energy_loss", summary.mean_energy_loss);
        printUQRow("mean_final_phase", summary.mean_final_phase);
        printUQRow("perturbed_fraction", summary.perturbed_fraction);
        printUQRow("mean_dominant_freq_hz", summary.mean_dominant_freq_hz);
        return summary.failed_runs == 0 ? 0 : 1;
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    phinet::SensitivityAnalyzer analyzer;
    phinet::SensitivityAnalyzer::ScenarioConfig scenario;
    scenario.seed = seed;
    scenario.pipeline = base;
    analyzer.setScenario(scenario);

    phinet::SensitivityAnalyzer::ParameterRange range;
    range.samples = samples;

    if (param == "threshold" || param == "feedback_threshold") {
        range.nominal = base.feedback_threshold;
    } else if (param == "noise" || param == "noise_amplitude") {
        range.nominal = base.noise_amplitude;
    } else if (param == "nodes" || param == "node_count") {
        range.nominal = static_cast<double>(base.node_count);
    } else if (param == "samples" || param == "sample_count") {
        range.nominal = static_cast<double>(base.sample_count);
    } else {
        std::cout << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    if (!min_set) {
        min_val = range.nominal * 0.75;
    }
    if (!max_set) {
        max_val = range.nominal * 1.25;
    }

    range.min = min_val;
    range.max = max_val;

    if (param == "threshold" || param == "feedback_threshold") {
        analyzer.analyzeFeedbackThreshold(range);
    } else if (param == "noise" || param == "noise_amplitude") {
        analyzer.analyzeNoiseAmplitude(range);
    } else if (param == "nodes" || param == "node_count") {
        analyzer.analyzeNodeCount(range);
    } else {
        analyzer.analyzeSampleCount(range);
    }

    for (const auto& row : analyzer.results()) {
        if (!row.ok) {
            std::cerr << "FATAL: " << row.parameter_name << "=" << row.parameter_value
                      << " is not a valid pipeline configuration\n";
            return 1;
        }
    }

    if (!analyzer.exportSensitivityMatrixCSV(out)) {
        std::cerr << "FATAL: could not write " << out << "\n";
        return 1;
    }
    std::cout << "Wrote sensitivity sweep to: " << out << "\n";
    return 0;
}
