#pragma once

#include <string>
#include <vector>

#include "OscillatorPipeline.h"
#include "SignalMatrix.h"

namespace phinet {

// File names written by exportPipelineCSV().
constexpr const char* kHarmonicCsvName = "harmonic_oscillations.csv";
constexpr const char* kEnergyLossCsvName = "energy_loss.csv";
constexpr const char* kSpectralCsvName = "spectral_magnitude.csv";
constexpr const char* kNodeSummaryCsvName = "node_summary.csv";

// One line per row, comma separated, scientific notation with 18 digits,
// no header. Returns false if the file cannot be written.
bool writeMatrixCSV(const std::string& filename, const SignalMatrix& m);

// One value per line, same number format as writeMatrixCSV().
bool writeVectorCSV(const std::string& filename, const std::vector<double>& values);

// Per-node table with a header row (parameters, flags, statistics).
bool writeNodeSummaryCSV(const std::string& filename, const PipelineResult& result);

// Writes the four CSV files into out_dir. On failure *failed_path (if non-null)
// names the first file that could not be written.
bool exportPipelineCSV(const PipelineResult& result,
                       const std::string& out_dir,
                       std::string* failed_path);

// out_dir joined with name ("." or "" yields name unchanged).
std::string joinPath(const std::string& out_dir, const std::string& name);

} // namespace phinet
