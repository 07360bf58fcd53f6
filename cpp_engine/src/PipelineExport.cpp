#include "PipelineExport.h"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace phinet {

namespace {
void applyNumberFormat(std::ofstream& out) {
    // Same shape as printf("%.18e").
    out << std::scientific << std::setprecision(18);
}
} // namespace

std::string joinPath(const std::string& out_dir, const std::string& name) {
    if (out_dir.empty() || out_dir == ".") {
        return name;
    }
    return (std::filesystem::path(out_dir) / name).string();
}

bool writeMatrixCSV(const std::string& filename, const SignalMatrix& m) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    applyNumberFormat(out);
    for (int r = 0; r < m.rows; ++r) {
        const double* row = m.row(r);
        for (int c = 0; c < m.cols; ++c) {
            if (c > 0) {
                out << ',';
            }
            out << row[c];
        }
        out << '\n';
    }
    out.flush();
    return static_cast<bool>(out);
}

bool writeVectorCSV(const std::string& filename, const std::vector<double>& values) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    applyNumberFormat(out);
    for (double v : values) {
        out << v << '\n';
    }
    out.flush();
    return static_cast<bool>(out);
}

bool writeNodeSummaryCSV(const std::string& filename, const PipelineResult& result) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "node,base_freq_hz,base_phase_rad,perturbed,energy_loss,final_phase,dominant_bin,dominant_freq_hz\n";
    out << std::fixed << std::setprecision(6);
    const std::size_t n = result.energy_loss.size();
    for (std::size_t i = 0; i < n; ++i) {
        out << i << ','
            << result.nodes.base_freq_hz[i] << ','
            << result.nodes.base_phase_rad[i] << ','
            << static_cast<int>(result.perturbed[i]) << ','
            << result.energy_loss[i] << ','
            << result.final_phase[i] << ','
            << result.dominant_bin[i] << ','
            << result.dominant_freq_hz[i] << '\n';
    }
    out.flush();
    return static_cast<bool>(out);
}

bool exportPipelineCSV(const PipelineResult& result,
                       const std::string& out_dir,
                       std::string* failed_path) {
    auto failed = [failed_path](const std::string& path) {
        if (failed_path) {
            *failed_path = path;
        }
        return false;
    };

    const std::string harmonic_path = joinPath(out_dir, kHarmonicCsvName);
    if (!writeMatrixCSV(harmonic_path, result.harmonic)) return failed(harmonic_path);

    const std::string energy_path = joinPath(out_dir, kEnergyLossCsvName);
    if (!writeVectorCSV(energy_path, result.energy_loss)) return failed(energy_path);

    const std::string spectral_path = joinPath(out_dir, kSpectralCsvName);
    if (!writeMatrixCSV(spectral_path, result.spectral)) return failed(spectral_path);

    const std::string summary_path = joinPath(out_dir, kNodeSummaryCsvName);
    if (!writeNodeSummaryCSV(summary_path, result)) return failed(summary_path);

    return true;
}

} // namespace phinet
