#include "FeedbackStabilizer.h"

#include <cstddef>

namespace phinet {

int StabilizedSignals::perturbedCount() const {
    int n = 0;
    for (std::uint8_t flag : perturbed) {
        if (flag != 0u) {
            ++n;
        }
    }
    return n;
}

StabilizedSignals stabilize(const SignalMatrix& harmonic,
                            const StabilizerConfig& cfg,
                            std::mt19937& rng) {
    StabilizedSignals out;
    out.adjusted = harmonic;
    out.perturbed.assign(static_cast<std::size_t>(harmonic.rows > 0 ? harmonic.rows : 0), 0u);

    SignalMatrix& adj = out.adjusted;
    std::uniform_real_distribution<double> noise(-cfg.noise_amplitude, cfg.noise_amplitude);

    for (int i = 0; i < adj.rows; ++i) {
        double* row = adj.row(i);

        if (rowMax(adj, i) < cfg.feedback_threshold) {
            for (int c = 0; c < adj.cols; ++c) {
                row[c] += noise(rng);
            }
            out.perturbed[static_cast<std::size_t>(i)] = 1u;
        }

        const double peak = rowPeakAbs(adj, i);
        const double divisor = (peak > 0.0) ? peak : 1.0;
        for (int c = 0; c < adj.cols; ++c) {
            row[c] /= divisor;
        }
    }
    return out;
}

} // namespace phinet
