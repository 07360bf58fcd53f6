#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "SignalMatrix.h"

namespace phinet {

struct StabilizerConfig {
    // Rows whose max raw value is strictly below this receive noise.
    double feedback_threshold = 0.7;
    // Noise is uniform in [-noise_amplitude, +noise_amplitude].
    double noise_amplitude = 0.1;
};

struct StabilizedSignals {
    SignalMatrix adjusted;
    // 1 = row received feedback noise.
    std::vector<std::uint8_t> perturbed;

    int perturbedCount() const;
};

// Copies `harmonic`, injects fresh per-sample noise into weak rows (row order,
// drawn from rng), then divides each row by its peak |x| (1 when that peak is 0).
StabilizedSignals stabilize(const SignalMatrix& harmonic,
                            const StabilizerConfig& cfg,
                            std::mt19937& rng);

} // namespace phinet
