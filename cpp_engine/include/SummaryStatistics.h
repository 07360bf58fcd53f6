#pragma once

#include <vector>

#include "SignalMatrix.h"

namespace phinet {

struct NodeSummary {
    // Sum of |x| along the time axis, per node.
    std::vector<double> energy_loss;
    // Max raw value along the time axis, per node (an amplitude, not an angle).
    std::vector<double> final_phase;
};

NodeSummary computeSummary(const SignalMatrix& adjusted);

// Arithmetic mean; 0 for an empty vector.
double mean(const std::vector<double>& values);

} // namespace phinet
