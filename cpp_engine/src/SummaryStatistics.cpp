#include "SummaryStatistics.h"

#include <cmath>
#include <cstddef>
#include <numeric>

namespace phinet {

NodeSummary computeSummary(const SignalMatrix& adjusted) {
    NodeSummary s;
    const std::size_t n = static_cast<std::size_t>(adjusted.rows > 0 ? adjusted.rows : 0);
    s.energy_loss.reserve(n);
    s.final_phase.reserve(n);

    for (int i = 0; i < adjusted.rows; ++i) {
        const double* row = adjusted.row(i);
        double energy = 0.0;
        for (int c = 0; c < adjusted.cols; ++c) {
            energy += std::fabs(row[c]);
        }
        s.energy_loss.push_back(energy);
        s.final_phase.push_back(rowMax(adjusted, i));
    }
    return s;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace phinet
