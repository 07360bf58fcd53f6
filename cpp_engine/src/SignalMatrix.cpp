#include "SignalMatrix.h"

#include <cmath>

namespace phinet {

double rowPeakAbs(const SignalMatrix& m, int r) {
    const double* p = m.row(r);
    double peak = 0.0;
    for (int c = 0; c < m.cols; ++c) {
        const double a = std::fabs(p[c]);
        if (a > peak) {
            peak = a;
        }
    }
    return peak;
}

double rowMax(const SignalMatrix& m, int r) {
    if (m.cols <= 0) {
        return 0.0;
    }
    const double* p = m.row(r);
    double best = p[0];
    for (int c = 1; c < m.cols; ++c) {
        if (p[c] > best) {
            best = p[c];
        }
    }
    return best;
}

} // namespace phinet
