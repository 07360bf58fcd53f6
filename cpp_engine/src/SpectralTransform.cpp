#include "SpectralTransform.h"

#include <cmath>
#include <complex>
#include <cstddef>

#include <Eigen/Core>
#include <unsupported/Eigen/FFT>

namespace phinet {

SignalMatrix computeSpectralMagnitude(const SignalMatrix& adjusted) {
    const int n = adjusted.cols;
    const int half = n / 2;
    SignalMatrix out(adjusted.rows, half);
    if (half == 0) {
        return out;
    }

    using ComplexVector = Eigen::Matrix<std::complex<double>, Eigen::Dynamic, 1>;
    ComplexVector input(n);
    ComplexVector output(n);
    Eigen::FFT<double> fft;

    for (int i = 0; i < adjusted.rows; ++i) {
        const double* row = adjusted.row(i);
        for (int c = 0; c < n; ++c) {
            input[c] = std::complex<double>(row[c], 0.0);
        }
        fft.fwd(output, input);

        double* mag = out.row(i);
        for (int k = 0; k < half; ++k) {
            mag[k] = std::abs(output[k]);
        }
    }
    return out;
}

std::vector<int> dominantBins(const SignalMatrix& spectral) {
    std::vector<int> bins;
    bins.reserve(static_cast<std::size_t>(spectral.rows > 0 ? spectral.rows : 0));
    for (int i = 0; i < spectral.rows; ++i) {
        if (spectral.cols <= 0) {
            bins.push_back(-1);
            continue;
        }
        const double* row = spectral.row(i);
        int best = 0;
        for (int k = 1; k < spectral.cols; ++k) {
            if (row[k] > row[best]) {
                best = k;
            }
        }
        bins.push_back(best);
    }
    return bins;
}

double binFrequencyHz(int bin, int sample_count, double span_s) {
    if (bin < 0 || sample_count <= 1 || !(span_s > 0.0)) {
        return 0.0;
    }
    const double fs_hz = static_cast<double>(sample_count - 1) / span_s;
    return static_cast<double>(bin) * fs_hz / static_cast<double>(sample_count);
}

} // namespace phinet
