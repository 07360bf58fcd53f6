#pragma once

#include <vector>

#include "SignalMatrix.h"

namespace phinet {

// |DFT| of every row (forward transform, no window, no scaling), keeping the
// first floor(cols/2) bins. Output is rows x floor(cols/2).
SignalMatrix computeSpectralMagnitude(const SignalMatrix& adjusted);

// Index of the largest bin per row; lowest index wins ties, -1 for an empty row.
std::vector<int> dominantBins(const SignalMatrix& spectral);

// Frequency of DFT bin `bin` for sample_count samples spread over span_s
// (endpoints included). Returns 0 when the grid has no spacing.
double binFrequencyHz(int bin, int sample_count, double span_s);

} // namespace phinet
