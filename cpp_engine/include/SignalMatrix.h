#pragma once

// SignalMatrix.h
//
// Row-major dense matrix used by every pipeline stage.
//   - rows = nodes
//   - cols = time samples (or spectral bins)
// No bounds checking beyond debug-free accessors; callers own shape validity.

#include <cstddef>
#include <vector>

namespace phinet {

struct SignalMatrix {
    int rows = 0;
    int cols = 0;
    std::vector<double> values;

    SignalMatrix() = default;
    SignalMatrix(int r, int c)
        : rows(r), cols(c),
          values(static_cast<std::size_t>(r > 0 ? r : 0) * static_cast<std::size_t>(c > 0 ? c : 0), 0.0) {}

    bool empty() const { return values.empty(); }

    double* row(int r) { return values.data() + index(r, 0); }
    const double* row(int r) const { return values.data() + index(r, 0); }

    double& at(int r, int c) { return values[index(r, c)]; }
    double at(int r, int c) const { return values[index(r, c)]; }

    std::vector<double> rowCopy(int r) const {
        const double* p = row(r);
        return std::vector<double>(p, p + cols);
    }

    std::vector<double> columnCopy(int c) const {
        std::vector<double> out;
        out.reserve(static_cast<std::size_t>(rows));
        for (int r = 0; r < rows; ++r) {
            out.push_back(at(r, c));
        }
        return out;
    }

private:
    std::size_t index(int r, int c) const {
        return static_cast<std::size_t>(r) * static_cast<std::size_t>(cols) + static_cast<std::size_t>(c);
    }
};

// Largest |x| in a row; 0 for an empty row.
double rowPeakAbs(const SignalMatrix& m, int r);

// Largest raw value in a row; 0 for an empty row.
double rowMax(const SignalMatrix& m, int r);

} // namespace phinet
