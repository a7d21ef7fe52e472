#include "fidelity.hpp"

#include "tomography_errors.hpp"

#include <algorithm>
#include <complex>
#include <string>

double fidelity(const StateVector& a, const StateVector& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatch(
            "cannot compare states of dimension " + std::to_string(a.size()) +
            " and " + std::to_string(b.size()));
    }
    std::complex<double> overlap(0.0, 0.0);
    for (std::size_t i = 0; i < a.size(); ++i) {
        overlap += std::conj(a[i]) * b[i];
    }
    return std::clamp(std::norm(overlap), 0.0, 1.0);
}
