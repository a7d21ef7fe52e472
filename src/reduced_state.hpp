#pragma once

#include <array>
#include <complex>
#include <vector>

#include "pauli_basis.hpp"
#include "state_parameterization.hpp"

// 2x2 row-major single-qubit density matrix: {rho00, rho01, rho10, rho11}.
using ReducedDensityMatrix = std::array<std::complex<double>, 4>;

struct BlochVector {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct ReducedState {
    ReducedDensityMatrix rho{};
    BlochVector bloch;
};

// |state><state| as a row-major 2^n x 2^n matrix.
ComplexMatrix density_matrix(const StateVector& state);

// Traces out every qubit except `target_qubit`. Indices are decomposed with
// the big-endian convention of qubit_ordering.hpp.
ReducedDensityMatrix partial_trace(const ComplexMatrix& rho, int n_qubits, int target_qubit);

BlochVector bloch_vector(const ReducedDensityMatrix& rho);

// One entry per qubit, qubit 0 first.
std::vector<ReducedState> reduced_states(const StateVector& state, int n_qubits);
