#pragma once

#include <array>
#include <complex>
#include <cstddef>
#include <string>
#include <vector>

#include "log_record.types.hpp"
#include "state_parameterization.hpp"

// One Pauli symbol (I, X, Y, Z) per qubit, qubit 0 first.
using BasisSetting = std::string;

// Row-major square matrix.
struct ComplexMatrix {
    std::size_t dim = 0;
    std::vector<std::complex<double>> data;

    ComplexMatrix() = default;
    explicit ComplexMatrix(std::size_t d)
        : dim(d), data(d * d, std::complex<double>(0.0, 0.0)) {}

    std::complex<double>& at(std::size_t row, std::size_t col) {
        return data[row * dim + col];
    }
    const std::complex<double>& at(std::size_t row, std::size_t col) const {
        return data[row * dim + col];
    }
};

std::array<std::complex<double>, 4> pauli_matrix(char symbol);

ComplexMatrix kron(const ComplexMatrix& a, const ComplexMatrix& b);

// Tensor product of the named Pauli matrices, qubit 0 leftmost.
ComplexMatrix pauli_product(const BasisSetting& setting);

// (I + P) / 2, the projector onto the +1 eigenspace of the joint observable.
ComplexMatrix projector_plus(const BasisSetting& setting);

// In-place application of single-qubit Paulis, big-endian qubit indexing.
void apply_pauli_x(StateVector& state, int n_qubits, int target);
void apply_pauli_y(StateVector& state, int n_qubits, int target);
void apply_pauli_z(StateVector& state, int n_qubits, int target);
void apply_pauli_string(StateVector& state, const BasisSetting& setting);

// <state| projector_plus(setting) |state>, clamped to [0, 1]. Imaginary
// residue or out-of-range values beyond tolerance are reported to `sink`.
double probability_plus(
    const StateVector& state,
    const BasisSetting& setting,
    const LogSink& sink = {}
);

double probability_minus(
    const StateVector& state,
    const BasisSetting& setting,
    const LogSink& sink = {}
);

bool is_identity_setting(const BasisSetting& setting);

// All 4^n - 1 non-identity settings, ordered lexicographically over I < X < Y < Z.
std::vector<BasisSetting> enumerate_basis_settings(int n_qubits);
