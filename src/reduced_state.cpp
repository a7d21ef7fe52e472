#include "reduced_state.hpp"

#include "qubit_ordering.hpp"
#include "tomography_errors.hpp"

#include <stdexcept>
#include <string>

ComplexMatrix density_matrix(const StateVector& state) {
    ComplexMatrix rho(state.size());
    for (std::size_t r = 0; r < state.size(); ++r) {
        for (std::size_t c = 0; c < state.size(); ++c) {
            rho.at(r, c) = state[r] * std::conj(state[c]);
        }
    }
    return rho;
}

ReducedDensityMatrix partial_trace(const ComplexMatrix& rho, int n_qubits, int target_qubit) {
    if (n_qubits < 1 || rho.dim != state_dimension(n_qubits) ||
        rho.data.size() != rho.dim * rho.dim) {
        throw DimensionMismatch(
            "density matrix of dimension " + std::to_string(rho.dim) +
            " does not describe " + std::to_string(n_qubits) + " qubits");
    }
    if (target_qubit < 0 || target_qubit >= n_qubits) {
        throw std::out_of_range("partial trace target qubit out of range");
    }

    const std::size_t mask = qubit_mask(target_qubit, n_qubits);
    ReducedDensityMatrix reduced{};
    // Walk every index with the target bit cleared; it labels one
    // configuration of the traced-out qubits.
    for (std::size_t rest = 0; rest < rho.dim; ++rest) {
        if (qubit_bit(rest, target_qubit, n_qubits) != 0) {
            continue;
        }
        for (std::size_t a = 0; a < 2; ++a) {
            for (std::size_t b = 0; b < 2; ++b) {
                const std::size_t row = a ? (rest | mask) : rest;
                const std::size_t col = b ? (rest | mask) : rest;
                reduced[2 * a + b] += rho.at(row, col);
            }
        }
    }
    return reduced;
}

BlochVector bloch_vector(const ReducedDensityMatrix& rho) {
    BlochVector v;
    v.x = 2.0 * rho[1].real();
    v.y = 2.0 * rho[2].imag();
    v.z = (rho[0] - rho[3]).real();
    return v;
}

std::vector<ReducedState> reduced_states(const StateVector& state, int n_qubits) {
    if (n_qubits < 1 || state.size() != state_dimension(n_qubits)) {
        throw DimensionMismatch(
            "state of dimension " + std::to_string(state.size()) +
            " does not describe " + std::to_string(n_qubits) + " qubits");
    }
    const ComplexMatrix rho = density_matrix(state);
    std::vector<ReducedState> out;
    out.reserve(static_cast<std::size_t>(n_qubits));
    for (int q = 0; q < n_qubits; ++q) {
        ReducedState reduced;
        reduced.rho = partial_trace(rho, n_qubits, q);
        reduced.bloch = bloch_vector(reduced.rho);
        out.push_back(reduced);
    }
    return out;
}
