#pragma once

#include <cstddef>

// Qubit-to-bit convention shared by state construction, Pauli application
// and the partial trace. Qubit 0 is the most significant bit of a
// computational-basis index (big-endian), so the amplitude at index k of an
// n-qubit state belongs to the basis state |b_0 b_1 ... b_{n-1}> whose
// binary expansion, read left to right, is k.

// Largest register whose 2^n - 1 angles and 4^n - 1 settings stay addressable.
inline constexpr int kMaxQubits = 30;

inline std::size_t bit_position(int qubit, int n_qubits) {
    return static_cast<std::size_t>(n_qubits - 1 - qubit);
}

inline std::size_t qubit_mask(int qubit, int n_qubits) {
    return static_cast<std::size_t>(1) << bit_position(qubit, n_qubits);
}

inline int qubit_bit(std::size_t index, int qubit, int n_qubits) {
    return static_cast<int>((index >> bit_position(qubit, n_qubits)) & 1ULL);
}

inline std::size_t state_dimension(int n_qubits) {
    return static_cast<std::size_t>(1) << n_qubits;
}
