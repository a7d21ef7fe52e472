#pragma once

#include <complex>
#include <cstddef>
#include <vector>

#include "random_stream.hpp"

inline constexpr double kPi = 3.14159265358979323846;

using StateVector = std::vector<std::complex<double>>;

// Hyperspherical angles of an n-qubit pure state. Both sequences hold
// 2^n - 1 entries; thetas lie in [0, pi] and phis in [0, 2pi).
struct ParameterVector {
    std::vector<double> thetas;
    std::vector<double> phis;
};

std::size_t parameter_count(int n_qubits);

// Inverse of parameter_count. Throws DimensionMismatch when `count` is not
// of the form 2^n - 1 with n >= 1.
int qubits_for_parameter_count(std::size_t count);

// Builds the amplitudes by peeling a residual magnitude off one basis state
// at a time. The result has unit norm by construction.
StateVector generate_state(
    const std::vector<double>& thetas,
    const std::vector<double>& phis
);

StateVector generate_state(const ParameterVector& params);

ParameterVector random_parameters(int n_qubits, RandomStream& rng);

// Flat layout used by the optimizer: thetas followed by phis.
std::vector<double> flatten(const ParameterVector& params);
ParameterVector unflatten(const std::vector<double>& flat);
