#include "state_parameterization.hpp"

#include "qubit_ordering.hpp"
#include "tomography_errors.hpp"

#include <cmath>
#include <string>

std::size_t parameter_count(int n_qubits) {
    if (n_qubits < 1 || n_qubits > kMaxQubits) {
        throw DimensionMismatch(
            "qubit count must be in [1, " + std::to_string(kMaxQubits) +
            "], got " + std::to_string(n_qubits));
    }
    return state_dimension(n_qubits) - 1;
}

int qubits_for_parameter_count(std::size_t count) {
    for (int n = 1; n <= kMaxQubits; ++n) {
        const std::size_t expected = state_dimension(n) - 1;
        if (expected == count) {
            return n;
        }
        if (expected > count) {
            break;
        }
    }
    throw DimensionMismatch(
        "angle count " + std::to_string(count) + " is not 2^n - 1 for any n >= 1");
}

StateVector generate_state(
    const std::vector<double>& thetas,
    const std::vector<double>& phis
) {
    if (thetas.size() != phis.size()) {
        throw DimensionMismatch(
            "thetas and phis differ in length: " + std::to_string(thetas.size()) +
            " vs " + std::to_string(phis.size()));
    }
    const int n_qubits = qubits_for_parameter_count(thetas.size());
    const std::size_t dim = state_dimension(n_qubits);

    StateVector state(dim);
    double residual = 1.0;
    for (std::size_t i = 0; i + 1 < dim; ++i) {
        const double magnitude = residual * std::cos(0.5 * thetas[i]);
        if (i == 0) {
            state[i] = std::complex<double>(magnitude, 0.0);
        } else {
            state[i] = magnitude * std::exp(std::complex<double>(0.0, phis[i - 1]));
        }
        residual *= std::sin(0.5 * thetas[i]);
    }
    state[dim - 1] = residual * std::exp(std::complex<double>(0.0, phis[dim - 2]));
    return state;
}

StateVector generate_state(const ParameterVector& params) {
    return generate_state(params.thetas, params.phis);
}

ParameterVector random_parameters(int n_qubits, RandomStream& rng) {
    const std::size_t count = parameter_count(n_qubits);
    ParameterVector params;
    params.thetas.reserve(count);
    params.phis.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        params.thetas.push_back(rng.uniform(0.0, kPi));
    }
    for (std::size_t i = 0; i < count; ++i) {
        params.phis.push_back(rng.uniform(0.0, 2.0 * kPi));
    }
    return params;
}

std::vector<double> flatten(const ParameterVector& params) {
    std::vector<double> flat;
    flat.reserve(params.thetas.size() + params.phis.size());
    flat.insert(flat.end(), params.thetas.begin(), params.thetas.end());
    flat.insert(flat.end(), params.phis.begin(), params.phis.end());
    return flat;
}

ParameterVector unflatten(const std::vector<double>& flat) {
    if (flat.size() % 2 != 0) {
        throw DimensionMismatch(
            "flat parameter vector has odd length " + std::to_string(flat.size()));
    }
    const std::size_t half = flat.size() / 2;
    ParameterVector params;
    params.thetas.assign(flat.begin(), flat.begin() + static_cast<std::ptrdiff_t>(half));
    params.phis.assign(flat.begin() + static_cast<std::ptrdiff_t>(half), flat.end());
    return params;
}
