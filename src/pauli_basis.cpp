#include "pauli_basis.hpp"

#include "qubit_ordering.hpp"
#include "tomography_errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

constexpr double kProbabilityTolerance = 1e-9;
constexpr char kPauliSymbols[4] = {'I', 'X', 'Y', 'Z'};

void check_setting(const StateVector& state, const BasisSetting& setting) {
    if (setting.empty() || state.size() != state_dimension(static_cast<int>(setting.size()))) {
        throw DimensionMismatch(
            "basis setting '" + setting + "' does not match a state of dimension " +
            std::to_string(state.size()));
    }
}

}  // namespace

std::array<std::complex<double>, 4> pauli_matrix(char symbol) {
    const std::complex<double> zero(0.0, 0.0);
    const std::complex<double> one(1.0, 0.0);
    const std::complex<double> imag(0.0, 1.0);
    switch (symbol) {
        case 'I':
            return {one, zero, zero, one};
        case 'X':
            return {zero, one, one, zero};
        case 'Y':
            return {zero, -imag, imag, zero};
        case 'Z':
            return {one, zero, zero, -one};
        default:
            throw std::invalid_argument(
                std::string("Unknown Pauli symbol: ") + symbol);
    }
}

ComplexMatrix kron(const ComplexMatrix& a, const ComplexMatrix& b) {
    ComplexMatrix out(a.dim * b.dim);
    for (std::size_t ar = 0; ar < a.dim; ++ar) {
        for (std::size_t ac = 0; ac < a.dim; ++ac) {
            const auto scale = a.at(ar, ac);
            if (scale == std::complex<double>(0.0, 0.0)) {
                continue;
            }
            for (std::size_t br = 0; br < b.dim; ++br) {
                for (std::size_t bc = 0; bc < b.dim; ++bc) {
                    out.at(ar * b.dim + br, ac * b.dim + bc) = scale * b.at(br, bc);
                }
            }
        }
    }
    return out;
}

ComplexMatrix pauli_product(const BasisSetting& setting) {
    if (setting.empty()) {
        throw DimensionMismatch("basis setting must name at least one qubit");
    }
    ComplexMatrix product(1);
    product.at(0, 0) = 1.0;
    for (char symbol : setting) {
        const auto u = pauli_matrix(symbol);
        ComplexMatrix single(2);
        single.data.assign(u.begin(), u.end());
        product = kron(product, single);
    }
    return product;
}

ComplexMatrix projector_plus(const BasisSetting& setting) {
    ComplexMatrix projector = pauli_product(setting);
    for (std::size_t r = 0; r < projector.dim; ++r) {
        for (std::size_t c = 0; c < projector.dim; ++c) {
            auto& entry = projector.at(r, c);
            if (r == c) {
                entry += 1.0;
            }
            entry *= 0.5;
        }
    }
    return projector;
}

void apply_pauli_x(StateVector& state, int n_qubits, int target) {
    const std::size_t dim = state.size();
    const std::size_t bit = qubit_mask(target, n_qubits);
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & bit) == 0) {
            const std::size_t j = i | bit;
            std::swap(state[i], state[j]);
        }
    }
}

void apply_pauli_y(StateVector& state, int n_qubits, int target) {
    const std::size_t dim = state.size();
    const std::size_t bit = qubit_mask(target, n_qubits);
    const std::complex<double> imag(0.0, 1.0);
    const std::complex<double> minus_imag(0.0, -1.0);
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & bit) == 0) {
            const std::size_t j = i | bit;
            const auto a0 = state[i];
            const auto a1 = state[j];
            state[i] = minus_imag * a1;
            state[j] = imag * a0;
        }
    }
}

void apply_pauli_z(StateVector& state, int n_qubits, int target) {
    const std::size_t dim = state.size();
    const std::size_t bit = qubit_mask(target, n_qubits);
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & bit) != 0) {
            state[i] = -state[i];
        }
    }
}

void apply_pauli_string(StateVector& state, const BasisSetting& setting) {
    check_setting(state, setting);
    const int n_qubits = static_cast<int>(setting.size());
    for (int q = 0; q < n_qubits; ++q) {
        switch (setting[static_cast<std::size_t>(q)]) {
            case 'I':
                break;
            case 'X':
                apply_pauli_x(state, n_qubits, q);
                break;
            case 'Y':
                apply_pauli_y(state, n_qubits, q);
                break;
            case 'Z':
                apply_pauli_z(state, n_qubits, q);
                break;
            default:
                throw std::invalid_argument(
                    std::string("Unknown Pauli symbol: ") +
                    setting[static_cast<std::size_t>(q)]);
        }
    }
}

double probability_plus(
    const StateVector& state,
    const BasisSetting& setting,
    const LogSink& sink
) {
    StateVector rotated = state;
    apply_pauli_string(rotated, setting);

    std::complex<double> expectation(0.0, 0.0);
    for (std::size_t i = 0; i < state.size(); ++i) {
        expectation += std::conj(state[i]) * rotated[i];
    }
    const double raw = 0.5 * (1.0 + expectation.real());

    if (sink) {
        if (std::fabs(0.5 * expectation.imag()) > kProbabilityTolerance) {
            std::ostringstream oss;
            oss << "type=imaginary_residue setting=" << setting
                << " imag=" << 0.5 * expectation.imag();
            sink(kNumericalInstabilityCategory, oss.str());
        }
        if (raw < -kProbabilityTolerance || raw > 1.0 + kProbabilityTolerance) {
            std::ostringstream oss;
            oss << "type=probability_clamped setting=" << setting << " p=" << raw;
            sink(kNumericalInstabilityCategory, oss.str());
        }
    }
    return std::clamp(raw, 0.0, 1.0);
}

double probability_minus(
    const StateVector& state,
    const BasisSetting& setting,
    const LogSink& sink
) {
    return 1.0 - probability_plus(state, setting, sink);
}

bool is_identity_setting(const BasisSetting& setting) {
    return std::all_of(setting.begin(), setting.end(), [](char c) { return c == 'I'; });
}

std::vector<BasisSetting> enumerate_basis_settings(int n_qubits) {
    if (n_qubits < 1 || n_qubits > kMaxQubits) {
        throw DimensionMismatch(
            "qubit count must be in [1, " + std::to_string(kMaxQubits) +
            "], got " + std::to_string(n_qubits));
    }
    const std::size_t count = state_dimension(2 * n_qubits);
    std::vector<BasisSetting> settings;
    settings.reserve(count - 1);
    for (std::size_t code = 1; code < count; ++code) {
        BasisSetting setting(static_cast<std::size_t>(n_qubits), 'I');
        std::size_t rest = code;
        for (int q = n_qubits - 1; q >= 0; --q) {
            setting[static_cast<std::size_t>(q)] = kPauliSymbols[rest % 4];
            rest /= 4;
        }
        settings.push_back(std::move(setting));
    }
    return settings;
}
