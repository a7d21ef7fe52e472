#include "fidelity.hpp"
#include "reduced_state.hpp"
#include "tomography_errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <complex>
#include <stdexcept>

TEST(FidelityTests, StateWithItselfIsOne) {
    SeededRandomStream rng(5);
    for (int n = 1; n <= 3; ++n) {
        const auto state = generate_state(random_parameters(n, rng));
        EXPECT_NEAR(fidelity(state, state), 1.0, 1e-12);
    }
}

TEST(FidelityTests, IsSymmetric) {
    SeededRandomStream rng(6);
    const auto a = generate_state(random_parameters(2, rng));
    const auto b = generate_state(random_parameters(2, rng));
    EXPECT_NEAR(fidelity(a, b), fidelity(b, a), 1e-14);
    EXPECT_GE(fidelity(a, b), 0.0);
    EXPECT_LE(fidelity(a, b), 1.0);
}

TEST(FidelityTests, OrthogonalBasisStatesScoreZero) {
    const auto zero = generate_state({0.0}, {0.0});
    const auto one = generate_state({kPi}, {0.0});
    EXPECT_NEAR(fidelity(zero, one), 0.0, 1e-12);
}

TEST(FidelityTests, IgnoresGlobalPhase) {
    SeededRandomStream rng(8);
    const auto state = generate_state(random_parameters(2, rng));
    StateVector rotated = state;
    for (auto& amp : rotated) {
        amp *= std::polar(1.0, 0.9);
    }
    EXPECT_NEAR(fidelity(state, rotated), 1.0, 1e-12);
}

TEST(FidelityTests, RejectsDimensionMismatch) {
    const auto one_qubit = generate_state({0.0}, {0.0});
    const auto two_qubit = generate_state({0.0, 0.0, 0.0}, {0.0, 0.0, 0.0});
    EXPECT_THROW(fidelity(one_qubit, two_qubit), DimensionMismatch);
}

TEST(ReducedStateTests, ProductStateTracesToFactors) {
    // |0> (x) |1>: qubit 0 is the most significant bit, so index 1.
    StateVector state(4, std::complex<double>(0.0, 0.0));
    state[1] = 1.0;
    const auto rho = density_matrix(state);

    const auto first = partial_trace(rho, 2, 0);
    EXPECT_NEAR(std::abs(first[0] - 1.0), 0.0, 1e-15);
    EXPECT_NEAR(std::abs(first[1]), 0.0, 1e-15);
    EXPECT_NEAR(std::abs(first[2]), 0.0, 1e-15);
    EXPECT_NEAR(std::abs(first[3]), 0.0, 1e-15);

    const auto second = partial_trace(rho, 2, 1);
    EXPECT_NEAR(std::abs(second[0]), 0.0, 1e-15);
    EXPECT_NEAR(std::abs(second[3] - 1.0), 0.0, 1e-15);
}

TEST(ReducedStateTests, BellStateReducesToMaximallyMixed) {
    StateVector state(4, std::complex<double>(0.0, 0.0));
    state[0] = 1.0 / std::sqrt(2.0);
    state[3] = 1.0 / std::sqrt(2.0);
    for (const auto& reduced : reduced_states(state, 2)) {
        EXPECT_NEAR(reduced.rho[0].real(), 0.5, 1e-12);
        EXPECT_NEAR(reduced.rho[3].real(), 0.5, 1e-12);
        EXPECT_NEAR(std::abs(reduced.rho[1]), 0.0, 1e-12);
        EXPECT_NEAR(reduced.bloch.x, 0.0, 1e-12);
        EXPECT_NEAR(reduced.bloch.y, 0.0, 1e-12);
        EXPECT_NEAR(reduced.bloch.z, 0.0, 1e-12);
    }
}

TEST(ReducedStateTests, BlochVectorsOfAxisStates) {
    const auto plus = reduced_states(generate_state({kPi / 2.0}, {0.0}), 1);
    EXPECT_NEAR(plus[0].bloch.x, 1.0, 1e-12);
    EXPECT_NEAR(plus[0].bloch.y, 0.0, 1e-12);
    EXPECT_NEAR(plus[0].bloch.z, 0.0, 1e-12);

    const auto plus_i = reduced_states(generate_state({kPi / 2.0}, {kPi / 2.0}), 1);
    EXPECT_NEAR(plus_i[0].bloch.x, 0.0, 1e-12);
    EXPECT_NEAR(plus_i[0].bloch.y, 1.0, 1e-12);

    const auto one = reduced_states(generate_state({kPi}, {0.0}), 1);
    EXPECT_NEAR(one[0].bloch.z, -1.0, 1e-12);
}

TEST(ReducedStateTests, ReducedMatricesAreUnitTraceHermitian) {
    SeededRandomStream rng(21);
    const auto state = generate_state(random_parameters(3, rng));
    for (const auto& reduced : reduced_states(state, 3)) {
        EXPECT_NEAR((reduced.rho[0] + reduced.rho[3]).real(), 1.0, 1e-12);
        EXPECT_NEAR(std::abs(reduced.rho[1] - std::conj(reduced.rho[2])), 0.0, 1e-12);
        const auto& v = reduced.bloch;
        EXPECT_LE(std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z), 1.0 + 1e-12);
    }
}

TEST(ReducedStateTests, RejectsBadArguments) {
    const auto rho = density_matrix(generate_state({0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}));
    EXPECT_THROW(partial_trace(rho, 3, 0), DimensionMismatch);
    EXPECT_THROW(partial_trace(rho, 2, 2), std::out_of_range);
    EXPECT_THROW(reduced_states(StateVector(3), 2), DimensionMismatch);
}
