#include "qubit_ordering.hpp"
#include "state_parameterization.hpp"
#include "tomography_errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <complex>
#include <vector>

namespace {

double norm_squared(const StateVector& state) {
    double total = 0.0;
    for (const auto& amp : state) {
        total += std::norm(amp);
    }
    return total;
}

}  // namespace

TEST(StateParameterizationTests, ZeroThetaGivesGroundState) {
    const auto state = generate_state({0.0}, {0.0});
    ASSERT_EQ(state.size(), 2u);
    EXPECT_NEAR(std::abs(state[0] - std::complex<double>(1.0, 0.0)), 0.0, 1e-12);
    EXPECT_NEAR(std::abs(state[1]), 0.0, 1e-12);
}

TEST(StateParameterizationTests, PiThetaGivesExcitedState) {
    const auto state = generate_state({kPi}, {0.0});
    EXPECT_NEAR(std::abs(state[0]), 0.0, 1e-12);
    EXPECT_NEAR(std::abs(state[1] - std::complex<double>(1.0, 0.0)), 0.0, 1e-12);
}

TEST(StateParameterizationTests, HalfPiThetaGivesEqualSuperposition) {
    const auto state = generate_state({kPi / 2.0}, {0.0});
    EXPECT_NEAR(state[0].real(), 0.70710678118654752, 1e-12);
    EXPECT_NEAR(state[1].real(), 0.70710678118654752, 1e-12);
    EXPECT_NEAR(state[1].imag(), 0.0, 1e-12);
}

TEST(StateParameterizationTests, PhasesFollowPeelingOrder) {
    // Two qubits: amplitude k > 0 carries phis[k - 1].
    const std::vector<double> thetas = {kPi / 2.0, kPi / 2.0, kPi / 2.0};
    const std::vector<double> phis = {0.3, 0.7, 1.1};
    const auto state = generate_state(thetas, phis);
    ASSERT_EQ(state.size(), 4u);
    EXPECT_NEAR(state[0].imag(), 0.0, 1e-12);
    EXPECT_NEAR(std::arg(state[1]), 0.3, 1e-12);
    EXPECT_NEAR(std::arg(state[2]), 0.7, 1e-12);
    EXPECT_NEAR(std::arg(state[3]), 1.1, 1e-12);
    EXPECT_NEAR(std::abs(state[0]), std::cos(kPi / 4.0), 1e-12);
    EXPECT_NEAR(std::abs(state[3]), std::pow(std::sin(kPi / 4.0), 3), 1e-12);
}

TEST(StateParameterizationTests, ThetaBeyondPiKeepsSignedMagnitude) {
    // cos(theta / 2) turns negative past pi; the amplitude must keep that sign.
    const std::vector<double> thetas = {kPi / 2.0, 1.5 * kPi, kPi / 2.0};
    const std::vector<double> phis = {0.4, 0.9, 1.3};
    const auto state = generate_state(thetas, phis);
    const std::complex<double> expected =
        std::sin(kPi / 4.0) * std::cos(0.75 * kPi) * std::exp(std::complex<double>(0.0, 0.4));
    EXPECT_NEAR(std::abs(state[1] - expected), 0.0, 1e-12);
    EXPECT_NEAR(norm_squared(state), 1.0, 1e-12);
}

TEST(StateParameterizationTests, QubitZeroIsMostSignificantBit) {
    EXPECT_EQ(qubit_mask(0, 3), 4u);
    EXPECT_EQ(qubit_mask(2, 3), 1u);
    // Index 6 is |110>.
    EXPECT_EQ(qubit_bit(6, 0, 3), 1);
    EXPECT_EQ(qubit_bit(6, 1, 3), 1);
    EXPECT_EQ(qubit_bit(6, 2, 3), 0);
    for (std::size_t index = 0; index < state_dimension(3); ++index) {
        std::size_t rebuilt = 0;
        for (int q = 0; q < 3; ++q) {
            if (qubit_bit(index, q, 3) != 0) {
                rebuilt |= qubit_mask(q, 3);
            }
        }
        EXPECT_EQ(rebuilt, index);
    }
}

TEST(StateParameterizationTests, RandomParametersProduceUnitNorm) {
    SeededRandomStream rng(1234);
    for (int n = 1; n <= 4; ++n) {
        for (int trial = 0; trial < 25; ++trial) {
            const auto params = random_parameters(n, rng);
            ASSERT_EQ(params.thetas.size(), parameter_count(n));
            for (double theta : params.thetas) {
                EXPECT_GE(theta, 0.0);
                EXPECT_LE(theta, kPi);
            }
            for (double phi : params.phis) {
                EXPECT_GE(phi, 0.0);
                EXPECT_LT(phi, 2.0 * kPi);
            }
            const auto state = generate_state(params);
            EXPECT_EQ(state.size(), static_cast<std::size_t>(1) << n);
            EXPECT_NEAR(norm_squared(state), 1.0, 1e-9);
        }
    }
}

TEST(StateParameterizationTests, RejectsMismatchedLengths) {
    EXPECT_THROW(generate_state({0.1, 0.2, 0.3}, {0.1, 0.2}), DimensionMismatch);
    EXPECT_THROW(generate_state({0.1, 0.2}, {0.1, 0.2}), DimensionMismatch);
    EXPECT_THROW(generate_state({}, {}), DimensionMismatch);
}

TEST(StateParameterizationTests, ParameterCountRoundTrips) {
    EXPECT_EQ(parameter_count(1), 1u);
    EXPECT_EQ(parameter_count(3), 7u);
    EXPECT_EQ(qubits_for_parameter_count(15), 4);
    EXPECT_THROW(qubits_for_parameter_count(4), DimensionMismatch);
    EXPECT_THROW(parameter_count(0), DimensionMismatch);
}

TEST(StateParameterizationTests, FlattenKeepsThetasBeforePhis) {
    ParameterVector params;
    params.thetas = {1.0, 2.0, 3.0};
    params.phis = {4.0, 5.0, 6.0};
    const auto flat = flatten(params);
    EXPECT_EQ(flat, std::vector<double>({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}));
    const auto back = unflatten(flat);
    EXPECT_EQ(back.thetas, params.thetas);
    EXPECT_EQ(back.phis, params.phis);
    EXPECT_THROW(unflatten({1.0, 2.0, 3.0}), DimensionMismatch);
}
