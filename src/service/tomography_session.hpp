#pragma once

#include "likelihood_estimator.hpp"
#include "log_record.types.hpp"
#include "measurement_simulator.hpp"
#include "progress_reporter.hpp"
#include "reduced_state.hpp"
#include "state_parameterization.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace service {

struct TomographyConfig {
    QubitConfig qubits;
    // Supplied true-state angles. Both must be set together; otherwise the
    // true state is drawn at random.
    std::optional<std::vector<double>> thetas;
    std::optional<std::vector<double>> phis;
    MultiStartConfig estimator;
};

// Fixed inputs of one tomography run.
struct TomographySession {
    TomographyConfig config;
    std::uint64_t seed = 0;
    ParameterVector true_params;
    StateVector true_state;
};

struct TomographyResult {
    ParameterVector true_params;
    ParameterVector estimated_params;
    StateVector true_state;
    StateVector reconstructed_state;
    double fidelity = 0.0;
    double objective = 0.0;
    std::size_t succeeded_attempts = 0;
    OutcomeSet outcomes;
    std::vector<ReducedState> true_reduced;
    std::vector<ReducedState> reconstructed_reduced;
    std::vector<ExecutionLog> logs;
};

// Validates the configuration before any sampling and prepares the true
// state. Without a seed one is drawn from std::random_device.
TomographySession create(
    const TomographyConfig& config,
    std::optional<std::uint64_t> seed = std::nullopt
);

TomographyResult run(
    const TomographySession& session,
    mle_tomography::ProgressReporter* reporter = nullptr
);

// Number of progress steps `run` reports for this configuration.
std::size_t total_steps(const TomographyConfig& config);

}  // namespace service
