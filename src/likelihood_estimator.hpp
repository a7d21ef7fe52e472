#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "local_optimizer.hpp"
#include "log_record.types.hpp"
#include "measurement_simulator.hpp"
#include "state_parameterization.hpp"

namespace mle_tomography {
class ProgressReporter;
}

// Regularizer inside log(p + eps) and log(1 - p + eps).
inline constexpr double kLikelihoodEpsilon = 1e-10;

double negative_log_likelihood(
    const ParameterVector& params,
    const OutcomeSet& outcomes,
    const QubitConfig& config
);

double negative_log_likelihood(
    const StateVector& state,
    const std::vector<OutcomeTally>& tallies,
    const LogSink& sink = {}
);

// Restart strategy for the likelihood search. Each attempt starts from an
// independent uniform draw and is bounded to thetas in [0, pi] and phis in
// [0, 2pi - phi_margin].
struct MultiStartConfig {
    std::size_t attempts = 50;
    double phi_margin = 1e-6;
    // 0 selects MLE_TOMO_MAX_THREADS, or the hardware concurrency.
    std::size_t max_threads = 0;
    int max_evaluations = 2000;
    double relative_tolerance = 1e-8;
};

struct AttemptReport {
    int attempt = 0;
    bool succeeded = false;
    double objective = 0.0;
    int evaluations = 0;
    std::string status;
};

struct EstimationResult {
    ParameterVector params;
    double objective = 0.0;
    int best_attempt = -1;
    std::size_t succeeded_attempts = 0;
    std::size_t failed_attempts = 0;
    std::vector<AttemptReport> attempts;
    std::vector<ExecutionLog> logs;
};

OptimizationBounds parameter_bounds(int n_qubits, double phi_margin);

class LikelihoodEstimator {
  public:
    explicit LikelihoodEstimator(
        MultiStartConfig config = {},
        std::shared_ptr<const LocalOptimizer> optimizer = nullptr
    );

    void set_progress_reporter(mle_tomography::ProgressReporter* reporter);

    const MultiStartConfig& config() const { return config_; }
    const LocalOptimizer& optimizer() const { return *optimizer_; }

    // Runs every attempt, then keeps the lowest finite objective (earliest
    // attempt on ties). Throws ConvergenceFailure when no attempt succeeds.
    EstimationResult estimate(
        const OutcomeSet& outcomes,
        const QubitConfig& qubits,
        std::uint64_t seed
    ) const;

  private:
    MultiStartConfig config_;
    std::shared_ptr<const LocalOptimizer> optimizer_;
    mle_tomography::ProgressReporter* progress_reporter_ = nullptr;
};

// Maximum-likelihood parameters with the default restart strategy. A random
// seed is drawn when none is given.
ParameterVector estimate(
    const OutcomeSet& outcomes,
    const QubitConfig& config,
    std::optional<std::uint64_t> seed = std::nullopt
);

std::size_t default_worker_limit();
