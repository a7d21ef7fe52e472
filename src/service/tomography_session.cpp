#include "service/tomography_session.hpp"

#include "fidelity.hpp"
#include "pauli_basis.hpp"
#include "random_stream.hpp"
#include "service/config_validation.hpp"

#include <random>
#include <sstream>
#include <string>
#include <utility>

namespace service {

namespace {

// Independent seeds for each stochastic stage of a run.
struct StageSeeds {
    std::uint64_t true_state = 0;
    std::uint64_t measurement = 0;
    std::uint64_t estimator = 0;
};

StageSeeds derive_stage_seeds(std::uint64_t seed) {
    std::mt19937_64 seed_rng(seed);
    StageSeeds seeds;
    seeds.true_state = seed_rng();
    seeds.measurement = seed_rng();
    seeds.estimator = seed_rng();
    return seeds;
}

std::string format_bloch(const BlochVector& v) {
    std::ostringstream oss;
    oss << "(" << v.x << "," << v.y << "," << v.z << ")";
    return oss.str();
}

}  // namespace

TomographySession create(const TomographyConfig& config, std::optional<std::uint64_t> seed) {
    validate_config(config);

    TomographySession session;
    session.config = config;
    session.seed = seed ? *seed : std::random_device{}();

    if (config.thetas && config.phis) {
        session.true_params.thetas = *config.thetas;
        session.true_params.phis = *config.phis;
    } else {
        SeededRandomStream rng(derive_stage_seeds(session.seed).true_state);
        session.true_params = random_parameters(config.qubits.n_qubits, rng);
    }
    session.true_state = generate_state(session.true_params);
    return session;
}

std::size_t total_steps(const TomographyConfig& config) {
    const std::size_t settings = enumerate_basis_settings(config.qubits.n_qubits).size();
    return settings + config.estimator.attempts;
}

TomographyResult run(const TomographySession& session, mle_tomography::ProgressReporter* reporter) {
    const TomographyConfig& config = session.config;
    const QubitConfig& qubits = config.qubits;
    const StageSeeds seeds = derive_stage_seeds(session.seed);

    TomographyResult result;
    result.true_params = session.true_params;
    result.true_state = session.true_state;

    auto log_event = [&result, reporter](const std::string& category, const std::string& message) {
        result.logs.push_back(ExecutionLog{-1, category, message});
        if (reporter) {
            reporter->record_log(result.logs.back());
        }
    };

    if (reporter) {
        reporter->set_total_steps(total_steps(config));
    }
    {
        std::ostringstream oss;
        oss << "n_qubits=" << qubits.n_qubits
            << " shots_x=" << qubits.shots_x
            << " shots_y=" << qubits.shots_y
            << " shots_z=" << qubits.shots_z
            << " attempts=" << config.estimator.attempts
            << " seed=" << session.seed;
        log_event("Config", oss.str());
    }

    SeededRandomStream measurement_rng(seeds.measurement);
    for (const auto& setting : enumerate_basis_settings(qubits.n_qubits)) {
        result.outcomes.emplace(
            setting, simulate(session.true_state, setting, qubits, measurement_rng, log_event));
        if (reporter) {
            reporter->increment_completed_steps();
        }
    }
    log_event("Simulate", "settings=" + std::to_string(result.outcomes.size()));

    LikelihoodEstimator estimator(config.estimator);
    estimator.set_progress_reporter(reporter);
    EstimationResult estimation = estimator.estimate(result.outcomes, qubits, seeds.estimator);
    result.logs.insert(result.logs.end(), estimation.logs.begin(), estimation.logs.end());

    result.estimated_params = std::move(estimation.params);
    result.objective = estimation.objective;
    result.succeeded_attempts = estimation.succeeded_attempts;
    result.reconstructed_state = generate_state(result.estimated_params);
    result.fidelity = fidelity(result.true_state, result.reconstructed_state);
    result.true_reduced = reduced_states(result.true_state, qubits.n_qubits);
    result.reconstructed_reduced = reduced_states(result.reconstructed_state, qubits.n_qubits);

    std::ostringstream oss;
    oss << "fidelity=" << result.fidelity;
    for (std::size_t q = 0; q < result.true_reduced.size(); ++q) {
        oss << " q" << q
            << "_true=" << format_bloch(result.true_reduced[q].bloch)
            << " q" << q
            << "_est=" << format_bloch(result.reconstructed_reduced[q].bloch);
    }
    log_event("Result", oss.str());
    return result;
}

}  // namespace service
