#include "likelihood_estimator.hpp"

#include "pauli_basis.hpp"
#include "progress_reporter.hpp"
#include "random_stream.hpp"
#include "tomography_errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {

std::vector<OutcomeTally> informative_tallies(const OutcomeSet& outcomes, int n_qubits) {
    std::vector<OutcomeTally> tallies;
    for (auto& t : tally(outcomes)) {
        if (static_cast<int>(t.setting.size()) != n_qubits) {
            throw DimensionMismatch(
                "outcomes for setting '" + t.setting + "' do not match " +
                std::to_string(n_qubits) + " qubits");
        }
        if (is_identity_setting(t.setting)) {
            continue;
        }
        tallies.push_back(std::move(t));
    }
    return tallies;
}

void check_parameter_size(const ParameterVector& params, int n_qubits) {
    const std::size_t expected = parameter_count(n_qubits);
    if (params.thetas.size() != expected || params.phis.size() != expected) {
        throw DimensionMismatch(
            "expected " + std::to_string(expected) + " thetas and phis for " +
            std::to_string(n_qubits) + " qubits, got " +
            std::to_string(params.thetas.size()) + " and " +
            std::to_string(params.phis.size()));
    }
}

struct AttemptSlot {
    AttemptReport report;
    std::vector<double> x;
    std::vector<ExecutionLog> logs;
};

}  // namespace

double negative_log_likelihood(
    const StateVector& state,
    const std::vector<OutcomeTally>& tallies,
    const LogSink& sink
) {
    double total = 0.0;
    for (const auto& t : tallies) {
        const double p = probability_plus(state, t.setting, sink);
        total -= static_cast<double>(t.n_plus) * std::log(p + kLikelihoodEpsilon) +
            static_cast<double>(t.n_minus) * std::log(1.0 - p + kLikelihoodEpsilon);
    }
    return total;
}

double negative_log_likelihood(
    const ParameterVector& params,
    const OutcomeSet& outcomes,
    const QubitConfig& config
) {
    check_parameter_size(params, config.n_qubits);
    const StateVector state = generate_state(params);
    return negative_log_likelihood(state, informative_tallies(outcomes, config.n_qubits));
}

OptimizationBounds parameter_bounds(int n_qubits, double phi_margin) {
    const std::size_t count = parameter_count(n_qubits);
    OptimizationBounds bounds;
    bounds.lower.assign(2 * count, 0.0);
    bounds.upper.reserve(2 * count);
    bounds.upper.insert(bounds.upper.end(), count, kPi);
    bounds.upper.insert(bounds.upper.end(), count, 2.0 * kPi - phi_margin);
    return bounds;
}

std::size_t default_worker_limit() {
    static const std::size_t value = [] {
        const std::size_t hardware_threads = std::thread::hardware_concurrency();
        const std::size_t fallback = hardware_threads > 0 ? hardware_threads : 1;
        const char* env = std::getenv("MLE_TOMO_MAX_THREADS");
        if (!env || *env == '\0') {
            return fallback;
        }
        try {
            const std::size_t parsed = std::stoull(env);
            return parsed > 0 ? parsed : fallback;
        } catch (const std::invalid_argument&) {
            return fallback;
        } catch (const std::out_of_range&) {
            return fallback;
        }
    }();
    return value;
}

LikelihoodEstimator::LikelihoodEstimator(
    MultiStartConfig config,
    std::shared_ptr<const LocalOptimizer> optimizer
)
    : config_(config)
    , optimizer_(optimizer ? std::move(optimizer)
                           : make_default_local_optimizer(
                                 config.max_evaluations, config.relative_tolerance)) {
    if (config_.attempts == 0) {
        throw std::invalid_argument("multi-start estimation needs at least one attempt");
    }
    if (config_.phi_margin < 0.0 || config_.phi_margin >= 2.0 * kPi) {
        throw std::invalid_argument("phi_margin must lie in [0, 2pi)");
    }
}

void LikelihoodEstimator::set_progress_reporter(mle_tomography::ProgressReporter* reporter) {
    progress_reporter_ = reporter;
}

EstimationResult LikelihoodEstimator::estimate(
    const OutcomeSet& outcomes,
    const QubitConfig& qubits,
    std::uint64_t seed
) const {
    const int n_qubits = qubits.n_qubits;
    const std::vector<OutcomeTally> tallies = informative_tallies(outcomes, n_qubits);
    const OptimizationBounds bounds = parameter_bounds(n_qubits, config_.phi_margin);

    const std::size_t num_attempts = config_.attempts;
    std::vector<std::uint64_t> seeds;
    seeds.reserve(num_attempts);
    std::mt19937_64 seed_rng(seed);
    for (std::size_t i = 0; i < num_attempts; ++i) {
        seeds.push_back(seed_rng());
    }

    const std::size_t worker_limit =
        config_.max_threads > 0 ? config_.max_threads : default_worker_limit();
    const std::size_t worker_count = std::min(num_attempts, worker_limit);

    std::vector<AttemptSlot> slots(num_attempts);
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    std::mutex failure_mutex;
    std::exception_ptr failure;

    const std::size_t base_attempts = num_attempts / worker_count;
    const std::size_t remainder = num_attempts % worker_count;
    std::size_t attempt_offset = 0;

    for (std::size_t worker_idx = 0; worker_idx < worker_count; ++worker_idx) {
        const std::size_t attempts_for_worker = base_attempts + (worker_idx < remainder ? 1 : 0);
        if (attempts_for_worker == 0) {
            continue;
        }
        const std::size_t start = attempt_offset;
        const std::size_t end = start + attempts_for_worker;
        workers.emplace_back([
            this,
            &tallies,
            &bounds,
            &seeds,
            &slots,
            n_qubits,
            start,
            end,
            &failure_mutex,
            &failure
        ]() {
            for (std::size_t attempt = start; attempt < end; ++attempt) {
                AttemptSlot& slot = slots[attempt];
                slot.report.attempt = static_cast<int>(attempt);
                auto log_event = [&slot, this](const std::string& category, const std::string& message) {
                    slot.logs.push_back(ExecutionLog{slot.report.attempt, category, message});
                    if (progress_reporter_) {
                        progress_reporter_->record_log(slot.logs.back());
                    }
                };
                try {
                    SeededRandomStream rng(seeds[attempt]);
                    const std::vector<double> initial = flatten(random_parameters(n_qubits, rng));

                    std::size_t clamped = 0;
                    const LogSink count_clamps = [&clamped](const std::string&, const std::string&) {
                        ++clamped;
                    };
                    const ObjectiveFunction objective = [&tallies, &count_clamps](const std::vector<double>& x) {
                        return negative_log_likelihood(generate_state(unflatten(x)), tallies, count_clamps);
                    };

                    LocalSolution solution = optimizer_->minimize(objective, initial, bounds);
                    slot.report.evaluations = solution.evaluations;
                    slot.report.status = solution.status;
                    slot.report.objective = solution.objective;
                    if (clamped > 0) {
                        log_event(
                            kNumericalInstabilityCategory,
                            "type=probability_clamped count=" + std::to_string(clamped));
                    }
                    if (!std::isfinite(solution.objective)) {
                        slot.report.status = "non_finite_objective";
                        log_event("Attempt", "status=failed reason=non_finite_objective");
                    } else {
                        slot.report.succeeded = true;
                        slot.x = std::move(solution.x);
                        std::ostringstream oss;
                        oss << "status=" << slot.report.status
                            << " objective=" << slot.report.objective
                            << " evaluations=" << slot.report.evaluations;
                        log_event("Attempt", oss.str());
                    }
                } catch (const std::exception& ex) {
                    slot.report.succeeded = false;
                    slot.report.status = "error";
                    log_event("Attempt", std::string("status=failed error=") + ex.what());
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failure_mutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                    return;
                }
                if (progress_reporter_) {
                    progress_reporter_->increment_completed_steps();
                }
            }
        });
        attempt_offset = end;
    }

    for (auto& worker : workers) {
        worker.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    EstimationResult result;
    result.attempts.reserve(num_attempts);
    const AttemptSlot* best = nullptr;
    for (const auto& slot : slots) {
        result.attempts.push_back(slot.report);
        result.logs.insert(result.logs.end(), slot.logs.begin(), slot.logs.end());
        if (!slot.report.succeeded) {
            ++result.failed_attempts;
            continue;
        }
        ++result.succeeded_attempts;
        if (!best || slot.report.objective < best->report.objective) {
            best = &slot;
        }
    }

    if (!best) {
        throw ConvergenceFailure(
            "all " + std::to_string(num_attempts) +
            " likelihood optimization attempts failed");
    }

    result.params = unflatten(best->x);
    result.objective = best->report.objective;
    result.best_attempt = best->report.attempt;

    std::ostringstream oss;
    oss << "optimizer=" << optimizer_->name()
        << " attempts=" << num_attempts
        << " succeeded=" << result.succeeded_attempts
        << " best_attempt=" << result.best_attempt
        << " objective=" << result.objective;
    result.logs.push_back(ExecutionLog{-1, "Estimate", oss.str()});
    if (progress_reporter_) {
        progress_reporter_->record_log(result.logs.back());
    }
    return result;
}

ParameterVector estimate(
    const OutcomeSet& outcomes,
    const QubitConfig& config,
    std::optional<std::uint64_t> seed
) {
    const std::uint64_t resolved = seed ? *seed : std::random_device{}();
    LikelihoodEstimator estimator;
    return estimator.estimate(outcomes, config, resolved).params;
}
