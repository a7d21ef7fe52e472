#include "service/config_validation.hpp"

#include "service/tomography_session.hpp"
#include "state_parameterization.hpp"
#include "tomography_errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace service {
namespace {

constexpr int kMaxSupportedQubits = 10;

void check_angle_range(
    const std::vector<double>& values,
    double lo,
    double hi,
    bool hi_inclusive,
    const std::string& label
) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        const double v = values[i];
        const bool above = hi_inclusive ? v > hi : v >= hi;
        if (!std::isfinite(v) || v < lo || above) {
            throw std::invalid_argument(
                label + "[" + std::to_string(i) + "]=" + std::to_string(v) +
                " is outside " + (hi_inclusive ? "[0, pi]" : "[0, 2pi)"));
        }
    }
}

}  // namespace

std::string Validator::name() const {
    return "validator";
}

LambdaValidator::LambdaValidator(std::string name, ValidateFn fn)
    : name_(std::move(name)), fn_(std::move(fn)) {}

void LambdaValidator::validate(const TomographyConfig& config) const {
    fn_(config);
}

std::string LambdaValidator::name() const {
    return name_;
}

void ValidatorRegistry::register_validator(std::unique_ptr<Validator> validator) {
    if (validator) {
        validators_.push_back(std::move(validator));
    }
}

void ValidatorRegistry::run_all_validators(const TomographyConfig& config) const {
    for (const auto& validator : validators_) {
        try {
            validator->validate(config);
        } catch (const DimensionMismatch& ex) {
            throw DimensionMismatch(validator->name() + ": " + ex.what());
        } catch (const std::invalid_argument& ex) {
            throw std::invalid_argument(validator->name() + ": " + ex.what());
        }
    }
}

std::vector<std::string> ValidatorRegistry::validator_names() const {
    std::vector<std::string> names;
    names.reserve(validators_.size());
    for (const auto& validator : validators_) {
        names.push_back(validator->name());
    }
    return names;
}

std::unique_ptr<Validator> make_qubit_count_validator() {
    return std::make_unique<LambdaValidator>(
        "qubit_count",
        [](const TomographyConfig& config) {
            const int n = config.qubits.n_qubits;
            if (n < 1 || n > kMaxSupportedQubits) {
                throw std::invalid_argument(
                    "n_qubits must be in [1, " + std::to_string(kMaxSupportedQubits) +
                    "], got " + std::to_string(n));
            }
        });
}

std::unique_ptr<Validator> make_shot_budget_validator() {
    return std::make_unique<LambdaValidator>(
        "shot_budget",
        [](const TomographyConfig& config) {
            const QubitConfig& q = config.qubits;
            if (q.shots_x < 1 || q.shots_y < 1 || q.shots_z < 1) {
                throw std::invalid_argument(
                    "shot counts must be positive (shots_x=" + std::to_string(q.shots_x) +
                    " shots_y=" + std::to_string(q.shots_y) +
                    " shots_z=" + std::to_string(q.shots_z) + ")");
            }
        });
}

std::unique_ptr<Validator> make_supplied_angles_validator() {
    return std::make_unique<LambdaValidator>(
        "supplied_angles",
        [](const TomographyConfig& config) {
            if (!config.thetas && !config.phis) {
                return;
            }
            if (!config.thetas || !config.phis) {
                throw std::invalid_argument("thetas and phis must be supplied together");
            }
            const std::size_t expected = parameter_count(config.qubits.n_qubits);
            if (config.thetas->size() != expected || config.phis->size() != expected) {
                throw DimensionMismatch(
                    "expected " + std::to_string(expected) + " thetas and phis, got " +
                    std::to_string(config.thetas->size()) + " and " +
                    std::to_string(config.phis->size()));
            }
            check_angle_range(*config.thetas, 0.0, kPi, true, "thetas");
            check_angle_range(*config.phis, 0.0, 2.0 * kPi, false, "phis");
        });
}

std::unique_ptr<Validator> make_multi_start_validator() {
    return std::make_unique<LambdaValidator>(
        "multi_start",
        [](const TomographyConfig& config) {
            const MultiStartConfig& ms = config.estimator;
            if (ms.attempts == 0) {
                throw std::invalid_argument("attempts must be at least 1");
            }
            if (!(ms.phi_margin >= 0.0) || ms.phi_margin >= 2.0 * kPi) {
                throw std::invalid_argument("phi_margin must lie in [0, 2pi)");
            }
            if (ms.max_evaluations <= 0) {
                throw std::invalid_argument("max_evaluations must be positive");
            }
            if (!(ms.relative_tolerance > 0.0)) {
                throw std::invalid_argument("relative_tolerance must be positive");
            }
        });
}

ValidatorRegistry make_default_validator_registry() {
    ValidatorRegistry registry;
    registry.register_validator(make_qubit_count_validator());
    registry.register_validator(make_shot_budget_validator());
    registry.register_validator(make_supplied_angles_validator());
    registry.register_validator(make_multi_start_validator());
    return registry;
}

void validate_config(const TomographyConfig& config) {
    make_default_validator_registry().run_all_validators(config);
}

}  // namespace service
