#include "measurement_simulator.hpp"

#include "tomography_errors.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

int QubitConfig::shots_for_axis(char axis) const {
    switch (axis) {
        case 'X':
            return shots_x;
        case 'Y':
            return shots_y;
        case 'Z':
            return shots_z;
        default:
            throw std::invalid_argument(
                std::string("No shot budget for axis: ") + axis);
    }
}

int shots_for_setting(const BasisSetting& setting, const QubitConfig& config) {
    if (static_cast<int>(setting.size()) != config.n_qubits) {
        throw DimensionMismatch(
            "basis setting '" + setting + "' does not cover " +
            std::to_string(config.n_qubits) + " qubits");
    }
    int shots = std::numeric_limits<int>::max();
    bool measured = false;
    for (char symbol : setting) {
        if (symbol == 'I') {
            continue;
        }
        shots = std::min(shots, config.shots_for_axis(symbol));
        measured = true;
    }
    if (!measured) {
        throw std::invalid_argument("the all-identity setting carries no information");
    }
    return shots;
}

std::vector<int> simulate(
    const StateVector& state,
    const BasisSetting& setting,
    const QubitConfig& config,
    RandomStream& rng,
    const LogSink& sink
) {
    const int shots = shots_for_setting(setting, config);
    const double p_plus = probability_plus(state, setting, sink);

    std::vector<int> outcomes;
    outcomes.reserve(static_cast<std::size_t>(std::max(shots, 0)));
    for (int shot = 0; shot < shots; ++shot) {
        outcomes.push_back(rng.uniform(0.0, 1.0) < p_plus ? 1 : -1);
    }
    return outcomes;
}

OutcomeSet simulate_all(
    const StateVector& state,
    const QubitConfig& config,
    RandomStream& rng,
    const LogSink& sink
) {
    OutcomeSet outcomes;
    for (const auto& setting : enumerate_basis_settings(config.n_qubits)) {
        outcomes.emplace(setting, simulate(state, setting, config, rng, sink));
    }
    return outcomes;
}

std::vector<OutcomeTally> tally(const OutcomeSet& outcomes) {
    std::vector<OutcomeTally> tallies;
    tallies.reserve(outcomes.size());
    for (const auto& entry : outcomes) {
        OutcomeTally t;
        t.setting = entry.first;
        for (int outcome : entry.second) {
            if (outcome == 1) {
                ++t.n_plus;
            } else if (outcome == -1) {
                ++t.n_minus;
            } else {
                throw std::invalid_argument(
                    "outcome " + std::to_string(outcome) + " for setting '" +
                    entry.first + "' is not +1 or -1");
            }
        }
        tallies.push_back(std::move(t));
    }
    return tallies;
}
