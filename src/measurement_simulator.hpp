#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "log_record.types.hpp"
#include "pauli_basis.hpp"
#include "random_stream.hpp"
#include "state_parameterization.hpp"

// Register size and per-axis shot budget.
struct QubitConfig {
    int n_qubits = 1;
    int shots_x = 1000;
    int shots_y = 1000;
    int shots_z = 1000;

    int shots_for_axis(char axis) const;
};

// Simulated +1/-1 outcomes keyed by basis setting.
using OutcomeSet = std::map<BasisSetting, std::vector<int>>;

struct OutcomeTally {
    BasisSetting setting;
    std::size_t n_plus = 0;
    std::size_t n_minus = 0;
};

// Shots spent on a setting: the smallest budget among the axes it measures.
int shots_for_setting(const BasisSetting& setting, const QubitConfig& config);

std::vector<int> simulate(
    const StateVector& state,
    const BasisSetting& setting,
    const QubitConfig& config,
    RandomStream& rng,
    const LogSink& sink = {}
);

OutcomeSet simulate_all(
    const StateVector& state,
    const QubitConfig& config,
    RandomStream& rng,
    const LogSink& sink = {}
);

// Counts per setting, in map order. Entries other than +1/-1 are rejected.
std::vector<OutcomeTally> tally(const OutcomeSet& outcomes);
