#include "reduced_state.hpp"
#include "service/tomography_session.hpp"

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

service::TomographyConfig config_from_dict(const py::dict& src) {
    service::TomographyConfig config;
    if (src.contains("n_qubits")) {
        config.qubits.n_qubits = py::cast<int>(src["n_qubits"]);
    }
    if (src.contains("shots_x")) {
        config.qubits.shots_x = py::cast<int>(src["shots_x"]);
    }
    if (src.contains("shots_y")) {
        config.qubits.shots_y = py::cast<int>(src["shots_y"]);
    }
    if (src.contains("shots_z")) {
        config.qubits.shots_z = py::cast<int>(src["shots_z"]);
    }
    if (src.contains("thetas") && !src["thetas"].is_none()) {
        config.thetas = py::cast<std::vector<double>>(src["thetas"]);
    }
    if (src.contains("phis") && !src["phis"].is_none()) {
        config.phis = py::cast<std::vector<double>>(src["phis"]);
    }
    if (src.contains("attempts")) {
        config.estimator.attempts = py::cast<std::size_t>(src["attempts"]);
    }
    if (src.contains("phi_margin")) {
        config.estimator.phi_margin = py::cast<double>(src["phi_margin"]);
    }
    if (src.contains("max_threads")) {
        config.estimator.max_threads = py::cast<std::size_t>(src["max_threads"]);
    }
    if (src.contains("max_evaluations")) {
        config.estimator.max_evaluations = py::cast<int>(src["max_evaluations"]);
    }
    if (src.contains("relative_tolerance")) {
        config.estimator.relative_tolerance = py::cast<double>(src["relative_tolerance"]);
    }
    return config;
}

py::dict params_to_dict(const ParameterVector& params) {
    py::dict out;
    out["thetas"] = params.thetas;
    out["phis"] = params.phis;
    return out;
}

py::list reduced_to_list(const std::vector<ReducedState>& states) {
    py::list out;
    for (const auto& state : states) {
        py::dict entry;
        entry["rho"] = std::vector<std::complex<double>>(state.rho.begin(), state.rho.end());
        entry["bloch"] = py::make_tuple(state.bloch.x, state.bloch.y, state.bloch.z);
        out.append(std::move(entry));
    }
    return out;
}

py::dict run_tomography(const py::dict& config_dict) {
    const service::TomographyConfig config = config_from_dict(config_dict);
    std::optional<std::uint64_t> seed;
    if (config_dict.contains("seed") && !config_dict["seed"].is_none()) {
        seed = py::cast<std::uint64_t>(config_dict["seed"]);
    }

    service::TomographyResult result;
    {
        py::gil_scoped_release release;
        const service::TomographySession session = service::create(config, seed);
        result = service::run(session);
    }

    py::dict counts;
    for (const auto& t : tally(result.outcomes)) {
        counts[py::str(t.setting)] = py::make_tuple(t.n_plus, t.n_minus);
    }
    py::list logs;
    for (const auto& log : result.logs) {
        py::dict entry;
        entry["attempt"] = log.attempt;
        entry["category"] = log.category;
        entry["message"] = log.message;
        logs.append(std::move(entry));
    }

    py::dict out;
    out["true_params"] = params_to_dict(result.true_params);
    out["estimated_params"] = params_to_dict(result.estimated_params);
    out["true_state"] = result.true_state;
    out["reconstructed_state"] = result.reconstructed_state;
    out["fidelity"] = result.fidelity;
    out["objective"] = result.objective;
    out["succeeded_attempts"] = result.succeeded_attempts;
    out["counts"] = counts;
    out["true_reduced"] = reduced_to_list(result.true_reduced);
    out["reconstructed_reduced"] = reduced_to_list(result.reconstructed_reduced);
    out["logs"] = logs;
    return out;
}

py::list reduced_states_py(const std::vector<std::complex<double>>& state, int n_qubits) {
    return reduced_to_list(reduced_states(state, n_qubits));
}

}  // namespace

PYBIND11_MODULE(_mle_tomography, m) {
    m.doc() = "Maximum-likelihood pure-state tomography bindings";
    m.def(
        "run_tomography",
        &run_tomography,
        py::arg("config"),
        "Simulate measurements of a random (or supplied) state and reconstruct it. "
        "The config dict mirrors service::TomographyConfig plus an optional seed."
    );
    m.def(
        "reduced_states",
        &reduced_states_py,
        py::arg("state"),
        py::arg("n_qubits"),
        "Per-qubit reduced density matrices and Bloch vectors of a pure state."
    );
    m.def(
        "generate_state",
        [](const std::vector<double>& thetas, const std::vector<double>& phis) {
            return generate_state(thetas, phis);
        },
        py::arg("thetas"),
        py::arg("phis"),
        "Amplitudes of the state described by hyperspherical angles."
    );
}
