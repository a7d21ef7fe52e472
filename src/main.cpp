#include "service/tomography_session.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

namespace {

void print_angles(const char* label, const std::vector<double>& values) {
    std::cout << label << ":";
    for (double v : values) {
        std::cout << ' ' << v;
    }
    std::cout << '\n';
}

}  // namespace

// Usage: mle_tomography [n_qubits] [shots_x] [shots_y] [shots_z] [seed]
int main(int argc, char** argv) {
    service::TomographyConfig config;
    config.qubits.n_qubits = 2;
    std::uint64_t seed = 7;

    try {
        if (argc > 1) {
            config.qubits.n_qubits = std::stoi(argv[1]);
        }
        if (argc > 2) {
            config.qubits.shots_x = std::stoi(argv[2]);
        }
        if (argc > 3) {
            config.qubits.shots_y = std::stoi(argv[3]);
        }
        if (argc > 4) {
            config.qubits.shots_z = std::stoi(argv[4]);
        }
        if (argc > 5) {
            seed = std::stoull(argv[5]);
        }

        const auto session = service::create(config, seed);
        const auto result = service::run(session);

        std::cout << "Fidelity: " << result.fidelity << '\n';
        std::cout << "Negative log-likelihood: " << result.objective << '\n';
        for (std::size_t q = 0; q < result.true_reduced.size(); ++q) {
            const auto& t = result.true_reduced[q].bloch;
            const auto& e = result.reconstructed_reduced[q].bloch;
            std::cout << "qubit " << q
                      << " true=(" << t.x << ", " << t.y << ", " << t.z << ")"
                      << " estimated=(" << e.x << ", " << e.y << ", " << e.z << ")\n";
        }
        print_angles("true thetas", result.true_params.thetas);
        print_angles("true phis", result.true_params.phis);
        print_angles("estimated thetas", result.estimated_params.thetas);
        print_angles("estimated phis", result.estimated_params.phis);
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
