#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlopt.hpp>

using ObjectiveFunction = std::function<double(const std::vector<double>& x)>;

struct OptimizationBounds {
    std::vector<double> lower;
    std::vector<double> upper;
};

struct LocalSolution {
    std::vector<double> x;
    double objective = 0.0;
    int evaluations = 0;
    std::string status;
};

// Box-constrained local minimizer used by each multi-start attempt.
// Implementations must be safe to call concurrently from several threads.
class LocalOptimizer {
  public:
    virtual ~LocalOptimizer() = default;

    virtual LocalSolution minimize(
        const ObjectiveFunction& objective,
        std::vector<double> start,
        const OptimizationBounds& bounds
    ) const = 0;

    virtual std::string name() const = 0;
};

struct NloptOptions {
    // Gradient-based algorithms (LD_*) are fed a finite-difference gradient;
    // derivative-free ones (LN_*) never request one.
    nlopt::algorithm algorithm = nlopt::LD_LBFGS;
    int max_evaluations = 2000;
    double relative_tolerance = 1e-8;
    double gradient_step = 1.4901161193847656e-8;
};

class NloptLocalOptimizer final : public LocalOptimizer {
  public:
    NloptLocalOptimizer() = default;
    explicit NloptLocalOptimizer(NloptOptions options);

    LocalSolution minimize(
        const ObjectiveFunction& objective,
        std::vector<double> start,
        const OptimizationBounds& bounds
    ) const override;

    std::string name() const override;

    const NloptOptions& options() const { return options_; }

  private:
    NloptOptions options_;
};

std::shared_ptr<const LocalOptimizer> make_default_local_optimizer(
    int max_evaluations,
    double relative_tolerance
);
