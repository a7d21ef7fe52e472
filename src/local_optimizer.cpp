#include "local_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

struct ObjectiveContext {
    const ObjectiveFunction* objective = nullptr;
    const OptimizationBounds* bounds = nullptr;
    double gradient_step = 0.0;
    int evaluations = 0;
};

// Forward differences, switching to backward differences where a forward
// step would leave the box.
void finite_difference_gradient(
    ObjectiveContext& ctx,
    const std::vector<double>& x,
    double fx,
    std::vector<double>& grad
) {
    std::vector<double> stepped = x;
    for (std::size_t i = 0; i < x.size(); ++i) {
        double h = ctx.gradient_step * std::max(1.0, std::fabs(x[i]));
        if (x[i] + h > ctx.bounds->upper[i]) {
            h = -h;
        }
        stepped[i] = x[i] + h;
        const double shifted = (*ctx.objective)(stepped);
        ++ctx.evaluations;
        grad[i] = (shifted - fx) / h;
        stepped[i] = x[i];
    }
}

double nlopt_objective(const std::vector<double>& x, std::vector<double>& grad, void* data) {
    auto& ctx = *static_cast<ObjectiveContext*>(data);
    const double fx = (*ctx.objective)(x);
    ++ctx.evaluations;
    if (!grad.empty()) {
        finite_difference_gradient(ctx, x, fx, grad);
    }
    return fx;
}

std::string describe(nlopt::result result) {
    switch (result) {
        case nlopt::SUCCESS:
            return "success";
        case nlopt::STOPVAL_REACHED:
            return "stopval_reached";
        case nlopt::FTOL_REACHED:
            return "ftol_reached";
        case nlopt::XTOL_REACHED:
            return "xtol_reached";
        case nlopt::MAXEVAL_REACHED:
            return "maxeval_reached";
        case nlopt::MAXTIME_REACHED:
            return "maxtime_reached";
        default:
            return "code_" + std::to_string(static_cast<int>(result));
    }
}

}  // namespace

NloptLocalOptimizer::NloptLocalOptimizer(NloptOptions options)
    : options_(options) {
    if (options_.max_evaluations <= 0) {
        throw std::invalid_argument("max_evaluations must be positive");
    }
    if (!(options_.relative_tolerance > 0.0) || !(options_.gradient_step > 0.0)) {
        throw std::invalid_argument("optimizer tolerances must be positive");
    }
}

LocalSolution NloptLocalOptimizer::minimize(
    const ObjectiveFunction& objective,
    std::vector<double> start,
    const OptimizationBounds& bounds
) const {
    const std::size_t dim = start.size();
    if (bounds.lower.size() != dim || bounds.upper.size() != dim) {
        throw std::invalid_argument("bounds do not match the start point dimension");
    }
    for (std::size_t i = 0; i < dim; ++i) {
        start[i] = std::clamp(start[i], bounds.lower[i], bounds.upper[i]);
    }

    nlopt::opt opt(options_.algorithm, static_cast<unsigned>(dim));
    opt.set_lower_bounds(bounds.lower);
    opt.set_upper_bounds(bounds.upper);
    opt.set_xtol_rel(options_.relative_tolerance);
    opt.set_ftol_rel(options_.relative_tolerance);
    opt.set_maxeval(options_.max_evaluations);

    ObjectiveContext ctx;
    ctx.objective = &objective;
    ctx.bounds = &bounds;
    ctx.gradient_step = options_.gradient_step;
    opt.set_min_objective(nlopt_objective, &ctx);

    LocalSolution solution;
    double minimum = 0.0;
    try {
        const nlopt::result result = opt.optimize(start, minimum);
        solution.status = describe(result);
    } catch (const nlopt::roundoff_limited&) {
        // NLopt leaves the best point found in `start` and `minimum`.
        solution.status = "roundoff_limited";
    }
    solution.x = std::move(start);
    solution.objective = minimum;
    solution.evaluations = ctx.evaluations;
    return solution;
}

std::string NloptLocalOptimizer::name() const {
    nlopt::opt descriptor(options_.algorithm, 1);
    return std::string("nlopt:") + descriptor.get_algorithm_name();
}

std::shared_ptr<const LocalOptimizer> make_default_local_optimizer(
    int max_evaluations,
    double relative_tolerance
) {
    NloptOptions options;
    options.max_evaluations = max_evaluations;
    options.relative_tolerance = relative_tolerance;
    return std::make_shared<NloptLocalOptimizer>(options);
}
