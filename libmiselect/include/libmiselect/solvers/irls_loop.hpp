#pragma once

#include "libmiselect/core/family.hpp"
#include "libmiselect/core/fit_options.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace libmiselect {
namespace solvers {

/// Relative margin added to lambda_max so the first point of a path is exactly null
constexpr double kLambdaMaxMargin = 1e-9;

/// Outcome of one penalized weighted least squares solve
struct InnerOutcome {
	size_t iterations = 0;
	bool converged = false;
};

/// Outcome of a full fit at one regularization setting
struct IrlsOutcome {
	size_t irls_iterations = 0;
	size_t cd_iterations = 0;
	bool converged = false;
	double deviance = std::numeric_limits<double>::quiet_NaN();
};

/**
 * Shared outer loop of both engines
 *
 * gaussian: one inner solve with the observation weights as working weights.
 * binomial: iteratively reweighted least squares. Each round replaces the
 * log-likelihood by its quadratic approximation at the current linear
 * predictor, solves the penalized weighted least squares problem by
 * coordinate descent (warm started from the current coefficients), and stops
 * once the relative deviance change falls below options.irls_tolerance:
 *
 *   |dev - dev_prev| / (|dev| + 0.1) < irls_tolerance
 *
 * The engine supplies three callables operating on its own state:
 *
 * @param update_working void(): recompute working weights and working response
 *                       from the current coefficients
 * @param solve_inner InnerOutcome(): run coordinate descent on the working problem
 * @param deviance double(): deviance of the current coefficients
 */
template <class WorkingFn, class InnerFn, class DevianceFn>
inline IrlsOutcome RunIrls(core::Family family, const core::FitOptions &options, WorkingFn update_working,
                           InnerFn solve_inner, DevianceFn deviance) {
	IrlsOutcome outcome;

	if (family == core::Family::GAUSSIAN) {
		update_working();
		InnerOutcome inner = solve_inner();
		outcome.irls_iterations = 1;
		outcome.cd_iterations = inner.iterations;
		outcome.converged = inner.converged;
		outcome.deviance = deviance();
		return outcome;
	}

	double dev_prev = deviance();
	for (size_t round = 0; round < options.max_irls_iterations; round++) {
		update_working();
		InnerOutcome inner = solve_inner();
		outcome.irls_iterations = round + 1;
		outcome.cd_iterations += inner.iterations;

		double dev = deviance();
		outcome.deviance = dev;
		if (std::abs(dev - dev_prev) / (std::abs(dev) + 0.1) < options.irls_tolerance) {
			outcome.converged = inner.converged;
			return outcome;
		}
		dev_prev = dev;
	}

	outcome.converged = false;
	return outcome;
}

/// Coordinate change measure used by the inner convergence test
inline double ScaledChange(double old_value, double new_value) {
	return std::abs(new_value - old_value) / std::max(1.0, std::abs(new_value));
}

/// Soft thresholding operator S(z, gamma) = sign(z) * max(|z| - gamma, 0)
inline double SoftThreshold(double z, double gamma) {
	if (z > gamma) {
		return z - gamma;
	} else if (z < -gamma) {
		return z + gamma;
	} else {
		return 0.0;
	}
}

} // namespace solvers
} // namespace libmiselect
