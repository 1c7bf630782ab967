#pragma once

#include "libmiselect/core/family.hpp"
#include <Eigen/Dense>
#include <limits>
#include <string>
#include <vector>

namespace libmiselect {
namespace core {

/// Which engine produced a path
enum class Method { SAENET, GALASSO };

inline std::string MethodName(Method method) {
	return method == Method::SAENET ? "saenet" : "galasso";
}

/**
 * Solution at one regularization setting
 *
 * Coefficients are on the original covariate scale. Entry 0 of
 * `coefficients` is the intercept, entries 1..p the slopes.
 */
struct PathPoint {
	/// Regularization strength (>= 0)
	double lambda = 0.0;

	/// Elastic net mixing parameter; GALASSO points report 1
	double alpha = 1.0;

	/// Intercept followed by the p slopes (length p + 1)
	/// GALASSO: average of the per-imputation columns below
	Eigen::VectorXd coefficients;

	/// (p + 1) × M, one column per imputation, same layout as `coefficients`
	/// SAENET repeats the shared vector in every column
	Eigen::MatrixXd imputation_coefficients;

	/// Number of nonzero slopes
	size_t n_nonzero = 0;

	/// Training deviance at the solution (weighted RSS for gaussian)
	double deviance = std::numeric_limits<double>::quiet_NaN();

	/// Total coordinate-descent cycles spent on this point
	size_t iterations = 0;

	/// False when an iteration cap was reached before the tolerance
	bool converged = true;

	/// Description of the convergence problem (empty when converged)
	std::string warning;
};

/**
 * Full regularization path returned by a fit
 *
 * Points are indexed [alpha][lambda]. Within each alpha slice the lambdas
 * are strictly decreasing, in the order the solver traversed them. GALASSO
 * paths have a single slice with alpha = 1.
 */
struct SolutionPath {
	Method method = Method::SAENET;
	Family family = Family::GAUSSIAN;

	size_t n_obs = 0;
	size_t n_vars = 0;
	size_t n_imputations = 0;

	std::vector<double> alphas;
	std::vector<std::vector<double>> lambdas;
	std::vector<std::vector<PathPoint>> points;

	size_t NumPoints() const {
		size_t count = 0;
		for (const auto &slice : points) {
			count += slice.size();
		}
		return count;
	}

	/// True if any point hit an iteration cap
	bool HasConvergenceWarnings() const {
		for (const auto &slice : points) {
			for (const auto &point : slice) {
				if (!point.converged) {
					return true;
				}
			}
		}
		return false;
	}

	/// Warnings of all non-converged points, in path order
	std::vector<std::string> Warnings() const {
		std::vector<std::string> out;
		for (const auto &slice : points) {
			for (const auto &point : slice) {
				if (!point.converged) {
					out.push_back(point.warning);
				}
			}
		}
		return out;
	}
};

} // namespace core
} // namespace libmiselect
