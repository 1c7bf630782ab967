#pragma once

#include "libmiselect/core/errors.hpp"
#include <cstddef>
#include <string>

namespace libmiselect {
namespace core {

/**
 * Configuration options for the SAENET and GALASSO fitting engines
 *
 * Covers path generation, the coordinate-descent and IRLS loops, the worker
 * pool and convergence handling. Defaults follow glmnet conventions; options
 * can be overridden individually or parsed from JSON (utils::ParseFitOptions).
 */
struct FitOptions {
	// ========================================================================
	// Regularization path
	// ========================================================================

	/// Number of lambda values in an automatically generated sequence
	/// Default: 100
	size_t nlambda = 100;

	/// Ratio between the smallest and the largest lambda of the sequence
	/// Must be in (0, 1). Default: 1e-3
	double lambda_min_ratio = 1e-3;

	// ========================================================================
	// Coordinate descent
	// ========================================================================

	/// Maximum number of full coordinate-descent cycles per inner solve
	/// Default: 1000
	size_t max_iterations = 1000;

	/// Inner convergence threshold on max |change| / max(1, |coefficient|)
	/// Default: 1e-5
	double tolerance = 1e-5;

	// ========================================================================
	// IRLS (binomial family)
	// ========================================================================

	/// Maximum number of reweighting rounds
	/// Default: 25
	size_t max_irls_iterations = 25;

	/// Relative deviance change ending the IRLS loop
	/// Default: 1e-8
	double irls_tolerance = 1e-8;

	/// Fitted probabilities are clipped to [clip, 1 - clip] before forming
	/// IRLS weights and when scoring binomial deviance
	/// Default: 1e-5
	double probability_clip = 1e-5;

	// ========================================================================
	// Group subproblem (GALASSO with unequal curvature)
	// ========================================================================

	/// Newton iterations for the group norm root search
	/// Default: 100
	size_t newton_max_iterations = 100;

	/// Newton tolerance on the secular equation value
	/// Default: 1e-12
	double newton_tolerance = 1e-12;

	// ========================================================================
	// Execution
	// ========================================================================

	/// Worker threads for fold/alpha tasks (0 = OpenMP default team size, 1 = sequential)
	/// Default: 0
	size_t n_threads = 0;

	/// Raise NonConvergenceError instead of flagging the path point
	/// Default: false
	bool strict_convergence = false;

	FitOptions() = default;

	/**
	 * Validate option values
	 *
	 * @throws InvalidParameterError if any option is outside its domain
	 */
	void Validate() const {
		if (nlambda == 0) {
			throw InvalidParameterError("nlambda must be positive");
		}
		if (!(lambda_min_ratio > 0.0 && lambda_min_ratio < 1.0)) {
			throw InvalidParameterError("lambda_min_ratio must be in (0, 1) (got " + std::to_string(lambda_min_ratio) +
			                            ")");
		}
		if (max_iterations == 0) {
			throw InvalidParameterError("max_iterations must be positive");
		}
		if (!(tolerance > 0.0)) {
			throw InvalidParameterError("tolerance must be positive (got " + std::to_string(tolerance) + ")");
		}
		if (max_irls_iterations == 0) {
			throw InvalidParameterError("max_irls_iterations must be positive");
		}
		if (!(irls_tolerance > 0.0)) {
			throw InvalidParameterError("irls_tolerance must be positive (got " + std::to_string(irls_tolerance) +
			                            ")");
		}
		if (!(probability_clip > 0.0 && probability_clip < 0.5)) {
			throw InvalidParameterError("probability_clip must be in (0, 0.5) (got " +
			                            std::to_string(probability_clip) + ")");
		}
		if (newton_max_iterations == 0) {
			throw InvalidParameterError("newton_max_iterations must be positive");
		}
		if (!(newton_tolerance > 0.0)) {
			throw InvalidParameterError("newton_tolerance must be positive (got " +
			                            std::to_string(newton_tolerance) + ")");
		}
	}
};

} // namespace core
} // namespace libmiselect
