#pragma once

#include "libmiselect/core/errors.hpp"
#include "libmiselect/core/family.hpp"
#include "libmiselect/core/fit_options.hpp"
#include "libmiselect/core/solution_path.hpp"
#include "libmiselect/data/penalty_context.hpp"
#include "libmiselect/data/stacker.hpp"
#include "libmiselect/solvers/irls_loop.hpp"
#include "libmiselect/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace libmiselect {
namespace solvers {

/// Alpha floor used when computing lambda_max for (near) ridge fits
constexpr double kLambdaMaxAlphaFloor = 1e-3;
/// Step cap and relative width of the lambda_max root search
constexpr size_t kLambdaMaxSearchSteps = 200;
constexpr double kLambdaMaxSearchTolerance = 1e-10;

/**
 * SAENET engine: adaptive elastic net on a stacked dataset
 *
 * Minimizes, for fixed (lambda, alpha),
 *
 *   L(a, b) + lambda * [alpha * sum_j pf_j adw_j |b_j| + (1 - alpha)/2 * sum_j pf_j b_j^2]
 *
 * where L is the weighted loss over the n*M stacked rows normalized by the
 * number of original observations n:
 *   gaussian: (1/(2n)) sum_k w_k (y_k - a - x_k b)^2
 *   binomial: (1/n) sum_k w_k [log(1 + exp(eta_k)) - y_k eta_k]
 *
 * Algorithm: cyclic coordinate descent with soft thresholding on the
 * standardized design (binomial wrapped in IRLS). The intercept is never
 * penalized and is refreshed as the weighted mean working residual after
 * every cycle.
 *
 * Design notes:
 * - One engine per alpha slice; state (coefficients, linear predictor) is
 *   kept between Solve() calls so a decreasing lambda sequence warm starts
 * - Holds a reference to the StackedDataset, which must outlive the engine
 * - Not thread-safe; parallel work uses one engine per task
 */
class ElasticNetPath {
public:
	/**
	 * @param data Stacked, standardized design
	 * @param penalty Per-variable penalty factors and adaptive weights
	 * @param family Model family
	 * @param options Iteration caps and tolerances
	 *
	 * @throws DimensionError if the penalty context does not cover p variables
	 */
	ElasticNetPath(const data::StackedDataset &data, const data::PenaltyContext &penalty, core::Family family,
	               const core::FitOptions &options);

	/**
	 * Smallest lambda at which every penalized coefficient is zero
	 *
	 * Fits the null model (intercept plus variables with zero L1 weight),
	 * which also becomes the warm start for the next Solve(). Variables
	 * with zero L1 weight but a ridge penalty are fitted with the ridge
	 * term of the returned lambda, so the first Solve() at lambda_max
	 * keeps every L1-penalized coefficient at zero.
	 *
	 * @param alpha Mixing parameter in [0, 1]; values below 1e-3 use 1e-3
	 * @return lambda_max, or 1 when no variable can enter the model
	 */
	double LambdaMax(double alpha);

	/**
	 * Fit at one regularization setting, warm started from the current state
	 *
	 * @return PathPoint with coefficients on the original covariate scale
	 *
	 * @throws InvalidParameterError for lambda < 0 or alpha outside [0, 1]
	 * @throws NonConvergenceError if an iteration cap is hit and
	 *         options.strict_convergence is set
	 */
	core::PathPoint Solve(double lambda, double alpha);

	/// Restore the intercept-only start
	void Reset();

	/// Current standardized slopes (length p)
	const Eigen::VectorXd &StandardizedCoefficients() const {
		return beta_;
	}

private:
	void UpdateWorking();
	InnerOutcome CoordinateDescent(double lambda, double alpha, bool null_model);
	double CurrentDeviance() const;
	IrlsOutcome Fit(double lambda, double alpha, bool null_model);
	double NullGradientRatio(double alpha_eff) const;
	double NullGradientBound(double alpha_eff) const;
	bool HasRidgeOnlyVariables() const;
	core::PathPoint BuildPoint(double lambda, double alpha, const IrlsOutcome &outcome) const;

	const data::StackedDataset &data_;
	data::PenaltyContext penalty_;
	core::Family family_;
	core::FitOptions options_;
	double inv_n_;

	double intercept_ = 0.0;
	Eigen::VectorXd beta_;
	Eigen::VectorXd eta_;

	// Working problem of the current IRLS round
	Eigen::VectorXd work_weights_;
	Eigen::VectorXd residual_;
	Eigen::VectorXd xv_;
};

// ============================================================================
// Implementation (header-only for performance)
// ============================================================================

inline ElasticNetPath::ElasticNetPath(const data::StackedDataset &data, const data::PenaltyContext &penalty,
                                      core::Family family, const core::FitOptions &options)
    : data_(data), penalty_(penalty), family_(family), options_(options),
      inv_n_(1.0 / static_cast<double>(data.n_obs)) {
	if (penalty_.NumVariables() != data_.n_vars) {
		throw core::DimensionError("penalty context covers " + std::to_string(penalty_.NumVariables()) +
		                           " variables, dataset has " + std::to_string(data_.n_vars));
	}
	const auto rows = static_cast<Eigen::Index>(data_.NumRows());
	work_weights_.resize(rows);
	residual_.resize(rows);
	xv_.resize(static_cast<Eigen::Index>(data_.n_vars));
	Reset();
}

inline void ElasticNetPath::Reset() {
	beta_ = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(data_.n_vars));
	intercept_ = core::NullIntercept(family_, data_.y, data_.weights, options_.probability_clip);
	eta_ = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(data_.NumRows()), intercept_);
}

inline void ElasticNetPath::UpdateWorking() {
	if (family_ == core::Family::GAUSSIAN) {
		work_weights_ = data_.weights;
		residual_ = data_.y - eta_;
	} else {
		const double clip = options_.probability_clip;
		for (Eigen::Index k = 0; k < eta_.size(); k++) {
			double prob = core::ClipProbability(core::InverseLogit(eta_(k)), clip);
			double var = prob * (1.0 - prob);
			work_weights_(k) = data_.weights(k) * var;
			// working response eta + (y - p)/var, stored relative to eta
			residual_(k) = (data_.y(k) - prob) / var;
		}
	}

	for (Eigen::Index j = 0; j < xv_.size(); j++) {
		xv_(j) = inv_n_ * (work_weights_.array() * data_.x.col(j).array().square()).sum();
	}
}

inline InnerOutcome ElasticNetPath::CoordinateDescent(double lambda, double alpha, bool null_model) {
	InnerOutcome outcome;
	const double sum_v = work_weights_.sum();

	for (size_t iter = 0; iter < options_.max_iterations; iter++) {
		double max_change = 0.0;

		for (Eigen::Index j = 0; j < beta_.size(); j++) {
			if (data_.is_constant[static_cast<size_t>(j)]) {
				continue;
			}
			const double l1 = penalty_.L1Weight(j);
			if (null_model && l1 > 0.0) {
				continue;
			}

			const double beta_old = beta_(j);
			const auto xj = data_.x.col(j);

			// Partial residual correlation with coordinate j added back
			double grad = inv_n_ * (work_weights_.array() * xj.array() * residual_.array()).sum();
			double u = grad + xv_(j) * beta_old;

			double denominator = xv_(j) + lambda * (1.0 - alpha) * penalty_.L2Weight(j);
			if (denominator <= 0.0) {
				continue;
			}
			double beta_new = SoftThreshold(u, lambda * alpha * l1) / denominator;

			if (beta_new != beta_old) {
				double delta = beta_new - beta_old;
				residual_ -= delta * xj;
				eta_ += delta * xj;
				beta_(j) = beta_new;
				max_change = std::max(max_change, ScaledChange(beta_old, beta_new));
			}
		}

		// Unpenalized intercept: weighted mean of the working residual
		double shift = (work_weights_.array() * residual_.array()).sum() / sum_v;
		if (shift != 0.0) {
			double intercept_old = intercept_;
			intercept_ += shift;
			residual_.array() -= shift;
			eta_.array() += shift;
			max_change = std::max(max_change, ScaledChange(intercept_old, intercept_));
		}

		outcome.iterations = iter + 1;
		if (max_change < options_.tolerance) {
			outcome.converged = true;
			break;
		}
	}

	return outcome;
}

inline double ElasticNetPath::CurrentDeviance() const {
	return core::Deviance(family_, data_.y, eta_, data_.weights, options_.probability_clip);
}

inline IrlsOutcome ElasticNetPath::Fit(double lambda, double alpha, bool null_model) {
	return RunIrls(
	    family_, options_, [this]() { UpdateWorking(); },
	    [this, lambda, alpha, null_model]() { return CoordinateDescent(lambda, alpha, null_model); },
	    [this]() { return CurrentDeviance(); });
}

inline double ElasticNetPath::NullGradientRatio(double alpha_eff) const {
	// Gradient of the loss at the null model: (1/n) sum_k w_k x_kj (y_k - mu_k)
	Eigen::VectorXd response_residual(eta_.size());
	for (Eigen::Index k = 0; k < eta_.size(); k++) {
		double mu = family_ == core::Family::GAUSSIAN ? eta_(k) : core::InverseLogit(eta_(k));
		response_residual(k) = data_.weights(k) * (data_.y(k) - mu);
	}

	double ratio = 0.0;
	for (Eigen::Index j = 0; j < beta_.size(); j++) {
		if (data_.is_constant[static_cast<size_t>(j)] || !penalty_.IsPenalized(j)) {
			continue;
		}
		double grad = inv_n_ * data_.x.col(j).dot(response_residual);
		ratio = std::max(ratio, std::abs(grad) / (alpha_eff * penalty_.L1Weight(j)));
	}
	return ratio;
}

inline bool ElasticNetPath::HasRidgeOnlyVariables() const {
	for (Eigen::Index j = 0; j < beta_.size(); j++) {
		if (!data_.is_constant[static_cast<size_t>(j)] && !penalty_.IsPenalized(j) && penalty_.L2Weight(j) > 0.0) {
			return true;
		}
	}
	return false;
}

inline double ElasticNetPath::NullGradientBound(double alpha_eff) const {
	// |y - mu| <= 1 for binomial; a gaussian null fit never leaves a larger
	// residual norm than the weighted mean does
	double residual_norm = 0.0;
	if (family_ == core::Family::GAUSSIAN) {
		double y_bar = data_.weights.dot(data_.y) / data_.weights.sum();
		residual_norm = std::sqrt((data_.weights.array() * (data_.y.array() - y_bar).square()).sum());
	} else {
		residual_norm = std::sqrt(data_.weights.sum());
	}

	double bound = 0.0;
	for (Eigen::Index j = 0; j < beta_.size(); j++) {
		if (data_.is_constant[static_cast<size_t>(j)] || !penalty_.IsPenalized(j)) {
			continue;
		}
		double column_norm = std::sqrt((data_.weights.array() * data_.x.col(j).array().square()).sum());
		bound = std::max(bound, inv_n_ * column_norm * residual_norm / (alpha_eff * penalty_.L1Weight(j)));
	}
	return bound;
}

inline double ElasticNetPath::LambdaMax(double alpha) {
	if (!(alpha >= 0.0 && alpha <= 1.0)) {
		throw core::InvalidParameterError("alpha must be in [0, 1] (got " + std::to_string(alpha) + ")");
	}

	const double alpha_eff = std::max(alpha, kLambdaMaxAlphaFloor);
	Reset();

	double lambda_max = 0.0;
	if (alpha >= 1.0 || !HasRidgeOnlyVariables()) {
		// The null fit does not depend on lambda
		Fit(0.0, 1.0, true);
		lambda_max = NullGradientRatio(alpha_eff);
	} else {
		// Ridge-only variables shrink with lambda, so the null gradient does too.
		// lambda_max is the largest root of ratio(lambda) = lambda: bracket it
		// from an upper bound downwards, then bisect.
		auto excess = [this, alpha, alpha_eff](double lambda) {
			Fit(lambda, alpha, true);
			return NullGradientRatio(alpha_eff) - lambda;
		};

		double hi = NullGradientBound(alpha_eff);
		if (!(hi > 0.0) || !std::isfinite(hi)) {
			MISELECT_DEBUG("no variable can enter the model at alpha=" << alpha << ", using lambda_max=1");
			Reset();
			return 1.0;
		}
		for (size_t step = 0; step < kLambdaMaxSearchSteps && excess(hi) > 0.0; step++) {
			hi *= 2.0;
		}

		double lo = 0.5 * hi;
		bool bracketed = false;
		for (size_t step = 0; step < kLambdaMaxSearchSteps; step++) {
			if (excess(lo) > 0.0) {
				bracketed = true;
				break;
			}
			hi = lo;
			lo *= 0.5;
		}

		if (bracketed) {
			for (size_t step = 0; step < kLambdaMaxSearchSteps && hi - lo > kLambdaMaxSearchTolerance * hi; step++) {
				double mid = 0.5 * (lo + hi);
				if (excess(mid) > 0.0) {
					lo = mid;
				} else {
					hi = mid;
				}
			}
			lambda_max = hi;
		}
		// Leave the null fit at lambda_max as the warm start
		Fit(lambda_max, alpha, true);
	}

	if (!(lambda_max > 0.0) || !std::isfinite(lambda_max)) {
		MISELECT_DEBUG("no variable can enter the model at alpha=" << alpha << ", using lambda_max=1");
		return 1.0;
	}
	MISELECT_DEBUG("lambda_max=" << lambda_max << " at alpha=" << alpha);
	return lambda_max * (1.0 + kLambdaMaxMargin);
}

inline core::PathPoint ElasticNetPath::Solve(double lambda, double alpha) {
	if (!(lambda >= 0.0) || !std::isfinite(lambda)) {
		throw core::InvalidParameterError("lambda must be finite and non-negative (got " + std::to_string(lambda) +
		                                  ")");
	}
	if (!(alpha >= 0.0 && alpha <= 1.0)) {
		throw core::InvalidParameterError("alpha must be in [0, 1] (got " + std::to_string(alpha) + ")");
	}

	IrlsOutcome outcome = Fit(lambda, alpha, false);
	core::PathPoint point = BuildPoint(lambda, alpha, outcome);

	if (!point.converged) {
		if (options_.strict_convergence) {
			throw core::NonConvergenceError(point.warning);
		}
		MISELECT_WARN(point.warning);
	}
	return point;
}

inline core::PathPoint ElasticNetPath::BuildPoint(double lambda, double alpha, const IrlsOutcome &outcome) const {
	const auto p = static_cast<Eigen::Index>(data_.n_vars);

	core::PathPoint point;
	point.lambda = lambda;
	point.alpha = alpha;
	point.deviance = outcome.deviance;
	point.iterations = outcome.cd_iterations;
	point.converged = outcome.converged;

	// Back to the original covariate scale
	point.coefficients.resize(p + 1);
	double intercept = intercept_;
	for (Eigen::Index j = 0; j < p; j++) {
		double slope = beta_(j) / data_.x_scale(j);
		point.coefficients(j + 1) = slope;
		intercept -= slope * data_.x_center(j);
		if (beta_(j) != 0.0) {
			point.n_nonzero++;
		}
	}
	point.coefficients(0) = intercept;

	point.imputation_coefficients =
	    point.coefficients.replicate(1, static_cast<Eigen::Index>(data_.n_imputations));

	if (!outcome.converged) {
		std::ostringstream msg;
		msg << "saenet did not converge at lambda=" << lambda << ", alpha=" << alpha << " ("
		    << outcome.irls_iterations << " IRLS rounds, " << outcome.cd_iterations << " coordinate descent cycles)";
		point.warning = msg.str();
	}
	return point;
}

} // namespace solvers
} // namespace libmiselect
