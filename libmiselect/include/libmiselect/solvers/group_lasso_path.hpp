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
#include <vector>

namespace libmiselect {
namespace solvers {

/**
 * Solution of the single-group subproblem
 *
 *   minimize 1/2 sum_m h_m b_m^2 - u' b + threshold * ||b||_2
 *
 * with curvatures h_m > 0.
 */
struct GroupUpdate {
	/// Number of Newton iterations used (0 for closed-form cases)
	size_t newton_iterations = 0;
	bool converged = true;
};

/**
 * GALASSO engine: group lasso over imputation-specific coefficients
 *
 * Each imputation m keeps its own intercept a_m and slopes b_.m; the M
 * copies of variable j form group j. For fixed lambda it minimizes
 *
 *   sum_m L_m(a_m, b_.m) + lambda * sum_j pf_j adw_j ||b_j.||_2
 *
 * where L_m is the unit-weight loss of imputation m on its own standardized
 * design (normalized by n as in ElasticNetPath). Block coordinate descent
 * over groups; binomial wrapped in IRLS across all imputations at once.
 *
 * The group norm either keeps all M copies of a variable or zeroes all of
 * them, so every imputation selects the same variables.
 *
 * Design notes:
 * - Holds a reference to the StandardizedImputations, which must outlive it
 * - Warm started between Solve() calls; not thread-safe
 */
class GroupLassoPath {
public:
	/**
	 * @throws DimensionError if the penalty context does not cover p variables
	 */
	GroupLassoPath(const data::StandardizedImputations &data, const data::PenaltyContext &penalty,
	               core::Family family, const core::FitOptions &options);

	/**
	 * Smallest lambda at which every penalized group is zero
	 *
	 * lambda_max = max_j ||grad_j||_2 / (pf_j adw_j) at the null model, which
	 * becomes the warm start for the next Solve().
	 *
	 * @return lambda_max, or 1 when no group can enter the model
	 */
	double LambdaMax();

	/**
	 * Fit at one lambda, warm started from the current state
	 *
	 * @return PathPoint with per-imputation coefficients (original scale) and
	 *         their average in `coefficients`
	 *
	 * @throws InvalidParameterError for lambda < 0
	 * @throws NonConvergenceError if an iteration cap is hit and
	 *         options.strict_convergence is set
	 */
	core::PathPoint Solve(double lambda);

	/// Restore the per-imputation intercept-only start
	void Reset();

	/// Current standardized slopes (p × M)
	const Eigen::MatrixXd &StandardizedCoefficients() const {
		return beta_;
	}

	/**
	 * Solve the single-group subproblem in place
	 *
	 * - ||u|| <= threshold: b = 0
	 * - all h equal: b = u (1 - threshold/||u||) / h
	 * - otherwise t = ||b|| is the root of sum_m (u_m / (h_m t + threshold))^2 = 1,
	 *   found by Newton's method from a lower bound, and b_m = t u_m / (h_m t + threshold)
	 */
	static GroupUpdate SolveGroup(const Eigen::VectorXd &u, const Eigen::VectorXd &h, double threshold,
	                              size_t max_iterations, double tolerance, Eigen::Ref<Eigen::VectorXd> b);

private:
	void UpdateWorking();
	InnerOutcome BlockCoordinateDescent(double lambda, bool null_model);
	double CurrentDeviance() const;
	IrlsOutcome Fit(double lambda, bool null_model);
	core::PathPoint BuildPoint(double lambda, const IrlsOutcome &outcome) const;

	const data::StandardizedImputations &data_;
	data::PenaltyContext penalty_;
	core::Family family_;
	core::FitOptions options_;
	double inv_n_;
	size_t newton_failures_ = 0;

	Eigen::VectorXd intercepts_;
	Eigen::MatrixXd beta_;
	std::vector<Eigen::VectorXd> eta_;

	std::vector<Eigen::VectorXd> work_weights_;
	std::vector<Eigen::VectorXd> residual_;
	Eigen::MatrixXd h_;
};

// ============================================================================
// Implementation (header-only for performance)
// ============================================================================

inline GroupLassoPath::GroupLassoPath(const data::StandardizedImputations &data, const data::PenaltyContext &penalty,
                                      core::Family family, const core::FitOptions &options)
    : data_(data), penalty_(penalty), family_(family), options_(options),
      inv_n_(1.0 / static_cast<double>(data.n_obs)) {
	if (penalty_.NumVariables() != data_.n_vars) {
		throw core::DimensionError("penalty context covers " + std::to_string(penalty_.NumVariables()) +
		                           " variables, dataset has " + std::to_string(data_.n_vars));
	}
	const auto n = static_cast<Eigen::Index>(data_.n_obs);
	work_weights_.assign(data_.n_imputations, Eigen::VectorXd(n));
	residual_.assign(data_.n_imputations, Eigen::VectorXd(n));
	h_.resize(static_cast<Eigen::Index>(data_.n_vars), static_cast<Eigen::Index>(data_.n_imputations));
	Reset();
}

inline void GroupLassoPath::Reset() {
	const auto n = static_cast<Eigen::Index>(data_.n_obs);
	const auto m_count = static_cast<Eigen::Index>(data_.n_imputations);

	beta_ = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(data_.n_vars), m_count);
	intercepts_.resize(m_count);
	eta_.clear();
	for (size_t m = 0; m < data_.n_imputations; m++) {
		auto m_idx = static_cast<Eigen::Index>(m);
		intercepts_(m_idx) = core::NullIntercept(family_, data_.y[m], data_.weights, options_.probability_clip);
		eta_.push_back(Eigen::VectorXd::Constant(n, intercepts_(m_idx)));
	}
}

inline void GroupLassoPath::UpdateWorking() {
	const double clip = options_.probability_clip;

	for (size_t m = 0; m < data_.n_imputations; m++) {
		auto m_idx = static_cast<Eigen::Index>(m);
		const Eigen::VectorXd &y = data_.y[m];
		Eigen::VectorXd &v = work_weights_[m];
		Eigen::VectorXd &r = residual_[m];

		if (family_ == core::Family::GAUSSIAN) {
			v = data_.weights;
			r = y - eta_[m];
		} else {
			for (Eigen::Index i = 0; i < y.size(); i++) {
				double prob = core::ClipProbability(core::InverseLogit(eta_[m](i)), clip);
				double var = prob * (1.0 - prob);
				v(i) = data_.weights(i) * var;
				r(i) = (y(i) - prob) / var;
			}
		}

		for (Eigen::Index j = 0; j < h_.rows(); j++) {
			h_(j, m_idx) = inv_n_ * (v.array() * data_.x[m].col(j).array().square()).sum();
		}
	}
}

inline GroupUpdate GroupLassoPath::SolveGroup(const Eigen::VectorXd &u, const Eigen::VectorXd &h, double threshold,
                                              size_t max_iterations, double tolerance, Eigen::Ref<Eigen::VectorXd> b) {
	GroupUpdate update;
	const double u_norm = u.norm();

	if (threshold <= 0.0) {
		b = (u.array() / h.array()).matrix();
		return update;
	}
	if (u_norm <= threshold) {
		b.setZero();
		return update;
	}

	const double h_min = h.minCoeff();
	const double h_max = h.maxCoeff();
	if (h_max - h_min <= 1e-12 * h_max) {
		b = u * ((1.0 - threshold / u_norm) / h_max);
		return update;
	}

	// phi(t) = sum_m (u_m / (h_m t + threshold))^2 - 1 is convex and decreasing
	// on t >= 0, so Newton steps from a lower bound increase monotonically to the root.
	double t = std::max(0.0, (u_norm - threshold) / h_max);
	update.converged = false;
	for (size_t iter = 0; iter < max_iterations; iter++) {
		double phi = -1.0;
		double dphi = 0.0;
		for (Eigen::Index m = 0; m < u.size(); m++) {
			double denom = h(m) * t + threshold;
			double ratio = u(m) / denom;
			phi += ratio * ratio;
			dphi -= 2.0 * ratio * ratio * h(m) / denom;
		}
		update.newton_iterations = iter + 1;
		if (std::abs(phi) < tolerance) {
			update.converged = true;
			break;
		}
		if (dphi >= 0.0) {
			break;
		}
		double t_next = std::max(0.0, t - phi / dphi);
		if (std::abs(t_next - t) <= tolerance * std::max(1.0, t)) {
			t = t_next;
			update.converged = true;
			break;
		}
		t = t_next;
	}

	for (Eigen::Index m = 0; m < u.size(); m++) {
		b(m) = t * u(m) / (h(m) * t + threshold);
	}
	return update;
}

inline InnerOutcome GroupLassoPath::BlockCoordinateDescent(double lambda, bool null_model) {
	InnerOutcome outcome;
	const auto m_count = static_cast<Eigen::Index>(data_.n_imputations);

	Eigen::VectorXd u(m_count);
	Eigen::VectorXd h(m_count);
	Eigen::VectorXd b_new(m_count);

	for (size_t iter = 0; iter < options_.max_iterations; iter++) {
		double max_change = 0.0;

		for (Eigen::Index j = 0; j < beta_.rows(); j++) {
			if (data_.is_constant[static_cast<size_t>(j)]) {
				continue;
			}
			const double c = penalty_.L1Weight(j);
			if (null_model && c > 0.0) {
				continue;
			}

			for (Eigen::Index m = 0; m < m_count; m++) {
				const auto &v = work_weights_[static_cast<size_t>(m)];
				const auto &r = residual_[static_cast<size_t>(m)];
				const auto xj = data_.x[static_cast<size_t>(m)].col(j);
				double grad = inv_n_ * (v.array() * xj.array() * r.array()).sum();
				h(m) = h_(j, m);
				u(m) = grad + h(m) * beta_(j, m);
			}

			GroupUpdate update = SolveGroup(u, h, lambda * c, options_.newton_max_iterations,
			                                options_.newton_tolerance, b_new);
			if (!update.converged) {
				newton_failures_++;
			}

			for (Eigen::Index m = 0; m < m_count; m++) {
				double beta_old = beta_(j, m);
				double delta = b_new(m) - beta_old;
				if (delta == 0.0) {
					continue;
				}
				const auto xj = data_.x[static_cast<size_t>(m)].col(j);
				residual_[static_cast<size_t>(m)] -= delta * xj;
				eta_[static_cast<size_t>(m)] += delta * xj;
				beta_(j, m) = b_new(m);
				max_change = std::max(max_change, ScaledChange(beta_old, b_new(m)));
			}
		}

		// One unpenalized intercept per imputation
		for (Eigen::Index m = 0; m < m_count; m++) {
			auto &v = work_weights_[static_cast<size_t>(m)];
			auto &r = residual_[static_cast<size_t>(m)];
			double shift = (v.array() * r.array()).sum() / v.sum();
			if (shift == 0.0) {
				continue;
			}
			double intercept_old = intercepts_(m);
			intercepts_(m) += shift;
			r.array() -= shift;
			eta_[static_cast<size_t>(m)].array() += shift;
			max_change = std::max(max_change, ScaledChange(intercept_old, intercepts_(m)));
		}

		outcome.iterations = iter + 1;
		if (max_change < options_.tolerance) {
			outcome.converged = true;
			break;
		}
	}

	return outcome;
}

inline double GroupLassoPath::CurrentDeviance() const {
	double dev = 0.0;
	for (size_t m = 0; m < data_.n_imputations; m++) {
		dev += core::Deviance(family_, data_.y[m], eta_[m], data_.weights, options_.probability_clip);
	}
	return dev;
}

inline IrlsOutcome GroupLassoPath::Fit(double lambda, bool null_model) {
	return RunIrls(
	    family_, options_, [this]() { UpdateWorking(); },
	    [this, lambda, null_model]() { return BlockCoordinateDescent(lambda, null_model); },
	    [this]() { return CurrentDeviance(); });
}

inline double GroupLassoPath::LambdaMax() {
	Reset();
	Fit(0.0, true);

	const auto m_count = static_cast<Eigen::Index>(data_.n_imputations);
	std::vector<Eigen::VectorXd> response_residual;
	for (size_t m = 0; m < data_.n_imputations; m++) {
		Eigen::VectorXd res(eta_[m].size());
		for (Eigen::Index i = 0; i < res.size(); i++) {
			double mu = family_ == core::Family::GAUSSIAN ? eta_[m](i) : core::InverseLogit(eta_[m](i));
			res(i) = data_.weights(i) * (data_.y[m](i) - mu);
		}
		response_residual.push_back(std::move(res));
	}

	double lambda_max = 0.0;
	Eigen::VectorXd grad(m_count);
	for (Eigen::Index j = 0; j < beta_.rows(); j++) {
		if (data_.is_constant[static_cast<size_t>(j)] || !penalty_.IsPenalized(j)) {
			continue;
		}
		for (Eigen::Index m = 0; m < m_count; m++) {
			grad(m) = inv_n_ * data_.x[static_cast<size_t>(m)].col(j).dot(response_residual[static_cast<size_t>(m)]);
		}
		lambda_max = std::max(lambda_max, grad.norm() / penalty_.L1Weight(j));
	}

	if (!(lambda_max > 0.0) || !std::isfinite(lambda_max)) {
		MISELECT_DEBUG("no group can enter the model, using lambda_max=1");
		return 1.0;
	}
	MISELECT_DEBUG("galasso lambda_max=" << lambda_max);
	return lambda_max * (1.0 + kLambdaMaxMargin);
}

inline core::PathPoint GroupLassoPath::Solve(double lambda) {
	if (!(lambda >= 0.0) || !std::isfinite(lambda)) {
		throw core::InvalidParameterError("lambda must be finite and non-negative (got " + std::to_string(lambda) +
		                                  ")");
	}

	newton_failures_ = 0;
	IrlsOutcome outcome = Fit(lambda, false);
	core::PathPoint point = BuildPoint(lambda, outcome);

	if (!point.converged) {
		if (options_.strict_convergence) {
			throw core::NonConvergenceError(point.warning);
		}
		MISELECT_WARN(point.warning);
	} else if (newton_failures_ > 0) {
		MISELECT_DEBUG(newton_failures_ << " group updates stopped at the Newton iteration cap at lambda=" << lambda);
	}
	return point;
}

inline core::PathPoint GroupLassoPath::BuildPoint(double lambda, const IrlsOutcome &outcome) const {
	const auto p = static_cast<Eigen::Index>(data_.n_vars);
	const auto m_count = static_cast<Eigen::Index>(data_.n_imputations);

	core::PathPoint point;
	point.lambda = lambda;
	point.alpha = 1.0;
	point.deviance = outcome.deviance;
	point.iterations = outcome.cd_iterations;
	point.converged = outcome.converged;

	point.imputation_coefficients.resize(p + 1, m_count);
	for (Eigen::Index m = 0; m < m_count; m++) {
		double intercept = intercepts_(m);
		for (Eigen::Index j = 0; j < p; j++) {
			double slope = beta_(j, m) / data_.x_scale(j, m);
			point.imputation_coefficients(j + 1, m) = slope;
			intercept -= slope * data_.x_center(j, m);
		}
		point.imputation_coefficients(0, m) = intercept;
	}
	point.coefficients = point.imputation_coefficients.rowwise().mean();

	for (Eigen::Index j = 0; j < p; j++) {
		if (beta_.row(j).cwiseAbs().maxCoeff() > 0.0) {
			point.n_nonzero++;
		}
	}

	if (!outcome.converged) {
		std::ostringstream msg;
		msg << "galasso did not converge at lambda=" << lambda << " (" << outcome.irls_iterations
		    << " IRLS rounds, " << outcome.cd_iterations << " block coordinate descent cycles)";
		point.warning = msg.str();
	}
	return point;
}

} // namespace solvers
} // namespace libmiselect
