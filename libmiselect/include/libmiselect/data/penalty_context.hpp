#pragma once

#include "libmiselect/core/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>

namespace libmiselect {
namespace data {

/**
 * Per-variable penalty scaling shared by both engines
 *
 * For variable j the lasso-type term is multiplied by
 *   l1_weight_j = penalty_factor_j * adaptive_weight_j
 * and the ridge term of SAENET by penalty_factor_j. A zero penalty factor
 * leaves the variable unpenalized (always kept).
 */
class PenaltyContext {
public:
	PenaltyContext() = default;

	/**
	 * Build and validate a penalty context
	 *
	 * @param penalty_factors Length p, non-negative (empty = all ones)
	 * @param adaptive_weights Length p, non-negative (empty = all ones)
	 * @param n_vars Number of variables p
	 *
	 * @throws DimensionError if a non-empty vector has length != p
	 * @throws InvalidParameterError on negative or non-finite entries
	 */
	PenaltyContext(const Eigen::VectorXd &penalty_factors, const Eigen::VectorXd &adaptive_weights, size_t n_vars)
	    : penalty_factors_(Resolve(penalty_factors, n_vars, "penalty factors")),
	      adaptive_weights_(Resolve(adaptive_weights, n_vars, "adaptive weights")) {
		l1_weights_ = penalty_factors_.array() * adaptive_weights_.array();
	}

	size_t NumVariables() const {
		return static_cast<size_t>(penalty_factors_.size());
	}

	const Eigen::VectorXd &PenaltyFactors() const {
		return penalty_factors_;
	}

	const Eigen::VectorXd &AdaptiveWeights() const {
		return adaptive_weights_;
	}

	/// pf_j * adw_j: scale of the lasso / group-norm penalty
	double L1Weight(Eigen::Index j) const {
		return l1_weights_(j);
	}

	/// pf_j: scale of the ridge penalty
	double L2Weight(Eigen::Index j) const {
		return penalty_factors_(j);
	}

	/// True if the lasso-type penalty can hold variable j at zero
	bool IsPenalized(Eigen::Index j) const {
		return l1_weights_(j) > 0.0;
	}

	/**
	 * Adaptive weights from a prior coefficient estimate
	 *
	 * adw_j = 1 / (|beta_j| + 1/n): variables with large prior coefficients
	 * are penalized less, and an exactly zero prior estimate stays finite.
	 *
	 * @param coefficients Prior slopes (length p, no intercept)
	 * @param n_obs Number of observations n used for the offset
	 */
	static Eigen::VectorXd AdaptiveWeightsFromCoefficients(const Eigen::VectorXd &coefficients, size_t n_obs) {
		if (n_obs == 0) {
			throw core::InvalidParameterError("n_obs must be positive");
		}
		const double offset = 1.0 / static_cast<double>(n_obs);
		Eigen::VectorXd out(coefficients.size());
		for (Eigen::Index j = 0; j < coefficients.size(); j++) {
			if (!std::isfinite(coefficients(j))) {
				throw core::InvalidParameterError("prior coefficient " + std::to_string(j) + " is not finite");
			}
			out(j) = 1.0 / (std::abs(coefficients(j)) + offset);
		}
		return out;
	}

private:
	static Eigen::VectorXd Resolve(const Eigen::VectorXd &values, size_t n_vars, const std::string &what) {
		if (values.size() == 0) {
			return Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n_vars));
		}
		if (static_cast<size_t>(values.size()) != n_vars) {
			throw core::DimensionError(what + " have length " + std::to_string(values.size()) + ", expected " +
			                           std::to_string(n_vars));
		}
		for (Eigen::Index j = 0; j < values.size(); j++) {
			if (!std::isfinite(values(j)) || values(j) < 0.0) {
				throw core::InvalidParameterError(what + " must be finite and non-negative (entry " +
				                                  std::to_string(j) + " is " + std::to_string(values(j)) + ")");
			}
		}
		return values;
	}

	Eigen::VectorXd penalty_factors_;
	Eigen::VectorXd adaptive_weights_;
	Eigen::VectorXd l1_weights_;
};

} // namespace data
} // namespace libmiselect
