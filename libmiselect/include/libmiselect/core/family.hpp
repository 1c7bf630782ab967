#pragma once

#include "libmiselect/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <string>

namespace libmiselect {
namespace core {

/**
 * Model family: selects the loss used in fitting and in CV scoring
 *
 * - GAUSSIAN: squared error, identity link
 * - BINOMIAL: negative binomial log-likelihood, logit link, responses in {0,1}
 */
enum class Family { GAUSSIAN, BINOMIAL };

inline std::string FamilyName(Family family) {
	switch (family) {
	case Family::GAUSSIAN:
		return "gaussian";
	case Family::BINOMIAL:
		return "binomial";
	default:
		return "unknown";
	}
}

/**
 * Parse a family name
 *
 * @throws InvalidParameterError for anything other than "gaussian" or "binomial"
 */
inline Family ParseFamily(const std::string &name) {
	if (name == "gaussian") {
		return Family::GAUSSIAN;
	}
	if (name == "binomial") {
		return Family::BINOMIAL;
	}
	throw InvalidParameterError("unknown family '" + name + "' (expected 'gaussian' or 'binomial')");
}

// ============================================================================
// Per-observation link and loss helpers
// ============================================================================

/// Logistic inverse link, evaluated without overflow for large |eta|
inline double InverseLogit(double eta) {
	if (eta >= 0.0) {
		return 1.0 / (1.0 + std::exp(-eta));
	}
	double e = std::exp(eta);
	return e / (1.0 + e);
}

/// Probability clipped to [clip, 1 - clip]
inline double ClipProbability(double prob, double clip) {
	return std::min(std::max(prob, clip), 1.0 - clip);
}

/**
 * Loss of one observation on the deviance scale
 *
 * gaussian: (y - eta)^2
 * binomial: -2 [y log p + (1 - y) log(1 - p)] with p clipped to [clip, 1 - clip]
 */
inline double ObservationLoss(Family family, double y, double eta, double clip) {
	if (family == Family::GAUSSIAN) {
		double r = y - eta;
		return r * r;
	}
	double prob = ClipProbability(InverseLogit(eta), clip);
	return -2.0 * (y * std::log(prob) + (1.0 - y) * std::log(1.0 - prob));
}

/**
 * Weighted deviance of a linear predictor
 *
 * @param family Model family
 * @param y Responses
 * @param eta Linear predictor (same length as y)
 * @param weights Observation weights (same length as y)
 * @param clip Probability clipping bound (binomial only)
 */
inline double Deviance(Family family, const Eigen::VectorXd &y, const Eigen::VectorXd &eta,
                       const Eigen::VectorXd &weights, double clip) {
	double dev = 0.0;
	for (Eigen::Index i = 0; i < y.size(); i++) {
		dev += weights(i) * ObservationLoss(family, y(i), eta(i), clip);
	}
	return dev;
}

/**
 * Intercept of the null (intercept-only) model for a weighted response
 *
 * gaussian: weighted mean; binomial: logit of the weighted mean
 */
inline double NullIntercept(Family family, const Eigen::VectorXd &y, const Eigen::VectorXd &weights, double clip) {
	double ybar = (weights.array() * y.array()).sum() / weights.sum();
	if (family == Family::GAUSSIAN) {
		return ybar;
	}
	double prob = ClipProbability(ybar, clip);
	return std::log(prob / (1.0 - prob));
}

} // namespace core
} // namespace libmiselect
