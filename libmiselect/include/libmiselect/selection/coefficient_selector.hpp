#pragma once

#include "libmiselect/core/cv_result.hpp"
#include "libmiselect/core/errors.hpp"
#include "libmiselect/core/family.hpp"
#include "libmiselect/core/solution_path.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>
#include <string>

namespace libmiselect {
namespace selection {

/// Scale of a prediction
enum class PredictionType {
	LINK,     ///< Linear predictor
	RESPONSE  ///< Mean response (probabilities for binomial)
};

/// Relative tolerance for matching a requested setting to the grid
constexpr double kSettingMatchTolerance = 1e-10;

/**
 * CoefficientSelector: read coefficients back from fitted paths
 *
 * Selection never refits. A requested (lambda, alpha) must match a computed
 * grid point (up to a relative tolerance of 1e-10); anything else raises
 * NotFoundError.
 */
class CoefficientSelector {
public:
	/**
	 * Coefficients of a plain path
	 *
	 * @param path Fitted path
	 * @param lambda Required
	 * @param alpha May be omitted only when the path has a single alpha
	 * @return Copy of the stored vector (intercept first, length p + 1)
	 *
	 * @throws InvalidParameterError if lambda is missing, or alpha is missing on
	 *         a multi-alpha path
	 * @throws NotFoundError if the setting is not on the grid
	 */
	static Eigen::VectorXd Select(const core::SolutionPath &path, std::optional<double> lambda,
	                              std::optional<double> alpha = std::nullopt);

	/**
	 * Coefficients of a cross-validated path
	 *
	 * Omitted lambda means lambda_min; omitted alpha means alpha_min.
	 *
	 * @throws NotFoundError if the setting is not on the grid
	 */
	static Eigen::VectorXd Select(const core::CVResult &cv, std::optional<double> lambda = std::nullopt,
	                              std::optional<double> alpha = std::nullopt);

	/// Coefficients at the one-standard-error setting of a cross-validated path
	static Eigen::VectorXd Select1se(const core::CVResult &cv);

	/**
	 * Per-imputation coefficients ((p + 1) × M) of a grid point
	 *
	 * For SAENET every column is the shared vector.
	 */
	static Eigen::MatrixXd SelectImputationCoefficients(const core::SolutionPath &path, std::optional<double> lambda,
	                                                    std::optional<double> alpha = std::nullopt);

	/**
	 * Grid point matching a setting
	 *
	 * @throws InvalidParameterError / NotFoundError as for Select()
	 */
	static const core::PathPoint &FindPoint(const core::SolutionPath &path, std::optional<double> lambda,
	                                        std::optional<double> alpha);

	/**
	 * Predict for a new design
	 *
	 * @param coefficients Intercept followed by p slopes
	 * @param x n × p design on the original covariate scale
	 * @param family Model family (selects the inverse link)
	 * @param type Link or response scale
	 *
	 * @throws DimensionError if x does not have p columns
	 */
	static Eigen::VectorXd Predict(const Eigen::VectorXd &coefficients, const Eigen::MatrixXd &x, core::Family family,
	                               PredictionType type = PredictionType::RESPONSE);

private:
	static bool Matches(double requested, double stored) {
		return std::abs(requested - stored) <= kSettingMatchTolerance * std::max(1.0, std::abs(stored));
	}
};

// ============================================================================
// Implementation (header-only for performance)
// ============================================================================

inline const core::PathPoint &CoefficientSelector::FindPoint(const core::SolutionPath &path,
                                                             std::optional<double> lambda,
                                                             std::optional<double> alpha) {
	if (!lambda.has_value()) {
		throw core::InvalidParameterError("lambda is required when selecting from a path without cross-validation");
	}
	if (!alpha.has_value()) {
		if (path.alphas.size() != 1) {
			throw core::InvalidParameterError("alpha is required for a path with " +
			                                  std::to_string(path.alphas.size()) + " alpha values");
		}
		alpha = path.alphas.front();
	}

	for (size_t a = 0; a < path.alphas.size(); a++) {
		if (!Matches(*alpha, path.alphas[a])) {
			continue;
		}
		for (size_t l = 0; l < path.lambdas[a].size(); l++) {
			if (Matches(*lambda, path.lambdas[a][l])) {
				return path.points[a][l];
			}
		}
	}

	std::ostringstream msg;
	msg << "no fitted point at lambda=" << *lambda << ", alpha=" << *alpha;
	throw core::NotFoundError(msg.str());
}

inline Eigen::VectorXd CoefficientSelector::Select(const core::SolutionPath &path, std::optional<double> lambda,
                                                   std::optional<double> alpha) {
	return FindPoint(path, lambda, alpha).coefficients;
}

inline Eigen::VectorXd CoefficientSelector::Select(const core::CVResult &cv, std::optional<double> lambda,
                                                   std::optional<double> alpha) {
	return FindPoint(cv.path, lambda.value_or(cv.lambda_min), alpha.value_or(cv.alpha_min)).coefficients;
}

inline Eigen::VectorXd CoefficientSelector::Select1se(const core::CVResult &cv) {
	return FindPoint(cv.path, cv.lambda_1se, cv.alpha_1se).coefficients;
}

inline Eigen::MatrixXd CoefficientSelector::SelectImputationCoefficients(const core::SolutionPath &path,
                                                                         std::optional<double> lambda,
                                                                         std::optional<double> alpha) {
	return FindPoint(path, lambda, alpha).imputation_coefficients;
}

inline Eigen::VectorXd CoefficientSelector::Predict(const Eigen::VectorXd &coefficients, const Eigen::MatrixXd &x,
                                                    core::Family family, PredictionType type) {
	if (coefficients.size() != x.cols() + 1) {
		throw core::DimensionError("design has " + std::to_string(x.cols()) + " columns but coefficients cover " +
		                           std::to_string(coefficients.size() - 1) + " variables");
	}

	Eigen::VectorXd eta = ((x * coefficients.tail(x.cols())).array() + coefficients(0)).matrix();
	if (type == PredictionType::LINK || family == core::Family::GAUSSIAN) {
		return eta;
	}
	return eta.unaryExpr([](double v) { return core::InverseLogit(v); });
}

} // namespace selection
} // namespace libmiselect
