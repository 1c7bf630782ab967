#pragma once

#include "libmiselect/core/cv_result.hpp"
#include "libmiselect/core/family.hpp"
#include "libmiselect/core/fit_options.hpp"
#include "libmiselect/core/imputed_dataset.hpp"
#include "libmiselect/core/solution_path.hpp"
#include "libmiselect/cv/cross_validator.hpp"
#include "libmiselect/data/penalty_context.hpp"
#include "libmiselect/data/stacker.hpp"
#include "libmiselect/path/path_driver.hpp"
#include "libmiselect/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <vector>

namespace libmiselect {
namespace models {

/**
 * Grouped adaptive lasso over multiply-imputed data
 *
 * Each imputation gets its own coefficients; the M copies of a variable are
 * penalized together through their Euclidean norm, so a variable is either
 * selected in every imputation or in none. Reported coefficients are the
 * average over imputations (the per-imputation matrix stays available in
 * PathPoint::imputation_coefficients).
 */
class Galasso {
public:
	/**
	 * Fit the regularization path
	 *
	 * @param dataset M imputations
	 * @param penalty_factors Length p, >= 0 (empty = all ones)
	 * @param adaptive_weights Length p, >= 0 (empty = all ones)
	 * @param family Model family
	 * @param lambdas Caller grid (empty = automatic)
	 * @param options Fit options
	 *
	 * @throws DimensionError on inconsistent shapes
	 * @throws InvalidParameterError on values outside their domain
	 */
	static core::SolutionPath Fit(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
	                              const Eigen::VectorXd &adaptive_weights, core::Family family,
	                              const std::vector<double> &lambdas = {},
	                              const core::FitOptions &options = core::FitOptions());

	/**
	 * Fit and cross-validate with random folds
	 *
	 * @throws InsufficientFoldsError on an unusable number of folds
	 */
	static core::CVResult CrossValidate(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
	                                    const Eigen::VectorXd &adaptive_weights, core::Family family,
	                                    const std::vector<double> &lambdas, size_t nfolds,
	                                    std::optional<uint64_t> seed = std::nullopt,
	                                    const core::FitOptions &options = core::FitOptions());

	/// Fit and cross-validate with caller-supplied folds
	static core::CVResult CrossValidate(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
	                                    const Eigen::VectorXd &adaptive_weights, core::Family family,
	                                    const std::vector<double> &lambdas, const std::vector<size_t> &fold_ids,
	                                    const core::FitOptions &options = core::FitOptions());

private:
	static void ValidateInputs(const core::ImputedDataset &dataset, core::Family family,
	                           const std::vector<double> &lambdas, const core::FitOptions &options);
};

// ============================================================================
// Implementation (header-only for performance)
// ============================================================================

inline void Galasso::ValidateInputs(const core::ImputedDataset &dataset, core::Family family,
                                    const std::vector<double> &lambdas, const core::FitOptions &options) {
	options.Validate();
	dataset.Validate(family);
	if (!lambdas.empty()) {
		path::PathDriver::PrepareLambdaGrid(lambdas);
	}
}

inline core::SolutionPath Galasso::Fit(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
                                       const Eigen::VectorXd &adaptive_weights, core::Family family,
                                       const std::vector<double> &lambdas, const core::FitOptions &options) {
	ValidateInputs(dataset, family, lambdas, options);
	data::PenaltyContext penalty(penalty_factors, adaptive_weights, dataset.NumVariables());

	MISELECT_DEBUG("galasso fit: n=" << dataset.NumObservations() << " p=" << dataset.NumVariables()
	                                 << " M=" << dataset.NumImputations() << " family=" << core::FamilyName(family));

	data::StandardizedImputations standardized = data::Stacker::StandardizeEach(dataset);
	return path::PathDriver::RunGalasso(standardized, penalty, family, lambdas, options);
}

inline core::CVResult Galasso::CrossValidate(const core::ImputedDataset &dataset,
                                             const Eigen::VectorXd &penalty_factors,
                                             const Eigen::VectorXd &adaptive_weights, core::Family family,
                                             const std::vector<double> &lambdas, size_t nfolds,
                                             std::optional<uint64_t> seed, const core::FitOptions &options) {
	ValidateInputs(dataset, family, lambdas, options);
	data::PenaltyContext penalty(penalty_factors, adaptive_weights, dataset.NumVariables());
	std::vector<size_t> fold_ids = cv::CrossValidator::AssignFolds(dataset.NumObservations(), nfolds, seed);

	return cv::CrossValidator::CrossValidateGalasso(dataset, penalty, family, lambdas, fold_ids, options);
}

inline core::CVResult Galasso::CrossValidate(const core::ImputedDataset &dataset,
                                             const Eigen::VectorXd &penalty_factors,
                                             const Eigen::VectorXd &adaptive_weights, core::Family family,
                                             const std::vector<double> &lambdas,
                                             const std::vector<size_t> &fold_ids, const core::FitOptions &options) {
	ValidateInputs(dataset, family, lambdas, options);
	data::PenaltyContext penalty(penalty_factors, adaptive_weights, dataset.NumVariables());
	cv::CrossValidator::ValidateFolds(fold_ids, dataset.NumObservations());

	return cv::CrossValidator::CrossValidateGalasso(dataset, penalty, family, lambdas, fold_ids, options);
}

} // namespace models
} // namespace libmiselect
