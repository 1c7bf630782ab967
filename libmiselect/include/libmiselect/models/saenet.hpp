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
 * Stacked adaptive elastic net over multiply-imputed data
 *
 * All M imputations are stacked into one weighted design (observation weight
 * w_i / M per row) and a single adaptive elastic net path is fitted, so one
 * coefficient vector, and one selected variable set, serves every imputation.
 *
 * Usage:
 *   core::ImputedDataset data(xs, ys);
 *   auto path = Saenet::Fit(data, pf, adw, weights, core::Family::GAUSSIAN, {1.0, 0.5});
 *   auto beta = selection::CoefficientSelector::Select(path, path.lambdas[0][10], 0.5);
 *
 * Every shape and parameter check runs before any solving starts.
 */
class Saenet {
public:
	/**
	 * Fit the regularization path
	 *
	 * @param dataset M imputations (n × p designs and length-n responses)
	 * @param penalty_factors Length p, >= 0 (empty = all ones)
	 * @param adaptive_weights Length p, >= 0 (empty = all ones)
	 * @param obs_weights Length n, in (0, 1] (empty = all ones)
	 * @param family Model family
	 * @param alphas Mixing parameters in [0, 1] (default {1})
	 * @param lambdas Caller grid shared by all alphas (empty = automatic)
	 * @param options Fit options
	 *
	 * @throws DimensionError on inconsistent shapes
	 * @throws InvalidParameterError on values outside their domain
	 */
	static core::SolutionPath Fit(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
	                              const Eigen::VectorXd &adaptive_weights, const Eigen::VectorXd &obs_weights,
	                              core::Family family, const std::vector<double> &alphas = {1.0},
	                              const std::vector<double> &lambdas = {},
	                              const core::FitOptions &options = core::FitOptions());

	/**
	 * Fit and cross-validate with random folds
	 *
	 * @param nfolds Number of folds (2 <= nfolds <= n)
	 * @param seed Fold shuffle seed (random when absent)
	 *
	 * @throws InsufficientFoldsError on an unusable number of folds
	 */
	static core::CVResult CrossValidate(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
	                                    const Eigen::VectorXd &adaptive_weights, const Eigen::VectorXd &obs_weights,
	                                    core::Family family, const std::vector<double> &alphas,
	                                    const std::vector<double> &lambdas, size_t nfolds,
	                                    std::optional<uint64_t> seed = std::nullopt,
	                                    const core::FitOptions &options = core::FitOptions());

	/**
	 * Fit and cross-validate with caller-supplied folds
	 *
	 * @param fold_ids Fold label (0..K-1) of each of the n observations
	 */
	static core::CVResult CrossValidate(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
	                                    const Eigen::VectorXd &adaptive_weights, const Eigen::VectorXd &obs_weights,
	                                    core::Family family, const std::vector<double> &alphas,
	                                    const std::vector<double> &lambdas, const std::vector<size_t> &fold_ids,
	                                    const core::FitOptions &options = core::FitOptions());

private:
	/// Eager validation; returns the resolved observation weights
	static Eigen::VectorXd ValidateInputs(const core::ImputedDataset &dataset, const Eigen::VectorXd &obs_weights,
	                                      core::Family family, const std::vector<double> &alphas,
	                                      const std::vector<double> &lambdas, const core::FitOptions &options);
};

// ============================================================================
// Implementation (header-only for performance)
// ============================================================================

inline Eigen::VectorXd Saenet::ValidateInputs(const core::ImputedDataset &dataset, const Eigen::VectorXd &obs_weights,
                                              core::Family family, const std::vector<double> &alphas,
                                              const std::vector<double> &lambdas,
                                              const core::FitOptions &options) {
	options.Validate();
	dataset.Validate(family);
	path::PathDriver::ValidateAlphas(alphas);
	if (!lambdas.empty()) {
		path::PathDriver::PrepareLambdaGrid(lambdas);
	}

	const size_t n = dataset.NumObservations();
	if (obs_weights.size() == 0) {
		return Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n));
	}
	core::ValidateObservationWeights(obs_weights, n);
	return obs_weights;
}

inline core::SolutionPath Saenet::Fit(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
                                      const Eigen::VectorXd &adaptive_weights, const Eigen::VectorXd &obs_weights,
                                      core::Family family, const std::vector<double> &alphas,
                                      const std::vector<double> &lambdas, const core::FitOptions &options) {
	Eigen::VectorXd weights = ValidateInputs(dataset, obs_weights, family, alphas, lambdas, options);
	data::PenaltyContext penalty(penalty_factors, adaptive_weights, dataset.NumVariables());

	MISELECT_DEBUG("saenet fit: n=" << dataset.NumObservations() << " p=" << dataset.NumVariables()
	                                << " M=" << dataset.NumImputations() << " family=" << core::FamilyName(family));

	data::StackedDataset stacked = data::Stacker::Stack(dataset, weights);
	return path::PathDriver::RunSaenet(stacked, penalty, family, alphas, lambdas, options);
}

inline core::CVResult Saenet::CrossValidate(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
                                            const Eigen::VectorXd &adaptive_weights,
                                            const Eigen::VectorXd &obs_weights, core::Family family,
                                            const std::vector<double> &alphas, const std::vector<double> &lambdas,
                                            size_t nfolds, std::optional<uint64_t> seed,
                                            const core::FitOptions &options) {
	Eigen::VectorXd weights = ValidateInputs(dataset, obs_weights, family, alphas, lambdas, options);
	data::PenaltyContext penalty(penalty_factors, adaptive_weights, dataset.NumVariables());
	std::vector<size_t> fold_ids = cv::CrossValidator::AssignFolds(dataset.NumObservations(), nfolds, seed);

	return cv::CrossValidator::CrossValidateSaenet(dataset, weights, penalty, family, alphas, lambdas, fold_ids,
	                                               options);
}

inline core::CVResult Saenet::CrossValidate(const core::ImputedDataset &dataset, const Eigen::VectorXd &penalty_factors,
                                            const Eigen::VectorXd &adaptive_weights,
                                            const Eigen::VectorXd &obs_weights, core::Family family,
                                            const std::vector<double> &alphas, const std::vector<double> &lambdas,
                                            const std::vector<size_t> &fold_ids, const core::FitOptions &options) {
	Eigen::VectorXd weights = ValidateInputs(dataset, obs_weights, family, alphas, lambdas, options);
	data::PenaltyContext penalty(penalty_factors, adaptive_weights, dataset.NumVariables());
	cv::CrossValidator::ValidateFolds(fold_ids, dataset.NumObservations());

	return cv::CrossValidator::CrossValidateSaenet(dataset, weights, penalty, family, alphas, lambdas, fold_ids,
	                                               options);
}

} // namespace models
} // namespace libmiselect
