#pragma once

#include "libmiselect/core/cv_result.hpp"
#include "libmiselect/core/errors.hpp"
#include "libmiselect/core/family.hpp"
#include "libmiselect/core/fit_options.hpp"
#include "libmiselect/core/imputed_dataset.hpp"
#include "libmiselect/core/solution_path.hpp"
#include "libmiselect/data/penalty_context.hpp"
#include "libmiselect/data/stacker.hpp"
#include "libmiselect/path/path_driver.hpp"
#include "libmiselect/solvers/elastic_net_path.hpp"
#include "libmiselect/solvers/group_lasso_path.hpp"
#include "libmiselect/utils/parallel.hpp"
#include "libmiselect/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace libmiselect {
namespace cv {

/**
 * Held-out errors of every fold
 *
 * errors[f][a][l] is the weighted mean loss of fold f at alpha slice a,
 * lambda index l; fold_weights[f] is the summed observation weight of fold f.
 */
struct FoldErrors {
	std::vector<std::vector<std::vector<double>>> errors;
	std::vector<double> fold_weights;
};

/**
 * CrossValidator: K-fold cross-validation of SAENET and GALASSO paths
 *
 * Folds partition the original observations, so a held-out observation is
 * held out of all M imputations. The lambda grid of every alpha is fixed by
 * a fit on the full data and reused by every fold, so errors line up
 * setting by setting.
 *
 * Each (fold, alpha) pair is an independent task with its own engine; the
 * fold errors are merged in one aggregation step after all tasks finish.
 */
class CrossValidator {
public:
	/**
	 * Balanced random fold labels
	 *
	 * Labels 0..nfolds-1 are repeated over the n observations and shuffled by
	 * Fisher-Yates driven by std::mt19937_64. Swap positions come from
	 * UniformIndex, so the assignment depends only on the generator's output
	 * sequence and the same seed gives the same folds on every platform.
	 *
	 * @param n Number of observations
	 * @param nfolds Number of folds K
	 * @param seed Shuffle seed; a random seed is drawn when absent
	 *
	 * @throws InsufficientFoldsError if K < 2 or K > n
	 */
	static std::vector<size_t> AssignFolds(size_t n, size_t nfolds, std::optional<uint64_t> seed);

	/**
	 * Check caller-supplied fold labels
	 *
	 * @return Number of folds (largest label + 1)
	 *
	 * @throws DimensionError if the length differs from n
	 * @throws InsufficientFoldsError if a label is n or larger, if fewer than
	 *         two folds are used, or if a label in 0..K-1 has no observation
	 */
	static size_t ValidateFolds(const std::vector<size_t> &fold_ids, size_t n);

	/// Uniform draw from 0..upper by rejection sampling on raw generator output
	static size_t UniformIndex(std::mt19937_64 &rng, size_t upper);

	/**
	 * Cross-validate a SAENET fit
	 *
	 * @param dataset Validated imputed dataset
	 * @param obs_weights Length-n observation weights
	 * @param penalty Penalty context
	 * @param family Model family
	 * @param alphas Alpha values
	 * @param lambdas Caller grid (empty = automatic per alpha on the full data)
	 * @param fold_ids Fold label of every observation
	 * @param options Fit options
	 */
	static core::CVResult CrossValidateSaenet(const core::ImputedDataset &dataset, const Eigen::VectorXd &obs_weights,
	                                          const data::PenaltyContext &penalty, core::Family family,
	                                          const std::vector<double> &alphas, const std::vector<double> &lambdas,
	                                          const std::vector<size_t> &fold_ids, const core::FitOptions &options);

	/**
	 * Cross-validate a GALASSO fit
	 *
	 * Held-out rows of imputation m are predicted with the coefficients of
	 * imputation m; observations carry unit weight.
	 */
	static core::CVResult CrossValidateGalasso(const core::ImputedDataset &dataset, const data::PenaltyContext &penalty,
	                                           core::Family family, const std::vector<double> &lambdas,
	                                           const std::vector<size_t> &fold_ids,
	                                           const core::FitOptions &options);

	/**
	 * Weighted mean and standard error of the fold errors
	 *
	 * cv_mean = sum_f W_f e_f / sum_f W_f
	 * cv_se   = sqrt(sum_f W_f (e_f - cv_mean)^2 / sum_f W_f / (K - 1))
	 */
	static void Aggregate(const FoldErrors &fold_errors, core::CVResult &result);

	/**
	 * Fill lambda_min/alpha_min and lambda_1se/alpha_1se from cv_mean and cv_se
	 *
	 * Minimum: first minimum in alpha order, then in path (decreasing lambda)
	 * order. 1se: largest lambda of the alpha_min slice whose mean error is at
	 * most cv_mean(min) + cv_se(min).
	 */
	static void SelectSettings(core::CVResult &result);

	/**
	 * Weighted held-out loss of one coefficient vector on one imputation
	 *
	 * @param coefficients Intercept followed by p slopes (original scale)
	 * @return sum_i w_i * loss(y_i, eta_i) over the given rows
	 */
	static double HeldOutLoss(core::Family family, const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
	                          const Eigen::VectorXd &coefficients, const std::vector<size_t> &rows,
	                          const Eigen::VectorXd &weights, double clip);

private:
	static void SplitRows(const std::vector<size_t> &fold_ids, size_t fold, std::vector<size_t> &train,
	                      std::vector<size_t> &test);
};

// ============================================================================
// Implementation (header-only for performance)
// ============================================================================

inline std::vector<size_t> CrossValidator::AssignFolds(size_t n, size_t nfolds, std::optional<uint64_t> seed) {
	if (nfolds < 2) {
		throw core::InsufficientFoldsError("nfolds must be at least 2 (got " + std::to_string(nfolds) + ")");
	}
	if (nfolds > n) {
		throw core::InsufficientFoldsError("nfolds (" + std::to_string(nfolds) + ") exceeds the number of observations (" +
		                                   std::to_string(n) + ")");
	}

	uint64_t seed_value;
	if (seed.has_value()) {
		seed_value = *seed;
	} else {
		std::random_device device;
		seed_value = (static_cast<uint64_t>(device()) << 32) ^ static_cast<uint64_t>(device());
		MISELECT_DEBUG("fold assignment seed drawn at random: " << seed_value);
	}

	std::vector<size_t> folds(n);
	for (size_t i = 0; i < n; i++) {
		folds[i] = i % nfolds;
	}

	std::mt19937_64 rng(seed_value);
	for (size_t i = n - 1; i > 0; i--) {
		std::swap(folds[i], folds[UniformIndex(rng, i)]);
	}
	return folds;
}

inline size_t CrossValidator::UniformIndex(std::mt19937_64 &rng, size_t upper) {
	const uint64_t range = static_cast<uint64_t>(upper) + 1;
	if (range == 0) {
		return static_cast<size_t>(rng());
	}
	// Largest multiple of range that fits; draws at or above it are rejected
	const uint64_t limit = std::numeric_limits<uint64_t>::max() - std::numeric_limits<uint64_t>::max() % range;
	uint64_t draw = rng();
	while (draw >= limit) {
		draw = rng();
	}
	return static_cast<size_t>(draw % range);
}

inline size_t CrossValidator::ValidateFolds(const std::vector<size_t> &fold_ids, size_t n) {
	if (fold_ids.size() != n) {
		throw core::DimensionError("fold ids have length " + std::to_string(fold_ids.size()) + ", expected " +
		                           std::to_string(n));
	}
	// K <= n, so every label must be below n
	size_t nfolds = 0;
	for (size_t id : fold_ids) {
		if (id >= n) {
			throw core::InsufficientFoldsError("fold label " + std::to_string(id) + " is out of range for " +
			                                   std::to_string(n) + " observations");
		}
		nfolds = std::max(nfolds, id + 1);
	}
	if (nfolds < 2) {
		throw core::InsufficientFoldsError("at least two folds are required");
	}

	std::vector<size_t> counts(nfolds, 0);
	for (size_t id : fold_ids) {
		counts[id]++;
	}
	for (size_t f = 0; f < nfolds; f++) {
		if (counts[f] == 0) {
			throw core::InsufficientFoldsError("fold " + std::to_string(f) + " has no observations");
		}
	}
	return nfolds;
}

inline void CrossValidator::SplitRows(const std::vector<size_t> &fold_ids, size_t fold, std::vector<size_t> &train,
                                      std::vector<size_t> &test) {
	train.clear();
	test.clear();
	for (size_t i = 0; i < fold_ids.size(); i++) {
		if (fold_ids[i] == fold) {
			test.push_back(i);
		} else {
			train.push_back(i);
		}
	}
}

inline double CrossValidator::HeldOutLoss(core::Family family, const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
                                          const Eigen::VectorXd &coefficients, const std::vector<size_t> &rows,
                                          const Eigen::VectorXd &weights, double clip) {
	const auto p = x.cols();
	double total = 0.0;
	for (size_t row : rows) {
		auto i = static_cast<Eigen::Index>(row);
		double eta = coefficients(0) + x.row(i).dot(coefficients.tail(p));
		total += weights(i) * core::ObservationLoss(family, y(i), eta, clip);
	}
	return total;
}

inline core::CVResult CrossValidator::CrossValidateSaenet(const core::ImputedDataset &dataset,
                                                          const Eigen::VectorXd &obs_weights,
                                                          const data::PenaltyContext &penalty, core::Family family,
                                                          const std::vector<double> &alphas,
                                                          const std::vector<double> &lambdas,
                                                          const std::vector<size_t> &fold_ids,
                                                          const core::FitOptions &options) {
	const size_t n = dataset.NumObservations();
	const size_t nfolds = ValidateFolds(fold_ids, n);
	const size_t n_alphas = alphas.size();
	const double inv_m = 1.0 / static_cast<double>(dataset.NumImputations());

	MISELECT_TIMING_START();

	core::CVResult result;
	result.fold_ids = fold_ids;
	result.nfolds = nfolds;

	data::StackedDataset full = data::Stacker::Stack(dataset, obs_weights);
	result.path = path::PathDriver::RunSaenet(full, penalty, family, alphas, lambdas, options);

	// Training data of every fold, built once and shared by its alpha tasks
	std::vector<std::vector<size_t>> test_rows(nfolds);
	std::vector<data::StackedDataset> train_data(nfolds);
	FoldErrors fold_errors;
	fold_errors.fold_weights.assign(nfolds, 0.0);
	fold_errors.errors.assign(nfolds, std::vector<std::vector<double>>(n_alphas));

	utils::ParallelFor(nfolds, options.n_threads, [&](size_t f) {
		std::vector<size_t> train;
		SplitRows(fold_ids, f, train, test_rows[f]);
		train_data[f] = data::Stacker::Stack(dataset.Subset(train), core::SubsetVector(obs_weights, train));
		for (size_t row : test_rows[f]) {
			fold_errors.fold_weights[f] += obs_weights(static_cast<Eigen::Index>(row));
		}
	});

	std::vector<std::vector<std::string>> task_warnings(nfolds * n_alphas);
	utils::ParallelFor(nfolds * n_alphas, options.n_threads, [&](size_t task) {
		const size_t f = task / n_alphas;
		const size_t a = task % n_alphas;

		solvers::ElasticNetPath engine(train_data[f], penalty, family, options);
		std::vector<core::PathPoint> points = path::PathDriver::TraceAlpha(engine, alphas[a], result.path.lambdas[a]);

		std::vector<double> &errors = fold_errors.errors[f][a];
		errors.resize(points.size());
		for (size_t l = 0; l < points.size(); l++) {
			double loss = 0.0;
			for (size_t m = 0; m < dataset.NumImputations(); m++) {
				loss += inv_m * HeldOutLoss(family, dataset.x[m], dataset.y[m], points[l].coefficients, test_rows[f],
				                            obs_weights, options.probability_clip);
			}
			errors[l] = loss / fold_errors.fold_weights[f];
			if (!points[l].converged) {
				task_warnings[task].push_back("fold " + std::to_string(f) + ": " + points[l].warning);
			}
		}
	});

	for (auto &warnings : task_warnings) {
		result.fold_warnings.insert(result.fold_warnings.end(), warnings.begin(), warnings.end());
	}

	Aggregate(fold_errors, result);
	SelectSettings(result);
	MISELECT_TIMING_END("saenet cross-validation");

	MISELECT_INFO("saenet cv: lambda.min=" << result.lambda_min << " alpha.min=" << result.alpha_min
	                                       << " lambda.1se=" << result.lambda_1se);
	return result;
}

inline core::CVResult CrossValidator::CrossValidateGalasso(const core::ImputedDataset &dataset,
                                                           const data::PenaltyContext &penalty, core::Family family,
                                                           const std::vector<double> &lambdas,
                                                           const std::vector<size_t> &fold_ids,
                                                           const core::FitOptions &options) {
	const size_t n = dataset.NumObservations();
	const size_t nfolds = ValidateFolds(fold_ids, n);
	const size_t m_count = dataset.NumImputations();
	const double inv_m = 1.0 / static_cast<double>(m_count);
	const Eigen::VectorXd unit_weights = Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n));

	MISELECT_TIMING_START();

	core::CVResult result;
	result.fold_ids = fold_ids;
	result.nfolds = nfolds;

	data::StandardizedImputations full = data::Stacker::StandardizeEach(dataset);
	result.path = path::PathDriver::RunGalasso(full, penalty, family, lambdas, options);
	const std::vector<double> &grid = result.path.lambdas.front();

	FoldErrors fold_errors;
	fold_errors.fold_weights.assign(nfolds, 0.0);
	fold_errors.errors.assign(nfolds, std::vector<std::vector<double>>(1));

	std::vector<std::vector<std::string>> task_warnings(nfolds);
	utils::ParallelFor(nfolds, options.n_threads, [&](size_t f) {
		std::vector<size_t> train;
		std::vector<size_t> test;
		SplitRows(fold_ids, f, train, test);
		fold_errors.fold_weights[f] = static_cast<double>(test.size());

		data::StandardizedImputations train_data = data::Stacker::StandardizeEach(dataset.Subset(train));
		solvers::GroupLassoPath engine(train_data, penalty, family, options);
		std::vector<core::PathPoint> points = path::PathDriver::TraceGalasso(engine, grid);

		std::vector<double> &errors = fold_errors.errors[f][0];
		errors.resize(points.size());
		for (size_t l = 0; l < points.size(); l++) {
			double loss = 0.0;
			for (size_t m = 0; m < m_count; m++) {
				Eigen::VectorXd coefficients = points[l].imputation_coefficients.col(static_cast<Eigen::Index>(m));
				loss += inv_m * HeldOutLoss(family, dataset.x[m], dataset.y[m], coefficients, test, unit_weights,
				                            options.probability_clip);
			}
			errors[l] = loss / fold_errors.fold_weights[f];
			if (!points[l].converged) {
				task_warnings[f].push_back("fold " + std::to_string(f) + ": " + points[l].warning);
			}
		}
	});

	for (auto &warnings : task_warnings) {
		result.fold_warnings.insert(result.fold_warnings.end(), warnings.begin(), warnings.end());
	}

	Aggregate(fold_errors, result);
	SelectSettings(result);
	MISELECT_TIMING_END("galasso cross-validation");

	MISELECT_INFO("galasso cv: lambda.min=" << result.lambda_min << " lambda.1se=" << result.lambda_1se);
	return result;
}

inline void CrossValidator::Aggregate(const FoldErrors &fold_errors, core::CVResult &result) {
	const size_t nfolds = fold_errors.errors.size();
	const size_t n_alphas = result.path.lambdas.size();

	double total_weight = 0.0;
	for (double w : fold_errors.fold_weights) {
		total_weight += w;
	}

	result.cv_mean.assign(n_alphas, std::vector<double>());
	result.cv_se.assign(n_alphas, std::vector<double>());
	for (size_t a = 0; a < n_alphas; a++) {
		const size_t n_lambdas = result.path.lambdas[a].size();
		result.cv_mean[a].assign(n_lambdas, 0.0);
		result.cv_se[a].assign(n_lambdas, 0.0);

		for (size_t l = 0; l < n_lambdas; l++) {
			double mean = 0.0;
			for (size_t f = 0; f < nfolds; f++) {
				mean += fold_errors.fold_weights[f] * fold_errors.errors[f][a][l];
			}
			mean /= total_weight;

			double spread = 0.0;
			for (size_t f = 0; f < nfolds; f++) {
				double diff = fold_errors.errors[f][a][l] - mean;
				spread += fold_errors.fold_weights[f] * diff * diff;
			}
			result.cv_mean[a][l] = mean;
			result.cv_se[a][l] = std::sqrt(spread / total_weight / static_cast<double>(nfolds - 1));
		}
	}
}

inline void CrossValidator::SelectSettings(core::CVResult &result) {
	double best = std::numeric_limits<double>::infinity();
	bool found = false;
	for (size_t a = 0; a < result.cv_mean.size(); a++) {
		for (size_t l = 0; l < result.cv_mean[a].size(); l++) {
			if (result.cv_mean[a][l] < best) {
				best = result.cv_mean[a][l];
				result.alpha_min_index = a;
				result.lambda_min_index = l;
				found = true;
			}
		}
	}
	if (!found) {
		throw core::NotFoundError("no finite cross-validation error to select from");
	}

	const size_t a_min = result.alpha_min_index;
	const size_t l_min = result.lambda_min_index;
	result.alpha_min = result.path.alphas[a_min];
	result.lambda_min = result.path.lambdas[a_min][l_min];

	// Lambdas are decreasing, so the first index within the band is the largest lambda
	const double bound = best + result.cv_se[a_min][l_min];
	result.lambda_1se_index = l_min;
	for (size_t l = 0; l <= l_min; l++) {
		if (result.cv_mean[a_min][l] <= bound) {
			result.lambda_1se_index = l;
			break;
		}
	}
	result.alpha_1se = result.alpha_min;
	result.lambda_1se = result.path.lambdas[a_min][result.lambda_1se_index];
}

} // namespace cv
} // namespace libmiselect
