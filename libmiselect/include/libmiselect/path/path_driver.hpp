#pragma once

#include "libmiselect/core/errors.hpp"
#include "libmiselect/core/family.hpp"
#include "libmiselect/core/fit_options.hpp"
#include "libmiselect/core/solution_path.hpp"
#include "libmiselect/data/penalty_context.hpp"
#include "libmiselect/data/stacker.hpp"
#include "libmiselect/solvers/elastic_net_path.hpp"
#include "libmiselect/solvers/group_lasso_path.hpp"
#include "libmiselect/utils/parallel.hpp"
#include "libmiselect/utils/tracing.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <string>
#include <vector>

namespace libmiselect {
namespace path {

/**
 * PathDriver: turns single-setting engines into full regularization paths
 *
 * Lambda sequences run from large to small so each fit warm starts from the
 * previous, sparser solution. SAENET alpha slices are independent and run as
 * separate tasks on the worker pool; each task owns its engine.
 *
 * Design notes:
 * - Stateless (all methods static)
 * - A caller-supplied lambda grid is shared by every alpha; otherwise each
 *   alpha gets its own automatic sequence from its lambda_max
 */
class PathDriver {
public:
	/**
	 * Log-spaced lambda sequence
	 *
	 * @param lambda_max First (largest) value
	 * @param nlambda Number of values (>= 1)
	 * @param lambda_min_ratio Last value is lambda_min_ratio * lambda_max
	 * @return Strictly decreasing sequence of length nlambda
	 *
	 * @throws InvalidParameterError on non-positive lambda_max or nlambda == 0
	 */
	static std::vector<double> LambdaSequence(double lambda_max, size_t nlambda, double lambda_min_ratio);

	/**
	 * Validate a caller-supplied grid and sort it in decreasing order
	 *
	 * Exact duplicates are dropped.
	 *
	 * @throws InvalidParameterError if the grid is empty or holds a negative or
	 *         non-finite value
	 */
	static std::vector<double> PrepareLambdaGrid(const std::vector<double> &lambdas);

	/**
	 * Validate the alpha values of a SAENET fit
	 *
	 * @throws InvalidParameterError if empty, outside [0, 1] or repeated
	 */
	static void ValidateAlphas(const std::vector<double> &alphas);

	/// Fit one alpha slice along a decreasing lambda sequence with warm starts
	static std::vector<core::PathPoint> TraceAlpha(solvers::ElasticNetPath &engine, double alpha,
	                                               const std::vector<double> &lambdas);

	/// Fit the GALASSO path along a decreasing lambda sequence with warm starts
	static std::vector<core::PathPoint> TraceGalasso(solvers::GroupLassoPath &engine,
	                                                 const std::vector<double> &lambdas);

	/**
	 * Full SAENET path over every alpha
	 *
	 * @param data Stacked dataset
	 * @param penalty Penalty context (p variables)
	 * @param family Model family
	 * @param alphas Alpha values (kept in the given order)
	 * @param lambdas Caller grid shared by all alphas; empty = automatic per alpha
	 * @param options Fit options
	 */
	static core::SolutionPath RunSaenet(const data::StackedDataset &data, const data::PenaltyContext &penalty,
	                                    core::Family family, const std::vector<double> &alphas,
	                                    const std::vector<double> &lambdas, const core::FitOptions &options);

	/**
	 * Full GALASSO path (single slice reported with alpha = 1)
	 *
	 * @param lambdas Caller grid; empty = automatic sequence
	 */
	static core::SolutionPath RunGalasso(const data::StandardizedImputations &data,
	                                     const data::PenaltyContext &penalty, core::Family family,
	                                     const std::vector<double> &lambdas, const core::FitOptions &options);
};

// ============================================================================
// Implementation (header-only for performance)
// ============================================================================

inline std::vector<double> PathDriver::LambdaSequence(double lambda_max, size_t nlambda, double lambda_min_ratio) {
	if (!(lambda_max > 0.0) || !std::isfinite(lambda_max)) {
		throw core::InvalidParameterError("lambda_max must be positive (got " + std::to_string(lambda_max) + ")");
	}
	if (nlambda == 0) {
		throw core::InvalidParameterError("nlambda must be positive");
	}
	if (!(lambda_min_ratio > 0.0 && lambda_min_ratio < 1.0)) {
		throw core::InvalidParameterError("lambda_min_ratio must be in (0, 1)");
	}

	std::vector<double> out(nlambda);
	out[0] = lambda_max;
	if (nlambda == 1) {
		return out;
	}

	const double log_max = std::log(lambda_max);
	const double step = std::log(lambda_min_ratio) / static_cast<double>(nlambda - 1);
	for (size_t k = 1; k < nlambda; k++) {
		out[k] = std::exp(log_max + step * static_cast<double>(k));
	}
	return out;
}

inline std::vector<double> PathDriver::PrepareLambdaGrid(const std::vector<double> &lambdas) {
	if (lambdas.empty()) {
		throw core::InvalidParameterError("lambda grid is empty");
	}
	for (double lambda : lambdas) {
		if (!(lambda >= 0.0) || !std::isfinite(lambda)) {
			throw core::InvalidParameterError("lambda values must be finite and non-negative (got " +
			                                  std::to_string(lambda) + ")");
		}
	}

	std::vector<double> out = lambdas;
	std::sort(out.begin(), out.end(), std::greater<double>());
	out.erase(std::unique(out.begin(), out.end()), out.end());
	return out;
}

inline void PathDriver::ValidateAlphas(const std::vector<double> &alphas) {
	if (alphas.empty()) {
		throw core::InvalidParameterError("at least one alpha value is required");
	}
	for (size_t a = 0; a < alphas.size(); a++) {
		if (!(alphas[a] >= 0.0 && alphas[a] <= 1.0)) {
			throw core::InvalidParameterError("alpha must be in [0, 1] (got " + std::to_string(alphas[a]) + ")");
		}
		for (size_t b = 0; b < a; b++) {
			if (alphas[b] == alphas[a]) {
				throw core::InvalidParameterError("alpha " + std::to_string(alphas[a]) + " appears more than once");
			}
		}
	}
}

inline std::vector<core::PathPoint> PathDriver::TraceAlpha(solvers::ElasticNetPath &engine, double alpha,
                                                           const std::vector<double> &lambdas) {
	std::vector<core::PathPoint> points;
	points.reserve(lambdas.size());
	for (double lambda : lambdas) {
		points.push_back(engine.Solve(lambda, alpha));
	}
	return points;
}

inline std::vector<core::PathPoint> PathDriver::TraceGalasso(solvers::GroupLassoPath &engine,
                                                             const std::vector<double> &lambdas) {
	std::vector<core::PathPoint> points;
	points.reserve(lambdas.size());
	for (double lambda : lambdas) {
		points.push_back(engine.Solve(lambda));
	}
	return points;
}

inline core::SolutionPath PathDriver::RunSaenet(const data::StackedDataset &data, const data::PenaltyContext &penalty,
                                                core::Family family, const std::vector<double> &alphas,
                                                const std::vector<double> &lambdas,
                                                const core::FitOptions &options) {
	ValidateAlphas(alphas);
	const std::vector<double> user_grid = lambdas.empty() ? std::vector<double>() : PrepareLambdaGrid(lambdas);

	core::SolutionPath path;
	path.method = core::Method::SAENET;
	path.family = family;
	path.n_obs = data.n_obs;
	path.n_vars = data.n_vars;
	path.n_imputations = data.n_imputations;
	path.alphas = alphas;
	path.lambdas.resize(alphas.size());
	path.points.resize(alphas.size());

	MISELECT_TIMING_START();
	utils::ParallelFor(alphas.size(), options.n_threads, [&](size_t a) {
		solvers::ElasticNetPath engine(data, penalty, family, options);
		std::vector<double> grid = user_grid;
		if (grid.empty()) {
			grid = LambdaSequence(engine.LambdaMax(alphas[a]), options.nlambda, options.lambda_min_ratio);
		}
		path.points[a] = TraceAlpha(engine, alphas[a], grid);
		path.lambdas[a] = std::move(grid);
		MISELECT_DEBUG("saenet alpha=" << alphas[a] << " traced " << path.points[a].size() << " lambdas");
	});
	MISELECT_TIMING_END("saenet path");

	return path;
}

inline core::SolutionPath PathDriver::RunGalasso(const data::StandardizedImputations &data,
                                                 const data::PenaltyContext &penalty, core::Family family,
                                                 const std::vector<double> &lambdas,
                                                 const core::FitOptions &options) {
	core::SolutionPath path;
	path.method = core::Method::GALASSO;
	path.family = family;
	path.n_obs = data.n_obs;
	path.n_vars = data.n_vars;
	path.n_imputations = data.n_imputations;
	path.alphas = {1.0};

	MISELECT_TIMING_START();
	solvers::GroupLassoPath engine(data, penalty, family, options);
	std::vector<double> grid;
	if (lambdas.empty()) {
		grid = LambdaSequence(engine.LambdaMax(), options.nlambda, options.lambda_min_ratio);
	} else {
		grid = PrepareLambdaGrid(lambdas);
	}
	path.points.push_back(TraceGalasso(engine, grid));
	path.lambdas.push_back(std::move(grid));
	MISELECT_TIMING_END("galasso path");

	MISELECT_DEBUG("galasso traced " << path.points.front().size() << " lambdas");
	return path;
}

} // namespace path
} // namespace libmiselect
