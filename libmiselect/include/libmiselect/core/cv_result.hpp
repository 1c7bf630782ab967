#pragma once

#include "libmiselect/core/solution_path.hpp"
#include <limits>
#include <string>
#include <vector>

namespace libmiselect {
namespace core {

/**
 * Result of cross-validating a regularization path
 *
 * `cv_mean` and `cv_se` share the [alpha][lambda] layout of `path`, whose
 * points were fitted on the full data. Selected settings always refer to
 * points of `path`, so coefficients can be read back without refitting.
 */
struct CVResult {
	/// Fit on all observations over the cross-validated grid
	SolutionPath path;

	/// Mean held-out error per setting
	std::vector<std::vector<double>> cv_mean;

	/// Standard error of the held-out error per setting
	std::vector<std::vector<double>> cv_se;

	/// Fold label (0-based) of every original observation
	std::vector<size_t> fold_ids;

	size_t nfolds = 0;

	// ========================================================================
	// Selected settings
	// ========================================================================

	/// Setting with the lowest mean error
	double lambda_min = std::numeric_limits<double>::quiet_NaN();
	double alpha_min = std::numeric_limits<double>::quiet_NaN();
	size_t alpha_min_index = 0;
	size_t lambda_min_index = 0;

	/// Largest lambda of the alpha_min slice within one standard error of the minimum
	double lambda_1se = std::numeric_limits<double>::quiet_NaN();
	double alpha_1se = std::numeric_limits<double>::quiet_NaN();
	size_t lambda_1se_index = 0;

	/// Convergence warnings raised while fitting the training folds
	std::vector<std::string> fold_warnings;

	/// True if the full-data path or any fold fit hit an iteration cap
	bool HasConvergenceWarnings() const {
		return path.HasConvergenceWarnings() || !fold_warnings.empty();
	}
};

} // namespace core
} // namespace libmiselect
