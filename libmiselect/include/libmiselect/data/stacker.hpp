#pragma once

#include "libmiselect/core/errors.hpp"
#include "libmiselect/core/imputed_dataset.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace libmiselect {
namespace data {

/// Columns whose (weighted) standard deviation falls below this are constant
constexpr double kConstantColumnTolerance = 1e-10;

/**
 * One weighted design built from M imputations
 *
 * Rows are the M imputation blocks one after another (block m holds rows
 * m*n .. m*n + n - 1, imputation order preserved). Owns all of its buffers;
 * nothing aliases the caller's matrices.
 */
struct StackedDataset {
	/// (n*M) × p design, every column centered and scaled by the stacked weights
	Eigen::MatrixXd x;

	/// Length n*M response
	Eigen::VectorXd y;

	/// Length n*M weights: observation weight w_i / M, repeated per imputation
	Eigen::VectorXd weights;

	/// Weighted column means of the raw stacked design (length p)
	Eigen::VectorXd x_center;

	/// Weighted column standard deviations (length p, 1 for constant columns)
	Eigen::VectorXd x_scale;

	/// Constant columns never enter the model
	std::vector<bool> is_constant;

	size_t n_obs = 0;
	size_t n_vars = 0;
	size_t n_imputations = 0;

	size_t NumRows() const {
		return n_obs * n_imputations;
	}
};

/**
 * M separately standardized imputations (GALASSO input)
 */
struct StandardizedImputations {
	std::vector<Eigen::MatrixXd> x;
	std::vector<Eigen::VectorXd> y;

	/// Unit observation weights (length n); kept so scoring code matches SAENET
	Eigen::VectorXd weights;

	/// p × M column means and standard deviations
	Eigen::MatrixXd x_center;
	Eigen::MatrixXd x_scale;

	/// A variable constant in any imputation is excluded from every imputation
	std::vector<bool> is_constant;

	size_t n_obs = 0;
	size_t n_vars = 0;
	size_t n_imputations = 0;
};

/**
 * Stacker: builds the fitting inputs from an ImputedDataset
 *
 * Design notes:
 * - Pure transforms (no state, all methods static)
 * - Standardization is always applied internally; engines map coefficients
 *   back through x_center / x_scale before reporting them
 */
class Stacker {
public:
	/**
	 * Concatenate imputations into one weighted, standardized design
	 *
	 * @param dataset M imputations sharing n and p
	 * @param obs_weights Length-n observation weights in (0, 1]
	 * @return StackedDataset with (n*M) rows
	 *
	 * @throws DimensionError if shapes disagree across imputations or with the weights
	 */
	static StackedDataset Stack(const core::ImputedDataset &dataset, const Eigen::VectorXd &obs_weights);

	/**
	 * Standardize each imputation on its own (unit weights)
	 *
	 * @throws DimensionError if shapes disagree across imputations
	 */
	static StandardizedImputations StandardizeEach(const core::ImputedDataset &dataset);

private:
	static void CheckShapes(const core::ImputedDataset &dataset);

	/**
	 * Center and scale the columns of x in place using weights w
	 *
	 * @return true for every column that is constant under the weights
	 */
	static std::vector<bool> StandardizeColumns(Eigen::MatrixXd &x, const Eigen::VectorXd &w,
	                                            Eigen::Ref<Eigen::VectorXd> center, Eigen::Ref<Eigen::VectorXd> scale);
};

// ============================================================================
// Implementation (header-only for performance)
// ============================================================================

inline void Stacker::CheckShapes(const core::ImputedDataset &dataset) {
	if (dataset.x.empty()) {
		throw core::DimensionError("at least one imputed dataset is required");
	}
	if (dataset.x.size() != dataset.y.size()) {
		throw core::DimensionError("number of design matrices and responses differ");
	}
	const Eigen::Index n = dataset.x.front().rows();
	const Eigen::Index p = dataset.x.front().cols();
	for (size_t m = 0; m < dataset.x.size(); m++) {
		if (dataset.x[m].rows() != n || dataset.x[m].cols() != p || dataset.y[m].size() != n) {
			throw core::DimensionError("imputation " + std::to_string(m) + " does not match the shape of imputation 0");
		}
	}
}

inline StackedDataset Stacker::Stack(const core::ImputedDataset &dataset, const Eigen::VectorXd &obs_weights) {
	CheckShapes(dataset);

	const size_t m_count = dataset.NumImputations();
	const size_t n = dataset.NumObservations();
	const size_t p = dataset.NumVariables();

	if (static_cast<size_t>(obs_weights.size()) != n) {
		throw core::DimensionError("observation weights have length " + std::to_string(obs_weights.size()) +
		                           ", expected " + std::to_string(n));
	}

	StackedDataset out;
	out.n_obs = n;
	out.n_vars = p;
	out.n_imputations = m_count;

	const auto n_idx = static_cast<Eigen::Index>(n);
	const auto rows = static_cast<Eigen::Index>(n * m_count);
	const auto p_idx = static_cast<Eigen::Index>(p);
	const double inv_m = 1.0 / static_cast<double>(m_count);

	out.x.resize(rows, p_idx);
	out.y.resize(rows);
	out.weights.resize(rows);

	for (size_t m = 0; m < m_count; m++) {
		const auto offset = static_cast<Eigen::Index>(m) * n_idx;
		out.x.middleRows(offset, n_idx) = dataset.x[m];
		out.y.segment(offset, n_idx) = dataset.y[m];
		out.weights.segment(offset, n_idx) = obs_weights * inv_m;
	}

	out.x_center.resize(p_idx);
	out.x_scale.resize(p_idx);
	out.is_constant = StandardizeColumns(out.x, out.weights, out.x_center, out.x_scale);

	return out;
}

inline StandardizedImputations Stacker::StandardizeEach(const core::ImputedDataset &dataset) {
	CheckShapes(dataset);

	const size_t m_count = dataset.NumImputations();
	const size_t n = dataset.NumObservations();
	const size_t p = dataset.NumVariables();
	const auto p_idx = static_cast<Eigen::Index>(p);

	StandardizedImputations out;
	out.n_obs = n;
	out.n_vars = p;
	out.n_imputations = m_count;
	out.weights = Eigen::VectorXd::Ones(static_cast<Eigen::Index>(n));
	out.x_center.resize(p_idx, static_cast<Eigen::Index>(m_count));
	out.x_scale.resize(p_idx, static_cast<Eigen::Index>(m_count));
	out.is_constant.assign(p, false);

	for (size_t m = 0; m < m_count; m++) {
		auto m_idx = static_cast<Eigen::Index>(m);
		Eigen::MatrixXd xm = dataset.x[m];
		auto constant = StandardizeColumns(xm, out.weights, out.x_center.col(m_idx), out.x_scale.col(m_idx));
		for (size_t j = 0; j < p; j++) {
			if (constant[j]) {
				out.is_constant[j] = true;
			}
		}
		out.x.push_back(std::move(xm));
		out.y.push_back(dataset.y[m]);
	}

	// Joint exclusion: zero the column in every imputation if constant in any
	for (size_t j = 0; j < p; j++) {
		if (!out.is_constant[j]) {
			continue;
		}
		auto j_idx = static_cast<Eigen::Index>(j);
		for (size_t m = 0; m < m_count; m++) {
			out.x[m].col(j_idx).setZero();
		}
	}

	return out;
}

inline std::vector<bool> Stacker::StandardizeColumns(Eigen::MatrixXd &x, const Eigen::VectorXd &w,
                                                     Eigen::Ref<Eigen::VectorXd> center,
                                                     Eigen::Ref<Eigen::VectorXd> scale) {
	const double sum_w = w.sum();
	std::vector<bool> constant(static_cast<size_t>(x.cols()), false);

	for (Eigen::Index j = 0; j < x.cols(); j++) {
		double mean = (w.array() * x.col(j).array()).sum() / sum_w;
		x.col(j).array() -= mean;
		double var = (w.array() * x.col(j).array().square()).sum() / sum_w;
		double sd = std::sqrt(var);

		center(j) = mean;
		if (sd < kConstantColumnTolerance) {
			x.col(j).setZero();
			scale(j) = 1.0;
			constant[static_cast<size_t>(j)] = true;
		} else {
			x.col(j) /= sd;
			scale(j) = sd;
		}
	}
	return constant;
}

} // namespace data
} // namespace libmiselect
