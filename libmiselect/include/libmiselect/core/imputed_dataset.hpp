#pragma once

#include "libmiselect/core/errors.hpp"
#include "libmiselect/core/family.hpp"
#include <Eigen/Dense>
#include <utility>
#include <string>
#include <vector>

namespace libmiselect {
namespace core {

/**
 * M imputed completions of one dataset
 *
 * x[m] is the n × p design of imputation m and y[m] its response. All
 * imputations share n (rows refer to the same original observations, in the
 * same order) and p. The structure is produced by the caller's imputation
 * workflow and is never modified by the fitting engines.
 */
struct ImputedDataset {
	std::vector<Eigen::MatrixXd> x;
	std::vector<Eigen::VectorXd> y;

	ImputedDataset() = default;

	ImputedDataset(std::vector<Eigen::MatrixXd> x_, std::vector<Eigen::VectorXd> y_)
	    : x(std::move(x_)), y(std::move(y_)) {
	}

	size_t NumImputations() const {
		return x.size();
	}

	/// Rows per imputation (n); 0 when empty
	size_t NumObservations() const {
		return x.empty() ? 0 : static_cast<size_t>(x.front().rows());
	}

	/// Columns per imputation (p); 0 when empty
	size_t NumVariables() const {
		return x.empty() ? 0 : static_cast<size_t>(x.front().cols());
	}

	/**
	 * Check shapes and values across imputations
	 *
	 * @param family Binomial responses must be 0 or 1
	 * @throws DimensionError on empty input or mismatched shapes
	 * @throws InvalidParameterError on non-finite values or invalid binomial responses
	 */
	void Validate(Family family) const {
		if (x.empty()) {
			throw DimensionError("at least one imputed dataset is required");
		}
		if (x.size() != y.size()) {
			throw DimensionError("got " + std::to_string(x.size()) + " design matrices but " +
			                     std::to_string(y.size()) + " response vectors");
		}

		const Eigen::Index n = x.front().rows();
		const Eigen::Index p = x.front().cols();
		if (n == 0 || p == 0) {
			throw DimensionError("design matrices must have at least one row and one column");
		}

		for (size_t m = 0; m < x.size(); m++) {
			if (x[m].rows() != n || x[m].cols() != p) {
				throw DimensionError("imputation " + std::to_string(m) + " has shape " +
				                     std::to_string(x[m].rows()) + "x" + std::to_string(x[m].cols()) +
				                     ", expected " + std::to_string(n) + "x" + std::to_string(p));
			}
			if (y[m].size() != n) {
				throw DimensionError("response of imputation " + std::to_string(m) + " has length " +
				                     std::to_string(y[m].size()) + ", expected " + std::to_string(n));
			}
			if (!x[m].allFinite()) {
				throw InvalidParameterError("design matrix of imputation " + std::to_string(m) +
				                            " contains non-finite values");
			}
			if (!y[m].allFinite()) {
				throw InvalidParameterError("response of imputation " + std::to_string(m) +
				                            " contains non-finite values");
			}
			if (family == Family::BINOMIAL) {
				for (Eigen::Index i = 0; i < n; i++) {
					if (y[m](i) != 0.0 && y[m](i) != 1.0) {
						throw InvalidParameterError("binomial responses must be 0 or 1 (imputation " +
						                            std::to_string(m) + ", row " + std::to_string(i) + ")");
					}
				}
			}
		}
	}

	/**
	 * Same rows of every imputation, in the given order
	 *
	 * Used by cross-validation: fold membership refers to original
	 * observations, so a held-out row is held out of all M imputations.
	 */
	ImputedDataset Subset(const std::vector<size_t> &rows) const {
		ImputedDataset out;
		out.x.reserve(x.size());
		out.y.reserve(y.size());

		const auto n_rows = static_cast<Eigen::Index>(rows.size());
		for (size_t m = 0; m < x.size(); m++) {
			Eigen::MatrixXd xm(n_rows, x[m].cols());
			Eigen::VectorXd ym(n_rows);
			for (Eigen::Index r = 0; r < n_rows; r++) {
				auto src = static_cast<Eigen::Index>(rows[static_cast<size_t>(r)]);
				xm.row(r) = x[m].row(src);
				ym(r) = y[m](src);
			}
			out.x.push_back(std::move(xm));
			out.y.push_back(std::move(ym));
		}
		return out;
	}
};

/**
 * Entries of a vector at the given positions
 */
inline Eigen::VectorXd SubsetVector(const Eigen::VectorXd &v, const std::vector<size_t> &rows) {
	Eigen::VectorXd out(static_cast<Eigen::Index>(rows.size()));
	for (size_t r = 0; r < rows.size(); r++) {
		out(static_cast<Eigen::Index>(r)) = v(static_cast<Eigen::Index>(rows[r]));
	}
	return out;
}

/**
 * Validate observation weights against n
 *
 * @throws DimensionError if the length differs from n
 * @throws InvalidParameterError if any weight is outside (0, 1]
 */
inline void ValidateObservationWeights(const Eigen::VectorXd &weights, size_t n) {
	if (static_cast<size_t>(weights.size()) != n) {
		throw DimensionError("observation weights have length " + std::to_string(weights.size()) + ", expected " +
		                     std::to_string(n));
	}
	for (Eigen::Index i = 0; i < weights.size(); i++) {
		if (!(weights(i) > 0.0 && weights(i) <= 1.0)) {
			throw InvalidParameterError("observation weights must be in (0, 1] (row " + std::to_string(i) +
			                            " has " + std::to_string(weights(i)) + ")");
		}
	}
}

} // namespace core
} // namespace libmiselect
