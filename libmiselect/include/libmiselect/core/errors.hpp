#pragma once

#include <stdexcept>
#include <string>

namespace libmiselect {
namespace core {

/**
 * Error kinds raised by libmiselect
 *
 * Shape and parameter problems derive from std::invalid_argument (like every
 * validation failure in the library) and are raised before any solving
 * starts. Non-convergence is normally recorded on the affected path point;
 * NonConvergenceError is only raised when FitOptions::strict_convergence is
 * set.
 */

/// Mismatched matrix/vector shapes across imputations, weights or penalties
class DimensionError : public std::invalid_argument {
public:
	explicit DimensionError(const std::string &msg) : std::invalid_argument("dimension error: " + msg) {
	}
};

/// Parameter outside its domain (alpha, lambda, nfolds, family, options)
class InvalidParameterError : public std::invalid_argument {
public:
	explicit InvalidParameterError(const std::string &msg) : std::invalid_argument("invalid parameter: " + msg) {
	}

protected:
	InvalidParameterError(const std::string &prefix, const std::string &msg)
	    : std::invalid_argument(prefix + ": " + msg) {
	}
};

/// Fewer than two folds, or a fold without observations
class InsufficientFoldsError : public InvalidParameterError {
public:
	explicit InsufficientFoldsError(const std::string &msg) : InvalidParameterError("insufficient folds", msg) {
	}
};

/// Iteration cap reached while strict convergence was requested
class NonConvergenceError : public std::runtime_error {
public:
	explicit NonConvergenceError(const std::string &msg) : std::runtime_error("non-convergence: " + msg) {
	}
};

/// Requested regularization setting is not on the computed grid
class NotFoundError : public std::out_of_range {
public:
	explicit NotFoundError(const std::string &msg) : std::out_of_range("not found: " + msg) {
	}
};

} // namespace core
} // namespace libmiselect
