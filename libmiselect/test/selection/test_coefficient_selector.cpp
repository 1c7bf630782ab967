#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libmiselect/models/galasso.hpp>
#include <libmiselect/models/saenet.hpp>
#include <libmiselect/selection/coefficient_selector.hpp>
#include "test_helpers.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <vector>

using namespace libmiselect;
using namespace libmiselect::selection;
using Catch::Matchers::WithinAbs;

namespace {

core::ImputedDataset SelectionData() {
	Eigen::VectorXd beta(2);
	beta << 1.5, -1.0;
	return test::SimulateImputations(50, 5, 3, beta, 808);
}

} // namespace

TEST_CASE("CoefficientSelector: reading back fitted points", "[select]") {
	core::ImputedDataset data = SelectionData();
	Eigen::VectorXd none;
	core::FitOptions opts;
	opts.nlambda = 10;

	core::SolutionPath path =
	    models::Saenet::Fit(data, none, none, none, core::Family::GAUSSIAN, {1.0, 0.5}, {}, opts);

	SECTION("Every stored point is returned as is") {
		for (size_t a = 0; a < path.alphas.size(); a++) {
			for (size_t l = 0; l < path.lambdas[a].size(); l++) {
				Eigen::VectorXd coefs = CoefficientSelector::Select(path, path.lambdas[a][l], path.alphas[a]);
				REQUIRE(coefs == path.points[a][l].coefficients);
			}
		}
	}

	SECTION("Tiny relative differences still match") {
		double lambda = path.lambdas[1][4];
		Eigen::VectorXd coefs = CoefficientSelector::Select(path, lambda * (1.0 + 1e-12), 0.5);
		REQUIRE(coefs == path.points[1][4].coefficients);
	}

	SECTION("Settings off the grid are not found") {
		double lambda = path.lambdas[0][3];
		REQUIRE_THROWS_AS(CoefficientSelector::Select(path, lambda * 1.001, 1.0), core::NotFoundError);
		REQUIRE_THROWS_AS(CoefficientSelector::Select(path, lambda, 0.7), core::NotFoundError);
	}

	SECTION("Lambda is required, alpha is required with several alphas") {
		REQUIRE_THROWS_AS(CoefficientSelector::Select(path, std::nullopt, 1.0), core::InvalidParameterError);
		REQUIRE_THROWS_AS(CoefficientSelector::Select(path, path.lambdas[0][0]), core::InvalidParameterError);
	}

	SECTION("SAENET imputation coefficients repeat the shared vector") {
		Eigen::MatrixXd per = CoefficientSelector::SelectImputationCoefficients(path, path.lambdas[0][6], 1.0);
		REQUIRE(per.rows() == 6);
		REQUIRE(per.cols() == 3);
		for (Eigen::Index m = 0; m < 3; m++) {
			REQUIRE(per.col(m) == path.points[0][6].coefficients);
		}
	}
}

TEST_CASE("CoefficientSelector: single-alpha paths need no alpha", "[select][galasso]") {
	core::ImputedDataset data = SelectionData();
	Eigen::VectorXd none;
	core::FitOptions opts;
	opts.nlambda = 6;

	core::SolutionPath path = models::Galasso::Fit(data, none, none, core::Family::GAUSSIAN, {}, opts);
	double lambda = path.lambdas[0][3];

	Eigen::VectorXd coefs = CoefficientSelector::Select(path, lambda);
	REQUIRE(coefs == path.points[0][3].coefficients);

	Eigen::MatrixXd per = CoefficientSelector::SelectImputationCoefficients(path, lambda);
	REQUIRE(per.cols() == 3);
	Eigen::VectorXd average = per.rowwise().mean();
	for (Eigen::Index k = 0; k < coefs.size(); k++) {
		REQUIRE_THAT(coefs(k), WithinAbs(average(k), 1e-12));
	}
}

TEST_CASE("CoefficientSelector: cross-validated defaults", "[select][cv]") {
	core::ImputedDataset data = SelectionData();
	Eigen::VectorXd none;
	core::FitOptions opts;
	opts.nlambda = 12;

	core::CVResult cv =
	    models::Saenet::CrossValidate(data, none, none, none, core::Family::GAUSSIAN, {1.0, 0.3}, {}, 5, 99, opts);

	const core::PathPoint &best = cv.path.points[cv.alpha_min_index][cv.lambda_min_index];
	REQUIRE(CoefficientSelector::Select(cv) == best.coefficients);
	REQUIRE(CoefficientSelector::Select(cv, cv.lambda_min) == best.coefficients);

	const core::PathPoint &one_se = cv.path.points[cv.alpha_min_index][cv.lambda_1se_index];
	REQUIRE(CoefficientSelector::Select1se(cv) == one_se.coefficients);

	// An explicit setting from the other slice
	size_t other = 1 - cv.alpha_min_index;
	double lambda = cv.path.lambdas[other][2];
	REQUIRE(CoefficientSelector::Select(cv, lambda, cv.path.alphas[other]) == cv.path.points[other][2].coefficients);

	REQUIRE_THROWS_AS(CoefficientSelector::Select(cv, cv.lambda_min * 3.7), core::NotFoundError);
}

TEST_CASE("CoefficientSelector: prediction", "[select][predict]") {
	Eigen::VectorXd coefficients(3);
	coefficients << 0.5, 1.0, -2.0;
	Eigen::MatrixXd x(2, 2);
	x << 1.0, 0.0,
	     0.5, 0.5;

	SECTION("Gaussian link and response agree") {
		Eigen::VectorXd link = CoefficientSelector::Predict(coefficients, x, core::Family::GAUSSIAN, PredictionType::LINK);
		Eigen::VectorXd response = CoefficientSelector::Predict(coefficients, x, core::Family::GAUSSIAN);
		REQUIRE_THAT(link(0), WithinAbs(1.5, 1e-15));
		REQUIRE_THAT(link(1), WithinAbs(0.0, 1e-15));
		REQUIRE(link == response);
	}

	SECTION("Binomial response is a probability") {
		Eigen::VectorXd link = CoefficientSelector::Predict(coefficients, x, core::Family::BINOMIAL, PredictionType::LINK);
		Eigen::VectorXd prob = CoefficientSelector::Predict(coefficients, x, core::Family::BINOMIAL);
		REQUIRE_THAT(link(0), WithinAbs(1.5, 1e-15));
		REQUIRE_THAT(prob(0), WithinAbs(1.0 / (1.0 + std::exp(-1.5)), 1e-12));
		REQUIRE_THAT(prob(1), WithinAbs(0.5, 1e-15));
	}

	SECTION("Column count must match") {
		Eigen::MatrixXd wide = Eigen::MatrixXd::Ones(2, 3);
		REQUIRE_THROWS_AS(CoefficientSelector::Predict(coefficients, wide, core::Family::GAUSSIAN), core::DimensionError);
	}
}
