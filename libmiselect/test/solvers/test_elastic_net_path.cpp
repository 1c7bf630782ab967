#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libmiselect/data/penalty_context.hpp>
#include <libmiselect/data/stacker.hpp>
#include <libmiselect/path/path_driver.hpp>
#include <libmiselect/solvers/elastic_net_path.hpp>
#include "test_helpers.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using namespace libmiselect;
using namespace libmiselect::solvers;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

core::FitOptions TightOptions() {
	core::FitOptions opts;
	opts.tolerance = 1e-12;
	opts.max_iterations = 100000;
	opts.irls_tolerance = 1e-12;
	opts.max_irls_iterations = 100;
	return opts;
}

// Linear predictor of every stacked row from original-scale coefficients
Eigen::VectorXd StackedPredictor(const core::ImputedDataset &data, const Eigen::VectorXd &coefficients) {
	const auto n = static_cast<Eigen::Index>(data.NumObservations());
	const auto p = static_cast<Eigen::Index>(data.NumVariables());
	Eigen::VectorXd eta(n * static_cast<Eigen::Index>(data.NumImputations()));
	for (size_t m = 0; m < data.NumImputations(); m++) {
		eta.segment(static_cast<Eigen::Index>(m) * n, n) =
		    ((data.x[m] * coefficients.tail(p)).array() + coefficients(0)).matrix();
	}
	return eta;
}

} // namespace

TEST_CASE("SoftThreshold operator", "[saenet][cd]") {
	REQUIRE(SoftThreshold(3.0, 1.0) == 2.0);
	REQUIRE(SoftThreshold(-3.0, 1.0) == -2.0);
	REQUIRE(SoftThreshold(0.5, 1.0) == 0.0);
	REQUIRE(SoftThreshold(-1.0, 1.0) == 0.0);
	REQUIRE(SoftThreshold(2.0, 0.0) == 2.0);
}

TEST_CASE("SAENET: orthogonal design matches the closed form", "[saenet][orthogonal]") {
	Eigen::MatrixXd x = test::HadamardDesign();
	Eigen::VectorXd y = test::HadamardResponse();
	core::ImputedDataset data({x}, {y});
	data::StackedDataset stacked = data::Stacker::Stack(data, Eigen::VectorXd::Ones(8));

	Eigen::VectorXd pf(3);
	pf << 1.0, 0.5, 2.0;
	Eigen::VectorXd adw(3);
	adw << 1.0, 2.0, 0.25;
	data::PenaltyContext penalty(pf, adw, 3);

	ElasticNetPath engine(stacked, penalty, core::Family::GAUSSIAN, TightOptions());

	Eigen::VectorXd z = x.transpose() * y / 8.0;
	const double lambdas[] = {0.8, 0.4, 0.1, 0.0};
	const double alphas[] = {1.0, 0.5, 0.0};

	for (double alpha : alphas) {
		engine.Reset();
		for (double lambda : lambdas) {
			core::PathPoint point = engine.Solve(lambda, alpha);
			REQUIRE(point.converged);
			REQUIRE_THAT(point.coefficients(0), WithinAbs(y.mean(), 1e-10));
			for (Eigen::Index j = 0; j < 3; j++) {
				double expected = test::Shrink(z(j), lambda * alpha * pf(j) * adw(j)) /
				                  (1.0 + lambda * (1.0 - alpha) * pf(j));
				REQUIRE_THAT(point.coefficients(j + 1), WithinAbs(expected, 1e-10));
			}
			REQUIRE(point.imputation_coefficients.cols() == 1);
			REQUIRE(point.imputation_coefficients.col(0).isApprox(point.coefficients));
		}
	}
}

TEST_CASE("SAENET: above lambda_max every slope is zero", "[saenet][lambda_max]") {
	Eigen::VectorXd beta(3);
	beta << 2.0, -1.0, 0.5;
	core::ImputedDataset data = test::SimulateImputations(60, 6, 3, beta, 17);
	Eigen::VectorXd w = test::RandomWeights(60, 4);
	data::StackedDataset stacked = data::Stacker::Stack(data, w);
	data::PenaltyContext penalty(Eigen::VectorXd(), Eigen::VectorXd(), 6);

	SECTION("Gaussian") {
		ElasticNetPath engine(stacked, penalty, core::Family::GAUSSIAN, TightOptions());
		double lambda_max = engine.LambdaMax(0.7);
		REQUIRE(lambda_max > 0.0);

		core::PathPoint above = engine.Solve(lambda_max * 1.01, 0.7);
		REQUIRE(above.n_nonzero == 0);
		REQUIRE(above.coefficients.tail(6).isZero());

		// Intercept of the null model: weighted mean over all stacked rows
		double mean = (stacked.weights.array() * stacked.y.array()).sum() / stacked.weights.sum();
		REQUIRE_THAT(above.coefficients(0), WithinAbs(mean, 1e-10));

		core::PathPoint below = engine.Solve(lambda_max * 0.95, 0.7);
		REQUIRE(below.n_nonzero >= 1);
	}

	SECTION("Binomial") {
		core::ImputedDataset bin = test::SimulateImputations(80, 4, 2, beta, 5, core::Family::BINOMIAL);
		data::StackedDataset bin_stacked = data::Stacker::Stack(bin, Eigen::VectorXd::Ones(80));
		data::PenaltyContext bin_penalty(Eigen::VectorXd(), Eigen::VectorXd(), 4);

		ElasticNetPath engine(bin_stacked, bin_penalty, core::Family::BINOMIAL, TightOptions());
		double lambda_max = engine.LambdaMax(1.0);
		core::PathPoint above = engine.Solve(lambda_max * 1.01, 1.0);
		REQUIRE(above.n_nonzero == 0);

		double ybar = bin_stacked.y.mean();
		REQUIRE_THAT(above.coefficients(0), WithinAbs(std::log(ybar / (1.0 - ybar)), 1e-8));
	}
}

TEST_CASE("SAENET: unpenalized variables are always in the model", "[saenet][penalty]") {
	Eigen::VectorXd beta(2);
	beta << 0.1, 1.5;
	core::ImputedDataset data = test::SimulateImputations(50, 4, 2, beta, 23);
	data::StackedDataset stacked = data::Stacker::Stack(data, Eigen::VectorXd::Ones(50));

	Eigen::VectorXd pf(4);
	pf << 0.0, 1.0, 1.0, 1.0;
	data::PenaltyContext penalty(pf, Eigen::VectorXd(), 4);

	ElasticNetPath engine(stacked, penalty, core::Family::GAUSSIAN, TightOptions());
	double lambda_max = engine.LambdaMax(1.0);
	core::PathPoint point = engine.Solve(lambda_max * 2.0, 1.0);

	REQUIRE(point.coefficients(1) != 0.0);
	REQUIRE(point.coefficients.tail(3).isZero());
	REQUIRE(point.n_nonzero == 1);
}

TEST_CASE("SAENET: ridge-only variables do not open the path early", "[saenet][lambda_max]") {
	Eigen::VectorXd beta(4);
	beta << 1.5, 0.8, 0.5, 0.3;
	core::ImputedDataset data = test::SimulateImputations(100, 4, 3, beta, 41);
	data::StackedDataset stacked = data::Stacker::Stack(data, Eigen::VectorXd::Ones(100));

	// Variable 0 carries only the ridge part of the penalty
	Eigen::VectorXd adw(4);
	adw << 0.0, 1.0, 1.0, 1.0;
	data::PenaltyContext penalty(Eigen::VectorXd(), adw, 4);
	const double alpha = 0.2;

	SECTION("First point keeps the L1-penalized slopes at zero") {
		ElasticNetPath engine(stacked, penalty, core::Family::GAUSSIAN, TightOptions());
		double lambda_max = engine.LambdaMax(alpha);
		core::PathPoint first = engine.Solve(lambda_max, alpha);

		REQUIRE(first.converged);
		REQUIRE(first.coefficients(1) != 0.0);
		REQUIRE(first.coefficients.tail(3).isZero());
		REQUIRE(first.n_nonzero == 1);

		// lambda_max is tight: the largest scaled gradient sits on the threshold
		Eigen::VectorXd residual = stacked.y - StackedPredictor(data, first.coefficients);
		double largest = 0.0;
		for (Eigen::Index j = 1; j < 4; j++) {
			double grad = (stacked.weights.array() * stacked.x.col(j).array() * residual.array()).sum() / 100.0;
			largest = std::max(largest, std::abs(grad) / (alpha * adw(j)));
		}
		REQUIRE_THAT(largest, WithinRel(lambda_max, 1e-6));
	}

	SECTION("Automatic grid") {
		core::FitOptions opts = TightOptions();
		opts.nlambda = 20;
		core::SolutionPath path = path::PathDriver::RunSaenet(stacked, penalty, core::Family::GAUSSIAN, {alpha, 0.6}, {},
		                                                      opts);
		for (size_t a = 0; a < path.alphas.size(); a++) {
			REQUIRE(path.points[a][0].coefficients.tail(3).isZero());
			REQUIRE(path.points[a].back().n_nonzero == 4);
		}
	}
}

TEST_CASE("SAENET: solution satisfies the KKT conditions", "[saenet][kkt]") {
	Eigen::VectorXd beta(3);
	beta << 1.5, -1.0, 0.6;
	core::ImputedDataset data = test::SimulateImputations(70, 8, 4, beta, 31);
	Eigen::VectorXd w = test::RandomWeights(70, 12);
	data::StackedDataset stacked = data::Stacker::Stack(data, w);

	Eigen::VectorXd pf = Eigen::VectorXd::Ones(8);
	pf(5) = 0.5;
	Eigen::VectorXd adw = Eigen::VectorXd::Ones(8);
	adw(2) = 3.0;
	data::PenaltyContext penalty(pf, adw, 8);

	const double alpha = 0.7;
	ElasticNetPath engine(stacked, penalty, core::Family::GAUSSIAN, TightOptions());
	double lambda = 0.3 * engine.LambdaMax(alpha);
	core::PathPoint point = engine.Solve(lambda, alpha);
	REQUIRE(point.converged);

	Eigen::VectorXd residual = stacked.y - StackedPredictor(data, point.coefficients);
	const double n = 70.0;

	// Intercept: weighted residuals sum to zero
	REQUIRE_THAT((stacked.weights.array() * residual.array()).sum(), WithinAbs(0.0, 1e-8));

	const Eigen::VectorXd &b = engine.StandardizedCoefficients();
	for (Eigen::Index j = 0; j < 8; j++) {
		double grad = (stacked.weights.array() * stacked.x.col(j).array() * residual.array()).sum() / n;
		double l1 = lambda * alpha * pf(j) * adw(j);
		double l2 = lambda * (1.0 - alpha) * pf(j);
		if (b(j) == 0.0) {
			REQUIRE(std::abs(grad) <= l1 + 1e-8);
		} else {
			double sign = b(j) > 0.0 ? 1.0 : -1.0;
			REQUIRE_THAT(grad - l2 * b(j), WithinAbs(l1 * sign, 1e-8));
		}
	}
}

TEST_CASE("SAENET: M identical imputations equal a single imputation", "[saenet][stacking]") {
	Eigen::VectorXd beta(2);
	beta << 1.0, -2.0;
	core::ImputedDataset one = test::SimulateImputations(40, 5, 1, beta, 99);
	core::ImputedDataset copies({one.x[0], one.x[0], one.x[0]}, {one.y[0], one.y[0], one.y[0]});
	Eigen::VectorXd w = test::RandomWeights(40, 3);

	data::StackedDataset stacked_one = data::Stacker::Stack(one, w);
	data::StackedDataset stacked_copies = data::Stacker::Stack(copies, w);
	data::PenaltyContext penalty(Eigen::VectorXd(), Eigen::VectorXd(), 5);

	ElasticNetPath engine_one(stacked_one, penalty, core::Family::GAUSSIAN, TightOptions());
	ElasticNetPath engine_copies(stacked_copies, penalty, core::Family::GAUSSIAN, TightOptions());

	REQUIRE_THAT(engine_copies.LambdaMax(0.5), WithinAbs(engine_one.LambdaMax(0.5), 1e-10));

	const double lambdas[] = {0.5, 0.2, 0.05, 0.01};
	for (double lambda : lambdas) {
		core::PathPoint a = engine_one.Solve(lambda, 0.5);
		core::PathPoint b = engine_copies.Solve(lambda, 0.5);
		REQUIRE(a.n_nonzero == b.n_nonzero);
		for (Eigen::Index j = 0; j < 6; j++) {
			REQUIRE_THAT(a.coefficients(j), WithinAbs(b.coefficients(j), 1e-8));
		}
	}
}

TEST_CASE("SAENET: binomial deviance decreases along the path", "[saenet][binomial]") {
	Eigen::VectorXd beta(2);
	beta << 1.2, -0.8;
	core::ImputedDataset data = test::SimulateImputations(120, 5, 3, beta, 41, core::Family::BINOMIAL);
	data::StackedDataset stacked = data::Stacker::Stack(data, Eigen::VectorXd::Ones(120));
	data::PenaltyContext penalty(Eigen::VectorXd(), Eigen::VectorXd(), 5);

	ElasticNetPath engine(stacked, penalty, core::Family::BINOMIAL, TightOptions());
	double lambda_max = engine.LambdaMax(1.0);

	double previous = std::numeric_limits<double>::infinity();
	for (int k = 0; k < 10; k++) {
		double lambda = lambda_max * std::pow(0.6, k);
		core::PathPoint point = engine.Solve(lambda, 1.0);
		REQUIRE(point.converged);
		REQUIRE(std::isfinite(point.deviance));
		REQUIRE(point.deviance <= previous + 1e-8);
		previous = point.deviance;
	}
}
