#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libmiselect/data/penalty_context.hpp>
#include <libmiselect/models/galasso.hpp>
#include <libmiselect/models/saenet.hpp>
#include <libmiselect/selection/coefficient_selector.hpp>
#include <libmiselect/utils/options_parser.hpp>
#include "test_helpers.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <vector>

using namespace libmiselect;
using Catch::Matchers::WithinAbs;

TEST_CASE("Integration: SAENET recovers the informative variables", "[integration][saenet]") {
	Eigen::VectorXd beta(3);
	beta << 3.0, -2.0, 1.5;
	Eigen::VectorXd none;

	core::FitOptions opts;
	opts.nlambda = 30;

	int recovered = 0;
	for (uint64_t seed = 1; seed <= 10; seed++) {
		core::ImputedDataset data = test::SimulateImputations(200, 20, 5, beta, 1000 + seed);
		core::CVResult cv = models::Saenet::CrossValidate(data, none, none, none, core::Family::GAUSSIAN, {0.5, 1.0},
		                                                  {}, 5, seed, opts);
		REQUIRE_FALSE(cv.HasConvergenceWarnings());

		Eigen::VectorXd coefs = selection::CoefficientSelector::Select(cv);
		REQUIRE(coefs.size() == 21);

		bool signal = coefs(1) != 0.0 && coefs(2) != 0.0 && coefs(3) != 0.0;
		double max_noise = coefs.tail(17).cwiseAbs().maxCoeff();
		if (signal && max_noise < 0.3) {
			recovered++;
		}
	}
	REQUIRE(recovered >= 9);
}

TEST_CASE("Integration: GALASSO binomial workflow", "[integration][galasso]") {
	Eigen::VectorXd beta(2);
	beta << 2.0, -1.5;
	core::ImputedDataset data = test::SimulateImputations(250, 8, 4, beta, 4242, core::Family::BINOMIAL, 0.0);
	Eigen::VectorXd none;

	core::FitOptions opts = utils::ParseFitOptions(nlohmann::json::parse(R"({"nlambda": 25})"));
	core::CVResult cv = models::Galasso::CrossValidate(data, none, none, core::Family::BINOMIAL, {}, 5, 2024, opts);

	Eigen::VectorXd coefs = selection::CoefficientSelector::Select(cv);
	REQUIRE(coefs(1) > 0.0);
	REQUIRE(coefs(2) < 0.0);

	// Jointly selected: the per-imputation columns agree on the support
	Eigen::MatrixXd per = selection::CoefficientSelector::SelectImputationCoefficients(cv.path, cv.lambda_min);
	for (Eigen::Index j = 1; j < per.rows(); j++) {
		bool first = per(j, 0) != 0.0;
		for (Eigen::Index m = 1; m < per.cols(); m++) {
			REQUIRE((per(j, m) != 0.0) == first);
		}
	}

	Eigen::VectorXd prob = selection::CoefficientSelector::Predict(coefs, data.x[0], core::Family::BINOMIAL);
	REQUIRE(prob.size() == 250);
	REQUIRE(prob.minCoeff() > 0.0);
	REQUIRE(prob.maxCoeff() < 1.0);

	// Training accuracy well above chance
	int correct = 0;
	for (Eigen::Index i = 0; i < prob.size(); i++) {
		if ((prob(i) > 0.5) == (data.y[0](i) > 0.5)) {
			correct++;
		}
	}
	REQUIRE(correct > 175);
}

TEST_CASE("Integration: adaptive SAENET from a prior fit", "[integration][adaptive]") {
	Eigen::VectorXd beta(2);
	beta << 2.0, 1.0;
	core::ImputedDataset data = test::SimulateImputations(120, 10, 3, beta, 3131);
	Eigen::VectorXd w = test::RandomWeights(120, 77, 0.5);
	Eigen::VectorXd none;

	core::FitOptions opts;
	opts.nlambda = 20;

	// Ridge-type first stage, then adaptive weights 1 / (|b| + 1/n)
	core::CVResult first = models::Saenet::CrossValidate(data, none, none, w, core::Family::GAUSSIAN, {0.0}, {}, 4, 8, opts);
	Eigen::VectorXd prior = selection::CoefficientSelector::Select(first).tail(10);
	Eigen::VectorXd adw = data::PenaltyContext::AdaptiveWeightsFromCoefficients(prior, 120);

	REQUIRE(adw(0) < adw(5));
	REQUIRE(adw(1) < adw(5));

	core::CVResult second = models::Saenet::CrossValidate(data, none, adw, w, core::Family::GAUSSIAN, {1.0}, {}, 4, 8, opts);
	Eigen::VectorXd coefs = selection::CoefficientSelector::Select(second);
	REQUIRE(coefs(1) != 0.0);
	REQUIRE(coefs(2) != 0.0);
	REQUIRE_THAT(coefs(1), WithinAbs(2.0, 0.6));
}
