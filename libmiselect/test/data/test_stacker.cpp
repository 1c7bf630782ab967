#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libmiselect/data/stacker.hpp>
#include "test_helpers.hpp"
#include <Eigen/Dense>
#include <cmath>

using namespace libmiselect;
using namespace libmiselect::data;
using Catch::Matchers::WithinAbs;

TEST_CASE("Stacker: blocks keep imputation order", "[stacker]") {
	Eigen::VectorXd beta(2);
	beta << 1.0, 2.0;
	core::ImputedDataset data = test::SimulateImputations(10, 3, 4, beta, 11);
	Eigen::VectorXd w = test::RandomWeights(10, 5);

	StackedDataset stacked = Stacker::Stack(data, w);

	REQUIRE(stacked.n_obs == 10);
	REQUIRE(stacked.n_vars == 3);
	REQUIRE(stacked.n_imputations == 4);
	REQUIRE(stacked.NumRows() == 40);
	REQUIRE(stacked.x.rows() == 40);
	REQUIRE(stacked.x.cols() == 3);

	for (Eigen::Index m = 0; m < 4; m++) {
		for (Eigen::Index i = 0; i < 10; i++) {
			auto k = m * 10 + i;
			REQUIRE(stacked.y(k) == data.y[static_cast<size_t>(m)](i));
			REQUIRE_THAT(stacked.weights(k), WithinAbs(w(i) / 4.0, 1e-15));
			for (Eigen::Index j = 0; j < 3; j++) {
				double raw = stacked.x(k, j) * stacked.x_scale(j) + stacked.x_center(j);
				REQUIRE_THAT(raw, WithinAbs(data.x[static_cast<size_t>(m)](i, j), 1e-10));
			}
		}
	}
}

TEST_CASE("Stacker: columns are standardized under the stacked weights", "[stacker]") {
	Eigen::VectorXd beta(1);
	beta << 1.0;
	core::ImputedDataset data = test::SimulateImputations(25, 4, 3, beta, 3);
	Eigen::VectorXd w = test::RandomWeights(25, 8);

	StackedDataset stacked = Stacker::Stack(data, w);
	const double sum_w = stacked.weights.sum();

	for (Eigen::Index j = 0; j < 4; j++) {
		double mean = (stacked.weights.array() * stacked.x.col(j).array()).sum() / sum_w;
		double var = (stacked.weights.array() * stacked.x.col(j).array().square()).sum() / sum_w;
		REQUIRE_THAT(mean, WithinAbs(0.0, 1e-12));
		REQUIRE_THAT(var, WithinAbs(1.0, 1e-12));
		REQUIRE_FALSE(stacked.is_constant[static_cast<size_t>(j)]);
	}
}

TEST_CASE("Stacker: constant columns are flagged and zeroed", "[stacker]") {
	Eigen::VectorXd beta(1);
	beta << 1.0;
	core::ImputedDataset data = test::SimulateImputations(12, 3, 2, beta, 9);
	for (auto &x : data.x) {
		x.col(2).setConstant(4.0);
	}

	StackedDataset stacked = Stacker::Stack(data, Eigen::VectorXd::Ones(12));
	REQUIRE(stacked.is_constant[2]);
	REQUIRE_FALSE(stacked.is_constant[0]);
	REQUIRE(stacked.x.col(2).isZero());
	REQUIRE(stacked.x_scale(2) == 1.0);
	REQUIRE_THAT(stacked.x_center(2), WithinAbs(4.0, 1e-12));
}

TEST_CASE("Stacker: a single imputation is left as is", "[stacker]") {
	Eigen::MatrixXd x = test::HadamardDesign();
	core::ImputedDataset data({x}, {test::HadamardResponse()});

	StackedDataset stacked = Stacker::Stack(data, Eigen::VectorXd::Ones(8));
	REQUIRE(stacked.NumRows() == 8);
	REQUIRE(stacked.weights.isOnes());
	// Hadamard columns already have mean 0 and unit standard deviation
	REQUIRE(stacked.x.isApprox(x, 1e-14));
}

TEST_CASE("Stacker: shape mismatches raise DimensionError", "[stacker]") {
	Eigen::VectorXd beta(1);
	beta << 1.0;
	core::ImputedDataset data = test::SimulateImputations(10, 2, 2, beta, 1);

	REQUIRE_THROWS_AS(Stacker::Stack(data, Eigen::VectorXd::Ones(9)), core::DimensionError);

	data.x[1] = Eigen::MatrixXd::Zero(10, 3);
	REQUIRE_THROWS_AS(Stacker::Stack(data, Eigen::VectorXd::Ones(10)), core::DimensionError);
	REQUIRE_THROWS_AS(Stacker::StandardizeEach(data), core::DimensionError);
}

TEST_CASE("Stacker: per-imputation standardization for GALASSO", "[stacker][galasso]") {
	Eigen::VectorXd beta(2);
	beta << 1.0, -1.0;
	core::ImputedDataset data = test::SimulateImputations(20, 3, 3, beta, 21);

	SECTION("Each imputation has its own center and scale") {
		StandardizedImputations out = Stacker::StandardizeEach(data);
		REQUIRE(out.x.size() == 3);
		REQUIRE(out.x_center.rows() == 3);
		REQUIRE(out.x_center.cols() == 3);
		REQUIRE(out.weights.isOnes());

		for (size_t m = 0; m < 3; m++) {
			auto m_idx = static_cast<Eigen::Index>(m);
			for (Eigen::Index j = 0; j < 3; j++) {
				REQUIRE_THAT(out.x[m].col(j).mean(), WithinAbs(0.0, 1e-12));
				REQUIRE_THAT(out.x[m].col(j).squaredNorm() / 20.0, WithinAbs(1.0, 1e-12));
				REQUIRE_THAT(out.x_center(j, m_idx), WithinAbs(data.x[m].col(j).mean(), 1e-12));
			}
		}
	}

	SECTION("Constant in one imputation excludes the variable everywhere") {
		data.x[1].col(0).setConstant(2.5);
		StandardizedImputations out = Stacker::StandardizeEach(data);
		REQUIRE(out.is_constant[0]);
		REQUIRE_FALSE(out.is_constant[1]);
		for (size_t m = 0; m < 3; m++) {
			REQUIRE(out.x[m].col(0).isZero());
		}
	}
}
