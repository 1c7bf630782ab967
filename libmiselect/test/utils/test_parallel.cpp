#include <catch2/catch_test_macros.hpp>

#include <libmiselect/core/errors.hpp>
#include <libmiselect/utils/parallel.hpp>
#include <stdexcept>
#include <vector>

using namespace libmiselect;
using namespace libmiselect::utils;

TEST_CASE("ParallelFor: every task runs once", "[parallel]") {
	const size_t thread_counts[] = {1, 2, 0};
	for (size_t threads : thread_counts) {
		std::vector<int> hits(50, 0);
		ParallelFor(hits.size(), threads, [&](size_t i) { hits[i]++; });
		for (int h : hits) {
			REQUIRE(h == 1);
		}
	}

	SECTION("No tasks") {
		bool called = false;
		ParallelFor(0, 4, [&](size_t) { called = true; });
		REQUIRE_FALSE(called);
	}
}

TEST_CASE("ParallelFor: task exceptions reach the caller", "[parallel]") {
	std::vector<int> done(8, 0);
	auto task = [&](size_t i) {
		if (i == 3) {
			throw core::NonConvergenceError("task 3 failed");
		}
		if (i == 6) {
			throw std::runtime_error("task 6 failed");
		}
		done[i] = 1;
	};

	SECTION("Sequential") {
		REQUIRE_THROWS_AS(ParallelFor(done.size(), 1, task), core::NonConvergenceError);
	}
	SECTION("Pooled") {
		REQUIRE_THROWS_AS(ParallelFor(done.size(), 3, task), core::NonConvergenceError);
	}

	// The remaining tasks still finished
	for (size_t i = 0; i < done.size(); i++) {
		REQUIRE(done[i] == ((i == 3 || i == 6) ? 0 : 1));
	}
}
