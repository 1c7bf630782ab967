#pragma once

#include <cstddef>
#include <exception>
#include <vector>
#if defined(_OPENMP)
#include <omp.h>
#endif

namespace libmiselect {
namespace utils {

/// True when called from inside an active OpenMP region
inline bool InParallel() {
#if defined(_OPENMP)
	return omp_in_parallel() != 0;
#else
	return false;
#endif
}

/**
 * Run task(i) for i in [0, n_tasks) on the worker pool
 *
 * Tasks are handed out dynamically. Each task must write only to its own
 * result slot. An exception escaping a task is captured and the first one (in
 * task order) is rethrown once every task has finished.
 *
 * @param n_tasks Number of tasks
 * @param n_threads 1 = sequential, 0 = OpenMP default team size
 * @param task Callable taking the task index
 */
template <class F>
inline void ParallelFor(size_t n_tasks, size_t n_threads, F task) {
	std::vector<std::exception_ptr> errors(n_tasks);
	const auto count = static_cast<long>(n_tasks);

	if (n_threads == 1 || n_tasks <= 1 || InParallel()) {
		for (long i = 0; i < count; i++) {
			try {
				task(static_cast<size_t>(i));
			} catch (...) {
				errors[static_cast<size_t>(i)] = std::current_exception();
			}
		}
	} else {
#if defined(_OPENMP)
		const int team = n_threads == 0 ? omp_get_max_threads() : static_cast<int>(n_threads);
#pragma omp parallel for schedule(dynamic) num_threads(team)
		for (long i = 0; i < count; i++) {
			try {
				task(static_cast<size_t>(i));
			} catch (...) {
				errors[static_cast<size_t>(i)] = std::current_exception();
			}
		}
#else
		for (long i = 0; i < count; i++) {
			try {
				task(static_cast<size_t>(i));
			} catch (...) {
				errors[static_cast<size_t>(i)] = std::current_exception();
			}
		}
#endif
	}

	for (auto &error : errors) {
		if (error) {
			std::rethrow_exception(error);
		}
	}
}

} // namespace utils
} // namespace libmiselect
