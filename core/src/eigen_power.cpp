#include "lowrank_core/eigen.hpp"

#include <cmath>

namespace lowrank_core {
namespace {
double magnitude_scale(double lambda) noexcept {
		const double m = std::fabs(lambda);
		return m > 1.0 ? m : 1.0;
}

// A := A - lambda * v * v^T
void deflate(MatrixMutView a, double lambda, VectorView v) noexcept {
		for (std::uint32_t i = 0; i < a.rows; i++) {
				double* row = a.row_mut(i);
				const double li = lambda * v.data[i];
				for (std::uint32_t j = 0; j < a.cols; j++)
						row[j] -= li * v.data[j];
		}
}

struct PowerState {
		MatrixMutView work;
		VectorMutView v;
		VectorMutView av;
};

enum class PairOutcome : std::uint8_t {
		Converged,
		ZeroStart,
		Vanished, // A v collapsed to zero, nothing left to find
		Shortfall,
};

// power iteration for the dominant pair of st.work. on Converged, st.v holds
// the unit eigenvector and *lambda its Rayleigh quotient
PairOutcome power_iterate(PowerState& st, const EigenOptions& opts, RandomSource& random, double* lambda, std::uint32_t* iterations) noexcept {
		const std::uint32_t n = st.v.size;
		for (std::uint32_t i = 0; i < n; i++)
				st.v.data[i] = random.next_centered();

		const double start_norm = vector_norm(st.v.view());
		if (start_norm < opts.tolerance)
				return PairOutcome::ZeroStart;
		for (std::uint32_t i = 0; i < n; i++)
				st.v.data[i] /= start_norm;

		double prev = 0.0;
		for (std::uint32_t iter = 0; iter < opts.max_iterations; iter++) {
				*iterations += 1;
				if (!is_ok(matrix_mul_vec(st.work.view(), st.v.view(), st.av)))
						return PairOutcome::Shortfall;

				const double norm = vector_norm(st.av.view());
				if (norm < opts.tolerance)
						return PairOutcome::Vanished;
				for (std::uint32_t i = 0; i < n; i++)
						st.v.data[i] = st.av.data[i] / norm;

				// Rayleigh quotient v^T A v for the updated unit v
				if (!is_ok(matrix_mul_vec(st.work.view(), st.v.view(), st.av)))
						return PairOutcome::Shortfall;
				double next = 0.0;
				if (!is_ok(vector_dot(st.v.view(), st.av.view(), &next)))
						return PairOutcome::Shortfall;

				// absolute tolerance near zero, relative for large eigenvalues
				if (std::fabs(next - prev) < opts.tolerance * magnitude_scale(next)) {
						*lambda = next;
						return PairOutcome::Converged;
				}
				prev = next;
		}
		*lambda = prev;
		return PairOutcome::Shortfall;
}
} // namespace

EigenOptions eigen_options_for(Dim channel) noexcept {
		EigenOptions opts;
		const std::size_t entries = static_cast<std::size_t>(channel.rows) * static_cast<std::size_t>(channel.cols);
		if (entries > kLargeMatrixEntries) {
				opts.tolerance = kLargeTolerance;
				opts.max_iterations = kLargeMaxIterations;
				opts.max_eigenvalues = kLargeMaxEigenvalues;
		}
		return opts;
}

const char* stop_reason_name(StopReason reason) noexcept {
		switch (reason) {
		case StopReason::Complete:
				return "complete";
		case StopReason::ZeroStart:
				return "zero start vector";
		case StopReason::Shortfall:
				return "convergence shortfall";
		case StopReason::Negligible:
				return "negligible eigenvalue";
		}
		return "unknown";
}

ErrorCode eigen_power_deflate(MatrixView a,
        const EigenOptions& opts,
        RandomSource& random,
        Arena& scratch,
        Arena& persist,
        const EigenObserver* observer,
        EigenResult* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		ErrorCode ec = matrix_check(a);
		if (!is_ok(ec))
				return ec;
		if (a.rows != a.cols)
				return ErrorCode::NotSquare;
		if (!(opts.tolerance > 0.0))
				return ErrorCode::InvalidArgument;

		const std::uint32_t n = a.rows;
		std::uint32_t k = opts.max_eigenvalues;
		if (k == 0 || k > n)
				k = n;

		// results first: persist may be the same arena as scratch, and the
		// scope below only rewinds what comes after it
		ArenaScope results(persist);
		EigenResult res;
		res.requested = k;
		res.values = persist.allocate_array<double>(k);
		if (!res.values)
				return ErrorCode::Overflow;
		ec = matrix_alloc(persist, k, n, &res.vectors);
		if (!is_ok(ec))
				return ec;

		ArenaScope temps(scratch);
		PowerState st;
		ec = matrix_clone(scratch, a, &st.work);
		if (!is_ok(ec))
				return ec;
		ec = vector_alloc(scratch, n, &st.v);
		if (!is_ok(ec))
				return ec;
		ec = vector_alloc(scratch, n, &st.av);
		if (!is_ok(ec))
				return ec;

		for (std::uint32_t i = 0; i < k; i++) {
				double lambda = 0.0;
				const PairOutcome outcome = power_iterate(st, opts, random, &lambda, &res.iterations);
				if (outcome == PairOutcome::ZeroStart) {
						res.stop = StopReason::ZeroStart;
						break;
				}
				if (outcome == PairOutcome::Vanished) {
						res.stop = StopReason::Negligible;
						break;
				}
				if (outcome == PairOutcome::Shortfall) {
						res.stop = StopReason::Shortfall;
						break;
				}
				if (std::fabs(lambda) < opts.tolerance) {
						res.stop = StopReason::Negligible;
						break;
				}

				res.values[i] = lambda;
				VectorMutView dst = matrix_row_mut(res.vectors, i);
				for (std::uint32_t j = 0; j < n; j++)
						dst.data[j] = st.v.data[j];
				res.found = i + 1;

				deflate(st.work, lambda, st.v.view());
				if (observer)
						observer->notify(res.found, k);
		}

		LOWRANK_DBG("[eigen] n=%lu found=%lu/%lu iters=%lu stop=%s\n",
		        (unsigned long)n,
		        (unsigned long)res.found,
		        (unsigned long)k,
		        (unsigned long)res.iterations,
		        stop_reason_name(res.stop));

		results.commit();
		*out = res;
		return ErrorCode::Ok;
}

} // namespace lowrank_core
