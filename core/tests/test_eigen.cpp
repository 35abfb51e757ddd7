#include "lowrank_core/lowrank_core.hpp"

#include <cassert>
#include <cmath>

using lowrank_core::Arena;
using lowrank_core::EigenOptions;
using lowrank_core::EigenResult;
using lowrank_core::ErrorCode;
using lowrank_core::MatrixMutView;
using lowrank_core::RandomSource;
using lowrank_core::SeededRandom;
using lowrank_core::Slab;
using lowrank_core::StopReason;

static MatrixMutView mat(Arena& a, std::uint32_t rows, std::uint32_t cols, const double* values) {
		MatrixMutView m;
		assert(lowrank_core::matrix_alloc(a, rows, cols, &m) == ErrorCode::Ok);
		for (std::uint32_t r = 0; r < rows; r++) {
				for (std::uint32_t c = 0; c < cols; c++)
						m.at_mut(r, c) = values[r * cols + c];
		}
		return m;
}

static bool near(double a, double b, double tol) {
		return std::fabs(a - b) <= tol;
}

struct PairCounter {
		std::uint32_t calls = 0;
		std::uint32_t last_found = 0;
		std::uint32_t requested = 0;
};

static void count_pair(void* ctx, std::uint32_t found, std::uint32_t requested) noexcept {
		auto* c = static_cast<PairCounter*>(ctx);
		c->calls++;
		c->last_found = found;
		c->requested = requested;
}

int main() {
		Slab slab;
		assert(slab.reserve(128 * 1024) == ErrorCode::Ok);
		Arena persist;
		Arena scratch;
		assert(slab.split(slab.size() / 2, &persist, &scratch) == ErrorCode::Ok);

		// seeded random source.
		{
				SeededRandom a(42);
				SeededRandom b(42);
				SeededRandom c(43);
				bool differs = false;
				for (int i = 0; i < 64; i++) {
						const double x = a.next_unit();
						assert(x >= 0.0 && x < 1.0);
						assert(x == b.next_unit());
						if (x != c.next_unit())
								differs = true;
				}
				assert(differs);

				RandomSource src = a.source();
				assert(src.available());
				for (int i = 0; i < 64; i++) {
						const double x = src.next_centered();
						assert(x >= -0.5 && x <= 0.5);
				}

				RandomSource none;
				assert(!none.available());
				assert(none.next_unit() == 0.5);

				assert(lowrank_core::mix_seed(7, 0) != lowrank_core::mix_seed(7, 1));
				assert(lowrank_core::mix_seed(7, 2) == lowrank_core::mix_seed(7, 2));
		}

		// sizing policy.
		{
				const EigenOptions small = lowrank_core::eigen_options_for({64, 64});
				assert(small.tolerance == lowrank_core::kDefaultTolerance);
				assert(small.max_iterations == lowrank_core::kDefaultMaxIterations);
				assert(small.max_eigenvalues == 0);

				const EigenOptions large = lowrank_core::eigen_options_for({512, 512});
				assert(large.tolerance == lowrank_core::kLargeTolerance);
				assert(large.max_iterations == lowrank_core::kLargeMaxIterations);
				assert(large.max_eigenvalues == lowrank_core::kLargeMaxEigenvalues);
		}

		// diagonal matrix: pairs come out by descending magnitude.
		{
				const double dv[] = {4, 0, 0, 0, 9, 0, 0, 0, 1};
				MatrixMutView d = mat(persist, 3, 3, dv);
				SeededRandom rng(1);
				RandomSource random = rng.source();
				PairCounter counter;
				const lowrank_core::EigenObserver observer{&counter, &count_pair};

				EigenResult res;
				const std::size_t scratch_before = scratch.used();
				assert(lowrank_core::eigen_power_deflate(d.view(), EigenOptions{}, random, scratch, persist, &observer, &res) == ErrorCode::Ok);
				assert(scratch.used() == scratch_before);

				assert(res.requested == 3);
				assert(res.found == 3);
				assert(res.stop == StopReason::Complete);
				assert(near(res.values[0], 9.0, 1e-6));
				assert(near(res.values[1], 4.0, 1e-6));
				assert(near(res.values[2], 1.0, 1e-6));
				assert(res.value_list().size == 3);
				assert(near(res.value_list()[1], 4.0, 1e-6));
				assert(near(std::fabs(res.vector(0)[1]), 1.0, 1e-4));
				assert(near(std::fabs(res.vector(1)[0]), 1.0, 1e-4));
				assert(near(std::fabs(res.vector(2)[2]), 1.0, 1e-4));
				for (std::uint32_t i = 0; i < res.found; i++)
						assert(near(lowrank_core::vector_norm(res.vector(i)), 1.0, 1e-9));

				assert(counter.calls == 3);
				assert(counter.last_found == 3);
				assert(counter.requested == 3);

				// caller's matrix is never deflated
				for (std::uint32_t r = 0; r < 3; r++) {
						for (std::uint32_t c = 0; c < 3; c++)
								assert(d.at(r, c) == dv[r * 3 + c]);
				}
		}

		// symmetric 2x2 with known eigenvectors.
		{
				const double sv[] = {2, 1, 1, 2};
				MatrixMutView s = mat(persist, 2, 2, sv);
				SeededRandom rng(9);
				RandomSource random = rng.source();
				EigenResult res;
				assert(lowrank_core::eigen_power_deflate(s.view(), EigenOptions{}, random, scratch, persist, nullptr, &res) == ErrorCode::Ok);
				assert(res.found == 2);
				assert(near(res.values[0], 3.0, 1e-8));
				assert(near(res.values[1], 1.0, 1e-8));
				const double h = std::sqrt(0.5);
				const double d0 = res.vector(0)[0] * h + res.vector(0)[1] * h;
				const double d1 = res.vector(1)[0] * h - res.vector(1)[1] * h;
				assert(near(std::fabs(d0), 1.0, 1e-6));
				assert(near(std::fabs(d1), 1.0, 1e-6));
		}

		// max_eigenvalues caps the pair count.
		{
				const double dv[] = {4, 0, 0, 0, 9, 0, 0, 0, 1};
				MatrixMutView d = mat(persist, 3, 3, dv);
				SeededRandom rng(2);
				RandomSource random = rng.source();
				EigenOptions opts;
				opts.max_eigenvalues = 1;
				EigenResult res;
				assert(lowrank_core::eigen_power_deflate(d.view(), opts, random, scratch, persist, nullptr, &res) == ErrorCode::Ok);
				assert(res.requested == 1);
				assert(res.found == 1);
				assert(res.stop == StopReason::Complete);
				assert(near(res.values[0], 9.0, 1e-6));

				opts.max_eigenvalues = 10;
				assert(lowrank_core::eigen_power_deflate(d.view(), opts, random, scratch, persist, nullptr, &res) == ErrorCode::Ok);
				assert(res.requested == 3);
		}

		// zero matrix: nothing to find, not an error.
		{
				const double zv[] = {0, 0, 0, 0, 0, 0, 0, 0, 0};
				MatrixMutView z = mat(persist, 3, 3, zv);
				SeededRandom rng(3);
				RandomSource random = rng.source();
				EigenResult res;
				assert(lowrank_core::eigen_power_deflate(z.view(), EigenOptions{}, random, scratch, persist, nullptr, &res) == ErrorCode::Ok);
				assert(res.found == 0);
				assert(res.stop == StopReason::Negligible);
		}

		// iteration cap reached before convergence truncates the result.
		{
				const double dv[] = {4, 0, 0, 0, 9, 0, 0, 0, 1};
				MatrixMutView d = mat(persist, 3, 3, dv);
				SeededRandom rng(4);
				RandomSource random = rng.source();
				EigenOptions opts;
				opts.max_iterations = 1;
				EigenResult res;
				assert(lowrank_core::eigen_power_deflate(d.view(), opts, random, scratch, persist, nullptr, &res) == ErrorCode::Ok);
				assert(res.found == 0);
				assert(res.stop == StopReason::Shortfall);
		}

		// a source without a generator yields a zero start vector.
		{
				const double sv[] = {2, 1, 1, 2};
				MatrixMutView s = mat(persist, 2, 2, sv);
				RandomSource none;
				EigenResult res;
				assert(lowrank_core::eigen_power_deflate(s.view(), EigenOptions{}, none, scratch, persist, nullptr, &res) == ErrorCode::Ok);
				assert(res.found == 0);
				assert(res.stop == StopReason::ZeroStart);
		}

		// equal seeds reproduce the decomposition exactly.
		{
				const double sv[] = {5, 2, 0, 2, 3, 1, 0, 1, 1};
				MatrixMutView s = mat(persist, 3, 3, sv);
				SeededRandom rng_a(77);
				SeededRandom rng_b(77);
				RandomSource ra = rng_a.source();
				RandomSource rb = rng_b.source();
				EigenResult a;
				EigenResult b;
				assert(lowrank_core::eigen_power_deflate(s.view(), EigenOptions{}, ra, scratch, persist, nullptr, &a) == ErrorCode::Ok);
				assert(lowrank_core::eigen_power_deflate(s.view(), EigenOptions{}, rb, scratch, persist, nullptr, &b) == ErrorCode::Ok);
				assert(a.found == b.found);
				assert(a.iterations == b.iterations);
				for (std::uint32_t i = 0; i < a.found; i++) {
						assert(a.values[i] == b.values[i]);
						for (std::uint32_t j = 0; j < 3; j++)
								assert(a.vector(i)[j] == b.vector(i)[j]);
				}
				for (std::uint32_t i = 1; i < a.found; i++)
						assert(std::fabs(a.values[i - 1]) >= std::fabs(a.values[i]) - 1e-9);
		}

		// argument errors.
		{
				const double rv[] = {1, 2, 3, 4, 5, 6};
				MatrixMutView r = mat(persist, 2, 3, rv);
				SeededRandom rng(5);
				RandomSource random = rng.source();
				EigenResult res;
				assert(lowrank_core::eigen_power_deflate(r.view(), EigenOptions{}, random, scratch, persist, nullptr, &res) == ErrorCode::NotSquare);
				assert(lowrank_core::eigen_power_deflate({}, EigenOptions{}, random, scratch, persist, nullptr, &res) == ErrorCode::InvalidDimension);
				assert(lowrank_core::eigen_power_deflate(r.view(), EigenOptions{}, random, scratch, persist, nullptr, nullptr) == ErrorCode::Internal);

				const double sv[] = {2, 1, 1, 2};
				MatrixMutView s = mat(persist, 2, 2, sv);
				EigenOptions bad;
				bad.tolerance = 0.0;
				assert(lowrank_core::eigen_power_deflate(s.view(), bad, random, scratch, persist, nullptr, &res) == ErrorCode::InvalidArgument);

				// room for the working copy and v but not A v. nothing stays allocated
				alignas(double) std::uint8_t buf[48] = {};
				Arena tiny(buf, sizeof(buf));
				const std::size_t persist_before = persist.used();
				assert(lowrank_core::eigen_power_deflate(s.view(), EigenOptions{}, random, tiny, persist, nullptr, &res) == ErrorCode::Overflow);
				assert(persist.used() == persist_before);
				assert(tiny.used() == 0);
		}

		return 0;
}
