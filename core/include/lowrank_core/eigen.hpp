#pragma once

#include <cstddef>
#include <cstdint>

#include "lowrank_core/arena.hpp"
#include "lowrank_core/config.hpp"
#include "lowrank_core/error.hpp"
#include "lowrank_core/matrix.hpp"
#include "lowrank_core/random.hpp"

namespace lowrank_core {
struct EigenOptions {
		double tolerance = kDefaultTolerance;
		std::uint32_t max_iterations = kDefaultMaxIterations;
		std::uint32_t max_eigenvalues = 0; // 0 requests one pair per row
};

// default options for decomposing a channel of the given size. large
// channels get a looser tolerance, fewer iterations and a capped pair count
EigenOptions eigen_options_for(In Dim channel) noexcept;

enum class StopReason : std::uint8_t {
		Complete,   // every requested pair was found
		ZeroStart,  // start vector had no length
		Shortfall,  // an eigenpair did not converge within max_iterations
		Negligible, // the next eigenvalue fell below tolerance
};

const char* stop_reason_name(StopReason reason) noexcept;

struct EigenResult {
		// values[i] pairs with vectors row i, in discovery order (descending
		// magnitude). rows past found are unused
		double* values = nullptr;
		MatrixMutView vectors{};
		std::uint32_t requested = 0;
		std::uint32_t found = 0;
		StopReason stop = StopReason::Complete;
		std::uint32_t iterations = 0; // total over all pairs

		VectorView value_list() const noexcept { return {found, values}; }
		VectorView vector(std::uint32_t i) const noexcept { return matrix_row(vectors.view(), i); }
};

// called after each emitted pair with (found, requested)
struct EigenObserver {
		void* ctx = nullptr;
		void (*on_pair)(InOut void*, In std::uint32_t, In std::uint32_t) noexcept = nullptr;

		void notify(std::uint32_t found, std::uint32_t requested) const noexcept {
				if (on_pair && ctx)
						on_pair(ctx, found, requested);
		}
};

// dominant eigenpairs of the symmetric matrix a by power iteration with
// deflation. a is copied into scratch and never modified. result storage is
// taken from persist. stopping early is not an error: found < requested
// and stop tells why
ErrorCode eigen_power_deflate(In MatrixView a,
        In const EigenOptions& opts,
        InOut RandomSource& random,
        InOut Arena& scratch,
        InOut Arena& persist,
        In const EigenObserver* observer,
        Out EigenResult* out) noexcept;

} // namespace lowrank_core
