#pragma once

#include <cstddef>
#include <cstdint>

#include "lowrank_core/arena.hpp"
#include "lowrank_core/eigen.hpp"
#include "lowrank_core/error.hpp"
#include "lowrank_core/matrix.hpp"
#include "lowrank_core/random.hpp"

namespace lowrank_core {
// A (m x n) ~= U * diag(sigma) * V_T
//
// rank is always min(m, n). when the eigen solve stopped early the tail of
// sigma is zero, the matching U columns and V_T rows are zero, and found
// tells how many components actually converged
struct SvdResult {
		MatrixMutView u{};  // m x rank
		double* sigma = nullptr;
		MatrixMutView vt{}; // rank x n
		std::uint32_t rank = 0;
		std::uint32_t found = 0;
		std::uint32_t degenerate = 0; // converged components with a zero u
		StopReason stop = StopReason::Complete;

		std::uint32_t rows() const noexcept { return u.rows; }
		std::uint32_t cols() const noexcept { return vt.cols; }
		VectorView sigma_list() const noexcept { return {rank, sigma}; }
};

// factor a. U, sigma and V_T are allocated from persist; on failure persist
// is rewound. scratch holds A^T A and solver temporaries and is left as it
// was found
Error svd_decompose(In MatrixView a,
        In const EigenOptions& opts,
        InOut RandomSource& random,
        InOut Arena& persist,
        InOut Arena& scratch,
        In const EigenObserver* observer,
        Out SvdResult* out) noexcept;

} // namespace lowrank_core
