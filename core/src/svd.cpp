#include "lowrank_core/svd.hpp"

#include <cmath>

namespace lowrank_core {
namespace {
// stable insertion sort of index by descending sigma. ties keep discovery
// order. rank is at most a few hundred here
void order_by_sigma(const double* sigma, std::uint32_t* index, std::uint32_t count) noexcept {
		for (std::uint32_t i = 0; i < count; i++)
				index[i] = i;
		for (std::uint32_t i = 1; i < count; i++) {
				const std::uint32_t cur = index[i];
				std::uint32_t j = i;
				while (j > 0 && sigma[index[j - 1]] < sigma[cur]) {
						index[j] = index[j - 1];
						j--;
				}
				index[j] = cur;
		}
}
} // namespace

Error svd_decompose(MatrixView a,
        const EigenOptions& opts,
        RandomSource& random,
        Arena& persist,
        Arena& scratch,
        const EigenObserver* observer,
        SvdResult* out) noexcept {
		if (!out)
				return {ErrorCode::Internal};
		ErrorCode ec = matrix_check(a);
		if (!is_ok(ec))
				return err_invalid_dim(a.dim());

		const std::uint32_t m = a.rows;
		const std::uint32_t n = a.cols;
		const std::uint32_t rank = m < n ? m : n;

		ArenaScope factors(persist);
		ArenaScope temps(scratch);

		// A^T A (n x n)
		MatrixMutView at;
		ec = matrix_alloc(scratch, n, m, &at);
		if (!is_ok(ec))
				return {ec, a.dim()};
		ec = matrix_transpose(a, at);
		if (!is_ok(ec))
				return {ec, a.dim()};
		MatrixMutView ata;
		ec = matrix_alloc(scratch, n, n, &ata);
		if (!is_ok(ec))
				return {ec, a.dim()};
		ec = matrix_mul(at.view(), a, ata);
		if (!is_ok(ec))
				return {ec, at.dim(), a.dim()};

		EigenOptions eig = opts;
		if (eig.max_eigenvalues == 0 || eig.max_eigenvalues > rank)
				eig.max_eigenvalues = rank;

		EigenResult pairs;
		ec = eigen_power_deflate(ata.view(), eig, random, scratch, scratch, observer, &pairs);
		if (!is_ok(ec))
				return {ec, ata.dim()};

		SvdResult res;
		res.rank = rank;
		res.found = pairs.found;
		res.stop = pairs.stop;
		res.sigma = persist.allocate_array<double>(rank);
		if (!res.sigma)
				return err_overflow();
		ec = matrix_alloc(persist, m, rank, &res.u);
		if (!is_ok(ec))
				return {ec, a.dim()};
		ec = matrix_alloc(persist, rank, n, &res.vt);
		if (!is_ok(ec))
				return {ec, a.dim()};
		for (std::uint32_t i = 0; i < rank; i++)
				res.sigma[i] = 0.0;

		const std::uint32_t found = pairs.found;
		if (found > 0) {
				double* raw = scratch.allocate_array<double>(found);
				std::uint32_t* index = scratch.allocate_array<std::uint32_t>(found);
				VectorMutView av;
				ec = vector_alloc(scratch, m, &av);
				if (!raw || !index)
						return err_overflow();
				if (!is_ok(ec))
						return {ec, a.dim()};

				// negative eigenvalues of a PSD matrix are rounding noise
				for (std::uint32_t i = 0; i < found; i++) {
						const double lambda = pairs.values[i];
						raw[i] = std::sqrt(lambda > 0.0 ? lambda : 0.0);
				}
				order_by_sigma(raw, index, found);

				for (std::uint32_t i = 0; i < found; i++) {
						const std::uint32_t src = index[i];
						const double s = raw[src];
						res.sigma[i] = s;

						const VectorView v = pairs.vector(src);
						VectorMutView vt_row = matrix_row_mut(res.vt, i);
						for (std::uint32_t j = 0; j < n; j++)
								vt_row.data[j] = v.data[j];

						// u_i = A v_i / sigma_i, renormalized. U starts zeroed so a
						// degenerate component keeps its zero column
						if (!(s > opts.tolerance)) {
								res.degenerate++;
								continue;
						}
						ec = matrix_mul_vec(a, v, av);
						if (!is_ok(ec))
								return {ec, a.dim()};
						for (std::uint32_t r = 0; r < m; r++)
								av.data[r] /= s;
						const double norm = vector_norm(av.view());
						if (norm < opts.tolerance) {
								res.degenerate++;
								continue;
						}
						for (std::uint32_t r = 0; r < m; r++)
								res.u.at_mut(r, i) = av.data[r] / norm;
				}
		}

		LOWRANK_DBG("[svd] %lux%lu rank=%lu found=%lu degenerate=%lu\n",
		        (unsigned long)m,
		        (unsigned long)n,
		        (unsigned long)rank,
		        (unsigned long)res.found,
		        (unsigned long)res.degenerate);

		factors.commit();
		*out = res;
		return {};
}

} // namespace lowrank_core
