#include "lowrank_core/workspace.hpp"

#include <limits>

namespace lowrank_core {
namespace {
constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
// alignment padding allowance per arena
constexpr std::size_t kSlack = 256;

// accumulates element counts and flags overflow instead of wrapping
struct ByteCounter {
		std::size_t bytes = kSlack;
		bool overflow = false;

		void add(std::size_t a, std::size_t b, std::size_t elem) noexcept {
				if (overflow)
						return;
				if (a != 0 && b > kMax / a) {
						overflow = true;
						return;
				}
				const std::size_t count = a * b;
				if (count != 0 && elem > kMax / count) {
						overflow = true;
						return;
				}
				const std::size_t size = count * elem;
				if (size > kMax - bytes) {
						overflow = true;
						return;
				}
				bytes += size;
		}
};
} // namespace

ErrorCode channel_workspace_bytes(Dim channel, const EigenOptions& opts, WorkspaceSize* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (channel.rows == 0 || channel.cols == 0)
				return ErrorCode::InvalidDimension;

		const std::size_t m = channel.rows;
		const std::size_t n = channel.cols;
		const std::size_t r = m < n ? m : n;
		std::size_t k = opts.max_eigenvalues;
		if (k == 0 || k > r)
				k = r;

		ByteCounter persist;
		persist.add(m, n, sizeof(double)); // channel
		persist.add(m, n, sizeof(double)); // reconstruction
		persist.add(m, r, sizeof(double)); // U
		persist.add(r, 1, sizeof(double)); // sigma
		persist.add(r, n, sizeof(double)); // V_T

		ByteCounter scratch;
		scratch.add(n, m, sizeof(double)); // A^T
		scratch.add(n, n, sizeof(double)); // A^T A
		scratch.add(k, 1, sizeof(double)); // eigenvalues
		scratch.add(k, n, sizeof(double)); // eigenvectors
		scratch.add(n, n, sizeof(double)); // deflation copy
		scratch.add(n, 2, sizeof(double)); // v, A v
		scratch.add(k, 1, sizeof(double)); // unsorted sigma
		scratch.add(k, 1, sizeof(std::uint32_t)); // sort order
		scratch.add(m, 1, sizeof(double)); // A v_i

		if (persist.overflow || scratch.overflow)
				return ErrorCode::Overflow;
		out->persist = persist.bytes;
		out->scratch = scratch.bytes;
		return ErrorCode::Ok;
}

} // namespace lowrank_core
