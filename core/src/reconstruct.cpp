#include "lowrank_core/reconstruct.hpp"

#include <cmath>

#include "lowrank_core/config.hpp"

namespace lowrank_core {
namespace {
double clamp_percent(double percent) noexcept {
		if (percent < 0.0)
				return 0.0;
		if (percent > 1.0)
				return 1.0;
		return percent;
}

double to_pixel(double v) noexcept {
		if (v < 0.0)
				v = 0.0;
		if (v > kPixelMax)
				v = kPixelMax;
		return std::round(v);
}

Error check_target(const SvdResult& svd, MatrixMutView out) noexcept {
		if (!svd.sigma || svd.u.empty() || svd.vt.empty())
				return {ErrorCode::InvalidDimension, svd.u.dim(), svd.vt.dim()};
		if (svd.u.cols != svd.rank || svd.vt.rows != svd.rank)
				return err_dim_mismatch(svd.u.dim(), svd.vt.dim());
		if (!out.data || out.rows != svd.rows() || out.cols != svd.cols())
				return err_dim_mismatch(out.dim(), {svd.rows(), svd.cols()});
		return {};
}
} // namespace

const char* policy_name(PolicyKind kind) noexcept {
		switch (kind) {
		case PolicyKind::ByCount:
				return "count";
		case PolicyKind::ByEnergy:
				return "sum";
		}
		return "unknown";
}

std::uint32_t retain_by_count(std::uint32_t rank, double percent) noexcept {
		if (rank == 0)
				return 0;
		const double wanted = std::ceil(static_cast<double>(rank) * clamp_percent(percent));
		if (wanted < 1.0)
				return 1;
		if (wanted >= static_cast<double>(rank))
				return rank;
		return static_cast<std::uint32_t>(wanted);
}

std::uint32_t retain_by_energy(VectorView sigma, double percent) noexcept {
		if (!sigma.data || sigma.size == 0)
				return 0;

		double total = 0.0;
		for (std::uint32_t i = 0; i < sigma.size; i++)
				total += sigma.data[i];
		const double threshold = clamp_percent(percent) * total;

		// the test runs after a component is added, so the crossing one is kept
		double running = 0.0;
		for (std::uint32_t i = 0; i < sigma.size; i++) {
				running += sigma.data[i];
				if (running > threshold)
						return i + 1;
		}
		return sigma.size;
}

ErrorCode reconstruct_leading(const SvdResult& svd, std::uint32_t count, MatrixMutView out) noexcept {
		const Error err = check_target(svd, out);
		if (!is_ok(err))
				return err.code;
		if (count > svd.rank)
				count = svd.rank;

		matrix_fill_zero(out);
		for (std::uint32_t k = 0; k < count; k++) {
				const double s = svd.sigma[k];
				if (s == 0.0)
						continue;
				const double* v = svd.vt.row(k);
				for (std::uint32_t i = 0; i < out.rows; i++) {
						const double su = s * svd.u.at(i, k);
						if (su == 0.0)
								continue;
						double* row = out.row_mut(i);
						for (std::uint32_t j = 0; j < out.cols; j++)
								row[j] += su * v[j];
				}
		}

		for (std::uint32_t i = 0; i < out.rows; i++) {
				double* row = out.row_mut(i);
				for (std::uint32_t j = 0; j < out.cols; j++)
						row[j] = to_pixel(row[j]);
		}
		return ErrorCode::Ok;
}

Error reconstruct_by_count(const SvdResult& svd, double percent, MatrixMutView out, std::uint32_t* used) noexcept {
		if (!used)
				return {ErrorCode::Internal};
		if (std::isnan(percent))
				return err_invalid_arg();
		Error err = check_target(svd, out);
		if (!is_ok(err))
				return err;

		const std::uint32_t keep = retain_by_count(svd.rank, percent);
		err.code = reconstruct_leading(svd, keep, out);
		if (!is_ok(err))
				return err;
		*used = keep;
		return {};
}

Error reconstruct_by_energy(const SvdResult& svd, double percent, MatrixMutView out, std::uint32_t* used) noexcept {
		if (!used)
				return {ErrorCode::Internal};
		if (std::isnan(percent))
				return err_invalid_arg();
		Error err = check_target(svd, out);
		if (!is_ok(err))
				return err;

		const std::uint32_t keep = retain_by_energy(svd.sigma_list(), percent);
		err.code = reconstruct_leading(svd, keep, out);
		if (!is_ok(err))
				return err;
		*used = keep;
		return {};
}

Error reconstruct(const SvdResult& svd, const Policy& policy, MatrixMutView out, std::uint32_t* used) noexcept {
		switch (policy.kind) {
		case PolicyKind::ByCount:
				return reconstruct_by_count(svd, policy.percent, out, used);
		case PolicyKind::ByEnergy:
				return reconstruct_by_energy(svd, policy.percent, out, used);
		}
		return err_invalid_arg();
}

} // namespace lowrank_core
