#include "lowrank_core/matrix.hpp"

#include <cmath>

namespace lowrank_core {
namespace {
constexpr bool valid_dim(std::uint32_t rows, std::uint32_t cols) noexcept {
		return rows >= 1 && cols >= 1;
}
} // namespace

ErrorCode matrix_check(MatrixView m) noexcept {
		if (m.empty())
				return ErrorCode::InvalidDimension;
		if (m.stride < m.cols)
				return ErrorCode::InvalidDimension;
		return ErrorCode::Ok;
}

ErrorCode matrix_alloc(Arena& arena, std::uint32_t rows, std::uint32_t cols, MatrixMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (!valid_dim(rows, cols))
				return ErrorCode::InvalidDimension;

		const std::size_t count = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);
		if (count / rows != cols)
				return ErrorCode::Overflow;
		double* data = arena.allocate_array<double>(count);
		if (!data)
				return ErrorCode::Overflow;

		for (std::size_t i = 0; i < count; i++)
				data[i] = 0.0;

		out->rows = rows;
		out->cols = cols;
		out->stride = cols;
		out->data = data;
		return ErrorCode::Ok;
}

ErrorCode matrix_clone(Arena& arena, MatrixView src, MatrixMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		MatrixMutView dst;
		ErrorCode ec = matrix_alloc(arena, src.rows, src.cols, &dst);
		if (!is_ok(ec))
				return ec;
		ec = matrix_copy(src, dst);
		if (!is_ok(ec))
				return ec;
		*out = dst;
		return ErrorCode::Ok;
}

ErrorCode matrix_copy(MatrixView src, MatrixMutView dst) noexcept {
		if (!src.data || !dst.data)
				return ErrorCode::Internal;
		if (src.rows != dst.rows || src.cols != dst.cols)
				return ErrorCode::DimensionMismatch;

		for (std::uint32_t row = 0; row < src.rows; row++) {
				const double* s = src.row(row);
				double* d = dst.row_mut(row);
				for (std::uint32_t col = 0; col < src.cols; col++)
						d[col] = s[col];
		}
		return ErrorCode::Ok;
}

void matrix_fill_zero(MatrixMutView m) noexcept {
		if (!m.data)
				return;
		for (std::uint32_t row = 0; row < m.rows; row++) {
				double* d = m.row_mut(row);
				for (std::uint32_t col = 0; col < m.cols; col++)
						d[col] = 0.0;
		}
}

ErrorCode matrix_mul(MatrixView a, MatrixView b, MatrixMutView out) noexcept {
		if (!a.data || !b.data || !out.data)
				return ErrorCode::Internal;
		if (a.cols != b.rows)
				return ErrorCode::DimensionMismatch;
		if (out.rows != a.rows || out.cols != b.cols)
				return ErrorCode::DimensionMismatch;

		// i-k-j order walks b and out along rows
		matrix_fill_zero(out);
		for (std::uint32_t i = 0; i < a.rows; i++) {
				double* o = out.row_mut(i);
				const double* ar = a.row(i);
				for (std::uint32_t k = 0; k < a.cols; k++) {
						const double aik = ar[k];
						if (aik == 0.0)
								continue;
						const double* br = b.row(k);
						for (std::uint32_t j = 0; j < b.cols; j++)
								o[j] += aik * br[j];
				}
		}
		return ErrorCode::Ok;
}

ErrorCode matrix_transpose(MatrixView a, MatrixMutView out) noexcept {
		if (!a.data || !out.data)
				return ErrorCode::Internal;
		if (out.rows != a.cols || out.cols != a.rows)
				return ErrorCode::DimensionMismatch;

		for (std::uint32_t row = 0; row < a.rows; row++) {
				for (std::uint32_t col = 0; col < a.cols; col++)
						out.at_mut(col, row) = a.at(row, col);
		}
		return ErrorCode::Ok;
}

ErrorCode matrix_mul_vec(MatrixView a, VectorView v, VectorMutView out) noexcept {
		if (!a.data || !v.data || !out.data)
				return ErrorCode::Internal;
		if (a.cols != v.size)
				return ErrorCode::DimensionMismatch;
		if (out.size != a.rows)
				return ErrorCode::DimensionMismatch;

		for (std::uint32_t row = 0; row < a.rows; row++) {
				const double* ar = a.row(row);
				double sum = 0.0;
				for (std::uint32_t col = 0; col < a.cols; col++)
						sum += ar[col] * v.data[col];
				out.data[row] = sum;
		}
		return ErrorCode::Ok;
}

ErrorCode vector_alloc(Arena& arena, std::uint32_t size, VectorMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (size == 0)
				return ErrorCode::InvalidDimension;
		double* data = arena.allocate_array<double>(size);
		if (!data)
				return ErrorCode::Overflow;
		for (std::uint32_t i = 0; i < size; i++)
				data[i] = 0.0;
		out->size = size;
		out->data = data;
		return ErrorCode::Ok;
}

void vector_fill_zero(VectorMutView v) noexcept {
		if (!v.data)
				return;
		for (std::uint32_t i = 0; i < v.size; i++)
				v.data[i] = 0.0;
}

double vector_norm(VectorView v) noexcept {
		double sum = 0.0;
		for (std::uint32_t i = 0; v.data && i < v.size; i++)
				sum += v.data[i] * v.data[i];
		return std::sqrt(sum);
}

ErrorCode vector_dot(VectorView a, VectorView b, double* out) noexcept {
		if (!a.data || !b.data || !out)
				return ErrorCode::Internal;
		if (a.size != b.size)
				return ErrorCode::DimensionMismatch;
		double sum = 0.0;
		for (std::uint32_t i = 0; i < a.size; i++)
				sum += a.data[i] * b.data[i];
		*out = sum;
		return ErrorCode::Ok;
}

} // namespace lowrank_core
