#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "lowrank_core/arena.hpp"
#include "lowrank_core/error.hpp"

namespace lowrank_core {
struct MatrixView {
		std::uint32_t rows = 0;
		std::uint32_t cols = 0;
		std::uint32_t stride = 0;
		const double* data = nullptr;

		constexpr Dim dim() const noexcept { return {rows, cols}; }
		constexpr bool empty() const noexcept { return rows == 0 || cols == 0 || data == nullptr; }

		const double& at(std::uint32_t r, std::uint32_t c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}

		const double* row(std::uint32_t r) const noexcept {
				assert(data);
				assert(r < rows);
				return data + static_cast<std::size_t>(r) * stride;
		}
};

struct MatrixMutView {
		std::uint32_t rows = 0;
		std::uint32_t cols = 0;
		std::uint32_t stride = 0;
		double* data = nullptr;

		MatrixView view() const noexcept { return {rows, cols, stride, data}; }

		constexpr Dim dim() const noexcept { return {rows, cols}; }
		constexpr bool empty() const noexcept { return rows == 0 || cols == 0 || data == nullptr; }

		const double& at(std::uint32_t r, std::uint32_t c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}

		const double* row(std::uint32_t r) const noexcept {
				assert(data);
				assert(r < rows);
				return data + static_cast<std::size_t>(r) * stride;
		}

		double& at_mut(std::uint32_t r, std::uint32_t c) noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}

		double* row_mut(std::uint32_t r) noexcept {
				assert(data);
				assert(r < rows);
				return data + static_cast<std::size_t>(r) * stride;
		}
};

struct VectorView {
		std::uint32_t size = 0;
		const double* data = nullptr;

		const double& operator[](std::uint32_t i) const noexcept {
				assert(data);
				assert(i < size);
				return data[i];
		}
};

struct VectorMutView {
		std::uint32_t size = 0;
		double* data = nullptr;

		VectorView view() const noexcept { return {size, data}; }

		double& operator[](std::uint32_t i) const noexcept {
				assert(data);
				assert(i < size);
				return data[i];
		}
};

// row r of a matrix as a vector (no copy)
inline VectorView matrix_row(MatrixView m, std::uint32_t r) noexcept {
		return {m.cols, m.row(r)};
}
inline VectorMutView matrix_row_mut(MatrixMutView m, std::uint32_t r) noexcept {
		return {m.cols, m.row_mut(r)};
}

// InvalidDimension for an empty or null matrix
ErrorCode matrix_check(In MatrixView m) noexcept;

ErrorCode matrix_alloc(InOut Arena& arena, In std::uint32_t rows, In std::uint32_t cols, Out MatrixMutView* out) noexcept;
ErrorCode matrix_clone(InOut Arena& arena, In MatrixView src, Out MatrixMutView* out) noexcept;
ErrorCode matrix_copy(In MatrixView src, Out MatrixMutView dst) noexcept;
void matrix_fill_zero(Out MatrixMutView m) noexcept;

ErrorCode matrix_mul(In MatrixView a, In MatrixView b, Out MatrixMutView out) noexcept;
ErrorCode matrix_transpose(In MatrixView a, Out MatrixMutView out) noexcept;
ErrorCode matrix_mul_vec(In MatrixView a, In VectorView v, Out VectorMutView out) noexcept;

ErrorCode vector_alloc(InOut Arena& arena, In std::uint32_t size, Out VectorMutView* out) noexcept;
void vector_fill_zero(Out VectorMutView v) noexcept;
double vector_norm(In VectorView v) noexcept;
ErrorCode vector_dot(In VectorView a, In VectorView b, Out double* out) noexcept;

} // namespace lowrank_core
