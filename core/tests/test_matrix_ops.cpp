#include "lowrank_core/lowrank_core.hpp"

#include <cassert>
#include <cmath>
#include <cstring>

using lowrank_core::Arena;
using lowrank_core::ArenaScope;
using lowrank_core::ArenaScratchScope;
using lowrank_core::ErrorCode;
using lowrank_core::MatrixMutView;
using lowrank_core::MatrixView;
using lowrank_core::Slab;
using lowrank_core::VectorMutView;
using lowrank_core::Writer;

static MatrixMutView mat(Arena& a, std::uint32_t rows, std::uint32_t cols, const double* values) {
		MatrixMutView m;
		assert(lowrank_core::matrix_alloc(a, rows, cols, &m) == ErrorCode::Ok);
		for (std::uint32_t r = 0; r < rows; r++) {
				for (std::uint32_t c = 0; c < cols; c++)
						m.at_mut(r, c) = values[r * cols + c];
		}
		return m;
}

static bool fixed_is(double v, std::uint8_t decimals, const char* expect) {
		char buf[32];
		Writer w{buf, sizeof(buf), 0};
		buf[0] = '\0';
		if (w.append_fixed(v, decimals) != ErrorCode::Ok)
				return false;
		return std::strcmp(buf, expect) == 0;
}

int main() {
		Slab slab;
		assert(slab.reserve(128 * 1024) == ErrorCode::Ok);
		Arena persist;
		Arena scratch;
		assert(slab.split(slab.size() / 2, &persist, &scratch) == ErrorCode::Ok);

		// matrix_view.cpp error branches.
		{
				alignas(double) std::uint8_t buf[64] = {};
				Arena tiny(buf, sizeof(buf));

				MatrixMutView m;
				assert(lowrank_core::matrix_alloc(tiny, 0, 1, &m) == ErrorCode::InvalidDimension);
				assert(lowrank_core::matrix_alloc(tiny, 1, 0, &m) == ErrorCode::InvalidDimension);
				assert(lowrank_core::matrix_alloc(tiny, 1, 1, nullptr) == ErrorCode::Internal);
				// 3x3 doubles need 72 bytes
				assert(lowrank_core::matrix_alloc(tiny, 3, 3, &m) == ErrorCode::Overflow);
				assert(lowrank_core::matrix_alloc(tiny, 2, 4, &m) == ErrorCode::Ok);
				assert(tiny.used() == 64);

				assert(lowrank_core::matrix_check(MatrixView{}) == ErrorCode::InvalidDimension);
				assert(lowrank_core::matrix_check(MatrixView{2, 2, 2, nullptr}) == ErrorCode::InvalidDimension);
				assert(lowrank_core::matrix_check(m.view()) == ErrorCode::Ok);

				MatrixMutView a2;
				MatrixMutView b2;
				assert(lowrank_core::matrix_alloc(persist, 2, 2, &a2) == ErrorCode::Ok);
				assert(lowrank_core::matrix_alloc(persist, 1, 2, &b2) == ErrorCode::Ok);
				assert(lowrank_core::matrix_copy(a2.view(), b2) == ErrorCode::DimensionMismatch);
				MatrixView bad_src{2, 2, 2, nullptr};
				assert(lowrank_core::matrix_copy(bad_src, a2) == ErrorCode::Internal);

				lowrank_core::matrix_fill_zero({2, 2, 2, nullptr});

				MatrixMutView mul_out;
				assert(lowrank_core::matrix_alloc(persist, 2, 3, &mul_out) == ErrorCode::Ok);
				assert(lowrank_core::matrix_mul(a2.view(), a2.view(), mul_out) == ErrorCode::DimensionMismatch);
				assert(lowrank_core::matrix_mul(a2.view(), b2.view(), mul_out) == ErrorCode::DimensionMismatch);
				assert(lowrank_core::matrix_transpose(mul_out.view(), a2) == ErrorCode::DimensionMismatch);
		}

		// fresh allocations are zeroed.
		{
				MatrixMutView z;
				assert(lowrank_core::matrix_alloc(persist, 3, 2, &z) == ErrorCode::Ok);
				assert(z.stride == 2);
				for (std::uint32_t r = 0; r < 3; r++) {
						for (std::uint32_t c = 0; c < 2; c++)
								assert(z.at(r, c) == 0.0);
				}
		}

		// transpose and multiply.
		{
				const double av[] = {1, 2, 3, 4, 5, 6};
				const double bv[] = {7, 8, 9, 10, 11, 12};
				MatrixMutView a = mat(persist, 2, 3, av);
				MatrixMutView b = mat(persist, 3, 2, bv);

				MatrixMutView at;
				assert(lowrank_core::matrix_alloc(persist, 3, 2, &at) == ErrorCode::Ok);
				assert(lowrank_core::matrix_transpose(a.view(), at) == ErrorCode::Ok);
				assert(at.at(0, 0) == 1 && at.at(0, 1) == 4);
				assert(at.at(1, 0) == 2 && at.at(1, 1) == 5);
				assert(at.at(2, 0) == 3 && at.at(2, 1) == 6);

				MatrixMutView ab;
				assert(lowrank_core::matrix_alloc(persist, 2, 2, &ab) == ErrorCode::Ok);
				assert(lowrank_core::matrix_mul(a.view(), b.view(), ab) == ErrorCode::Ok);
				assert(ab.at(0, 0) == 58 && ab.at(0, 1) == 64);
				assert(ab.at(1, 0) == 139 && ab.at(1, 1) == 154);

				// previous contents of out do not leak into the product
				ab.at_mut(0, 0) = 1000;
				assert(lowrank_core::matrix_mul(a.view(), b.view(), ab) == ErrorCode::Ok);
				assert(ab.at(0, 0) == 58);

				MatrixMutView clone;
				assert(lowrank_core::matrix_clone(persist, a.view(), &clone) == ErrorCode::Ok);
				assert(clone.data != a.data);
				assert(clone.at(1, 2) == 6);
				assert(lowrank_core::matrix_clone(persist, a.view(), nullptr) == ErrorCode::Internal);
		}

		// matrix x vector, norm and dot.
		{
				const double av[] = {1, 2, 3, 4, 5, 6};
				MatrixMutView a = mat(persist, 2, 3, av);

				VectorMutView v;
				VectorMutView out;
				VectorMutView bad;
				assert(lowrank_core::vector_alloc(persist, 3, &v) == ErrorCode::Ok);
				assert(lowrank_core::vector_alloc(persist, 2, &out) == ErrorCode::Ok);
				assert(lowrank_core::vector_alloc(persist, 2, &bad) == ErrorCode::Ok);
				assert(lowrank_core::vector_alloc(persist, 0, &bad) == ErrorCode::InvalidDimension);
				v[0] = 1;
				v[1] = 0;
				v[2] = -1;

				assert(lowrank_core::matrix_mul_vec(a.view(), v.view(), out) == ErrorCode::Ok);
				assert(out[0] == -2 && out[1] == -2);
				assert(lowrank_core::matrix_mul_vec(a.view(), out.view(), bad) == ErrorCode::DimensionMismatch);
				assert(lowrank_core::matrix_mul_vec(a.view(), v.view(), v) == ErrorCode::DimensionMismatch);

				VectorMutView w;
				assert(lowrank_core::vector_alloc(persist, 2, &w) == ErrorCode::Ok);
				w[0] = 3;
				w[1] = 4;
				assert(lowrank_core::vector_norm(w.view()) == 5.0);
				double dot = 0.0;
				assert(lowrank_core::vector_dot(w.view(), out.view(), &dot) == ErrorCode::Ok);
				assert(dot == -14.0);
				// lengths 2 and 3 never pair up, dot is left alone
				assert(lowrank_core::vector_dot(w.view(), v.view(), &dot) == ErrorCode::DimensionMismatch);
				assert(dot == -14.0);
				assert(lowrank_core::vector_dot(w.view(), out.view(), nullptr) == ErrorCode::Internal);

				// row access through a read-only mutable view
				const MatrixMutView fixed = a;
				const double* r1 = fixed.row(1);
				assert(r1[0] == 4 && r1[2] == 6);

				const lowrank_core::VectorView row1 = lowrank_core::matrix_row(a.view(), 1);
				assert(row1.size == 3 && row1[0] == 4 && row1[2] == 6);

				lowrank_core::vector_fill_zero(w);
				assert(lowrank_core::vector_norm(w.view()) == 0.0);
		}

		// arena scopes.
		{
				const std::size_t before = scratch.used();
				{
						ArenaScope scope(scratch);
						assert(scratch.allocate_array<double>(16) != nullptr);
						assert(scratch.used() > before);
				}
				assert(scratch.used() == before);

				{
						ArenaScope scope(scratch);
						assert(scratch.allocate_array<double>(4) != nullptr);
						scope.commit();
				}
				assert(scratch.used() > before);

				{
						ArenaScratchScope scope(scratch);
						assert(scratch.used() == 0);
						assert(scratch.allocate_array<std::uint32_t>(8) != nullptr);
				}
				assert(scratch.used() == 0);

				assert(scratch.allocate_array<double>(0) == nullptr);
				assert(scratch.allocate_array<double>(static_cast<std::size_t>(-1) / 4) == nullptr);

				double* d = scratch.allocate_array<double>(1);
				assert(d != nullptr);
				assert(reinterpret_cast<std::uintptr_t>(d) % alignof(double) == 0);
		}

		// slab.
		{
				Slab s;
				Arena p;
				Arena q;
				assert(s.split(0, &p, &q) == ErrorCode::Overflow);
				assert(s.reserve(0) == ErrorCode::InvalidDimension);
				assert(s.reserve(256) == ErrorCode::Ok);
				std::uint8_t* first = s.data();
				assert(s.reserve(128) == ErrorCode::Ok);
				assert(s.data() == first && s.size() == 256);

				assert(s.split(257, &p, &q) == ErrorCode::Overflow);
				assert(s.split(64, &p, nullptr) == ErrorCode::Internal);
				assert(s.split(64, &p, &q) == ErrorCode::Ok);
				// 8 doubles fill the persist part exactly, the rest goes to scratch
				assert(p.allocate_array<double>(8) != nullptr);
				assert(p.allocate_array<double>(1) == nullptr);
				assert(q.allocate_array<double>(24) != nullptr);
				assert(q.allocate_array<double>(1) == nullptr);
		}

		// workspace sizing.
		{
				lowrank_core::WorkspaceSize ws;
				lowrank_core::EigenOptions opts;
				assert(lowrank_core::channel_workspace_bytes({0, 4}, opts, &ws) == ErrorCode::InvalidDimension);
				assert(lowrank_core::channel_workspace_bytes({4, 4}, opts, nullptr) == ErrorCode::Internal);
				assert(lowrank_core::channel_workspace_bytes({0xFFFFFFFFu, 0xFFFFFFFFu}, opts, &ws) == ErrorCode::Overflow);

				assert(lowrank_core::channel_workspace_bytes({3, 5}, opts, &ws) == ErrorCode::Ok);
				// channel, reconstruction, U, sigma, V_T
				assert(ws.persist >= (15 + 15 + 9 + 3 + 15) * sizeof(double));
				// A^T, A^T A, deflation copy
				assert(ws.scratch >= (15 + 25 + 25) * sizeof(double));
				assert(ws.total() == ws.persist + ws.scratch);
		}

		// writer fixed point output.
		{
				assert(fixed_is(0.8888, 2, "0.89"));
				assert(fixed_is(4.975124, 2, "4.98"));
				assert(fixed_is(3.0, 2, "3.00"));
				assert(fixed_is(0.007, 2, "0.01"));
				assert(fixed_is(1.05, 3, "1.050"));
				assert(fixed_is(12.34, 1, "12.3"));
				assert(fixed_is(-1.6, 0, "-2"));
				assert(fixed_is(-0.001, 2, "0.00"));
				assert(fixed_is(255.0, 0, "255"));

				char small[4];
				Writer w{small, sizeof(small), 0};
				assert(w.append_fixed(123.45, 2) == ErrorCode::BufferTooSmall);
				Writer w2{small, sizeof(small), 0};
				assert(w2.append_fixed(1.0, 7) == ErrorCode::InvalidArgument);
		}

		// error helpers.
		{
				const lowrank_core::Error e = lowrank_core::err_dim_mismatch({1, 2}, {3, 4});
				assert(e.code == ErrorCode::DimensionMismatch);
				assert(e.a.rows == 1 && e.b.cols == 4);
				assert(!lowrank_core::is_ok(e));
				assert(lowrank_core::is_ok(lowrank_core::Error{}));
				assert(std::strcmp(lowrank_core::error_name(ErrorCode::DimensionMismatch), "dimension mismatch") == 0);
				assert(std::strcmp(lowrank_core::error_name(ErrorCode::Overflow), "out of memory") == 0);
		}

		return 0;
}
