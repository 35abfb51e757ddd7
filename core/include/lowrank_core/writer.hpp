#pragma once

#include <cstddef>
#include <cstdint>

#include "lowrank_core/error.hpp"

namespace lowrank_core {

// string builder helper that writes to a fixed capacity buffer
// all operations are noexcept and return ErrorCode on overflow
struct Writer {
		char* data = nullptr;
		std::size_t cap = 0;
		std::size_t len = 0;

		ErrorCode put(char ch) noexcept {
				if (!data || cap == 0)
						return ErrorCode::BufferTooSmall;
				if (len + 1 >= cap)
						return ErrorCode::BufferTooSmall;
				data[len++] = ch;
				data[len] = '\0';
				return ErrorCode::Ok;
		}

		ErrorCode append(const char* s) noexcept {
				if (!s)
						return ErrorCode::Internal;
				for (std::size_t i = 0; s[i] != '\0'; i++) {
						ErrorCode ec = put(s[i]);
						if (!is_ok(ec))
								return ec;
				}
				return ErrorCode::Ok;
		}

		ErrorCode append_u64(std::uint64_t v) noexcept {
				char buf[32];
				std::size_t n = 0;
				do {
						buf[n++] = static_cast<char>('0' + (v % 10u));
						v /= 10u;
				} while (v != 0u);

				for (std::size_t i = 0; i < n; i++) {
						ErrorCode ec = put(buf[n - 1 - i]);
						if (!is_ok(ec))
								return ec;
				}
				return ErrorCode::Ok;
		}

		ErrorCode append_i64(std::int64_t v) noexcept {
				std::uint64_t mag = (v < 0) ? (static_cast<std::uint64_t>(-(v + 1)) + 1u) : static_cast<std::uint64_t>(v);
				if (v < 0) {
						ErrorCode ec = put('-');
						if (!is_ok(ec))
								return ec;
				}
				return append_u64(mag);
		}

		// fixed point decimal, rounded half away from zero. decimals <= 6
		ErrorCode append_fixed(double v, std::uint8_t decimals) noexcept;
};

} // namespace lowrank_core
