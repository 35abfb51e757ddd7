#pragma once

#include <cstdint>

// parameter direction annotations
#define In
#define Out
#define InOut

namespace lowrank_core {
struct Dim {
		std::uint32_t rows = 0;
		std::uint32_t cols = 0;
};

enum class ErrorCode : std::uint8_t {
		Ok = 0,
		FeatureDisabled,
		InvalidDimension,
		DimensionMismatch,
		NotSquare,
		InvalidArgument,
		Overflow,
		BufferTooSmall,
		IndexOutOfRange,
		Internal,
};

struct Error {
		ErrorCode code = ErrorCode::Ok;
		Dim a{};
		Dim b{};
};

constexpr bool is_ok(ErrorCode code) noexcept {
		return code == ErrorCode::Ok;
}
constexpr bool is_ok(const Error& err) noexcept {
		return is_ok(err.code);
}

constexpr Error err_dim_mismatch(Dim a, Dim b) noexcept {
		return {ErrorCode::DimensionMismatch, a, b};
}
constexpr Error err_not_square(Dim a) noexcept {
		return {ErrorCode::NotSquare, a};
}
constexpr Error err_overflow(void) noexcept {
		return {ErrorCode::Overflow};
}
constexpr Error err_invalid_dim(Dim a) noexcept {
		return {ErrorCode::InvalidDimension, a};
}
constexpr Error err_invalid_arg() noexcept {
		return {ErrorCode::InvalidArgument};
}
constexpr Error err_feature_disabled() noexcept {
		return {ErrorCode::FeatureDisabled};
}

// short stable name for logs and CLI messages
const char* error_name(ErrorCode code) noexcept;
} // namespace lowrank_core
