#include "lowrank_core/error.hpp"

namespace lowrank_core {

const char* error_name(ErrorCode code) noexcept {
		switch (code) {
		case ErrorCode::Ok:
				return "ok";
		case ErrorCode::FeatureDisabled:
				return "feature disabled";
		case ErrorCode::InvalidDimension:
				return "invalid dimension";
		case ErrorCode::DimensionMismatch:
				return "dimension mismatch";
		case ErrorCode::NotSquare:
				return "not square";
		case ErrorCode::InvalidArgument:
				return "invalid argument";
		case ErrorCode::Overflow:
				return "out of memory";
		case ErrorCode::BufferTooSmall:
				return "buffer too small";
		case ErrorCode::IndexOutOfRange:
				return "index out of range";
		case ErrorCode::Internal:
				return "internal error";
		}
		return "unknown";
}

} // namespace lowrank_core
