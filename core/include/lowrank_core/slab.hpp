#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include "lowrank_core/arena.hpp"
#include "lowrank_core/error.hpp"

namespace lowrank_core {
// owned heap block. a channel task splits it into its persist and scratch
// arenas, a bitmap keeps its pixels in one. never shared between tasks
class Slab {
	  public:
		Slab() noexcept = default;
		Slab(const Slab&) = delete;
		Slab& operator=(const Slab&) = delete;

		~Slab() { std::free(data_); }

		// at least bytes of storage. a block that is already large enough is
		// kept, a smaller one is replaced and its contents dropped
		ErrorCode reserve(std::size_t bytes) noexcept {
				if (bytes == 0)
						return ErrorCode::InvalidDimension;
				if (data_ && size_ >= bytes)
						return ErrorCode::Ok;

				std::free(data_);
				data_ = static_cast<std::uint8_t*>(std::malloc(bytes));
				size_ = data_ ? bytes : 0;
				return data_ ? ErrorCode::Ok : ErrorCode::Overflow;
		}

		// persist over the first persist_bytes, scratch over the rest
		ErrorCode split(std::size_t persist_bytes, Arena* persist, Arena* scratch) const noexcept {
				if (!persist || !scratch)
						return ErrorCode::Internal;
				if (!data_ || persist_bytes > size_)
						return ErrorCode::Overflow;
				*persist = Arena(data_, persist_bytes);
				*scratch = Arena(data_ + persist_bytes, size_ - persist_bytes);
				return ErrorCode::Ok;
		}

		std::uint8_t* data() noexcept { return data_; }
		const std::uint8_t* data() const noexcept { return data_; }
		std::size_t size() const noexcept { return size_; }

	  private:
		std::uint8_t* data_ = nullptr;
		std::size_t size_ = 0;
};
} // namespace lowrank_core
