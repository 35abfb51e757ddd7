#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace lowrank_core {
// bump allocator over a borrowed buffer. matrices and vectors of one channel
// are carved from it and released together by rewinding
class Arena {
	  public:
		Arena() noexcept = default;
		Arena(void* buffer, std::size_t capacity) noexcept
		    : base_(static_cast<std::uint8_t*>(buffer)), cap_(buffer ? capacity : 0) {}

		std::size_t used() const noexcept { return used_; }
		std::size_t mark() const noexcept { return used_; }

		void rewind(std::size_t mark) noexcept {
				if (mark < used_)
						used_ = mark;
		}
		void clear() noexcept { used_ = 0; }

		// uninitialized storage for count objects of T, nullptr when it does not fit
		template <typename T> T* allocate_array(std::size_t count) noexcept {
				if (count == 0 || count > std::numeric_limits<std::size_t>::max() / sizeof(T))
						return nullptr;
				return static_cast<T*>(bump(sizeof(T) * count, alignof(T)));
		}

	  private:
		void* bump(std::size_t size, std::size_t align) noexcept {
				if (!base_)
						return nullptr;
				const std::size_t misalign = reinterpret_cast<std::uintptr_t>(base_ + used_) % align;
				const std::size_t start = used_ + (misalign ? align - misalign : 0);
				if (start > cap_ || size > cap_ - start)
						return nullptr;
				used_ = start + size;
				return base_ + start;
		}

		std::uint8_t* base_ = nullptr;
		std::size_t cap_ = 0;
		std::size_t used_ = 0;
};

// rolls the arena back to where it stood at construction unless commit() ran.
// a failed decomposition leaves the persist arena as it found it
class ArenaScope final {
	  public:
		explicit ArenaScope(Arena& arena) noexcept : arena_(arena), mark_(arena.mark()) {}

		ArenaScope(const ArenaScope&) = delete;
		ArenaScope& operator=(const ArenaScope&) = delete;

		~ArenaScope() noexcept {
				if (!committed_)
						arena_.rewind(mark_);
		}

		void commit() noexcept { committed_ = true; }

	  private:
		Arena& arena_;
		std::size_t mark_;
		bool committed_ = false;
};

// empties a scratch arena for the duration of one call
class ArenaScratchScope final {
	  public:
		explicit ArenaScratchScope(Arena& arena) noexcept : arena_(arena) { arena_.clear(); }

		ArenaScratchScope(const ArenaScratchScope&) = delete;
		ArenaScratchScope& operator=(const ArenaScratchScope&) = delete;

		~ArenaScratchScope() noexcept { arena_.clear(); }

	  private:
		Arena& arena_;
};
} // namespace lowrank_core
