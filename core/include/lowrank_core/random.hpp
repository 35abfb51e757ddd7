#pragma once

#include <cstdint>

#include "lowrank_core/error.hpp"

namespace lowrank_core {
struct RandomSourceVTable;

// non-owning handle to a caller supplied generator. the solver draws its
// start vectors through this and never touches global random state
class RandomSource {
	  public:
		RandomSource() noexcept = default;

		bool available() const noexcept { return vtable_ != nullptr && ctx_ != nullptr; }

		// uniform in [0, 1). returns 0.5 when no generator is attached
		double next_unit() noexcept;

		// uniform in [-0.5, 0.5]
		double next_centered() noexcept { return next_unit() - 0.5; }

		static RandomSource make(void* ctx, const RandomSourceVTable* vtable) noexcept;

	  private:
		void* ctx_ = nullptr;
		const RandomSourceVTable* vtable_ = nullptr;
};

struct RandomSourceVTable {
		double (*next_unit)(InOut void*) noexcept;
};

// xorshift64* generator. equal seeds give equal sequences on every platform
class SeededRandom final {
	  public:
		explicit SeededRandom(std::uint64_t seed) noexcept { reseed(seed); }

		SeededRandom(const SeededRandom&) = delete;
		SeededRandom& operator=(const SeededRandom&) = delete;

		void reseed(std::uint64_t seed) noexcept;

		std::uint64_t next_u64() noexcept;
		double next_unit() noexcept;

		RandomSource source() noexcept;

	  private:
		std::uint64_t state_ = 0;
};

// derives independent per task seeds from one request seed
std::uint64_t mix_seed(std::uint64_t seed, std::uint64_t stream) noexcept;

} // namespace lowrank_core
