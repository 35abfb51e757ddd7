#include "lowrank_core/random.hpp"

namespace lowrank_core {
namespace {
double seeded_next_unit(void* ctx) noexcept {
		return static_cast<SeededRandom*>(ctx)->next_unit();
}

constexpr RandomSourceVTable kSeededVTable = {
        .next_unit = &seeded_next_unit,
};

constexpr std::uint64_t splitmix64(std::uint64_t x) noexcept {
		x += 0x9E3779B97F4A7C15ull;
		x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
		x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
		return x ^ (x >> 31);
}
} // namespace

double RandomSource::next_unit() noexcept {
		if (!available())
				return 0.5;
		return vtable_->next_unit(ctx_);
}

RandomSource RandomSource::make(void* ctx, const RandomSourceVTable* vtable) noexcept {
		RandomSource r;
		r.ctx_ = ctx;
		r.vtable_ = vtable;
		return r;
}

void SeededRandom::reseed(std::uint64_t seed) noexcept {
		// xorshift state must never be zero
		state_ = splitmix64(seed);
		if (state_ == 0)
				state_ = 0x9E3779B97F4A7C15ull;
}

std::uint64_t SeededRandom::next_u64() noexcept {
		state_ ^= state_ >> 12;
		state_ ^= state_ << 25;
		state_ ^= state_ >> 27;
		return state_ * 0x2545F4914F6CDD1Dull;
}

double SeededRandom::next_unit() noexcept {
		// top 53 bits give every representable double in [0, 1) with step 2^-53
		return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);
}

RandomSource SeededRandom::source() noexcept {
		return RandomSource::make(this, &kSeededVTable);
}

std::uint64_t mix_seed(std::uint64_t seed, std::uint64_t stream) noexcept {
		return splitmix64(seed ^ splitmix64(stream + 1u));
}

} // namespace lowrank_core
