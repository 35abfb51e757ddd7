#pragma once

#include <cstddef>
#include <cstdint>

#include "lowrank_core/error.hpp"
#include "lowrank_core/matrix.hpp"
#include "lowrank_core/svd.hpp"

namespace lowrank_core {
enum class PolicyKind : std::uint8_t {
		ByCount, // keep a fraction of the components
		ByEnergy, // keep components until their share of the sigma sum is reached
};

struct Policy {
		PolicyKind kind = PolicyKind::ByCount;
		double percent = 1.0; // in [0, 1]

		static constexpr Policy by_count(double p) noexcept { return {PolicyKind::ByCount, p}; }
		static constexpr Policy by_energy(double p) noexcept { return {PolicyKind::ByEnergy, p}; }
};

const char* policy_name(PolicyKind kind) noexcept;

// max(1, ceil(rank * percent)) clamped to rank. 0 for rank 0
std::uint32_t retain_by_count(In std::uint32_t rank, In double percent) noexcept;

// number of leading components ByEnergy keeps: the component whose sigma
// pushes the running sum past percent * total is included
std::uint32_t retain_by_energy(In VectorView sigma, In double percent) noexcept;

// sum of the first count rank one terms, clamped to [0, 255] and rounded
ErrorCode reconstruct_leading(In const SvdResult& svd, In std::uint32_t count, Out MatrixMutView out) noexcept;

Error reconstruct_by_count(In const SvdResult& svd, In double percent, Out MatrixMutView out, Out std::uint32_t* used) noexcept;
Error reconstruct_by_energy(In const SvdResult& svd, In double percent, Out MatrixMutView out, Out std::uint32_t* used) noexcept;

Error reconstruct(In const SvdResult& svd, In const Policy& policy, Out MatrixMutView out, Out std::uint32_t* used) noexcept;

} // namespace lowrank_core
