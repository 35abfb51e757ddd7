#pragma once

#include <cstddef>
#include <cstdint>

#include "lowrank_core/eigen.hpp"
#include "lowrank_core/error.hpp"

namespace lowrank_core {
struct WorkspaceSize {
		std::size_t persist = 0; // channel matrix, reconstruction and factors
		std::size_t scratch = 0; // A^T, A^T A, eigen pairs and solver vectors

		std::size_t total() const noexcept { return persist + scratch; }
};

// upper bound of the arena space compress_channel() needs for one channel
ErrorCode channel_workspace_bytes(In Dim channel, In const EigenOptions& opts, Out WorkspaceSize* out) noexcept;

} // namespace lowrank_core
