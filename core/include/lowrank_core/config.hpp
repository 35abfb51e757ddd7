#pragma once

#include <cstddef>
#include <cstdint>

namespace lowrank_core {
constexpr double kPixelMax = 255.0;

// power iteration settings for ordinary channel sizes
constexpr double kDefaultTolerance = 1e-10;
constexpr std::uint32_t kDefaultMaxIterations = 100;

// channels with more entries than this trade accuracy for bounded runtime
constexpr std::size_t kLargeMatrixEntries = 256u * 256u;
constexpr double kLargeTolerance = 1e-6;
constexpr std::uint32_t kLargeMaxIterations = 50;
constexpr std::uint32_t kLargeMaxEigenvalues = 64;

constexpr std::uint8_t kMaxChannels = 3;
} // namespace lowrank_core

#ifndef LOWRANK_CORE_ENABLE_PARALLEL
#define LOWRANK_CORE_ENABLE_PARALLEL 1
#endif
#ifndef LOWRANK_CORE_ENABLE_PREVIEW
#define LOWRANK_CORE_ENABLE_PREVIEW 1
#endif

// dbg_printf is only available from the CE toolchain
#ifndef LOWRANK_CORE_ENABLE_DEBUG
#define LOWRANK_CORE_ENABLE_DEBUG 0
#endif

#if LOWRANK_CORE_ENABLE_DEBUG
#include <debug.h>
#define LOWRANK_DBG(...) dbg_printf(__VA_ARGS__)
#else
#define LOWRANK_DBG(...) \
		do {             \
		} while (0)
#endif
