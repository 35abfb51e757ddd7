#pragma once

#include <cstddef>
#include <cstdint>

#include "lowrank_core/arena.hpp"
#include "lowrank_core/config.hpp"
#include "lowrank_core/eigen.hpp"
#include "lowrank_core/error.hpp"
#include "lowrank_core/image.hpp"
#include "lowrank_core/matrix.hpp"
#include "lowrank_core/progress.hpp"
#include "lowrank_core/random.hpp"
#include "lowrank_core/reconstruct.hpp"

namespace lowrank_core {
struct CompressRequest {
		std::uint8_t percent = 50; // retention in [0, 100]
		PolicyKind policy = PolicyKind::ByCount;
		ChannelLayout layout = ChannelLayout::Rgb;
		std::uint64_t seed = 1;
		const EigenOptions* eigen = nullptr; // nullptr selects eigen_options_for()
};

struct ChannelReport {
		Channel channel = Channel::Gray;
		std::uint32_t used = 0;
		std::uint32_t total = 0; // declared rank min(rows, cols)
		std::uint32_t found = 0;
		std::uint32_t degenerate = 0;
		StopReason stop = StopReason::Complete;
};

struct CompressReport {
		std::uint32_t used = 0;  // rounded mean over channels
		std::uint32_t total = 0; // rounded mean over channels
		double data_ratio = 0.0;       // 2 decimals
		double retained_percent = 0.0; // used / total * 100, 1 decimal
		double mse = 0.0;
		std::uint8_t channel_count = 0;
		ChannelReport channels[kMaxChannels]{};
};

// dense storage over the storage of a rank k factorization:
// (rows * cols) / (k * (rows + cols + 1)), rounded to 2 decimals. 0 when k is 0
double data_compression_ratio(In Dim channel, In std::uint32_t used) noexcept;

// decompose and rebuild one channel matrix. out is rows x cols
Error compress_channel(In MatrixView channel,
        In const Policy& policy,
        In const EigenOptions& opts,
        InOut RandomSource& random,
        InOut Arena& persist,
        InOut Arena& scratch,
        In const EigenObserver* observer,
        Out MatrixMutView out,
        Out ChannelReport* report) noexcept;

// split src into channels, compress each as an independent task and write the
// recomposed image into dst (same size as src, may not alias it)
Error compress_image(In ImageView src,
        In const CompressRequest& request,
        In const ProgressSink* progress,
        Out ImageMutView dst,
        Out CompressReport* report) noexcept;

} // namespace lowrank_core
