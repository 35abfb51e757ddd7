#include "lowrank_core/pipeline.hpp"

#include <cmath>

#include "lowrank_core/slab.hpp"
#include "lowrank_core/svd.hpp"
#include "lowrank_core/workspace.hpp"
#include "lowrank_core/writer.hpp"

namespace lowrank_core {
namespace {
// checkpoint layout: 0 start, channel work spread over [10, 70), 80
// recomposition, 100 done
constexpr std::uint8_t kStartPercent = 0;
constexpr std::uint8_t kChannelsBegin = 10;
constexpr std::uint8_t kChannelsSpan = 60;
constexpr std::uint8_t kReconstructPercent = 80;
constexpr std::uint8_t kDonePercent = 100;

// serializes notifications from channel tasks and keeps them non-decreasing
struct ProgressGate {
		const ProgressSink* sink = nullptr;
		std::uint8_t last = 0;

		void emit(std::uint8_t percent, const char* label) noexcept {
				if (!sink)
						return;
#if LOWRANK_CORE_ENABLE_PARALLEL
#pragma omp critical(lowrank_progress)
#endif
				{
						if (percent < last)
								percent = last;
						last = percent;
						sink->notify(percent, label);
				}
		}
};

void emit_channel(ProgressGate& gate, std::uint8_t percent, const char* verb, Channel channel) noexcept {
		char label[40];
		Writer w{label, sizeof(label), 0};
		label[0] = '\0';
		// a truncated label is still a usable label
		(void)w.append(verb);
		(void)w.append(" ");
		(void)w.append(channel_name(channel));
		gate.emit(percent, label);
}

struct MidpointCtx {
		ProgressGate* gate = nullptr;
		Channel channel = Channel::Gray;
		std::uint8_t percent = 0;
		bool sent = false;
};

void send_midpoint(MidpointCtx& ctx) noexcept {
		if (ctx.sent)
				return;
		ctx.sent = true;
		emit_channel(*ctx.gate, ctx.percent, "solving eigenpairs", ctx.channel);
}

void on_eigen_pair(void* vctx, std::uint32_t found, std::uint32_t requested) noexcept {
		auto* ctx = static_cast<MidpointCtx*>(vctx);
		if (found * 2u >= requested)
				send_midpoint(*ctx);
}

struct ChannelTask {
		Channel channel = Channel::Gray;
		std::uint8_t index = 0;
		Slab slab;
		MatrixMutView out{};
		ChannelReport report{};
		Error err{};
};

void run_channel(ChannelTask& task,
        ImageView src,
        const Policy& policy,
        const EigenOptions& opts,
        const WorkspaceSize& ws,
        std::uint64_t seed,
        std::uint8_t channel_count,
        ProgressGate& gate) noexcept {
		const std::uint8_t span = static_cast<std::uint8_t>(kChannelsSpan / channel_count);
		const auto begin = static_cast<std::uint8_t>(kChannelsBegin + task.index * span);
		emit_channel(gate, begin, "decomposing", task.channel);

		Arena persist;
		Arena scratch;
		ErrorCode ec = task.slab.reserve(ws.total());
		if (is_ok(ec))
				ec = task.slab.split(ws.persist, &persist, &scratch);
		if (!is_ok(ec)) {
				task.err = {ec, src.dim()};
				return;
		}

		MatrixMutView channel;
		ec = matrix_alloc(persist, src.height, src.width, &channel);
		if (is_ok(ec))
				ec = matrix_alloc(persist, src.height, src.width, &task.out);
		if (is_ok(ec))
				ec = image_extract_channel(src, task.channel, channel);
		if (!is_ok(ec)) {
				task.err = {ec, src.dim()};
				return;
		}

		// each task draws from its own stream so scheduling never changes results
		SeededRandom rng(mix_seed(seed, task.index));
		RandomSource random = rng.source();

		MidpointCtx mid;
		mid.gate = &gate;
		mid.channel = task.channel;
		mid.percent = static_cast<std::uint8_t>(begin + span / 2);
		const EigenObserver observer{&mid, &on_eigen_pair};

		task.report.channel = task.channel;
		task.err = compress_channel(channel.view(), policy, opts, random, persist, scratch, &observer, task.out, &task.report);
		// a solve that stopped before half its pairs still passes the checkpoint
		if (is_ok(task.err))
				send_midpoint(mid);

		LOWRANK_DBG("[pipeline] %s used=%lu total=%lu found=%lu stop=%s\n",
		        channel_name(task.channel),
		        (unsigned long)task.report.used,
		        (unsigned long)task.report.total,
		        (unsigned long)task.report.found,
		        stop_reason_name(task.report.stop));
}

double round_to(double v, double scale) noexcept {
		return std::round(v * scale) / scale;
}
} // namespace

double data_compression_ratio(Dim channel, std::uint32_t used) noexcept {
		if (used == 0)
				return 0.0;
		const double rows = channel.rows;
		const double cols = channel.cols;
		const double stored = static_cast<double>(used) * (rows + cols + 1.0);
		return round_to(rows * cols / stored, 100.0);
}

Error compress_channel(MatrixView channel,
        const Policy& policy,
        const EigenOptions& opts,
        RandomSource& random,
        Arena& persist,
        Arena& scratch,
        const EigenObserver* observer,
        MatrixMutView out,
        ChannelReport* report) noexcept {
		if (!report)
				return {ErrorCode::Internal};
		if (!is_ok(matrix_check(channel)))
				return err_invalid_dim(channel.dim());
		if (!out.data || out.rows != channel.rows || out.cols != channel.cols)
				return err_dim_mismatch(channel.dim(), out.dim());

		SvdResult svd;
		Error err = svd_decompose(channel, opts, random, persist, scratch, observer, &svd);
		if (!is_ok(err))
				return err;

		std::uint32_t used = 0;
		err = reconstruct(svd, policy, out, &used);
		if (!is_ok(err))
				return err;

		report->used = used;
		report->total = svd.rank;
		report->found = svd.found;
		report->degenerate = svd.degenerate;
		report->stop = svd.stop;
		return {};
}

Error compress_image(ImageView src,
        const CompressRequest& request,
        const ProgressSink* progress,
        ImageMutView dst,
        CompressReport* report) noexcept {
		if (!report)
				return {ErrorCode::Internal};
		if (!is_ok(image_check(src)))
				return err_invalid_dim(src.dim());
		if (!is_ok(image_check(dst.view())))
				return err_invalid_dim(dst.dim());
		if (src.width != dst.width || src.height != dst.height)
				return err_dim_mismatch(src.dim(), dst.dim());
		if (src.data == dst.data)
				return err_invalid_arg();
		if (request.percent > 100)
				return err_invalid_arg();

		const Policy policy{request.policy, static_cast<double>(request.percent) / 100.0};
		const Dim dim = src.dim();
		const EigenOptions opts = request.eigen ? *request.eigen : eigen_options_for(dim);
		WorkspaceSize ws;
		ErrorCode ec = channel_workspace_bytes(dim, opts, &ws);
		if (!is_ok(ec))
				return {ec, dim};

		ProgressGate gate;
		gate.sink = (progress && progress->available()) ? progress : nullptr;
		gate.emit(kStartPercent, "starting");

		const std::uint8_t count = layout_channel_count(request.layout);
		ChannelTask tasks[kMaxChannels];
		for (std::uint8_t i = 0; i < count; i++) {
				tasks[i].channel = layout_channel(request.layout, i);
				tasks[i].index = i;
		}

		// channels share nothing mutable until recomposition below
#if LOWRANK_CORE_ENABLE_PARALLEL
#pragma omp parallel for schedule(static, 1) if (count > 1)
#endif
		for (int i = 0; i < static_cast<int>(count); i++)
				run_channel(tasks[i], src, policy, opts, ws, request.seed, count, gate);

		for (std::uint8_t i = 0; i < count; i++) {
				if (!is_ok(tasks[i].err))
						return tasks[i].err;
		}

		gate.emit(kReconstructPercent, "reconstructing image");
		CompressReport rep;
		rep.channel_count = count;
		std::uint64_t used_sum = 0;
		std::uint64_t total_sum = 0;
		for (std::uint8_t i = 0; i < count; i++) {
				ec = image_store_channel(tasks[i].out.view(), tasks[i].channel, dst);
				if (!is_ok(ec))
						return {ec, dim};
				rep.channels[i] = tasks[i].report;
				used_sum += tasks[i].report.used;
				total_sum += tasks[i].report.total;
		}
		image_set_opaque(dst);

		rep.used = static_cast<std::uint32_t>(std::lround(static_cast<double>(used_sum) / count));
		rep.total = static_cast<std::uint32_t>(std::lround(static_cast<double>(total_sum) / count));
		rep.data_ratio = data_compression_ratio(dim, rep.used);
		rep.retained_percent = rep.total ? round_to(100.0 * rep.used / rep.total, 10.0) : 0.0;

		Error err = image_mse(src, dst.view(), &rep.mse);
		if (!is_ok(err))
				return err;

		gate.emit(kDonePercent, "done");
		*report = rep;
		return {};
}

} // namespace lowrank_core
