#include "lowrank_cli/report.hpp"

namespace lowrank_cli {
namespace {
using lowrank_core::ErrorCode;
using lowrank_core::Writer;

ErrorCode append_dim(Writer* w, lowrank_core::Dim d) noexcept {
		ErrorCode ec = w->append_u64(d.rows);
		if (is_ok(ec))
				ec = w->put('x');
		if (is_ok(ec))
				ec = w->append_u64(d.cols);
		return ec;
}

ErrorCode append_channel(Writer* w, const lowrank_core::ChannelReport& ch) noexcept {
		ErrorCode ec = w->append("channel ");
		if (is_ok(ec))
				ec = w->append(lowrank_core::channel_name(ch.channel));
		if (is_ok(ec))
				ec = w->append(": ");
		if (is_ok(ec))
				ec = w->append_u64(ch.used);
		if (is_ok(ec))
				ec = w->append(" / ");
		if (is_ok(ec))
				ec = w->append_u64(ch.total);
		if (is_ok(ec))
				ec = w->append(" used, ");
		if (is_ok(ec))
				ec = w->append_u64(ch.found);
		if (is_ok(ec))
				ec = w->append(" found");
		if (is_ok(ec) && ch.degenerate > 0) {
				ec = w->append(", ");
				if (is_ok(ec))
						ec = w->append_u64(ch.degenerate);
				if (is_ok(ec))
						ec = w->append(" degenerate");
		}
		if (is_ok(ec) && ch.stop != lowrank_core::StopReason::Complete) {
				ec = w->append(" (");
				if (is_ok(ec))
						ec = w->append(lowrank_core::stop_reason_name(ch.stop));
				if (is_ok(ec))
						ec = w->put(')');
		}
		if (is_ok(ec))
				ec = w->put('\n');
		return ec;
}
} // namespace

ErrorCode format_progress(std::uint8_t percent, const char* label, Writer* w) noexcept {
		if (!w)
				return ErrorCode::Internal;
		ErrorCode ec = w->put('[');
		if (is_ok(ec) && percent < 100)
				ec = w->put(' ');
		if (is_ok(ec) && percent < 10)
				ec = w->put(' ');
		if (is_ok(ec))
				ec = w->append_u64(percent);
		if (is_ok(ec))
				ec = w->append("%] ");
		if (is_ok(ec))
				ec = w->append(label ? label : "");
		return ec;
}

ErrorCode format_report(const lowrank_core::CompressReport& report, lowrank_core::PolicyKind policy, Writer* w) noexcept {
		if (!w)
				return ErrorCode::Internal;

		ErrorCode ec = w->append("singular values: ");
		if (is_ok(ec))
				ec = w->append_u64(report.used);
		if (is_ok(ec))
				ec = w->append(" / ");
		if (is_ok(ec))
				ec = w->append_u64(report.total);
		if (is_ok(ec))
				ec = w->append(" (");
		if (is_ok(ec))
				ec = w->append(lowrank_core::policy_name(policy));
		if (is_ok(ec))
				ec = w->append(")\ndata ratio: ");
		if (is_ok(ec))
				ec = w->append_fixed(report.data_ratio, 2);
		if (is_ok(ec) && policy == lowrank_core::PolicyKind::ByEnergy) {
				ec = w->append("\nretained: ");
				if (is_ok(ec))
						ec = w->append_fixed(report.retained_percent, 1);
				if (is_ok(ec))
						ec = w->put('%');
		}
		if (is_ok(ec))
				ec = w->append("\nmse: ");
		if (is_ok(ec))
				ec = w->append_fixed(report.mse, 2);
		if (is_ok(ec))
				ec = w->put('\n');

		for (std::uint8_t i = 0; i < report.channel_count && i < lowrank_core::kMaxChannels; i++) {
				if (!is_ok(ec))
						break;
				ec = append_channel(w, report.channels[i]);
		}
		return ec;
}

ErrorCode format_error(const lowrank_core::Error& err, Writer* w) noexcept {
		if (!w)
				return ErrorCode::Internal;
		ErrorCode ec = w->append(lowrank_core::error_name(err.code));
		const bool has_a = err.a.rows != 0 || err.a.cols != 0;
		const bool has_b = err.b.rows != 0 || err.b.cols != 0;
		if (is_ok(ec) && has_a) {
				ec = w->put(' ');
				if (is_ok(ec))
						ec = append_dim(w, err.a);
		}
		if (is_ok(ec) && has_b) {
				ec = w->append(" vs ");
				if (is_ok(ec))
						ec = append_dim(w, err.b);
		}
		return ec;
}

} // namespace lowrank_cli
