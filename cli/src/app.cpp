#include "lowrank_cli/app.hpp"

#include "lowrank_cli/config.hpp"
#include "lowrank_cli/report.hpp"

#include "lowrank_core/pipeline.hpp"
#include "lowrank_core/progress.hpp"
#include "lowrank_core/writer.hpp"

namespace lowrank_cli {
namespace {
using lowrank_core::ErrorCode;
using lowrank_core::Writer;

void print_line(std::FILE* f, const char* text) noexcept {
		std::fputs(text, f);
		std::fputc('\n', f);
}

void print_progress(void* ctx, std::uint8_t percent, const char* label) noexcept {
		char buf[64];
		Writer w{buf, sizeof(buf), 0};
		buf[0] = '\0';
		// a clipped label is still worth printing
		(void)format_progress(percent, label, &w);
		auto* out = static_cast<std::FILE*>(ctx);
		print_line(out, buf);
		std::fflush(out);
}

constexpr lowrank_core::ProgressSinkVTable kPrintVTable = {
        .on_progress = &print_progress,
};

int io_failure(std::FILE* err, const char* what, const char* path, PnmError pe) noexcept {
		std::fprintf(err, "lowrank_cli: %s %s: %s\n", what, path, pnm_error_name(pe));
		return kExitIo;
}

// dir + '/' + name
bool join_path(const char* dir, const char* name, char* buf, std::size_t cap) noexcept {
		Writer w{buf, cap, 0};
		buf[0] = '\0';
		ErrorCode ec = w.append(dir);
		if (is_ok(ec) && w.len > 0 && buf[w.len - 1] != '/')
				ec = w.put('/');
		if (is_ok(ec))
				ec = w.append(name);
		return is_ok(ec);
}

// r.ppm, g.ppm and b.ppm, each keeping a single reconstructed component
int write_previews(std::FILE* err, lowrank_core::ImageView img, const char* dir) noexcept {
		static constexpr struct {
				lowrank_core::Channel channel;
				const char* file;
		} kPreviews[] = {
		        {lowrank_core::Channel::Red, "r.ppm"},
		        {lowrank_core::Channel::Green, "g.ppm"},
		        {lowrank_core::Channel::Blue, "b.ppm"},
		};

		Bitmap preview;
		PnmError pe = preview.init(img.width, img.height);
		if (pe != PnmError::Ok)
				return io_failure(err, "cannot allocate preview for", dir, pe);

		char path[kPathBytes];
		for (const auto& p : kPreviews) {
				const ErrorCode ec = lowrank_core::channel_preview(img, p.channel, preview.mut());
				if (!is_ok(ec)) {
						std::fprintf(err, "lowrank_cli: preview: %s\n", lowrank_core::error_name(ec));
						return kExitCompress;
				}
				if (!join_path(dir, p.file, path, sizeof(path))) {
						std::fprintf(err, "lowrank_cli: preview path too long: %s\n", dir);
						return kExitUsage;
				}
				pe = pnm_save(path, preview.view(), PnmFormat::Color);
				if (pe != PnmError::Ok)
						return io_failure(err, "cannot write", path, pe);
		}
		return kExitOk;
}
} // namespace

int run(int argc, const char* const* argv, std::FILE* out, std::FILE* err) noexcept {
		if (!out || !err)
				return kExitUsage;
		const char* program = (argc > 0 && argv && argv[0]) ? argv[0] : "lowrank_cli";

		char msg[kMessageBytes];
		Writer mw{msg, sizeof(msg), 0};
		msg[0] = '\0';

		Options opts;
		if (!is_ok(parse_args(argc, argv, &opts, &mw))) {
				std::fprintf(err, "lowrank_cli: %s\n", msg);
				mw.len = 0;
				msg[0] = '\0';
				(void)write_usage(program, &mw);
				std::fputs(msg, err);
				return kExitUsage;
		}
		if (opts.help) {
				(void)write_usage(program, &mw);
				std::fputs(msg, out);
				return kExitOk;
		}

		Bitmap src;
		PnmFormat in_format = PnmFormat::Color;
		PnmError pe = pnm_load(opts.input, &src, &in_format);
		if (pe != PnmError::Ok)
				return io_failure(err, "cannot read", opts.input, pe);

		lowrank_core::CompressRequest req;
		req.percent = opts.percent;
		req.policy = opts.policy;
		req.seed = opts.seed;
		if (opts.layout_given)
				req.layout = opts.layout;
		else
				req.layout = in_format == PnmFormat::Gray ? lowrank_core::ChannelLayout::Gray : lowrank_core::ChannelLayout::Rgb;

		Bitmap dst;
		pe = dst.init(src.width(), src.height());
		if (pe != PnmError::Ok)
				return io_failure(err, "cannot allocate output for", opts.input, pe);

		const lowrank_core::ProgressSink sink = lowrank_core::ProgressSink::make(out, &kPrintVTable);
		lowrank_core::CompressReport report;
		const lowrank_core::Error ce = lowrank_core::compress_image(src.view(), req, opts.quiet ? nullptr : &sink, dst.mut(), &report);
		if (!is_ok(ce)) {
				mw.len = 0;
				msg[0] = '\0';
				(void)format_error(ce, &mw);
				std::fprintf(err, "lowrank_cli: compression failed: %s\n", msg);
				return kExitCompress;
		}

		const bool gray = req.layout == lowrank_core::ChannelLayout::Gray;
		pe = pnm_save(opts.output, dst.view(), gray ? PnmFormat::Gray : PnmFormat::Color);
		if (pe != PnmError::Ok)
				return io_failure(err, "cannot write", opts.output, pe);

		// a gray result has no separate channels to show
		if (opts.preview_dir && !gray) {
				const int rc = write_previews(err, dst.view(), opts.preview_dir);
				if (rc != kExitOk)
						return rc;
		}

		char text[kReportBytes];
		Writer rw{text, sizeof(text), 0};
		text[0] = '\0';
		if (!is_ok(format_report(report, req.policy, &rw)))
				std::fputs("lowrank_cli: report truncated\n", err);
		std::fputs(text, out);
		return kExitOk;
}

} // namespace lowrank_cli
