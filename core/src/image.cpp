#include "lowrank_core/image.hpp"

#include <cmath>

#include "lowrank_core/config.hpp"

namespace lowrank_core {
namespace {
std::uint8_t to_byte(double v) noexcept {
		if (!(v > 0.0))
				return 0;
		if (v >= kPixelMax)
				return 255;
		return static_cast<std::uint8_t>(std::lround(v));
}

double gray_of(const std::uint8_t* px) noexcept {
		const unsigned sum = static_cast<unsigned>(px[0]) + px[1] + px[2];
		return std::round(static_cast<double>(sum) / 3.0);
}

bool same_size(ImageView a, ImageView b) noexcept {
		return a.width == b.width && a.height == b.height;
}
} // namespace

std::uint8_t layout_channel_count(ChannelLayout layout) noexcept {
		return layout == ChannelLayout::Gray ? 1 : 3;
}

Channel layout_channel(ChannelLayout layout, std::uint8_t index) noexcept {
		if (layout == ChannelLayout::Gray)
				return Channel::Gray;
		switch (index) {
		case 0:
				return Channel::Red;
		case 1:
				return Channel::Green;
		default:
				return Channel::Blue;
		}
}

const char* channel_name(Channel channel) noexcept {
		switch (channel) {
		case Channel::Red:
				return "R";
		case Channel::Green:
				return "G";
		case Channel::Blue:
				return "B";
		case Channel::Gray:
				return "gray";
		}
		return "?";
}

ErrorCode image_check(ImageView img) noexcept {
		if (!img.data || img.width == 0 || img.height == 0)
				return ErrorCode::InvalidDimension;
		if (static_cast<std::uint64_t>(img.stride) < static_cast<std::uint64_t>(img.width) * kBytesPerPixel)
				return ErrorCode::InvalidDimension;
		return ErrorCode::Ok;
}

ErrorCode image_extract_channel(ImageView src, Channel channel, MatrixMutView out) noexcept {
		ErrorCode ec = image_check(src);
		if (!is_ok(ec))
				return ec;
		if (!out.data)
				return ErrorCode::Internal;
		if (out.rows != src.height || out.cols != src.width)
				return ErrorCode::DimensionMismatch;

		const auto comp = static_cast<std::uint8_t>(channel);
		for (std::uint32_t y = 0; y < src.height; y++) {
				double* row = out.row_mut(y);
				for (std::uint32_t x = 0; x < src.width; x++) {
						const std::uint8_t* px = src.pixel(x, y);
						row[x] = channel == Channel::Gray ? gray_of(px) : static_cast<double>(px[comp]);
				}
		}
		return ErrorCode::Ok;
}

ErrorCode image_store_channel(MatrixView m, Channel channel, ImageMutView dst) noexcept {
		ErrorCode ec = image_check(dst.view());
		if (!is_ok(ec))
				return ec;
		if (!m.data)
				return ErrorCode::Internal;
		if (m.rows != dst.height || m.cols != dst.width)
				return ErrorCode::DimensionMismatch;

		const auto comp = static_cast<std::uint8_t>(channel);
		for (std::uint32_t y = 0; y < dst.height; y++) {
				const double* row = m.row(y);
				for (std::uint32_t x = 0; x < dst.width; x++) {
						std::uint8_t* px = dst.pixel_mut(x, y);
						const std::uint8_t v = to_byte(row[x]);
						if (channel == Channel::Gray) {
								px[0] = v;
								px[1] = v;
								px[2] = v;
						} else {
								px[comp] = v;
						}
				}
		}
		return ErrorCode::Ok;
}

void image_set_opaque(ImageMutView dst) noexcept {
		if (!dst.data)
				return;
		for (std::uint32_t y = 0; y < dst.height; y++) {
				for (std::uint32_t x = 0; x < dst.width; x++)
						dst.pixel_mut(x, y)[3] = 255;
		}
}

Error image_mse(ImageView a, ImageView b, double* out) noexcept {
		if (!out)
				return {ErrorCode::Internal};
		if (!is_ok(image_check(a)) || !is_ok(image_check(b)))
				return {ErrorCode::InvalidDimension, a.dim(), b.dim()};
		if (!same_size(a, b))
				return err_dim_mismatch(a.dim(), b.dim());

		// integer accumulation keeps image vs itself exactly zero
		std::uint64_t sum = 0;
		for (std::uint32_t y = 0; y < a.height; y++) {
				for (std::uint32_t x = 0; x < a.width; x++) {
						const std::uint8_t* pa = a.pixel(x, y);
						const std::uint8_t* pb = b.pixel(x, y);
						for (std::uint32_t c = 0; c < 3; c++) {
								const int d = static_cast<int>(pa[c]) - static_cast<int>(pb[c]);
								sum += static_cast<std::uint64_t>(d * d);
						}
				}
		}
		const double samples = static_cast<double>(a.width) * static_cast<double>(a.height) * 3.0;
		*out = static_cast<double>(sum) / samples;
		return {};
}

ErrorCode channel_preview(ImageView src, Channel channel, ImageMutView dst) noexcept {
#if LOWRANK_CORE_ENABLE_PREVIEW
		ErrorCode ec = image_check(src);
		if (!is_ok(ec))
				return ec;
		ec = image_check(dst.view());
		if (!is_ok(ec))
				return ec;
		if (!same_size(src, dst.view()))
				return ErrorCode::DimensionMismatch;

		const auto comp = static_cast<std::uint8_t>(channel);
		for (std::uint32_t y = 0; y < src.height; y++) {
				for (std::uint32_t x = 0; x < src.width; x++) {
						const std::uint8_t* s = src.pixel(x, y);
						std::uint8_t* d = dst.pixel_mut(x, y);
						if (channel == Channel::Gray) {
								const auto g = static_cast<std::uint8_t>(gray_of(s));
								d[0] = g;
								d[1] = g;
								d[2] = g;
						} else {
								const std::uint8_t v = s[comp];
								d[0] = 0;
								d[1] = 0;
								d[2] = 0;
								d[comp] = v;
						}
						d[3] = 255;
				}
		}
		return ErrorCode::Ok;
#else
		(void)src;
		(void)channel;
		(void)dst;
		return ErrorCode::FeatureDisabled;
#endif
}

} // namespace lowrank_core
