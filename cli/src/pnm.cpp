#include "lowrank_cli/pnm.hpp"

#include <cmath>

#include "lowrank_cli/config.hpp"

namespace lowrank_cli {
namespace {
using lowrank_core::ImageMutView;
using lowrank_core::ImageView;
using lowrank_core::kBytesPerPixel;

bool is_space(int c) noexcept {
		return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// next header integer. whitespace and '#' comments before it are skipped,
// the single delimiter after it is consumed
bool read_header_u32(std::FILE* in, std::uint32_t* out) noexcept {
		int c = std::fgetc(in);
		for (;;) {
				if (c == '#') {
						while (c != '\n' && c != EOF)
								c = std::fgetc(in);
				} else if (is_space(c)) {
						c = std::fgetc(in);
				} else {
						break;
				}
		}
		if (c < '0' || c > '9')
				return false;

		std::uint64_t v = 0;
		while (c >= '0' && c <= '9') {
				v = v * 10u + static_cast<std::uint64_t>(c - '0');
				if (v > 0xFFFFFFFFull)
						return false;
				c = std::fgetc(in);
		}
		if (c != EOF && !is_space(c))
				return false;
		*out = static_cast<std::uint32_t>(v);
		return true;
}

std::uint8_t scale_sample(std::uint8_t v, std::uint32_t maxval) noexcept {
		if (maxval == 255)
				return v;
		if (v >= maxval)
				return 255;
		return static_cast<std::uint8_t>(std::lround(static_cast<double>(v) * 255.0 / static_cast<double>(maxval)));
}

std::uint8_t gray_sample(const std::uint8_t* px) noexcept {
		const unsigned sum = static_cast<unsigned>(px[0]) + px[1] + px[2];
		return static_cast<std::uint8_t>(std::lround(static_cast<double>(sum) / 3.0));
}

// closes the file on every path
struct FileCloser {
		std::FILE* f = nullptr;
		~FileCloser() {
				if (f)
						std::fclose(f);
		}
};
} // namespace

const char* pnm_error_name(PnmError err) noexcept {
		switch (err) {
		case PnmError::Ok:
				return "ok";
		case PnmError::OpenFailed:
				return "cannot open file";
		case PnmError::BadMagic:
				return "not a binary PGM (P5) or PPM (P6) file";
		case PnmError::BadHeader:
				return "malformed header";
		case PnmError::UnsupportedMaxval:
				return "maxval above 255";
		case PnmError::TooLarge:
				return "image too large";
		case PnmError::Truncated:
				return "truncated pixel data";
		case PnmError::OutOfMemory:
				return "out of memory";
		case PnmError::WriteFailed:
				return "write failed";
		}
		return "unknown";
}

PnmError Bitmap::init(std::uint32_t width, std::uint32_t height) noexcept {
		width_ = 0;
		height_ = 0;
		if (width == 0 || height == 0)
				return PnmError::BadHeader;
		if (width > kMaxImageSide || height > kMaxImageSide)
				return PnmError::TooLarge;

		const std::size_t bytes = static_cast<std::size_t>(width) * height * kBytesPerPixel;
		if (!is_ok(slab_.reserve(bytes)))
				return PnmError::OutOfMemory;
		std::uint8_t* p = slab_.data();
		for (std::size_t i = 0; i < bytes; i += kBytesPerPixel) {
				p[i + 0] = 0;
				p[i + 1] = 0;
				p[i + 2] = 0;
				p[i + 3] = 255;
		}
		width_ = width;
		height_ = height;
		return PnmError::Ok;
}

ImageView Bitmap::view() const noexcept {
		return {width_, height_, width_ * kBytesPerPixel, slab_.data()};
}

ImageMutView Bitmap::mut() noexcept {
		return {width_, height_, width_ * kBytesPerPixel, slab_.data()};
}

PnmError pnm_read(std::FILE* in, Bitmap* out, PnmFormat* format) noexcept {
		if (!in || !out || !format)
				return PnmError::OpenFailed;

		const int p = std::fgetc(in);
		const int kind = std::fgetc(in);
		if (p != 'P' || (kind != '5' && kind != '6'))
				return PnmError::BadMagic;
		const PnmFormat fmt = kind == '5' ? PnmFormat::Gray : PnmFormat::Color;

		std::uint32_t width = 0;
		std::uint32_t height = 0;
		std::uint32_t maxval = 0;
		if (!read_header_u32(in, &width) || !read_header_u32(in, &height) || !read_header_u32(in, &maxval))
				return PnmError::BadHeader;
		if (maxval == 0)
				return PnmError::BadHeader;
		if (maxval > 255)
				return PnmError::UnsupportedMaxval;

		const PnmError err = out->init(width, height);
		if (err != PnmError::Ok)
				return err;

		const std::uint32_t channels = fmt == PnmFormat::Gray ? 1u : 3u;
		std::uint8_t sample[3] = {};
		ImageMutView img = out->mut();
		for (std::uint32_t y = 0; y < height; y++) {
				for (std::uint32_t x = 0; x < width; x++) {
						if (std::fread(sample, 1, channels, in) != channels)
								return PnmError::Truncated;
						std::uint8_t* px = img.pixel_mut(x, y);
						if (channels == 1) {
								const std::uint8_t v = scale_sample(sample[0], maxval);
								px[0] = v;
								px[1] = v;
								px[2] = v;
						} else {
								px[0] = scale_sample(sample[0], maxval);
								px[1] = scale_sample(sample[1], maxval);
								px[2] = scale_sample(sample[2], maxval);
						}
				}
		}

		*format = fmt;
		return PnmError::Ok;
}

PnmError pnm_write(std::FILE* out, ImageView img, PnmFormat format) noexcept {
		if (!out)
				return PnmError::OpenFailed;
		if (!is_ok(lowrank_core::image_check(img)))
				return PnmError::BadHeader;

		const char magic = format == PnmFormat::Gray ? '5' : '6';
		if (std::fprintf(out, "P%c\n%lu %lu\n255\n", magic, (unsigned long)img.width, (unsigned long)img.height) < 0)
				return PnmError::WriteFailed;

		std::uint8_t sample[3] = {};
		const std::size_t channels = format == PnmFormat::Gray ? 1u : 3u;
		for (std::uint32_t y = 0; y < img.height; y++) {
				for (std::uint32_t x = 0; x < img.width; x++) {
						const std::uint8_t* px = img.pixel(x, y);
						if (channels == 1) {
								sample[0] = gray_sample(px);
						} else {
								sample[0] = px[0];
								sample[1] = px[1];
								sample[2] = px[2];
						}
						if (std::fwrite(sample, 1, channels, out) != channels)
								return PnmError::WriteFailed;
				}
		}
		return std::fflush(out) == 0 ? PnmError::Ok : PnmError::WriteFailed;
}

PnmError pnm_load(const char* path, Bitmap* out, PnmFormat* format) noexcept {
		if (!path)
				return PnmError::OpenFailed;
		FileCloser file{std::fopen(path, "rb")};
		if (!file.f)
				return PnmError::OpenFailed;
		return pnm_read(file.f, out, format);
}

PnmError pnm_save(const char* path, ImageView img, PnmFormat format) noexcept {
		if (!path)
				return PnmError::OpenFailed;
		std::FILE* f = std::fopen(path, "wb");
		if (!f)
				return PnmError::OpenFailed;
		const PnmError err = pnm_write(f, img, format);
		// a failed close can lose buffered bytes
		if (std::fclose(f) != 0 && err == PnmError::Ok)
				return PnmError::WriteFailed;
		return err;
}

} // namespace lowrank_cli
