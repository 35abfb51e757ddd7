#include "lowrank_cli/pnm.hpp"

#include <cassert>
#include <cstdio>
#include <cstring>

using lowrank_cli::Bitmap;
using lowrank_cli::PnmError;
using lowrank_cli::PnmFormat;

// temporary stream holding bytes, rewound for reading
static std::FILE* stream_of(const void* bytes, std::size_t len) {
		std::FILE* f = std::tmpfile();
		assert(f);
		assert(std::fwrite(bytes, 1, len, f) == len);
		std::rewind(f);
		return f;
}

static PnmError read_bytes(const char* bytes, std::size_t len, Bitmap* out, PnmFormat* format) {
		std::FILE* f = stream_of(bytes, len);
		const PnmError err = lowrank_cli::pnm_read(f, out, format);
		std::fclose(f);
		return err;
}

int main() {
		// P6 with a header comment.
		{
				const char data[] = "P6\n# made by hand\n2 1\n255\n\x0a\x14\x1e\xff\x00\x80";
				Bitmap bmp;
				PnmFormat fmt = PnmFormat::Gray;
				assert(read_bytes(data, sizeof(data) - 1, &bmp, &fmt) == PnmError::Ok);
				assert(fmt == PnmFormat::Color);
				assert(bmp.width() == 2 && bmp.height() == 1);
				const std::uint8_t* a = bmp.view().pixel(0, 0);
				const std::uint8_t* b = bmp.view().pixel(1, 0);
				assert(a[0] == 10 && a[1] == 20 && a[2] == 30 && a[3] == 255);
				assert(b[0] == 255 && b[1] == 0 && b[2] == 128 && b[3] == 255);
		}

		// P5 fills R, G and B. comments may sit between any two fields.
		{
				const char data[] = "P5 1 #w\n 2 #h\n255\n\x07\xc8";
				Bitmap bmp;
				PnmFormat fmt = PnmFormat::Color;
				assert(read_bytes(data, sizeof(data) - 1, &bmp, &fmt) == PnmError::Ok);
				assert(fmt == PnmFormat::Gray);
				assert(bmp.width() == 1 && bmp.height() == 2);
				const std::uint8_t* a = bmp.view().pixel(0, 0);
				const std::uint8_t* b = bmp.view().pixel(0, 1);
				assert(a[0] == 7 && a[1] == 7 && a[2] == 7 && a[3] == 255);
				assert(b[0] == 200 && b[1] == 200 && b[2] == 200);
		}

		// small maxval is scaled up.
		{
				const char data[] = "P5\n3 1\n15\n\x00\x0f\x05";
				Bitmap bmp;
				PnmFormat fmt;
				assert(read_bytes(data, sizeof(data) - 1, &bmp, &fmt) == PnmError::Ok);
				assert(bmp.view().pixel(0, 0)[0] == 0);
				assert(bmp.view().pixel(1, 0)[0] == 255);
				assert(bmp.view().pixel(2, 0)[0] == 85);
		}

		// malformed inputs.
		{
				Bitmap bmp;
				PnmFormat fmt;
				const char p3[] = "P3\n1 1\n255\n1 2 3\n";
				assert(read_bytes(p3, sizeof(p3) - 1, &bmp, &fmt) == PnmError::BadMagic);
				const char text[] = "hello";
				assert(read_bytes(text, sizeof(text) - 1, &bmp, &fmt) == PnmError::BadMagic);
				const char wide[] = "P5\n1 1\n65535\n\x00\x00";
				assert(read_bytes(wide, sizeof(wide) - 1, &bmp, &fmt) == PnmError::UnsupportedMaxval);
				const char zero[] = "P5\n0 1\n255\n";
				assert(read_bytes(zero, sizeof(zero) - 1, &bmp, &fmt) == PnmError::BadHeader);
				const char junk[] = "P6\n2 x\n255\n";
				assert(read_bytes(junk, sizeof(junk) - 1, &bmp, &fmt) == PnmError::BadHeader);
				const char nomax[] = "P6\n2 2\n0\n";
				assert(read_bytes(nomax, sizeof(nomax) - 1, &bmp, &fmt) == PnmError::BadHeader);
				const char huge[] = "P6\n100000 1\n255\n";
				assert(read_bytes(huge, sizeof(huge) - 1, &bmp, &fmt) == PnmError::TooLarge);
				const char cut[] = "P6\n2 1\n255\n\x01\x02\x03\x04";
				assert(read_bytes(cut, sizeof(cut) - 1, &bmp, &fmt) == PnmError::Truncated);
				assert(lowrank_cli::pnm_load("/nonexistent/dir/in.ppm", &bmp, &fmt) == PnmError::OpenFailed);
		}

		// written images read back, P5 stores the channel mean.
		{
				Bitmap bmp;
				assert(bmp.init(2, 2) == PnmError::Ok);
				lowrank_core::ImageMutView img = bmp.mut();
				const std::uint8_t colors[4][3] = {{255, 0, 0}, {0, 255, 0}, {1, 2, 4}, {9, 9, 9}};
				for (std::uint32_t i = 0; i < 4; i++) {
						std::uint8_t* px = img.pixel_mut(i % 2, i / 2);
						px[0] = colors[i][0];
						px[1] = colors[i][1];
						px[2] = colors[i][2];
				}

				std::FILE* f = std::tmpfile();
				assert(f);
				assert(lowrank_cli::pnm_write(f, bmp.view(), PnmFormat::Color) == PnmError::Ok);
				std::rewind(f);
				char header[16] = {};
				assert(std::fread(header, 1, 11, f) == 11);
				assert(std::memcmp(header, "P6\n2 2\n255\n", 11) == 0);
				std::rewind(f);
				Bitmap back;
				PnmFormat fmt;
				assert(lowrank_cli::pnm_read(f, &back, &fmt) == PnmError::Ok);
				std::fclose(f);
				assert(fmt == PnmFormat::Color);
				assert(std::memcmp(back.view().data, bmp.view().data, 2 * 2 * lowrank_core::kBytesPerPixel) == 0);

				f = std::tmpfile();
				assert(f);
				assert(lowrank_cli::pnm_write(f, bmp.view(), PnmFormat::Gray) == PnmError::Ok);
				std::rewind(f);
				Bitmap gray;
				assert(lowrank_cli::pnm_read(f, &gray, &fmt) == PnmError::Ok);
				std::fclose(f);
				assert(fmt == PnmFormat::Gray);
				assert(gray.view().pixel(0, 0)[0] == 85);
				assert(gray.view().pixel(1, 0)[1] == 85);
				assert(gray.view().pixel(0, 1)[2] == 2);
				assert(gray.view().pixel(1, 1)[0] == 9);

				assert(lowrank_cli::pnm_write(nullptr, bmp.view(), PnmFormat::Gray) == PnmError::OpenFailed);
				assert(lowrank_cli::pnm_save("/nonexistent/dir/out.ppm", bmp.view(), PnmFormat::Color) == PnmError::OpenFailed);
		}

		assert(std::strcmp(lowrank_cli::pnm_error_name(PnmError::Truncated), "truncated pixel data") == 0);
		return 0;
}
