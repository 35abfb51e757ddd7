#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "lowrank_core/error.hpp"
#include "lowrank_core/image.hpp"
#include "lowrank_core/slab.hpp"

namespace lowrank_cli {
enum class PnmFormat : std::uint8_t {
		Gray,  // P5
		Color, // P6
};

enum class PnmError : std::uint8_t {
		Ok = 0,
		OpenFailed,
		BadMagic,
		BadHeader,
		UnsupportedMaxval,
		TooLarge,
		Truncated,
		OutOfMemory,
		WriteFailed,
};

const char* pnm_error_name(In PnmError err) noexcept;

// RGBA8 pixels in a heap slab, rows packed
class Bitmap {
	  public:
		Bitmap() noexcept = default;
		Bitmap(const Bitmap&) = delete;
		Bitmap& operator=(const Bitmap&) = delete;

		// pixels start zeroed with opaque alpha
		PnmError init(In std::uint32_t width, In std::uint32_t height) noexcept;

		std::uint32_t width() const noexcept { return width_; }
		std::uint32_t height() const noexcept { return height_; }

		lowrank_core::ImageView view() const noexcept;
		lowrank_core::ImageMutView mut() noexcept;

	  private:
		lowrank_core::Slab slab_;
		std::uint32_t width_ = 0;
		std::uint32_t height_ = 0;
};

// binary P5/P6 with maxval <= 255. header comments are skipped. samples are
// scaled to 0..255 when maxval is smaller
PnmError pnm_read(InOut std::FILE* in, Out Bitmap* out, Out PnmFormat* format) noexcept;

// P5 stores the rounded mean of R, G and B. alpha is dropped
PnmError pnm_write(InOut std::FILE* out, In lowrank_core::ImageView img, In PnmFormat format) noexcept;

PnmError pnm_load(In const char* path, Out Bitmap* out, Out PnmFormat* format) noexcept;
PnmError pnm_save(In const char* path, In lowrank_core::ImageView img, In PnmFormat format) noexcept;

} // namespace lowrank_cli
