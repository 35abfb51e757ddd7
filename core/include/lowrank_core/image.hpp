#pragma once

#include <cstddef>
#include <cstdint>

#include "lowrank_core/error.hpp"
#include "lowrank_core/matrix.hpp"

namespace lowrank_core {
constexpr std::uint32_t kBytesPerPixel = 4; // interleaved R, G, B, A

struct ImageView {
		std::uint32_t width = 0;
		std::uint32_t height = 0;
		std::uint32_t stride = 0; // bytes per row, at least width * 4
		const std::uint8_t* data = nullptr;

		constexpr Dim dim() const noexcept { return {height, width}; }

		const std::uint8_t* pixel(std::uint32_t x, std::uint32_t y) const noexcept {
				return data + static_cast<std::size_t>(y) * stride + static_cast<std::size_t>(x) * kBytesPerPixel;
		}
};

struct ImageMutView {
		std::uint32_t width = 0;
		std::uint32_t height = 0;
		std::uint32_t stride = 0;
		std::uint8_t* data = nullptr;

		ImageView view() const noexcept { return {width, height, stride, data}; }

		constexpr Dim dim() const noexcept { return {height, width}; }

		std::uint8_t* pixel_mut(std::uint32_t x, std::uint32_t y) const noexcept {
				return data + static_cast<std::size_t>(y) * stride + static_cast<std::size_t>(x) * kBytesPerPixel;
		}
};

enum class ChannelLayout : std::uint8_t {
		Gray,
		Rgb,
};

enum class Channel : std::uint8_t {
		Red = 0,
		Green = 1,
		Blue = 2,
		Gray = 3, // rounded mean of R, G and B
};

std::uint8_t layout_channel_count(In ChannelLayout layout) noexcept;
Channel layout_channel(In ChannelLayout layout, In std::uint8_t index) noexcept;
const char* channel_name(In Channel channel) noexcept;

// InvalidDimension for an empty image or a stride shorter than a row
ErrorCode image_check(In ImageView img) noexcept;

// out must be height x width
ErrorCode image_extract_channel(In ImageView src, In Channel channel, Out MatrixMutView out) noexcept;

// writes clamped, rounded values. Gray is written to R, G and B. alpha is
// left alone
ErrorCode image_store_channel(In MatrixView m, In Channel channel, Out ImageMutView dst) noexcept;

void image_set_opaque(Out ImageMutView dst) noexcept;

// mean of squared R, G, B differences. alpha is ignored
Error image_mse(In ImageView a, In ImageView b, Out double* out) noexcept;

// dst keeps only the selected colour component, other components are zero
// and alpha is opaque. Gray copies the mean into all three
ErrorCode channel_preview(In ImageView src, In Channel channel, Out ImageMutView dst) noexcept;

} // namespace lowrank_core
