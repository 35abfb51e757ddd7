#pragma once

#include <cstddef>
#include <cstdint>

#include "lowrank_core/error.hpp"
#include "lowrank_core/image.hpp"
#include "lowrank_core/reconstruct.hpp"
#include "lowrank_core/writer.hpp"

namespace lowrank_cli {
// parsed command line. strings point into argv
struct Options {
		const char* input = nullptr;
		const char* output = nullptr;
		std::uint8_t percent = 50;
		lowrank_core::PolicyKind policy = lowrank_core::PolicyKind::ByCount;
		bool layout_given = false; // otherwise the input format decides
		lowrank_core::ChannelLayout layout = lowrank_core::ChannelLayout::Rgb;
		std::uint64_t seed = 1;
		const char* preview_dir = nullptr;
		bool quiet = false;
		bool help = false;
};

// decimal digits only, no sign, no trailing characters
bool parse_u64(In const char* s, Out std::uint64_t* out) noexcept;

// InvalidArgument with a one line reason in message. --help short circuits
// the positional checks
lowrank_core::ErrorCode parse_args(In int argc,
        In const char* const* argv,
        Out Options* out,
        Out lowrank_core::Writer* message) noexcept;

lowrank_core::ErrorCode write_usage(In const char* program, Out lowrank_core::Writer* w) noexcept;

} // namespace lowrank_cli
