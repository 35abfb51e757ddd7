#include "lowrank_cli/args.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace lowrank_cli {
namespace {
using lowrank_core::ErrorCode;
using lowrank_core::Writer;

bool same(const char* a, const char* b) noexcept {
		return std::strcmp(a, b) == 0;
}

ErrorCode fail(Writer* message, const char* what, const char* arg) noexcept {
		if (message) {
				// a clipped message still names the problem
				(void)message->append(what);
				if (arg) {
						(void)message->append(": ");
						(void)message->append(arg);
				}
		}
		return ErrorCode::InvalidArgument;
}
} // namespace

bool parse_u64(const char* s, std::uint64_t* out) noexcept {
		if (!out || !s || s[0] == '\0')
				return false;
		// strtoull accepts a sign and leading blanks
		if (s[0] < '0' || s[0] > '9')
				return false;

		const char* const end = s + std::strlen(s);
		char* parse_end = nullptr;
		errno = 0;
		const unsigned long long v = std::strtoull(s, &parse_end, 10);
		if (errno != 0)
				return false;
		if (parse_end != end)
				return false;
		*out = static_cast<std::uint64_t>(v);
		return true;
}

ErrorCode parse_args(int argc, const char* const* argv, Options* out, Writer* message) noexcept {
		if (!out || !argv)
				return ErrorCode::Internal;

		Options opts;
		std::uint8_t positional = 0;
		for (int i = 1; i < argc; i++) {
				const char* arg = argv[i];
				if (!arg)
						return fail(message, "null argument", nullptr);

				if (same(arg, "-h") || same(arg, "--help")) {
						opts.help = true;
						*out = opts;
						return ErrorCode::Ok;
				}
				if (same(arg, "--gray")) {
						opts.layout_given = true;
						opts.layout = lowrank_core::ChannelLayout::Gray;
						continue;
				}
				if (same(arg, "--color")) {
						opts.layout_given = true;
						opts.layout = lowrank_core::ChannelLayout::Rgb;
						continue;
				}
				if (same(arg, "--quiet")) {
						opts.quiet = true;
						continue;
				}

				const bool takes_value = same(arg, "--percent") || same(arg, "--policy") || same(arg, "--seed") || same(arg, "--preview");
				if (takes_value) {
						if (i + 1 >= argc || !argv[i + 1])
								return fail(message, "missing value for", arg);
						const char* value = argv[++i];

						if (same(arg, "--percent")) {
								std::uint64_t p = 0;
								if (!parse_u64(value, &p) || p > 100)
										return fail(message, "percent must be an integer in 0..100", value);
								opts.percent = static_cast<std::uint8_t>(p);
						} else if (same(arg, "--policy")) {
								if (same(value, "count"))
										opts.policy = lowrank_core::PolicyKind::ByCount;
								else if (same(value, "sum"))
										opts.policy = lowrank_core::PolicyKind::ByEnergy;
								else
										return fail(message, "policy must be count or sum", value);
						} else if (same(arg, "--seed")) {
								if (!parse_u64(value, &opts.seed))
										return fail(message, "seed must be a non-negative integer", value);
						} else {
								if (value[0] == '\0')
										return fail(message, "empty preview directory", nullptr);
								opts.preview_dir = value;
						}
						continue;
				}

				if (arg[0] == '-' && arg[1] != '\0')
						return fail(message, "unknown option", arg);

				if (positional == 0)
						opts.input = arg;
				else if (positional == 1)
						opts.output = arg;
				else
						return fail(message, "unexpected argument", arg);
				positional++;
		}

		if (!opts.input)
				return fail(message, "missing input image", nullptr);
		if (!opts.output)
				return fail(message, "missing output image", nullptr);

		*out = opts;
		return ErrorCode::Ok;
}

ErrorCode write_usage(const char* program, Writer* w) noexcept {
		if (!w)
				return ErrorCode::Internal;
		ErrorCode ec = w->append("usage: ");
		if (is_ok(ec))
				ec = w->append(program ? program : "lowrank_cli");
		if (is_ok(ec)) {
				ec = w->append(" <in.ppm|in.pgm> <out> [--percent N] [--policy count|sum]\n"
				               "        [--gray|--color] [--seed S] [--preview DIR] [--quiet]\n");
		}
		return ec;
}

} // namespace lowrank_cli
