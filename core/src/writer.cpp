#include "lowrank_core/writer.hpp"

#include <cmath>

namespace lowrank_core {

ErrorCode Writer::append_fixed(double v, std::uint8_t decimals) noexcept {
		if (decimals > 6)
				return ErrorCode::InvalidArgument;
		if (std::isnan(v))
				return append("nan");
		if (std::isinf(v))
				return append(v < 0 ? "-inf" : "inf");

		std::uint64_t scale = 1;
		for (std::uint8_t i = 0; i < decimals; i++)
				scale *= 10u;

		const bool neg = v < 0;
		const double scaled = std::round(std::fabs(v) * static_cast<double>(scale));
		if (scaled >= 1.8e19)
				return ErrorCode::Overflow;
		const auto units = static_cast<std::uint64_t>(scaled);

		ErrorCode ec = ErrorCode::Ok;
		if (neg && units != 0) {
				ec = put('-');
				if (!is_ok(ec))
						return ec;
		}
		ec = append_u64(units / scale);
		if (!is_ok(ec) || decimals == 0)
				return ec;
		ec = put('.');
		if (!is_ok(ec))
				return ec;

		// leading zeros of the fraction
		std::uint64_t frac = units % scale;
		for (std::uint64_t div = scale / 10u; div > 0; div /= 10u) {
				ec = put(static_cast<char>('0' + (frac / div) % 10u));
				if (!is_ok(ec))
						return ec;
		}
		return ErrorCode::Ok;
}

} // namespace lowrank_core
