#pragma once

#include <cmath>

namespace fcd_digest {

constexpr double kmh_per_ms = 3.6;

[[nodiscard]] inline auto round_to(const double value, const int decimals) -> double {
	const double scale = std::pow(10.0, decimals);
	return std::round(value * scale) / scale;
}

} // namespace fcd_digest
