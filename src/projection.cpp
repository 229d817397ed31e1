#include "projection.hpp"

#include <charconv>
#include <cmath>
#include <numbers>
#include <optional>
#include <system_error>

#include <fmt/core.h>

#include "field-decoder.hpp"

namespace fcd_digest {

namespace {

// WGS84
constexpr double semi_major_axis = 6378137.0;
constexpr double flattening = 1.0 / 298.257223563;
constexpr double utm_scale_factor = 0.9996;
constexpr double utm_false_easting = 500000.0;
constexpr double utm_false_northing_south = 10000000.0;

constexpr auto degrees(const double radians) -> double {
	return radians * 180.0 / std::numbers::pi;
}

// Value of `+key=value` inside a proj4 string
auto proj_value(std::string_view proj, std::string_view key) -> std::optional<std::string_view> {
	const auto token = fmt::format("+{}=", key);
	const auto pos = proj.find(token);
	if (pos == std::string_view::npos) {
		return std::nullopt;
	}
	const auto start = pos + token.size();
	const auto end = proj.find(' ', start);
	return proj.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
}

auto has_flag(std::string_view proj, std::string_view flag) -> bool {
	std::size_t pos = 0;
	while ((pos = proj.find(flag, pos)) != std::string_view::npos) {
		const auto end = pos + flag.size();
		if (end == proj.size() || proj[end] == ' ') {
			return true;
		}
		pos = end;
	}
	return false;
}

auto parse_net_offset(std::string_view text) -> std::optional<Point> {
	const auto comma = text.find(',');
	if (comma == std::string_view::npos) {
		return std::nullopt;
	}
	const auto x = parse_double(text.substr(0, comma));
	const auto y = parse_double(text.substr(comma + 1));
	if (! x || ! y) {
		return std::nullopt;
	}
	return Point {*x, *y};
}

} // namespace

[[nodiscard]] auto pformat(const projection_error err) -> std::string {
	switch (err) {
		case projection_error::malformed_net_offset:
			return "malformed netOffset";
		case projection_error::unsupported_projection:
			return "unsupported projParameter, only +proj=utm and '!' are supported";
		case projection_error::malformed_utm_zone:
			return "malformed or missing +zone in projParameter";
	}
	return "unknown projection error";
}

auto Projection::identity() -> Projection {
	return Projection {};
}

auto Projection::utm(const int zone, const bool south, const Point offset) -> Projection {
	auto projection = Projection {};
	projection.kind_ = Kind::utm;
	projection.zone_ = zone;
	projection.south_ = south;
	projection.offset_ = offset;
	return projection;
}

auto Projection::from_sumo_location(std::string_view net_offset, std::string_view proj_parameter)
	-> tl::expected<Projection, projection_error> {
	auto offset = Point {};
	if (! net_offset.empty()) {
		const auto parsed = parse_net_offset(net_offset);
		if (! parsed) {
			return tl::make_unexpected(projection_error::malformed_net_offset);
		}
		offset = *parsed;
	}

	if (proj_parameter.empty() || proj_parameter == "!") {
		auto projection = Projection::identity();
		projection.offset_ = offset;
		return projection;
	}

	const auto proj = proj_value(proj_parameter, "proj");
	if (! proj || *proj != "utm") {
		return tl::make_unexpected(projection_error::unsupported_projection);
	}

	const auto zone_text = proj_value(proj_parameter, "zone");
	if (! zone_text) {
		return tl::make_unexpected(projection_error::malformed_utm_zone);
	}
	int zone = 0;
	const auto* const end = zone_text->data() + zone_text->size();
	const auto [ptr, ec] = std::from_chars(zone_text->data(), end, zone);
	if (ec != std::errc {} || ptr != end || zone < 1 || zone > 60) {
		return tl::make_unexpected(projection_error::malformed_utm_zone);
	}

	return Projection::utm(zone, has_flag(proj_parameter, "+south"), offset);
}

auto Projection::to_lon_lat(const Point& p) const -> LonLat {
	const auto x = p.x - this->offset_.x;
	const auto y = p.y - this->offset_.y;
	if (this->kind_ == Kind::shift) {
		return LonLat {x, y};
	}
	return this->inverse_utm(x, y);
}

// Inverse transverse mercator series (Snyder, "Map Projections: A Working
// Manual", eq. 8-18 to 8-25). Sub-centimeter within a zone.
auto Projection::inverse_utm(const double easting, const double northing) const -> LonLat {
	constexpr double e2 = flattening * (2.0 - flattening);
	constexpr double ep2 = e2 / (1.0 - e2);
	const double	 e1 = (1.0 - std::sqrt(1.0 - e2)) / (1.0 + std::sqrt(1.0 - e2));

	const double x = easting - utm_false_easting;
	const double y = this->south_ ? northing - utm_false_northing_south : northing;

	const double m = y / utm_scale_factor;
	const double mu =
		m / (semi_major_axis *
			 (1.0 - e2 / 4.0 - 3.0 * e2 * e2 / 64.0 - 5.0 * e2 * e2 * e2 / 256.0));

	const double phi1 = mu + (3.0 * e1 / 2.0 - 27.0 * std::pow(e1, 3) / 32.0) * std::sin(2.0 * mu) +
						(21.0 * e1 * e1 / 16.0 - 55.0 * std::pow(e1, 4) / 32.0) * std::sin(4.0 * mu) +
						(151.0 * std::pow(e1, 3) / 96.0) * std::sin(6.0 * mu) +
						(1097.0 * std::pow(e1, 4) / 512.0) * std::sin(8.0 * mu);

	const double sin_phi1 = std::sin(phi1);
	const double cos_phi1 = std::cos(phi1);
	const double tan_phi1 = std::tan(phi1);

	const double n1 = semi_major_axis / std::sqrt(1.0 - e2 * sin_phi1 * sin_phi1);
	const double t1 = tan_phi1 * tan_phi1;
	const double c1 = ep2 * cos_phi1 * cos_phi1;
	const double r1 =
		semi_major_axis * (1.0 - e2) / std::pow(1.0 - e2 * sin_phi1 * sin_phi1, 1.5);
	const double d = x / (n1 * utm_scale_factor);

	const double lat =
		phi1 - (n1 * tan_phi1 / r1) *
				   (d * d / 2.0 -
					(5.0 + 3.0 * t1 + 10.0 * c1 - 4.0 * c1 * c1 - 9.0 * ep2) * std::pow(d, 4) / 24.0 +
					(61.0 + 90.0 * t1 + 298.0 * c1 + 45.0 * t1 * t1 - 252.0 * ep2 - 3.0 * c1 * c1) *
						std::pow(d, 6) / 720.0);

	const double lon = (d - (1.0 + 2.0 * t1 + c1) * std::pow(d, 3) / 6.0 +
						(5.0 - 2.0 * c1 + 28.0 * t1 - 3.0 * c1 * c1 + 8.0 * ep2 + 24.0 * t1 * t1) *
							std::pow(d, 5) / 120.0) /
					   cos_phi1;

	const double central_meridian = (this->zone_ - 1) * 6.0 - 180.0 + 3.0;
	return LonLat {central_meridian + degrees(lon), degrees(lat)};
}

[[nodiscard]] auto pformat(const Projection& projection) -> std::string {
	if (projection.is_utm()) {
		return fmt::format("(Projection) {{ utm zone {}, offset = ({}, {}) }}", projection.zone(),
						   projection.offset().x, projection.offset().y);
	}
	return fmt::format("(Projection) {{ none, offset = ({}, {}) }}", projection.offset().x,
					   projection.offset().y);
}

} // namespace fcd_digest
