#pragma once

#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace fcd_digest {

// Network coordinates in meters, as written by netconvert.
struct Point {
	double x = 0.0;
	double y = 0.0;
};

struct LonLat {
	double lon = 0.0;
	double lat = 0.0;
};

enum class projection_error {
	malformed_net_offset,
	unsupported_projection,
	malformed_utm_zone,
};

[[nodiscard]]
auto pformat(projection_error err) -> std::string;

// Reverses the transform netconvert applies to geographic input:
//   x_net = project(lon, lat).x + netOffset.x
// Supported are UTM on WGS84 (`+proj=utm +zone=N [+south]`) and no
// projection at all (`!`), where net coordinates are shifted lon/lat.
class Projection {
  public:
	[[nodiscard]] static auto identity() -> Projection;

	[[nodiscard]] static auto from_sumo_location(std::string_view net_offset,
												 std::string_view proj_parameter)
		-> tl::expected<Projection, projection_error>;

	[[nodiscard]] static auto utm(int zone, bool south, Point offset = {}) -> Projection;

	[[nodiscard]] auto to_lon_lat(const Point& p) const -> LonLat;
	[[nodiscard]] auto to_lon_lat(double x, double y) const -> LonLat {
		return this->to_lon_lat(Point {x, y});
	}

	[[nodiscard]] auto is_utm() const -> bool { return this->kind_ == Kind::utm; }
	[[nodiscard]] auto zone() const -> int { return this->zone_; }
	[[nodiscard]] auto offset() const -> const Point& { return this->offset_; }

  private:
	enum class Kind {
		shift,
		utm,
	};

	Kind  kind_ = Kind::shift;
	Point offset_ {};
	int	  zone_ = 0;
	bool  south_ = false;

	[[nodiscard]] auto inverse_utm(double easting, double northing) const -> LonLat;
};

[[nodiscard]]
auto pformat(const Projection& projection) -> std::string;

} // namespace fcd_digest
